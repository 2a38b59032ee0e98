#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/cashout/cashout_types.hpp"

#include <string>
#include <string_view>

namespace veil::transfer::cashout {

/**
 * @brief CashoutState <-> veil.proto.cashout.CashoutState wire bytes
 */
class CashoutStateCodec {
public:
    [[nodiscard]] static Result<std::string, TransferFailure> Serialize(const CashoutState& state);

    [[nodiscard]] static Result<CashoutState, TransferFailure> Parse(std::string_view bytes);

private:
    CashoutStateCodec() = delete;
};

} // namespace veil::transfer::cashout
