#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/cashout/cashout_types.hpp"
#include <string_view>
namespace veil::transfer::interfaces {
/**
 * @brief Swap, shielded-pool and fiat off-ramp collaborators
 *
 * One Execute per working phase; the request alternative identifies the
 * phase. Value-moving requests are not idempotent.
 */
class ICashoutRails {
public:
    virtual ~ICashoutRails() = default;
    virtual Result<cashout::PhaseReceipt, TransferFailure> Execute(const cashout::PhaseRequest& request) = 0;
    /**
     * @brief Returns an address reserved by CreateAddressParams
     */
    virtual Result<Unit, TransferFailure> ReleaseAddress(std::string_view address) = 0;
};
}
