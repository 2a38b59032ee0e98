#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include <optional>
#include <string>
#include <string_view>
namespace veil::transfer::interfaces {
/**
 * @brief One serialized CashoutState row per user
 */
class ICashoutStateStore {
public:
    virtual ~ICashoutStateStore() = default;
    virtual Result<Unit, TransferFailure> Save(std::string_view user_id, const std::string& serialized_state) = 0;
    virtual Result<std::optional<std::string>, TransferFailure> Load(std::string_view user_id) = 0;
    virtual Result<Unit, TransferFailure> Remove(std::string_view user_id) = 0;
};
}
