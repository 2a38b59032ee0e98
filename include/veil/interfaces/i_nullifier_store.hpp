#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/core/clock.hpp"
#include "veil/security/nullifier/nullifier.hpp"
#include <cstddef>
#include <string_view>
namespace veil::transfer::interfaces {
/**
 * @brief Durable backing for the nullifier registry
 *
 * Any Err is treated as RegistryUnavailable and the protected operation is
 * refused.
 */
class INullifierStore {
public:
    virtual ~INullifierStore() = default;
    /**
     * @return Ok(true) when inserted, Ok(false) when the nullifier already exists
     */
    virtual Result<bool, TransferFailure> InsertIfAbsent(const security::NullifierRecord& record) = 0;
    virtual Result<bool, TransferFailure> Contains(std::string_view nullifier) = 0;
    virtual Result<size_t, TransferFailure> RemoveExpired(Timestamp now) = 0;
};
}
