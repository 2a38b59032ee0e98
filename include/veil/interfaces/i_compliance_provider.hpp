#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/cashout/cashout_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
namespace veil::transfer::interfaces {
struct ComplianceCheck {
    std::string sender;
    std::optional<std::string> recipient;
    uint64_t amount_usd_cents = 0;
};
/**
 * @brief Screening provider. Implementations fail closed: a provider error
 * is an Err, never a pass.
 */
class IComplianceProvider {
public:
    virtual ~IComplianceProvider() = default;
    virtual Result<cashout::ComplianceResult, TransferFailure> CheckCompliance(const ComplianceCheck& check) = 0;
};
}
