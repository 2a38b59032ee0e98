#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/relay/relay_types.hpp"
#include <string>
namespace veil::transfer::interfaces {
/**
 * @brief Opaque signing capability backed by device key storage or a remote signer
 *
 * Private key material never crosses this interface.
 */
class ISigner {
public:
    virtual ~ISigner() = default;
    virtual std::string Address() const = 0;
    virtual Result<relay::SignedTransaction, TransferFailure> Sign(const relay::UnsignedTransaction& transaction) = 0;
};
}
