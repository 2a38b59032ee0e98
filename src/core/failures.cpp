#include "veil/core/failures.hpp"

namespace veil::transfer {

std::string_view FailureTypeName(const TransferFailureType type) noexcept {
    switch (type) {
        case TransferFailureType::Generic: return "generic";
        case TransferFailureType::InvalidInput: return "invalid_input";
        case TransferFailureType::Encode: return "encode";
        case TransferFailureType::Decode: return "decode";
        case TransferFailureType::DeriveKey: return "derive_key";
        case TransferFailureType::KeyGeneration: return "key_generation";
        case TransferFailureType::DecryptionFailed: return "decryption_failed";
        case TransferFailureType::CommitmentMismatch: return "commitment_mismatch";
        case TransferFailureType::RegistryUnavailable: return "registry_unavailable";
        case TransferFailureType::ReplayDetected: return "replay_detected";
        case TransferFailureType::ProofExpired: return "proof_expired";
        case TransferFailureType::InsufficientPoolBalance: return "insufficient_pool_balance";
        case TransferFailureType::DepositUnconfirmed: return "deposit_unconfirmed";
        case TransferFailureType::InsufficientDeposit: return "insufficient_deposit";
        case TransferFailureType::ConfirmationTimeout: return "confirmation_timeout";
        case TransferFailureType::TransactionRejected: return "transaction_rejected";
        case TransferFailureType::ComplianceRejected: return "compliance_rejected";
        case TransferFailureType::InvalidState: return "invalid_state";
        case TransferFailureType::PipelineBusy: return "pipeline_busy";
        case TransferFailureType::NotFound: return "not_found";
        case TransferFailureType::Revoked: return "revoked";
        case TransferFailureType::AuthorizationDenied: return "authorization_denied";
        case TransferFailureType::StorageFailure: return "storage_failure";
        case TransferFailureType::ExternalCallFailed: return "external_call_failed";
    }
    return "unknown";
}

}
