#pragma once
#include <string>
#include <string_view>
namespace veil::transfer {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class TransferFailureType {
    Generic,
    InvalidInput,
    Encode,
    Decode,
    DeriveKey,
    KeyGeneration,
    DecryptionFailed,
    CommitmentMismatch,
    RegistryUnavailable,
    ReplayDetected,
    ProofExpired,
    InsufficientPoolBalance,
    DepositUnconfirmed,
    InsufficientDeposit,
    ConfirmationTimeout,
    TransactionRejected,
    ComplianceRejected,
    InvalidState,
    PipelineBusy,
    NotFound,
    Revoked,
    AuthorizationDenied,
    StorageFailure,
    ExternalCallFailed
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure reported by every transfer-layer operation
 *
 * The type drives caller decisions (refuse, retry, cancel); the message is
 * human readable and never carries key material or decrypted record fields.
 */
class TransferFailure {
public:
    TransferFailureType type;
    std::string message;
    TransferFailure(const TransferFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static TransferFailure Generic(std::string msg) {
        return {TransferFailureType::Generic, std::move(msg)};
    }
    static TransferFailure InvalidInput(std::string msg) {
        return {TransferFailureType::InvalidInput, std::move(msg)};
    }
    static TransferFailure Encode(std::string msg) {
        return {TransferFailureType::Encode, std::move(msg)};
    }
    static TransferFailure Decode(std::string msg) {
        return {TransferFailureType::Decode, std::move(msg)};
    }
    static TransferFailure DeriveKey(std::string msg) {
        return {TransferFailureType::DeriveKey, std::move(msg)};
    }
    static TransferFailure KeyGeneration(std::string msg) {
        return {TransferFailureType::KeyGeneration, std::move(msg)};
    }
    static TransferFailure DecryptionFailed(std::string msg) {
        return {TransferFailureType::DecryptionFailed, std::move(msg)};
    }
    static TransferFailure CommitmentMismatch(std::string msg) {
        return {TransferFailureType::CommitmentMismatch, std::move(msg)};
    }
    static TransferFailure RegistryUnavailable(std::string msg) {
        return {TransferFailureType::RegistryUnavailable, std::move(msg)};
    }
    static TransferFailure ReplayDetected(std::string msg) {
        return {TransferFailureType::ReplayDetected, std::move(msg)};
    }
    static TransferFailure ProofExpired(std::string msg) {
        return {TransferFailureType::ProofExpired, std::move(msg)};
    }
    static TransferFailure InsufficientPoolBalance(std::string msg) {
        return {TransferFailureType::InsufficientPoolBalance, std::move(msg)};
    }
    static TransferFailure DepositUnconfirmed(std::string msg) {
        return {TransferFailureType::DepositUnconfirmed, std::move(msg)};
    }
    static TransferFailure InsufficientDeposit(std::string msg) {
        return {TransferFailureType::InsufficientDeposit, std::move(msg)};
    }
    static TransferFailure ConfirmationTimeout(std::string msg) {
        return {TransferFailureType::ConfirmationTimeout, std::move(msg)};
    }
    static TransferFailure TransactionRejected(std::string msg) {
        return {TransferFailureType::TransactionRejected, std::move(msg)};
    }
    static TransferFailure ComplianceRejected(std::string msg) {
        return {TransferFailureType::ComplianceRejected, std::move(msg)};
    }
    static TransferFailure InvalidState(std::string msg) {
        return {TransferFailureType::InvalidState, std::move(msg)};
    }
    static TransferFailure PipelineBusy(std::string msg) {
        return {TransferFailureType::PipelineBusy, std::move(msg)};
    }
    static TransferFailure NotFound(std::string msg) {
        return {TransferFailureType::NotFound, std::move(msg)};
    }
    static TransferFailure Revoked(std::string msg) {
        return {TransferFailureType::Revoked, std::move(msg)};
    }
    static TransferFailure AuthorizationDenied(std::string msg) {
        return {TransferFailureType::AuthorizationDenied, std::move(msg)};
    }
    static TransferFailure StorageFailure(std::string msg) {
        return {TransferFailureType::StorageFailure, std::move(msg)};
    }
    static TransferFailure ExternalCallFailed(std::string msg) {
        return {TransferFailureType::ExternalCallFailed, std::move(msg)};
    }
    static TransferFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

[[nodiscard]] std::string_view FailureTypeName(TransferFailureType type) noexcept;
}
