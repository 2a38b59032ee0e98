#include "veil/agents/agent_record_codec.hpp"
#include "veil/crypto/encoding.hpp"
#include "veil/crypto/key_derivation.hpp"
#include "veil/crypto/payload_sealer.hpp"
#include "veil/crypto/record_cipher.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/core/constants.hpp"
#include "veil/core/format.hpp"
#include "agents/agent_record.pb.h"

namespace veil::transfer::agents {

namespace {
    proto::agents::AgentStatus ToProto(const AgentStatus status) {
        switch (status) {
            case AgentStatus::Active: return proto::agents::AGENT_STATUS_ACTIVE;
            case AgentStatus::Suspended: return proto::agents::AGENT_STATUS_SUSPENDED;
            case AgentStatus::Revoked: return proto::agents::AGENT_STATUS_REVOKED;
            case AgentStatus::Creating: break;
        }
        return proto::agents::AGENT_STATUS_CREATING;
    }

    AgentStatus FromProto(const proto::agents::AgentStatus status) {
        switch (status) {
            case proto::agents::AGENT_STATUS_ACTIVE: return AgentStatus::Active;
            case proto::agents::AGENT_STATUS_SUSPENDED: return AgentStatus::Suspended;
            case proto::agents::AGENT_STATUS_REVOKED: return AgentStatus::Revoked;
            default: return AgentStatus::Creating;
        }
    }

    void WritePermissions(const AgentPermissions& permissions, proto::agents::AgentPermissions* out) {
        for (const auto& token : permissions.allowed) {
            out->add_allowed(token);
        }
        if (permissions.wallet_scoping.has_value()) {
            const auto& scoping = *permissions.wallet_scoping;
            auto* message = out->mutable_wallet_scoping();
            for (const auto& address : scoping.allowed_addresses) {
                message->add_allowed_addresses(address);
            }
            if (scoping.max_transaction_amount.has_value()) {
                message->set_max_transaction_amount(*scoping.max_transaction_amount);
            }
            if (scoping.daily_limit.has_value()) {
                message->set_daily_limit(*scoping.daily_limit);
            }
            if (scoping.monthly_limit.has_value()) {
                message->set_monthly_limit(*scoping.monthly_limit);
            }
        }
        if (permissions.activity_restrictions.has_value()) {
            auto* message = out->mutable_activity_restrictions();
            for (const auto& code : permissions.activity_restrictions->allowed_mcc_codes) {
                message->add_allowed_mcc_codes(code);
            }
        }
        if (permissions.time_restrictions.has_value()) {
            const auto& window = *permissions.time_restrictions;
            auto* message = out->mutable_time_restrictions();
            if (window.valid_from_ms.has_value()) {
                message->set_valid_from_ms(*window.valid_from_ms);
            }
            if (window.valid_until_ms.has_value()) {
                message->set_valid_until_ms(*window.valid_until_ms);
            }
            for (const uint32_t hour : window.allowed_hours) {
                message->add_allowed_hours(hour);
            }
        }
    }

    AgentPermissions ReadPermissions(const proto::agents::AgentPermissions& in) {
        AgentPermissions permissions;
        permissions.allowed.assign(in.allowed().begin(), in.allowed().end());
        if (in.has_wallet_scoping()) {
            const auto& message = in.wallet_scoping();
            WalletScoping scoping;
            scoping.allowed_addresses.assign(message.allowed_addresses().begin(), message.allowed_addresses().end());
            if (message.has_max_transaction_amount()) {
                scoping.max_transaction_amount = message.max_transaction_amount();
            }
            if (message.has_daily_limit()) {
                scoping.daily_limit = message.daily_limit();
            }
            if (message.has_monthly_limit()) {
                scoping.monthly_limit = message.monthly_limit();
            }
            permissions.wallet_scoping = std::move(scoping);
        }
        if (in.has_activity_restrictions()) {
            const auto& codes = in.activity_restrictions().allowed_mcc_codes();
            permissions.activity_restrictions = ActivityRestrictions{
                .allowed_mcc_codes = std::vector<std::string>(codes.begin(), codes.end())
            };
        }
        if (in.has_time_restrictions()) {
            const auto& message = in.time_restrictions();
            TimeRestrictions window;
            if (message.has_valid_from_ms()) {
                window.valid_from_ms = message.valid_from_ms();
            }
            if (message.has_valid_until_ms()) {
                window.valid_until_ms = message.valid_until_ms();
            }
            window.allowed_hours.assign(message.allowed_hours().begin(), message.allowed_hours().end());
            permissions.time_restrictions = std::move(window);
        }
        return permissions;
    }

    Result<crypto::SecureMemoryHandle, TransferFailure> RecordKey(const crypto::SecureMemoryHandle& wallet_secret) {
        return crypto::KeyDerivation::DeriveEncryptionKey(wallet_secret, kAgentRecordContext);
    }
}

Result<std::string, TransferFailure> AgentRecordCodec::Serialize(const AgentRecord& record) {
    proto::agents::AgentRecord message;
    message.set_version(kRecordFormatVersion);
    message.set_agent_id(record.agent_id);
    message.set_name(record.name);
    message.set_description(record.description);
    message.set_agent_pubkey(record.agent_pubkey);
    message.set_wallet_pubkey(record.wallet_pubkey);
    WritePermissions(record.permissions, message.mutable_permissions());
    message.set_nonce(record.nonce);
    message.set_created_at_ms(ToUnixMillis(record.created_at));
    message.set_updated_at_ms(ToUnixMillis(record.updated_at));
    message.set_status(ToProto(record.status));

    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return Result<std::string, TransferFailure>::Err(
            TransferFailure::Encode("Failed to serialize AgentRecord to protobuf"));
    }
    return Result<std::string, TransferFailure>::Ok(std::move(bytes));
}

Result<AgentRecord, TransferFailure> AgentRecordCodec::Parse(const std::string_view bytes) {
    proto::agents::AgentRecord message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<AgentRecord, TransferFailure>::Err(
            TransferFailure::Decode("Failed to parse AgentRecord from protobuf"));
    }
    if (message.version() != kRecordFormatVersion) {
        return Result<AgentRecord, TransferFailure>::Err(
            TransferFailure::Decode(compat::format("Unsupported agent record version {}", message.version())));
    }

    AgentRecord record;
    record.agent_id = message.agent_id();
    record.name = message.name();
    record.description = message.description();
    record.agent_pubkey = message.agent_pubkey();
    record.wallet_pubkey = message.wallet_pubkey();
    record.permissions = ReadPermissions(message.permissions());
    record.nonce = message.nonce();
    record.created_at = FromUnixMillis(message.created_at_ms());
    record.updated_at = FromUnixMillis(message.updated_at_ms());
    record.status = FromProto(message.status());
    return Result<AgentRecord, TransferFailure>::Ok(std::move(record));
}

Result<std::string, TransferFailure> AgentRecordCodec::Encrypt(
    const AgentRecord& record,
    const crypto::SecureMemoryHandle& wallet_secret) {
    auto serialized = Serialize(record);
    if (serialized.IsErr()) {
        return Result<std::string, TransferFailure>::Err(serialized.UnwrapErr());
    }
    std::string plaintext = std::move(serialized).Unwrap();

    auto key = RecordKey(wallet_secret);
    if (key.IsErr()) {
        (void)crypto::SodiumInterop::SecureWipe(plaintext);
        return Result<std::string, TransferFailure>::Err(key.UnwrapErr());
    }

    auto encrypted = key.Unwrap().WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return crypto::RecordCipher::Encrypt(
            crypto::Encoding::AsBytes(plaintext),
            key_bytes,
            crypto::Encoding::AsBytes(record.agent_id));
    });
    (void)crypto::SodiumInterop::SecureWipe(plaintext);

    if (encrypted.IsErr()) {
        return Result<std::string, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(encrypted.UnwrapErr()));
    }
    return std::move(encrypted).Unwrap();
}

Result<AgentRecord, TransferFailure> AgentRecordCodec::Decrypt(
    const std::string_view agent_id,
    const std::string_view encrypted_record,
    const crypto::SecureMemoryHandle& wallet_secret) {
    auto key = RecordKey(wallet_secret);
    if (key.IsErr()) {
        return Result<AgentRecord, TransferFailure>::Err(key.UnwrapErr());
    }

    auto decrypted = key.Unwrap().WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return crypto::RecordCipher::Decrypt(
            encrypted_record,
            key_bytes,
            crypto::Encoding::AsBytes(agent_id));
    });
    if (decrypted.IsErr()) {
        return Result<AgentRecord, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(decrypted.UnwrapErr()));
    }
    auto plaintext_result = std::move(decrypted).Unwrap();
    if (plaintext_result.IsErr()) {
        return Result<AgentRecord, TransferFailure>::Err(plaintext_result.UnwrapErr());
    }
    std::vector<uint8_t> plaintext = std::move(plaintext_result).Unwrap();

    auto parsed = Parse(std::string_view(reinterpret_cast<const char*>(plaintext.data()), plaintext.size()));
    (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
    if (parsed.IsErr()) {
        return parsed;
    }
    if (parsed.Unwrap().agent_id != agent_id) {
        return Result<AgentRecord, TransferFailure>::Err(
            TransferFailure::Decode("Decrypted record belongs to a different agent"));
    }
    return parsed;
}

Result<std::vector<uint8_t>, TransferFailure> AgentRecordCodec::SealOperation(
    const std::string_view agent_id,
    const AgentOperation& operation,
    const AgentOperationResult& result,
    const std::span<const uint8_t> owner_public_key) {
    proto::agents::AgentOperation message;
    message.set_agent_id(std::string(agent_id));
    message.set_type(operation.type);
    if (operation.amount.has_value()) {
        message.set_amount(*operation.amount);
    }
    if (operation.target.has_value()) {
        message.set_target(*operation.target);
    }
    message.set_nullifier(result.nullifier);
    message.set_strategy(result.strategy);
    message.set_signature(std::string(result.signature.begin(), result.signature.end()));
    message.set_executed_at_ms(ToUnixMillis(result.executed_at));

    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Encode("Failed to serialize AgentOperation to protobuf"));
    }
    auto sealed = crypto::PayloadSealer::Seal(owner_public_key, crypto::Encoding::AsBytes(bytes));
    (void)crypto::SodiumInterop::SecureWipe(bytes);
    return sealed;
}

} // namespace veil::transfer::agents
