#include "veil/crypto/commitment.hpp"
#include "veil/crypto/sodium_interop.hpp"

#include <algorithm>

namespace veil::transfer::crypto {

namespace {
    constexpr char kOrderedTag = 'O';
    constexpr char kNumberTag = 'N';
    constexpr char kSetTag = 'S';

    void AppendLengthPrefixed(std::string& out, std::string_view value) {
        const auto len = static_cast<uint32_t>(value.size());
        out.push_back(static_cast<char>(len >> 24));
        out.push_back(static_cast<char>(len >> 16));
        out.push_back(static_cast<char>(len >> 8));
        out.push_back(static_cast<char>(len));
        out.append(value);
    }
}

CommitmentFields& CommitmentFields::Ordered(const std::string_view value) {
    std::string field(1, kOrderedTag);
    field.append(value);
    encoded_.push_back(std::move(field));
    return *this;
}

CommitmentFields& CommitmentFields::Number(const uint64_t value) {
    std::string field(1, kNumberTag);
    for (int shift = 56; shift >= 0; shift -= 8) {
        field.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
    encoded_.push_back(std::move(field));
    return *this;
}

CommitmentFields& CommitmentFields::Unordered(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    std::string field(1, kSetTag);
    AppendLengthPrefixed(field, std::to_string(values.size()));
    for (const auto& value : values) {
        AppendLengthPrefixed(field, value);
    }
    encoded_.push_back(std::move(field));
    return *this;
}

Hash256 Commitment::HashCommitment(const std::string_view domain, const CommitmentFields& fields) {
    Sha256 hasher;
    hasher.UpdateField(domain);
    for (const auto& field : fields.Encoded()) {
        hasher.UpdateField(field);
    }
    return hasher.Final();
}

Result<bool, TransferFailure> Commitment::VerifyCommitment(
    std::span<const uint8_t> commitment,
    const std::string_view domain,
    const CommitmentFields& fields) {
    const Hash256 expected = HashCommitment(domain, fields);
    auto equal = SodiumInterop::ConstantTimeEquals(commitment, expected);
    if (equal.IsErr()) {
        return Result<bool, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(equal.UnwrapErr()));
    }
    return Result<bool, TransferFailure>::Ok(equal.Unwrap());
}

Hash256 Commitment::GenerateNonce() {
    Hash256 nonce{};
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

} // namespace veil::transfer::crypto
