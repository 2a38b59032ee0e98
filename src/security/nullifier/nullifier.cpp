#include "veil/security/nullifier/nullifier.hpp"
#include "veil/crypto/encoding.hpp"
#include "veil/crypto/sha256.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/core/constants.hpp"

#include <algorithm>

namespace veil::transfer::security {

using crypto::Encoding;
using crypto::SodiumInterop;

std::string Nullifier::Generate(
    const std::string_view nonce,
    const std::string_view proof_type,
    const std::optional<std::string_view> extra) {
    crypto::Sha256 hasher;
    hasher.UpdateField(kNullifierDomain)
          .UpdateField(nonce)
          .UpdateField(proof_type);
    if (extra.has_value()) {
        hasher.UpdateField("extra").UpdateField(*extra);
    }
    return Encoding::ToHex(hasher.Final());
}

Result<bool, TransferFailure> Nullifier::Verify(
    const std::string_view nullifier,
    const std::string_view nonce,
    const std::string_view proof_type,
    const std::optional<std::string_view> extra) {
    const std::string expected = Generate(nonce, proof_type, extra);
    auto equal = SodiumInterop::ConstantTimeEquals(
        Encoding::AsBytes(nullifier),
        Encoding::AsBytes(expected));
    if (equal.IsErr()) {
        return Result<bool, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(equal.UnwrapErr()));
    }
    return Result<bool, TransferFailure>::Ok(equal.Unwrap());
}

std::string Nullifier::GenerateSecureNonce() {
    return Encoding::ToHex(SodiumInterop::GetRandomBytes(kNonceBytes));
}

bool Nullifier::IsWellFormed(const std::string_view nullifier) noexcept {
    return nullifier.size() == kHash256HexChars &&
           std::all_of(nullifier.begin(), nullifier.end(), [](const char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

} // namespace veil::transfer::security
