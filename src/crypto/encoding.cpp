#include "veil/crypto/encoding.hpp"
#include "veil/core/constants.hpp"

#include <sodium.h>

namespace veil::transfer::crypto {

std::string Encoding::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

std::string Encoding::ToPrefixedHex(std::span<const uint8_t> data) {
    return std::string(kHexPrefix) + ToHex(data);
}

std::string_view Encoding::StripHexPrefix(std::string_view hex) noexcept {
    if (hex.size() >= kHexPrefix.size() &&
        (hex.substr(0, kHexPrefix.size()) == kHexPrefix || hex.substr(0, kHexPrefix.size()) == "0X")) {
        hex.remove_prefix(kHexPrefix.size());
    }
    return hex;
}

Result<std::vector<uint8_t>, TransferFailure> Encoding::FromHex(std::string_view hex) {
    hex = StripHexPrefix(hex);
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Decode("Hex string has odd length"));
    }
    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &decoded_len, &end) != 0 ||
        decoded_len != bytes.size() || end != hex.data() + hex.size()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Decode("Invalid hex string"));
    }
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(bytes));
}

std::string Encoding::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_encoded_len(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.pop_back();
    return encoded;
}

Result<std::vector<uint8_t>, TransferFailure> Encoding::FromBase64(std::string_view encoded) {
    std::vector<uint8_t> bytes(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(bytes.data(), bytes.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Decode("Invalid base64 payload"));
    }
    bytes.resize(decoded_len);
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(bytes));
}

} // namespace veil::transfer::crypto
