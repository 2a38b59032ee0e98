#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace veil::transfer::crypto {

/**
 * @brief Hex and base64 codecs backed by libsodium's constant-time helpers
 *
 * Hex output is lowercase. Base64 uses the standard alphabet with padding.
 */
class Encoding {
public:
    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> data);

    /**
     * @brief Lowercase hex with a leading "0x"
     */
    [[nodiscard]] static std::string ToPrefixedHex(std::span<const uint8_t> data);

    /**
     * @brief Decode hex, accepting an optional "0x" prefix and either case
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> FromHex(std::string_view hex);

    [[nodiscard]] static std::string ToBase64(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> FromBase64(std::string_view encoded);

    [[nodiscard]] static std::string_view StripHexPrefix(std::string_view hex) noexcept;

    [[nodiscard]] static std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

private:
    Encoding() = delete;
};

} // namespace veil::transfer::crypto
