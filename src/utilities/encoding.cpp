#include "bbs/utilities/encoding.hpp"
#include "bbs/core/constants.hpp"

#include <sodium.h>

namespace bbs::signatures::utilities {

namespace {
constexpr int BASE64_VARIANT = sodium_base64_VARIANT_ORIGINAL;
}

std::span<const uint8_t> Encoding::AsBytes(const std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

std::string Encoding::EncodeBase64(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    const size_t encoded_length = sodium_base64_encoded_len(data.size(), BASE64_VARIANT);
    std::string encoded(encoded_length, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), BASE64_VARIANT);
    encoded.resize(encoded_length - 1);
    return encoded;
}

Result<std::vector<uint8_t>, BbsFailure> Encoding::DecodeBase64(const std::string_view encoded) {
    if (encoded.empty()) {
        return Result<std::vector<uint8_t>, BbsFailure>::Ok(std::vector<uint8_t>{});
    }

    std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    size_t decoded_length = 0;
    const char* encoded_end = nullptr;
    const int rc = sodium_base642bin(
        decoded.data(), decoded.size(),
        encoded.data(), encoded.size(),
        nullptr, &decoded_length, &encoded_end,
        BASE64_VARIANT);
    if (rc != SodiumConstants::SUCCESS || encoded_end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, BbsFailure>::Err(
            BbsFailure::InvalidInput(std::string(ErrorMessages::INVALID_BASE64)));
    }
    decoded.resize(decoded_length);
    return Result<std::vector<uint8_t>, BbsFailure>::Ok(std::move(decoded));
}

} // namespace bbs::signatures::utilities
