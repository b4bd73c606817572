#pragma once
#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
namespace bbs::signatures::utilities {
class Encoding {
public:
    /// UTF-8 view of `text` as bytes. No copy, no terminator.
    [[nodiscard]] static std::span<const uint8_t> AsBytes(std::string_view text) noexcept;

    /// Standard base64 with padding.
    [[nodiscard]] static std::string EncodeBase64(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, BbsFailure> DecodeBase64(std::string_view encoded);
private:
    Encoding() = delete;
};
}
