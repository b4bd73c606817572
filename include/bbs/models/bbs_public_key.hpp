#pragma once
#include <vector>
#include <cstdint>
#include <utility>
namespace bbs::signatures::models {
/// BBS+ public key derived from a BLS public key for a fixed message count.
class BbsPublicKey {
public:
    BbsPublicKey(std::vector<uint8_t> key, const uint32_t message_count)
        : key_(std::move(key))
        , message_count_(message_count) {}
    [[nodiscard]] const std::vector<uint8_t>& GetKey() const noexcept {
        return key_;
    }
    [[nodiscard]] uint32_t GetMessageCount() const noexcept {
        return message_count_;
    }
    [[nodiscard]] std::vector<uint8_t> TakeKey() && {
        return std::move(key_);
    }
private:
    std::vector<uint8_t> key_;
    uint32_t message_count_;
};
}
