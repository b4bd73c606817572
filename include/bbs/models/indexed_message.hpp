#pragma once
#include <string>
#include <cstdint>
namespace bbs::signatures::models {
/// A message and its position within the full signed message vector
struct IndexedMessage {
    std::string message;
    uint32_t index;
};
}
