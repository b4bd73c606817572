#pragma once
#include "bbs/enums/proof_message_type.hpp"
#include <string>
namespace bbs::signatures::models {
struct ProofMessage {
    std::string message;
    enums::ProofMessageType proof_type;
};
}
