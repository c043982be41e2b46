#include "tether/core/failures.hpp"
#include <fmt/core.h>

namespace tether {

namespace {
    std::string_view ReasonName(const DecryptionFailureReason reason) noexcept {
        switch (reason) {
            case DecryptionFailureReason::AuthenticationFailed: return "authentication-failed";
            case DecryptionFailureReason::WrongKey: return "wrong-key";
            case DecryptionFailureReason::CorruptCiphertext: return "corrupt-ciphertext";
            case DecryptionFailureReason::Malformed: return "malformed";
            case DecryptionFailureReason::UnsupportedFormat: return "unsupported-format";
        }
        return "unknown";
    }
}

std::string_view FailureTypeName(const TetherFailureType type) noexcept {
    switch (type) {
        case TetherFailureType::Generic: return "Generic";
        case TetherFailureType::InvalidInput: return "InvalidInput";
        case TetherFailureType::InvalidKeyFormat: return "InvalidKeyFormat";
        case TetherFailureType::DeriveKey: return "DeriveKey";
        case TetherFailureType::Encode: return "Encode";
        case TetherFailureType::Decode: return "Decode";
        case TetherFailureType::DecryptionFailed: return "DecryptionFailed";
        case TetherFailureType::InvalidFormat: return "InvalidFormat";
        case TetherFailureType::Expired: return "Expired";
        case TetherFailureType::AlreadyUsed: return "AlreadyUsed";
        case TetherFailureType::AlreadyJoined: return "AlreadyJoined";
        case TetherFailureType::GroupFull: return "GroupFull";
        case TetherFailureType::SelfPairingRejected: return "SelfPairingRejected";
        case TetherFailureType::ContactWasDeleted: return "ContactWasDeleted";
        case TetherFailureType::NotFound: return "NotFound";
        case TetherFailureType::NotPermitted: return "NotPermitted";
        case TetherFailureType::Storage: return "Storage";
        case TetherFailureType::Backend: return "Backend";
    }
    return "Unknown";
}

std::string TetherFailure::ToString() const {
    if (reason.has_value()) {
        return fmt::format("{}({}): {}", FailureTypeName(type), ReasonName(*reason), message);
    }
    return fmt::format("{}: {}", FailureTypeName(type), message);
}

}
