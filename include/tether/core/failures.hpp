#pragma once
#include <string>
#include <string_view>
#include <optional>

namespace tether {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation,
    EncodingFailed
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
};

enum class TetherFailureType {
    Generic,
    InvalidInput,
    InvalidKeyFormat,
    DeriveKey,
    Encode,
    Decode,
    DecryptionFailed,
    InvalidFormat,
    Expired,
    AlreadyUsed,
    AlreadyJoined,
    GroupFull,
    SelfPairingRejected,
    ContactWasDeleted,
    NotFound,
    NotPermitted,
    Storage,
    Backend
};

/// Narrows a DecryptionFailed failure where the primitive can tell the cases apart.
enum class DecryptionFailureReason {
    AuthenticationFailed,
    WrongKey,
    CorruptCiphertext,
    Malformed,
    UnsupportedFormat
};

class TetherFailure {
public:
    TetherFailureType type;
    std::string message;
    std::optional<DecryptionFailureReason> reason;

    TetherFailure(const TetherFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static TetherFailure Generic(std::string msg) {
        return {TetherFailureType::Generic, std::move(msg)};
    }
    static TetherFailure InvalidInput(std::string msg) {
        return {TetherFailureType::InvalidInput, std::move(msg)};
    }
    static TetherFailure InvalidKeyFormat(std::string msg) {
        return {TetherFailureType::InvalidKeyFormat, std::move(msg)};
    }
    static TetherFailure DeriveKey(std::string msg) {
        return {TetherFailureType::DeriveKey, std::move(msg)};
    }
    static TetherFailure Encode(std::string msg) {
        return {TetherFailureType::Encode, std::move(msg)};
    }
    static TetherFailure Decode(std::string msg) {
        return {TetherFailureType::Decode, std::move(msg)};
    }
    static TetherFailure DecryptionFailed(const DecryptionFailureReason why, std::string msg) {
        TetherFailure failure(TetherFailureType::DecryptionFailed, std::move(msg));
        failure.reason = why;
        return failure;
    }
    static TetherFailure InvalidFormat(std::string msg) {
        return {TetherFailureType::InvalidFormat, std::move(msg)};
    }
    static TetherFailure Expired(std::string msg) {
        return {TetherFailureType::Expired, std::move(msg)};
    }
    static TetherFailure AlreadyUsed(std::string msg) {
        return {TetherFailureType::AlreadyUsed, std::move(msg)};
    }
    static TetherFailure AlreadyJoined(std::string msg) {
        return {TetherFailureType::AlreadyJoined, std::move(msg)};
    }
    static TetherFailure GroupFull(std::string msg) {
        return {TetherFailureType::GroupFull, std::move(msg)};
    }
    static TetherFailure SelfPairingRejected(std::string msg) {
        return {TetherFailureType::SelfPairingRejected, std::move(msg)};
    }
    static TetherFailure ContactWasDeleted(std::string msg) {
        return {TetherFailureType::ContactWasDeleted, std::move(msg)};
    }
    static TetherFailure NotFound(std::string msg) {
        return {TetherFailureType::NotFound, std::move(msg)};
    }
    static TetherFailure NotPermitted(std::string msg) {
        return {TetherFailureType::NotPermitted, std::move(msg)};
    }
    static TetherFailure Storage(std::string msg) {
        return {TetherFailureType::Storage, std::move(msg)};
    }
    static TetherFailure Backend(std::string msg) {
        return {TetherFailureType::Backend, std::move(msg)};
    }
    static TetherFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }

    [[nodiscard]] bool Is(const TetherFailureType t) const noexcept { return type == t; }

    /// "Expired: invite INV-... expired" style rendering for diagnostics.
    [[nodiscard]] std::string ToString() const;
};

[[nodiscard]] std::string_view FailureTypeName(TetherFailureType type) noexcept;

}
