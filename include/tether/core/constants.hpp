#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>

namespace tether {

struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t RAW_KEY_SIZE = 32;
    static constexpr size_t RAW_KEY_HEX_LENGTH = RAW_KEY_SIZE * 2;
    static constexpr size_t DEVICE_ID_RANDOM_BYTES = 16;
    static constexpr size_t USER_ID_RANDOM_BYTES = 8;
    static constexpr size_t KEY_CHECK_SIZE = 8;
    static constexpr size_t MESSAGE_ID_RANDOM_BYTES = 12;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_ATTACHMENT_SIZE = 50 * 1024 * 1024;
};

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_PBKDF2 = "PBKDF2";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct KeyDerivationConstants {
    static constexpr uint32_t PBKDF2_ITERATIONS = 100'000;
    static constexpr std::string_view CONVERSATION_SALT = "tether-conversation-key-v1";
    static constexpr std::string_view ATTACHMENT_SALT = "tether-attachment-key-v1";
    static constexpr char KEY_SEPARATOR = '|';
};

struct WireFormatConstants {
    static constexpr std::string_view MESSAGE_PREFIX = "ENC2_";
    static constexpr std::string_view LEGACY_MESSAGE_PREFIX = "ENC_";
    static constexpr char LEGACY_JUNK_SEPARATOR = ':';
    static constexpr std::string_view ATTACHMENT_PREFIX = "ATT1_";
    static constexpr std::string_view QR_V2_PREFIX = "TQ2:";
    static constexpr uint32_t QR_PAYLOAD_VERSION = 2;
};

struct IdentityConstants {
    static constexpr std::string_view DEVICE_ID_PREFIX = "dev_";
    static constexpr std::string_view USER_ID_PREFIX = "TU-";
    static constexpr std::string_view PUBLIC_KEY_PREFIX = "tpub_";
    static constexpr std::string_view PRIVATE_KEY_PREFIX = "tpriv_";
    // 32 symbols, no 0/O/1/I.
    static constexpr std::string_view USER_ID_ALPHABET = "23456789ABCDEFGHJKLMNPQRSTUVWXYZ";

    static constexpr std::string_view KEY_DEVICE_ID = "tether.identity.device_id";
    static constexpr std::string_view KEY_USER_ID = "tether.identity.user_id";
    static constexpr std::string_view KEY_PUBLIC_KEY = "tether.identity.public_key";
    static constexpr std::string_view KEY_PRIVATE_KEY = "tether.identity.private_key";
    static constexpr std::string_view KEY_LOGIN_EMAIL = "tether.identity.login_email";
};

struct InviteConstants {
    static constexpr std::string_view CODE_PREFIX = "INV-";
    static constexpr size_t CODE_SYMBOLS = 10;
    static constexpr std::string_view GROUP_ID_PREFIX = "grp_";
    static constexpr std::string_view CONVERSATION_ID_PREFIX = "conv_";
    static constexpr size_t GROUP_ID_RANDOM_BYTES = 8;
    static constexpr uint32_t MIN_GROUP_MEMBERS = 2;
    static constexpr uint32_t MAX_GROUP_MEMBERS = 50;
    static constexpr size_t MAX_GROUP_NAME_LENGTH = 120;
    static constexpr std::chrono::hours DEFAULT_INVITE_TTL{24};
    static constexpr std::string_view KEY_CURRENT_INVITE = "tether.invite.current";
};

struct MessagingConstants {
    static constexpr std::string_view MESSAGE_ID_PREFIX = "msg_";
    static constexpr uint32_t MAX_AUTO_DELETE_MINUTES = 7 * 24 * 60;
};

struct LedgerConstants {
    static constexpr std::string_view KEY_LEDGER_STATE = "tether.ledger.state";
    static constexpr std::string_view CONVERSATION_KEY_PREFIX = "tether.ledger.conversation.";
    static constexpr std::string_view ATTACHMENT_PAYLOAD_PREFIX = "tether.attachment.";
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AES_GCM_TAG_MISMATCH = "Authentication tag verification failed";
    static constexpr std::string_view ENVELOPE_TOO_SMALL = "Envelope shorter than nonce and tag";
    static constexpr std::string_view UNKNOWN_ENVELOPE_TAG = "Envelope carries no known format tag";
    static constexpr std::string_view CONTACT_TOMBSTONED = "Contact was deleted and cannot be re-added";
};

}
