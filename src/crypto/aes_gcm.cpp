#include "tether/crypto/aes_gcm.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/core.h>
#include <memory>

namespace tether::crypto {

using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    Result<Unit, TetherFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::InvalidInput(
                    fmt::format("AES-256-GCM key must be {} bytes, got {}",
                                Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::InvalidInput(
                    fmt::format("AES-GCM nonce must be {} bytes, got {}",
                                Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, TetherFailure>::Ok(unit);
    }

    void Wipe(std::vector<uint8_t>& buffer) {
        auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void)wiped;
    }

    Result<std::vector<uint8_t>, TetherFailure> OpenSSLFailure(std::string_view step) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::Generic(fmt::format("{}: {}", step, GetOpenSSLError())));
    }
}

Result<std::vector<uint8_t>, TetherFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(valid).UnwrapErr());
    }

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSSLFailure("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set nonce length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenSSLFailure("Failed to add associated data");
        }
    }

    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, TetherFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, TetherFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(
                DecryptionFailureReason::Malformed,
                fmt::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                            ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }

    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    const std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSSLFailure("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set nonce length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenSSLFailure("Failed to add associated data");
        }
    }

    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                            tag.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Failed to set authentication tag");
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(
                DecryptionFailureReason::AuthenticationFailed,
                std::string(ErrorMessages::AES_GCM_TAG_MISMATCH)));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, TetherFailure>::Ok(std::move(output));
}

}
