#include "tether/crypto/pbkdf2.hpp"
#include "tether/core/constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <fmt/core.h>
#include <memory>

namespace tether::crypto {

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, TetherFailure> Pbkdf2::DeriveKey(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    const uint32_t iterations,
    std::span<uint8_t> output) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput(
                fmt::format("PBKDF2 output size must be in [1, {}], got {}",
                            MAX_OUTPUT_LEN, output.size())));
    }
    if (password.empty()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput("PBKDF2 password cannot be empty"));
    }
    if (iterations == 0) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput("PBKDF2 iteration count cannot be zero"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_PBKDF2.data(), nullptr);
    if (!kdf) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::DeriveKey("Failed to fetch PBKDF2 algorithm"));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::DeriveKey("Failed to create PBKDF2 context"));
    }

    unsigned int iter = iterations;
    OSSL_PARAM params[5];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);
    params[1] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_PASSWORD, const_cast<uint8_t*>(password.data()), password.size());
    params[2] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    params[3] = OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iter);
    params[4] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::DeriveKey("PBKDF2 key derivation failed"));
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, TetherFailure> Pbkdf2::DeriveKeyBytes(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    const uint32_t iterations,
    const size_t output_size) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(password, salt, iterations, output);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, TetherFailure>::Ok(std::move(output));
}

}
