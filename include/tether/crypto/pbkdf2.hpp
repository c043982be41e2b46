#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace tether::crypto {

/**
 * PBKDF2-HMAC-SHA256 via the OpenSSL 3 EVP_KDF interface.
 */
class Pbkdf2 {
public:
    static Result<Unit, TetherFailure> DeriveKey(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        std::span<uint8_t> output);

    static Result<std::vector<uint8_t>, TetherFailure> DeriveKeyBytes(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        size_t output_size);

    static constexpr size_t MAX_OUTPUT_LEN = 1024;

    Pbkdf2() = delete;
};

}
