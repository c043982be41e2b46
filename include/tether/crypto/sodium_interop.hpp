#pragma once

#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tether::crypto {

enum class Base64Variant {
    Standard,
    UrlSafeNoPadding
};

/**
 * @brief Thin layer over libsodium
 *
 * Initialization, the CSPRNG, secure wiping, constant-time comparison,
 * guarded allocation and the hex/base64 codecs every wire format in the
 * library is built on.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     *
     * Small buffers are cleared through a volatile pointer, larger ones
     * with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::string& buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return true when sizes and contents match
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /// Fill a fresh buffer from the CSPRNG. Exhaustion aborts inside libsodium.
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // Codecs

    static std::string ToHex(std::span<const uint8_t> data);

    /// Accepts upper or lower case. Fails on odd length or any non-hex character.
    static Result<std::vector<uint8_t>, SodiumFailure> FromHex(std::string_view hex);

    static std::string ToBase64(std::span<const uint8_t> data, Base64Variant variant);

    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(
        std::string_view encoded,
        Base64Variant variant);

    /// BLAKE2b digest of the given length (16..64 bytes).
    static Result<std::vector<uint8_t>, SodiumFailure> GenericHash(
        std::span<const uint8_t> data,
        size_t output_size);

    // Guarded memory, backing SecureMemoryHandle

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static void WipeSmallBuffer(std::span<uint8_t> buffer) noexcept;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
