#include "tether/crypto/sodium_interop.hpp"

#include <fmt/core.h>

namespace tether::crypto {

namespace {
    int ToSodiumVariant(const Base64Variant variant) noexcept {
        return variant == Base64Variant::Standard
            ? sodium_base64_VARIANT_ORIGINAL
            : sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    }
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        WipeSmallBuffer(buffer);
    } else {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& buffer) {
    auto result = SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(buffer.data()), buffer.size()));
    buffer.clear();
    return result;
}

void SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) noexcept {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Hex string has odd length"));
    }

    std::vector<uint8_t> bin(hex.size() / 2);
    size_t bin_len = 0;
    const char* hex_end = nullptr;
    if (sodium_hex2bin(bin.data(), bin.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &hex_end) != 0 ||
        hex_end != hex.data() + hex.size()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Hex string contains invalid characters"));
    }
    bin.resize(bin_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bin));
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data, const Base64Variant variant) {
    const int sodium_variant = ToSodiumVariant(variant);
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), sodium_variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), sodium_variant);
    // ENCODED_LEN counts the terminating NUL
    encoded.resize(std::char_traits<char>::length(encoded.c_str()));
    return encoded;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(
    std::string_view encoded,
    const Base64Variant variant) {

    std::vector<uint8_t> bin(encoded.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* b64_end = nullptr;
    if (sodium_base642bin(bin.data(), bin.size(), encoded.data(), encoded.size(),
                          nullptr, &bin_len, &b64_end, ToSodiumVariant(variant)) != 0 ||
        b64_end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Input is not valid base64"));
    }
    bin.resize(bin_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bin));
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::GenericHash(
    std::span<const uint8_t> data,
    const size_t output_size) {

    if (output_size < crypto_generichash_BYTES_MIN || output_size > crypto_generichash_BYTES_MAX) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                fmt::format("Generic hash length {} outside [{}, {}]", output_size,
                            crypto_generichash_BYTES_MIN, crypto_generichash_BYTES_MAX)));
    }

    std::vector<uint8_t> digest(output_size);
    if (crypto_generichash(digest.data(), digest.size(), data.data(), data.size(), nullptr, 0) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("crypto_generichash failed"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(digest));
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
