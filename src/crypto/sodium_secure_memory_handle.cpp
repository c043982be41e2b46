#include "tether/crypto/sodium_secure_memory_handle.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <utility>

namespace tether::crypto {

void SecureMemoryHandle::SecureFree::operator()(uint8_t* ptr) const noexcept {
    SodiumInterop::FreeSecure(ptr);
}

SecureMemoryHandle::SecureMemoryHandle(uint8_t* ptr, const size_t size) noexcept
    : bytes_(ptr)
    , size_(size) {
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : bytes_(std::move(other.bytes_))
    , size_(std::exchange(other.size_, 0)) {
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        bytes_ = std::move(other.bytes_);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

SodiumFailure SecureMemoryHandle::DisposedFailure() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Key material cannot be empty"));
    }

    auto* region = static_cast<uint8_t*>(SodiumInterop::AllocateSecure(size));
    if (region == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                fmt::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(region, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto allocated = Allocate(data.size());
    if (allocated.IsErr()) {
        return allocated;
    }
    if (auto written = allocated.Unwrap().Write(data); written.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(std::move(written).UnwrapErr());
    }
    return allocated;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(DisposedFailure());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("{} (data: {}, buffer: {})", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }
    uint8_t* const region = bytes_.get();
    std::copy(data.begin(), data.end(), region);
    std::fill(region + data.size(), region + size_, uint8_t{0});
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::CopyOut() const {
    return WithReadAccess([](std::span<const uint8_t> bytes) {
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    });
}

}
