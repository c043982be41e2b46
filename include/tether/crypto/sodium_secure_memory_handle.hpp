#pragma once

#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <vector>

namespace tether::crypto {

/**
 * @brief Move-only owner of key bytes in sodium_malloc'd memory
 *
 * Guard pages around the region, locked out of swap, zeroed on free.
 * Derived conversation and attachment keys live in one of these for as
 * long as they are cached; callers reach the bytes through WithReadAccess
 * so no copy outlives the call.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocate exactly data.size() bytes and copy data in.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    SecureMemoryHandle() noexcept = default;

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    /// Copies data in and zero-fills any remaining bytes.
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// Unguarded copy of the whole region. The caller wipes it.
    [[nodiscard]] Result<std::vector<uint8_t>, SodiumFailure> CopyOut() const;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(DisposedFailure());
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(std::span<const uint8_t>(bytes_.get(), size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return bytes_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    struct SecureFree {
        void operator()(uint8_t* ptr) const noexcept;
    };

    SecureMemoryHandle(uint8_t* ptr, size_t size) noexcept;

    static SodiumFailure DisposedFailure();

    std::unique_ptr<uint8_t, SecureFree> bytes_;
    size_t size_ = 0;
};

}
