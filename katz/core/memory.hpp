#pragma once

#include "katz/config.hpp"
#include "katz/core/type.hpp"
#include "katz/core/macros.hpp"
#include "katz/core/error.hpp"
#include <cstring>
#include <new>
#include <utility>
#include <memory>
#include <algorithm>

// =============================================================================
// FILE: katz/core/memory.hpp
// BRIEF: Aligned scratch buffers for the SIMD kernels
// =============================================================================

namespace katz::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (KATZ_UNLIKELY(!ptr)) return;
        operator delete[](ptr, std::align_val_t(alignment_));
    }
};

// Zero-initialized, aligned array of arithmetic values.
// Throws OutOfMemoryError rather than returning an empty handle.
template <typename T>
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
KATZ_FORCE_INLINE auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> std::unique_ptr<T[], AlignedDeleter<T>> {
    static_assert(std::is_arithmetic_v<T>,
                  "aligned_alloc: Type must be arithmetic");

    if (KATZ_UNLIKELY(count == 0)) {
        // NOLINTNEXTLINE(modernize-avoid-c-arrays)
        return std::unique_ptr<T[], AlignedDeleter<T>>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = nullptr;
    try {
        raw_ptr = new (std::align_val_t(alignment)) T[count]();
    } catch (const std::bad_alloc&) {
        throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                               std::to_string(count * sizeof(T)) + " bytes");
    }

    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    return std::unique_ptr<T[], AlignedDeleter<T>>(raw_ptr, AlignedDeleter<T>(alignment));
}

template <typename T>
struct AlignedBuffer {
    explicit AlignedBuffer(Size count, std::size_t alignment = DEFAULT_ALIGNMENT)
        : ptr_(aligned_alloc<T>(count, alignment)), count_(count) {}

    ~AlignedBuffer() = default;

    AlignedBuffer(const AlignedBuffer&) = delete;
    auto operator=(const AlignedBuffer&) -> AlignedBuffer& = delete;

    AlignedBuffer(AlignedBuffer&&) noexcept = default;
    auto operator=(AlignedBuffer&&) noexcept -> AlignedBuffer& = default;

    [[nodiscard]] auto array() noexcept -> Array<T> {
        return Array<T>(ptr_.get(), count_);
    }

    [[nodiscard]] auto array() const noexcept -> Array<const T> {
        return Array<const T>(ptr_.get(), count_);
    }

    [[nodiscard]] auto size() const noexcept -> Size { return count_; }

private:
    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    std::unique_ptr<T[], AlignedDeleter<T>> ptr_;
    Size count_;
};

} // namespace katz::memory

namespace katz::algo {

template <typename T>
KATZ_FORCE_INLINE void copy(const T* KATZ_RESTRICT src, T* KATZ_RESTRICT dst, Size n) noexcept {
    if (n == 0) return;
    std::memcpy(dst, src, n * sizeof(T));
}

template <typename T>
KATZ_FORCE_INLINE void fill(T* dst, Size n, T value) noexcept {
    std::fill(dst, dst + n, value);
}

} // namespace katz::algo
