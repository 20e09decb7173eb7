#pragma once

#include "katz/config.hpp"
#include "katz/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <concepts>
#include <cassert>
#include <iterator>
#include <span>
#include <vector>

// =============================================================================
// FILE: katz/core/type.hpp
// BRIEF: Unified type system and zero-overhead views
// =============================================================================

namespace katz {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

#if defined(KATZ_USE_FLOAT32)
    using Real = float;
#elif defined(KATZ_USE_FLOAT64)
    using Real = double;
#else
    #error "KATZ: No precision macro defined."
#endif

#if defined(KATZ_USE_INT32)
    using Index = std::int32_t;
#elif defined(KATZ_USE_INT64)
    using Index = std::int64_t;
#else
    #error "KATZ: No index precision selected."
#endif

using Size = std::size_t;

// =============================================================================
// SECTION 2: Array View
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using size_type = Size;
    using difference_type = std::ptrdiff_t;
    using iterator = T*;
    using const_iterator = const T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    // Conversion from non-const to const
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    template <std::size_t Extent = std::dynamic_extent>
    constexpr Array(std::span<T, Extent> span) noexcept
        : ptr(span.data()), len(static_cast<Size>(span.size())) {}

    KATZ_FORCE_INLINE constexpr auto operator[](Index i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i >= 0 && static_cast<Size>(i) < len && "Array index out of bounds");
#endif
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] KATZ_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] KATZ_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] KATZ_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] KATZ_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] KATZ_FORCE_INLINE constexpr auto end() const noexcept -> T* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return ptr + len;
    }

    [[nodiscard]] KATZ_FORCE_INLINE constexpr auto subspan(Index offset, Size count) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(offset >= 0 && static_cast<Size>(offset) + count <= len && "Subspan out of bounds");
#endif
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return Array<T>(ptr + offset, count);
    }

    [[nodiscard]] KATZ_FORCE_INLINE constexpr auto first(Size count) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(count <= len && "Count exceeds array size");
#endif
        return Array<T>(ptr, count);
    }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);
static_assert(std::is_trivially_copyable_v<Array<const Real>>);
static_assert(std::is_standard_layout_v<Array<Real>>);

/// @brief View a std::vector as an Array (no ownership transfer).
template <typename T>
[[nodiscard]] constexpr auto as_array(std::vector<T>& v) noexcept -> Array<T> {
    return Array<T>(v.data(), v.size());
}

template <typename T>
[[nodiscard]] constexpr auto as_array(const std::vector<T>& v) noexcept -> Array<const T> {
    return Array<const T>(v.data(), v.size());
}

} // namespace katz
