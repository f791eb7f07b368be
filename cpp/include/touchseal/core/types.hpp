#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace touchseal::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferMut b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    // View over character data (std::string, literals). Caller keeps the storage alive.
    [[nodiscard]] inline BufferView view_of(const char* s, std::size_t n) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s), static_cast<u32>(n)};
    }

    template <typename Container>
    [[nodiscard]] BufferView view_of(const Container& c) noexcept {
        return BufferView{reinterpret_cast<const u8*>(c.data()), static_cast<u32>(c.size())};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);

} // namespace touchseal::core
