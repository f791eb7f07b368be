#pragma once

#include <string_view>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"

namespace touchseal::codec {
    using u8 = touchseal::core::u8;
    using u32 = touchseal::core::u32;
    using BufferView = touchseal::core::BufferView;

    // Cursor over RFC 4251 wire data (uint32 big-endian, length-prefixed strings).
    // Reads past the end fail with Input/Format and do not move the cursor.
    struct SshReader {
        BufferView in{};
        u32 off{0};
    };

    [[nodiscard]] constexpr bool ssh_reader_done(const SshReader& r) noexcept {
        return r.off == r.in.len;
    }

    touchseal::core::Status ssh_read_u8(SshReader* r, u8* out) noexcept;
    touchseal::core::Status ssh_read_u32(SshReader* r, u32* out) noexcept;
    touchseal::core::Status ssh_read_string(SshReader* r, BufferView* out) noexcept;
    touchseal::core::Status ssh_read_bytes(SshReader* r, u32 n, BufferView* out) noexcept;

    [[nodiscard]] inline std::string_view ssh_as_text(BufferView b) noexcept {
        return std::string_view(reinterpret_cast<const char*>(b.data), b.len);
    }

} // namespace touchseal::codec
