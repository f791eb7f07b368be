#include "touchseal/codec/ssh_wire.hpp"

namespace touchseal::codec {
    namespace {
        [[nodiscard]] touchseal::core::Status truncated() noexcept {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Format);
        }

        [[nodiscard]] bool reader_ok(const SshReader* r) noexcept {
            return r != nullptr && touchseal::core::buffer_ok(r->in) && r->off <= r->in.len;
        }
    } // namespace

    touchseal::core::Status ssh_read_u8(SshReader* r, u8* out) noexcept {
        if (!reader_ok(r) || out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        if (r->in.len - r->off < 1) {
            return truncated();
        }
        *out = r->in.data[r->off];
        r->off += 1;
        return touchseal::core::ok_status();
    }

    touchseal::core::Status ssh_read_u32(SshReader* r, u32* out) noexcept {
        if (!reader_ok(r) || out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        if (r->in.len - r->off < 4) {
            return truncated();
        }
        const u8* p = r->in.data + r->off;
        *out = (static_cast<u32>(p[0]) << 24) |
               (static_cast<u32>(p[1]) << 16) |
               (static_cast<u32>(p[2]) << 8) |
               (static_cast<u32>(p[3]) << 0);
        r->off += 4;
        return touchseal::core::ok_status();
    }

    touchseal::core::Status ssh_read_bytes(SshReader* r, u32 n, BufferView* out) noexcept {
        if (!reader_ok(r) || out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        if (r->in.len - r->off < n) {
            return truncated();
        }
        *out = BufferView{r->in.data + r->off, n};
        r->off += n;
        return touchseal::core::ok_status();
    }

    touchseal::core::Status ssh_read_string(SshReader* r, BufferView* out) noexcept {
        if (!reader_ok(r) || out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        const u32 start = r->off;
        u32 len = 0;
        touchseal::core::Status s = ssh_read_u32(r, &len);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }
        s = ssh_read_bytes(r, len, out);
        if (!touchseal::core::is_ok(s)) {
            r->off = start;
            return s;
        }
        return touchseal::core::ok_status();
    }
} // namespace touchseal::codec
