#include <crock/uuid.hpp>

namespace crock {

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Uuid Uuid::nil() {
    return Uuid{};
}

// ---- to_string: xxxxxxxx-xxxx-Mxxx-Nxxx-xxxxxxxxxxxx ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return CrockError(CrockError::Parse,
            "UUID string must be 36 characters, got " + std::to_string(s.size()),
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return CrockError(CrockError::Parse,
            "UUID string has invalid dash positions",
            "Expected dashes at positions 8, 13, 18, 23");
    }

    Uuid u;
    size_t byte_idx = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (s[i] == '-') { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return CrockError(CrockError::Parse,
                "UUID string contains invalid hex character",
                "Invalid char at position " + std::to_string(hi < 0 ? i : i + 1));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

bool Uuid::is_nil() const {
    for (uint8_t b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

int Uuid::version() const {
    return bytes[6] >> 4;
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

} // namespace crock
