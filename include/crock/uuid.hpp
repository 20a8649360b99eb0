#pragma once

#include <crock/result.hpp>
#include <crock/uuid_traits.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace crock {

// RFC 4122 UUID in its usual hyphenated hex form.
struct Uuid {
    Bytes16 bytes{};

    static Uuid nil();
    static Result<Uuid> from_string(const std::string& s);
    std::string to_string() const;

    bool is_nil() const;
    int version() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

template<>
struct UuidTraits<Uuid> {
    static Bytes16 to_bytes(const Uuid& u) { return u.bytes; }
    static Uuid from_bytes(const Bytes16& b) { return Uuid{b}; }
};

} // namespace crock
