#pragma once

#include <crock/base32.hpp>
#include <crock/result.hpp>
#include <crock/uuid.hpp>
#include <crock/uuid_traits.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace crock {

// A 128-bit identifier whose text form is Crockford Base32.
//
// Values are immutable. Equality and hashing are over the raw bytes;
// ordering comparisons are deliberately not provided.
class CrockfordUuid {
public:
    // The three accepted input shapes.
    using Input = std::variant<std::string, std::vector<uint8_t>, Uuid>;

    static Result<CrockfordUuid> from_string(std::string_view text);
    static Result<CrockfordUuid> from_bytes(const uint8_t* data, size_t len);
    static Result<CrockfordUuid> from_bytes(const std::vector<uint8_t>& data);
    static CrockfordUuid from_bytes(const Bytes16& bytes);
    static Result<CrockfordUuid> from_input(const Input& input);

    template<typename T>
    static CrockfordUuid from_uuid(const T& foreign) {
        return CrockfordUuid(UuidTraits<T>::to_bytes(foreign));
    }

    static CrockfordUuid generate_v4();
    static CrockfordUuid generate_v7();
    static CrockfordUuid generate_v7_at(uint64_t unix_ms);

    std::string to_string() const;
    Bytes16 to_bytes() const { return bytes_; }
    Uuid uuid() const { return Uuid{bytes_}; }

    template<typename T>
    T to_uuid() const {
        return UuidTraits<T>::from_bytes(bytes_);
    }

    // CrockfordUuid('<canonical>')
    std::string repr() const;

    int version() const;
    // Embedded Unix milliseconds, only for version 7 values.
    std::optional<uint64_t> unix_ts_ms() const;

    size_t hash() const;

    bool operator==(const CrockfordUuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const CrockfordUuid& other) const { return bytes_ != other.bytes_; }

    bool operator<(const CrockfordUuid&) const = delete;
    bool operator<=(const CrockfordUuid&) const = delete;
    bool operator>(const CrockfordUuid&) const = delete;
    bool operator>=(const CrockfordUuid&) const = delete;

private:
    explicit CrockfordUuid(const Bytes16& bytes) : bytes_(bytes) {}

    Bytes16 bytes_;
};

std::ostream& operator<<(std::ostream& os, const CrockfordUuid& id);

} // namespace crock

namespace std {

template<>
struct hash<crock::CrockfordUuid> {
    size_t operator()(const crock::CrockfordUuid& id) const { return id.hash(); }
};

} // namespace std
