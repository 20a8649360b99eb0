#include <crock/crockford_uuid.hpp>
#include <crock/log.hpp>
#include <crock/random.hpp>
#include <algorithm>
#include <chrono>
#include <mutex>

namespace crock {

// ---- Construction ----

Result<CrockfordUuid> CrockfordUuid::from_string(std::string_view text) {
    auto decoded = base32::decode(text);
    CROCK_TRY(decoded);
    return Result<CrockfordUuid>::ok(CrockfordUuid(decoded.value()));
}

Result<CrockfordUuid> CrockfordUuid::from_bytes(const uint8_t* data, size_t len) {
    if (data == nullptr || len != base32::kPayloadBytes) {
        return CrockError(CrockError::WrongByteCount,
            "bytes input must be 16 bytes, got " + std::to_string(data ? len : 0));
    }
    Bytes16 b;
    std::copy(data, data + len, b.begin());
    return Result<CrockfordUuid>::ok(CrockfordUuid(b));
}

Result<CrockfordUuid> CrockfordUuid::from_bytes(const std::vector<uint8_t>& data) {
    return from_bytes(data.data(), data.size());
}

CrockfordUuid CrockfordUuid::from_bytes(const Bytes16& bytes) {
    return CrockfordUuid(bytes);
}

Result<CrockfordUuid> CrockfordUuid::from_input(const Input& input) {
    if (auto s = std::get_if<std::string>(&input)) {
        return from_string(*s);
    }
    if (auto b = std::get_if<std::vector<uint8_t>>(&input)) {
        return from_bytes(*b);
    }
    return Result<CrockfordUuid>::ok(from_uuid(std::get<Uuid>(input)));
}

// ---- Generation ----

namespace {

void set_variant(Bytes16& b) {
    // Variant 1: top two bits of byte 8 = 10
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
}

// unix_ts_ms (48 bits) | ver (4) | rand_a (12) | var (2) | rand_b (62)
void set_v7_fields(Bytes16& b, uint64_t unix_ms, uint16_t rand_a) {
    for (int i = 0; i < 6; ++i) {
        b[i] = static_cast<uint8_t>(unix_ms >> (40 - 8 * i));
    }
    b[6] = static_cast<uint8_t>(0x70 | ((rand_a >> 8) & 0x0F));
    b[7] = static_cast<uint8_t>(rand_a & 0xFF);
    set_variant(b);
}

uint64_t now_unix_ms() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

constexpr uint16_t kCounterMax = 0x0FFF;

// Shared by every generate_v7() caller in the process.
struct V7State {
    std::mutex mu;
    uint64_t last_ms = 0;
    uint16_t counter = 0;
};

V7State& v7_state() {
    static V7State state;
    return state;
}

// Fresh counters start in the lower half so a busy millisecond still has
// at least 2048 increments before it has to borrow the next one.
uint16_t seed_counter(const Bytes16& random) {
    return static_cast<uint16_t>(((random[6] << 8) | random[7]) & 0x07FF);
}

} // namespace

CrockfordUuid CrockfordUuid::generate_v4() {
    Bytes16 b;
    fill_random_bytes(b.data(), b.size());
    // Version 4: high nibble of byte 6 = 0100
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
    set_variant(b);
    return CrockfordUuid(b);
}

CrockfordUuid CrockfordUuid::generate_v7() {
    Bytes16 b;
    fill_random_bytes(b.data(), b.size());

    uint64_t ms = now_unix_ms();
    uint16_t counter;
    {
        auto& st = v7_state();
        std::lock_guard<std::mutex> lock(st.mu);
        if (ms > st.last_ms) {
            st.last_ms = ms;
            st.counter = seed_counter(b);
        } else {
            if (ms < st.last_ms) {
                log::debug("system clock moved back %llu ms, keeping v7 order",
                           static_cast<unsigned long long>(st.last_ms - ms));
            }
            if (st.counter >= kCounterMax) {
                ++st.last_ms;
                st.counter = seed_counter(b);
            } else {
                ++st.counter;
            }
        }
        ms = st.last_ms;
        counter = st.counter;
    }

    set_v7_fields(b, ms, counter);
    return CrockfordUuid(b);
}

CrockfordUuid CrockfordUuid::generate_v7_at(uint64_t unix_ms) {
    Bytes16 b;
    fill_random_bytes(b.data(), b.size());
    set_v7_fields(b, unix_ms & 0xFFFFFFFFFFFFULL,
                  static_cast<uint16_t>((b[6] << 8) | b[7]));
    return CrockfordUuid(b);
}

// ---- Views ----

std::string CrockfordUuid::to_string() const {
    return base32::encode(bytes_);
}

std::string CrockfordUuid::repr() const {
    return "CrockfordUuid('" + to_string() + "')";
}

int CrockfordUuid::version() const {
    return bytes_[6] >> 4;
}

std::optional<uint64_t> CrockfordUuid::unix_ts_ms() const {
    if (version() != 7) return std::nullopt;
    uint64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes_[i];
    }
    return ms;
}

// FNV-1a, 64-bit
size_t CrockfordUuid::hash() const {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (uint8_t b : bytes_) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    return static_cast<size_t>(h);
}

std::ostream& operator<<(std::ostream& os, const CrockfordUuid& id) {
    return os << id.to_string();
}

} // namespace crock
