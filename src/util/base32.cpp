#include <crock/base32.hpp>
#include <cctype>
#include <cstdio>

namespace crock::base32 {

const char kAlphabet[33] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

namespace {

constexpr int8_t kInvalid = -1;
constexpr int8_t kSkip = -2;

struct DecodeTable {
    std::array<int8_t, 256> value;

    DecodeTable() {
        value.fill(kInvalid);
        for (int i = 0; i < 32; ++i) {
            unsigned char c = static_cast<unsigned char>(kAlphabet[i]);
            value[c] = static_cast<int8_t>(i);
            value[std::tolower(c)] = static_cast<int8_t>(i);
        }
        // Ambiguous characters
        value['I'] = value['i'] = 1;
        value['L'] = value['l'] = 1;
        value['O'] = value['o'] = 0;
        value['-'] = kSkip;
    }
};

// Built once on first use, read-only afterwards.
const DecodeTable& decode_table() {
    static const DecodeTable table;
    return table;
}

std::string describe_char(unsigned char c) {
    if (std::isprint(c)) {
        return std::string("'") + static_cast<char>(c) + "'";
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
    return buf;
}

} // namespace

std::string encode(const Bytes16& bytes) {
    std::string out;
    out.reserve(kEncodedLength);

    uint32_t acc = 0;
    int bits = 0;
    for (uint8_t b : bytes) {
        acc = (acc << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out += kAlphabet[(acc >> bits) & 0x1F];
        }
    }
    if (bits > 0) {
        out += kAlphabet[(acc << (5 - bits)) & 0x1F];
    }
    return out;
}

Result<std::string> encode(const uint8_t* data, size_t len) {
    if (data == nullptr || len != kPayloadBytes) {
        return CrockError(CrockError::WrongByteCount,
            "input must be exactly 16 bytes, got " + std::to_string(data ? len : 0));
    }
    Bytes16 bytes;
    for (size_t i = 0; i < kPayloadBytes; ++i) bytes[i] = data[i];
    return Result<std::string>::ok(encode(bytes));
}

Result<Bytes16> decode(std::string_view text) {
    const auto& table = decode_table();

    Bytes16 out{};
    size_t symbols = 0;
    size_t produced = 0;
    uint32_t acc = 0;
    int bits = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        int8_t v = table.value[c];
        if (v == kSkip) continue;
        if (v == kInvalid) {
            return CrockError(CrockError::Decode,
                "invalid symbol " + describe_char(c) + " at offset " + std::to_string(i),
                "Crockford Base32 uses 0-9 and A-Z without U; I, L and O are read as 1, 1 and 0");
        }
        ++symbols;
        acc = (acc << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            if (produced < kPayloadBytes) {
                out[produced] = static_cast<uint8_t>(acc >> bits);
            }
            ++produced;
        }
    }

    if (symbols != kEncodedLength && produced == kPayloadBytes) {
        // 27 symbols still fill 16 whole bytes; report the symbols instead
        return CrockError(CrockError::InvalidLength,
            "expected 26 symbols, got " + std::to_string(symbols),
            "a 128-bit value is 26 symbols and decodes to 16 bytes");
    }
    if (symbols != kEncodedLength) {
        return CrockError(CrockError::InvalidLength,
            "expected 16 bytes, got " + std::to_string(produced),
            "a 128-bit value is 26 symbols, input has " + std::to_string(symbols));
    }

    // 26 symbols carry 130 bits; the final 2 must be zero.
    if ((acc & ((1u << bits) - 1)) != 0) {
        return CrockError(CrockError::Decode,
            "non-zero trailing bits in final symbol",
            "the last symbol of a canonical encoding is a multiple of 4");
    }

    return Result<Bytes16>::ok(out);
}

bool is_valid(std::string_view text) {
    return decode(text).is_ok();
}

std::string format_grouped(std::string_view canonical, size_t group) {
    if (group == 0 || canonical.size() <= group) {
        return std::string(canonical);
    }
    std::string out;
    out.reserve(canonical.size() + canonical.size() / group);
    for (size_t i = 0; i < canonical.size(); ++i) {
        if (i > 0 && i % group == 0) out += '-';
        out += canonical[i];
    }
    return out;
}

} // namespace crock::base32
