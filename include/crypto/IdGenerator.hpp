#pragma once

#include "crypto/random.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sodium.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace es::crypto {

// ---------- Alphabet: Crockford Base32 (no I, L, O, U) – filesystem safe
// 32 symbols => each char encodes 5 bits; 128-bit payload => 26 chars
static inline constexpr char kBase32Crockford[] =
    "0123456789ABCDEFGHJKMNPQRSTVWXYZ"; // [0..31]

inline std::string b32_crockford_encode(const uint8_t* data, const size_t len) {
    if (len == 0) return {};
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            const uint8_t idx = (buffer >> bits) & 0x1F;
            out.push_back(kBase32Crockford[idx]);
        }
    }
    if (bits > 0) {
        const uint8_t idx = (buffer << (5 - bits)) & 0x1F;
        out.push_back(kBase32Crockford[idx]);
    }
    return out;
}

struct IdOptions {
    // Literal prefix, e.g. "JOB". Empty => body only.
    std::string prefix;

    // 16 bytes => 128-bit => 26 chars.
    size_t random_bytes = 16;

    char separator = '_';
};

class IdGenerator {
public:
    explicit IdGenerator(IdOptions opt) : options_(std::move(opt)) {
        ensure_sodium_init();
        if (options_.random_bytes == 0) throw std::invalid_argument("random_bytes must be > 0");
        if (options_.separator == ' ' || options_.separator == '\0' || options_.separator == '\n')
            throw std::invalid_argument("bad separator");
        if (std::ranges::any_of(options_.prefix, [](const unsigned char c) { return !std::isalnum(c); }))
            throw std::invalid_argument("id prefix must be alphanumeric");
    }

    // "<prefix><sep><body>", body is Crockford Base32 of `random_bytes` of secure randomness.
    [[nodiscard]] std::string generate() const {
        std::vector<uint8_t> buf(options_.random_bytes);
        randombytes_buf(buf.data(), buf.size());
        const auto body = b32_crockford_encode(buf.data(), buf.size());

        if (options_.prefix.empty()) return body;

        std::string id;
        id.reserve(options_.prefix.size() + 1 + body.size());
        id.append(options_.prefix);
        id.push_back(options_.separator);
        id.append(body);
        return id;
    }

    [[nodiscard]] const IdOptions& options() const { return options_; }

private:
    IdOptions options_;
};

}
