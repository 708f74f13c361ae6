#include <hiecore/content_hash.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace hiecore {

namespace {

// FIPS 180-4, section 4.2.2
constexpr uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

constexpr std::array<uint32_t, 8> kInitial = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

} // namespace

ContentHash::ContentHash() : h_(kInitial) {}

void ContentHash::compress(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) {
        w[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16) |
               (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
    }
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<uint32_t, 8> v = h_;
    for (int i = 0; i < 64; ++i) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) +
                      ((e & v[5]) ^ (~e & v[6])) + kRound[i] + w[i];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) +
                      ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
        for (int j = 7; j > 0; --j) v[j] = v[j - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) h_[i] += v[i];
}

void ContentHash::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        size_t take = std::min(len, block_.size() - block_fill_);
        std::memcpy(block_.data() + block_fill_, data, take);
        block_fill_ += take;
        data += take;
        len -= take;
        if (block_fill_ == block_.size()) {
            compress(block_.data());
            block_fill_ = 0;
        }
    }
}

void ContentHash::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::string ContentHash::finish() {
    uint64_t bits = length_ * 8;

    block_[block_fill_++] = 0x80;
    if (block_fill_ > 56) {
        std::fill(block_.begin() + block_fill_, block_.end(), 0);
        compress(block_.data());
        block_fill_ = 0;
    }
    std::fill(block_.begin() + block_fill_, block_.begin() + 56, 0);
    for (int i = 0; i < 8; ++i) {
        block_[56 + i] = static_cast<uint8_t>(bits >> (56 - 8 * i));
    }
    compress(block_.data());
    block_fill_ = 0;

    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(64);
    for (uint32_t word : h_) {
        for (int shift = 28; shift >= 0; shift -= 4) {
            hex += digits[(word >> shift) & 0xf];
        }
    }
    return hex;
}

std::string ContentHash::hash_bytes(const std::string& bytes) {
    ContentHash h;
    h.update(bytes);
    return h.finish();
}

Result<std::string> ContentHash::hash_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return HieError{HieError::IO,
            "cannot open for hashing: " + path.string() + ": " + std::strerror(errno)};
    }

    ContentHash h;
    char buf[16384];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize got = in.gcount();
        if (got > 0) {
            h.update(reinterpret_cast<const uint8_t*>(buf), static_cast<size_t>(got));
        }
    }
    if (in.bad()) {
        return HieError{HieError::IO, "read failed while hashing: " + path.string()};
    }
    return Result<std::string>::ok(h.finish());
}

} // namespace hiecore
