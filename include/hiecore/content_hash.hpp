#pragma once

#include <hiecore/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace hiecore {

// Streaming SHA-256. A file's digest is a freshness token for cached
// artifacts, never an identity.
class ContentHash {
public:
    ContentHash();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Lowercase hex digest. The hasher is spent afterwards.
    std::string finish();

    static std::string hash_bytes(const std::string& bytes);
    static Result<std::string> hash_file(const std::filesystem::path& path);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> block_;
    size_t block_fill_ = 0;
    uint64_t length_ = 0;
};

} // namespace hiecore
