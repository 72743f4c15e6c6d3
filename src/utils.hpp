#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string &data);
std::string sha256_hex_file(const std::filesystem::path& path);

// "12.3 MiB" style rendering used by the meter and the log lines.
std::string format_bytes(uint64_t bytes);

// Incremental SHA-256 over the payload stream.
class Sha256Accumulator {
public:
    Sha256Accumulator();
    ~Sha256Accumulator();
    Sha256Accumulator(const Sha256Accumulator&) = delete;
    Sha256Accumulator& operator=(const Sha256Accumulator&) = delete;

    void update(const char* data, std::size_t size);
    std::string hex_digest();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
