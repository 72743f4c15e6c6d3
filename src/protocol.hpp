#pragma once
#include <nlohmann/json.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// Wire header: [u64 LE file_size][u64 LE name length][name bytes]
inline constexpr std::size_t kSizeFieldBytes = 8;
inline constexpr std::size_t kFixedHeaderBytes = 2 * kSizeFieldBytes;
inline constexpr std::size_t kMaxFilenameBytes = 4096;

inline constexpr const char* kAnnounceType = "codedrop_announce";
inline constexpr int kAnnounceVersion = 1;

struct TransferHeader {
    uint64_t file_size = 0;
    std::string filename;
};

struct RendezvousAnnouncement {
    std::string passcode;
    std::string filename;
    std::string session_token;
    uint64_t file_size = 0;
    uint16_t transfer_port = 0;
};

void put_u64_le(uint64_t value, unsigned char* out);
uint64_t get_u64_le(const unsigned char* in);

// Throws std::invalid_argument for names that are empty or too long.
std::vector<char> encode_header(const TransferHeader& header);

// Decodes the fixed part; returns {file_size, name_length}. Throws
// std::invalid_argument when name_length is zero or over the limit.
std::pair<uint64_t, uint64_t> decode_fixed_header(const std::array<unsigned char, kFixedHeaderBytes>& bytes);

json make_announcement(const RendezvousAnnouncement& announcement);
// Returns nullopt for anything that is not a well-formed announcement.
std::optional<RendezvousAnnouncement> parse_announcement(const std::string& datagram);
