#include "protocol.hpp"

#include <algorithm>
#include <stdexcept>

void put_u64_le(uint64_t value, unsigned char* out) {
    for(std::size_t i = 0; i < kSizeFieldBytes; ++i) {
        out[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFFu);
    }
}

uint64_t get_u64_le(const unsigned char* in) {
    uint64_t value = 0;
    for(std::size_t i = 0; i < kSizeFieldBytes; ++i) {
        value |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return value;
}

std::vector<char> encode_header(const TransferHeader& header) {
    if(header.filename.empty()) {
        throw std::invalid_argument("filename must not be empty");
    }
    if(header.filename.size() > kMaxFilenameBytes) {
        throw std::invalid_argument("filename longer than " + std::to_string(kMaxFilenameBytes) + " bytes");
    }
    std::vector<char> out(kFixedHeaderBytes + header.filename.size());
    auto* raw = reinterpret_cast<unsigned char*>(out.data());
    put_u64_le(header.file_size, raw);
    put_u64_le(header.filename.size(), raw + kSizeFieldBytes);
    std::copy(header.filename.begin(), header.filename.end(), out.begin() + kFixedHeaderBytes);
    return out;
}

std::pair<uint64_t, uint64_t> decode_fixed_header(const std::array<unsigned char, kFixedHeaderBytes>& bytes) {
    uint64_t file_size = get_u64_le(bytes.data());
    uint64_t name_length = get_u64_le(bytes.data() + kSizeFieldBytes);
    if(name_length == 0 || name_length > kMaxFilenameBytes) {
        throw std::invalid_argument("header declares a filename of " + std::to_string(name_length) + " bytes");
    }
    return {file_size, name_length};
}

json make_announcement(const RendezvousAnnouncement& announcement) {
    json j;
    j["type"] = kAnnounceType;
    j["version"] = kAnnounceVersion;
    j["passcode"] = announcement.passcode;
    j["filename"] = announcement.filename;
    j["file_size"] = announcement.file_size;
    j["session_token"] = announcement.session_token;
    j["transfer_port"] = announcement.transfer_port;
    return j;
}

std::optional<RendezvousAnnouncement> parse_announcement(const std::string& datagram) {
    auto j = json::parse(datagram, nullptr, false);
    if(j.is_discarded() || !j.is_object()) return std::nullopt;
    if(j.value("type", "") != kAnnounceType) return std::nullopt;
    try {
        RendezvousAnnouncement out;
        out.passcode = j.at("passcode").get<std::string>();
        out.filename = j.value("filename", "");
        out.session_token = j.value("session_token", "");
        out.file_size = j.value("file_size", uint64_t{0});
        auto port = j.at("transfer_port").get<int64_t>();
        if(port <= 0 || port > 65535) return std::nullopt;
        out.transfer_port = static_cast<uint16_t>(port);
        return out;
    } catch(const json::exception&) {
        return std::nullopt;
    }
}
