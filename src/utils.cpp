#include "utils.hpp"
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

struct Sha256Accumulator::Impl {
    EVP_MD_CTX* ctx = nullptr;
    bool finished = false;
    std::string digest;
};

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_hex(const std::string &data){
    Sha256Accumulator acc;
    acc.update(data.data(), data.size());
    return acc.hex_digest();
}

std::string sha256_hex_file(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open " + path.string());
    Sha256Accumulator acc;
    std::vector<char> buffer(64 * 1024);
    while(in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = in.gcount();
        if(n <= 0) break;
        acc.update(buffer.data(), static_cast<std::size_t>(n));
    }
    return acc.hex_digest();
}

std::string format_bytes(uint64_t bytes){
    static constexpr std::array<const char*, 5> kUnits = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << value << ' ' << kUnits[unit];
    }
    return oss.str();
}

Sha256Accumulator::Sha256Accumulator() : impl_(std::make_unique<Impl>()) {
    impl_->ctx = EVP_MD_CTX_new();
    if(!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(impl_->ctx);
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256Accumulator::~Sha256Accumulator(){
    EVP_MD_CTX_free(impl_->ctx);
}

void Sha256Accumulator::update(const char* data, std::size_t size){
    if(impl_->finished) throw std::logic_error("Sha256Accumulator already finalized");
    if(data == nullptr || size == 0) return;
    if(EVP_DigestUpdate(impl_->ctx, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256Accumulator::hex_digest(){
    if(impl_->finished) return impl_->digest;
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(impl_->ctx, out.data(), &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    out.resize(length);
    impl_->digest = hex_from_bytes(out);
    impl_->finished = true;
    return impl_->digest;
}
