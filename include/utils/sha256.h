#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>

namespace ardl {

inline std::string to_hex(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(hex[(data[i] >> 4) & 0x0F]);
        out.push_back(hex[data[i] & 0x0F]);
    }
    return out;
}

// Incremental SHA-256 over OpenSSL EVP. Throws std::runtime_error if OpenSSL
// refuses an operation.
class Sha256Stream {
public:
    Sha256Stream() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("sha256: digest init failed");
        }
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("sha256: digest update failed");
        }
    }

    // Lowercase hex digest. The stream must not be updated afterwards.
    std::string finalize() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash.data(), &len) != 1) {
            throw std::runtime_error("sha256: digest final failed");
        }
        return to_hex(hash.data(), len);
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

inline std::string sha256_text(const std::string& text) {
    Sha256Stream stream;
    stream.update(text.data(), text.size());
    return stream.finalize();
}

// Streams the file in chunk_size pieces. Throws std::runtime_error when the
// file cannot be opened or read.
inline std::string sha256_file(const std::filesystem::path& path, size_t chunk_size = 8192) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    Sha256Stream stream;
    std::unique_ptr<char[]> buf(new char[chunk_size]);
    while (file) {
        file.read(buf.get(), static_cast<std::streamsize>(chunk_size));
        std::streamsize n = file.gcount();
        if (n > 0) {
            stream.update(buf.get(), static_cast<size_t>(n));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("read error on " + path.string());
    }
    return stream.finalize();
}

}  // namespace ardl
