#include "crypto/hasher.hpp"
#include "common/serializer.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>

namespace Hasher {

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };

namespace {
    hash_t sha256_raw(const void* data, size_t size) {
        hash_t hash;
        std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx(EVP_MD_CTX_new());

        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }

        if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL)) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }

        if (!EVP_DigestUpdate(ctx.get(), data, size)) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }

        unsigned int len = 0;
        if (!EVP_DigestFinal_ex(ctx.get(), hash.data(), &len)) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }

        return hash;
    }
}

hash_t sha256(const std::vector<uint8_t>& data) {
    return sha256_raw(data.data(), data.size());
}

hash_t sha256(const std::string& data) {
    return sha256_raw(data.data(), data.size());
}

std::string hash_to_hex(const hash_t& hash) {
    std::stringstream ss;
    for (uint8_t byte : hash) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return ss.str();
}

std::string content_hash(const std::vector<uint8_t>& data) {
    return hash_to_hex(sha256(data));
}

std::string content_hash(const std::string& data) {
    return hash_to_hex(sha256(data));
}

std::string info_hash(const Manifest& manifest) {
    return content_hash(Serializer::serialize_manifest(manifest));
}

bool is_hex_digest(const std::string& text) {
    if (text.size() != HASH_HEX_SIZE) return false;
    for (char c : text) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

} // namespace Hasher
