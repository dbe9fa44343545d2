#include "CryptoUtils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Sha1::Sha1() : ctx(EVP_MD_CTX_new()) {
    if (ctx == nullptr) {
        throw std::runtime_error("Failed to allocate SHA-1 context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize SHA-1 context");
    }
}

Sha1::~Sha1() {
    EVP_MD_CTX_free(ctx);
}

void Sha1::update(const uint8_t* data, size_t len) {
    if (finished) {
        throw std::logic_error("SHA-1 context already finished");
    }
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Sha1Digest Sha1::finish() {
    if (finished) {
        throw std::logic_error("SHA-1 context already finished");
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1 || len != 20) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finished = true;
    Sha1Digest out;
    std::copy(hash, hash + 20, out.begin());
    return out;
}

Sha1Digest Sha1::digest(const uint8_t* data, size_t len) {
    Sha1 sha;
    sha.update(data, len);
    return sha.finish();
}

Sha1Digest Sha1::digest(const std::string& data) {
    return digest(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string CryptoUtils::sha1_to_hex(const std::string& input) {
    return digest_to_hex(Sha1::digest(input));
}

std::string CryptoUtils::digest_to_hex(const Sha1Digest& digest) {
    std::ostringstream oss;
    for (uint8_t byte : digest) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

std::string CryptoUtils::hex_to_raw(const std::string& hex_string) {
    if (hex_string.size() % 2 != 0) {
        throw std::invalid_argument("Invalid hex string length");
    }
    std::string raw;
    raw.reserve(hex_string.size() / 2);

    for (size_t i = 0; i < hex_string.size(); i += 2) {
        std::string byte_string = hex_string.substr(i, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byte_string[0])) ||
            !std::isxdigit(static_cast<unsigned char>(byte_string[1]))) {
            throw std::invalid_argument("Invalid hex digit in: " + byte_string);
        }
        raw.push_back(static_cast<char>(std::stoi(byte_string, nullptr, 16)));
    }
    return raw;
}

Sha1Digest CryptoUtils::hex_to_digest(const std::string& hex_string) {
    std::string raw = hex_to_raw(hex_string);
    if (raw.size() != 20) {
        throw std::invalid_argument("SHA-1 digest must be 40 hex characters");
    }
    Sha1Digest out;
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
}
