#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

struct evp_md_ctx_st;

using Sha1Digest = std::array<uint8_t, 20>;

// Incremental SHA-1 over OpenSSL's EVP interface.
class Sha1 {
public:
    Sha1();
    ~Sha1();
    Sha1(const Sha1&) = delete;
    Sha1& operator=(const Sha1&) = delete;

    void update(const uint8_t* data, size_t len);
    Sha1Digest finish();

    static Sha1Digest digest(const uint8_t* data, size_t len);
    static Sha1Digest digest(const std::string& data);

private:
    evp_md_ctx_st* ctx;
    bool finished = false;
};

class CryptoUtils {
public:
    static std::string sha1_to_hex(const std::string& input);
    static std::string digest_to_hex(const Sha1Digest& digest);
    static std::string hex_to_raw(const std::string& hex_string);
    static Sha1Digest hex_to_digest(const std::string& hex_string);
};
