#pragma once

#include <crabby/result.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace crabby {

enum class HashAlgorithm { Sha1, Sha256, Sha512 };

const char* algorithm_name(HashAlgorithm alg);
std::optional<HashAlgorithm> parse_algorithm(const std::string& name);

// Streaming digest over OpenSSL EVP.
class Hasher {
public:
    explicit Hasher(HashAlgorithm alg);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Object should not be reused after this call.
    Result<std::vector<uint8_t>> finalize();

    HashAlgorithm algorithm() const { return alg_; }

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    HashAlgorithm alg_;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool failed_ = false;
};

std::string to_hex(const std::vector<uint8_t>& bytes);
std::string to_base64(const std::vector<uint8_t>& bytes);
Result<std::vector<uint8_t>> from_hex(const std::string& hex);
Result<std::vector<uint8_t>> from_base64(const std::string& b64);

// Package content digest. Accepts Subresource Integrity strings
// ("sha512-<base64>", possibly several separated by spaces) and bare hex
// shasums, where the algorithm is inferred from the length.
struct Integrity {
    HashAlgorithm algorithm = HashAlgorithm::Sha512;
    std::vector<uint8_t> digest;

    static Result<Integrity> parse(const std::string& s);
    static Result<Integrity> compute(HashAlgorithm alg, const std::string& bytes);

    // SRI form: "<alg>-<base64>"
    std::string to_string() const;
    std::string hex() const { return to_hex(digest); }

    Status verify(const std::string& bytes) const;

    bool empty() const { return digest.empty(); }
    bool operator==(const Integrity& o) const {
        return algorithm == o.algorithm && digest == o.digest;
    }
    bool operator!=(const Integrity& o) const { return !(*this == o); }
};

// One-shot helpers
Result<std::string> sha256_hex(const std::string& input);
Result<std::string> hash_file_hex(HashAlgorithm alg, const std::filesystem::path& path);

} // namespace crabby
