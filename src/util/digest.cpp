#include <crabby/digest.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace crabby {

const char* algorithm_name(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Sha1:   return "sha1";
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha512: return "sha512";
    }
    return "unknown";
}

std::optional<HashAlgorithm> parse_algorithm(const std::string& name) {
    if (name == "sha1") return HashAlgorithm::Sha1;
    if (name == "sha256") return HashAlgorithm::Sha256;
    if (name == "sha512") return HashAlgorithm::Sha512;
    return std::nullopt;
}

static const EVP_MD* evp_for(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Sha1:   return EVP_sha1();
        case HashAlgorithm::Sha256: return EVP_sha256();
        case HashAlgorithm::Sha512: return EVP_sha512();
    }
    return EVP_sha512();
}

static size_t digest_size(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Sha1:   return 20;
        case HashAlgorithm::Sha256: return 32;
        case HashAlgorithm::Sha512: return 64;
    }
    return 0;
}

static int strength(HashAlgorithm alg) {
    return static_cast<int>(digest_size(alg));
}

// ---------------------------------------------------------------------------
// Hasher
// ---------------------------------------------------------------------------

void Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    if (ctx) EVP_MD_CTX_free(ctx);
}

Hasher::Hasher(HashAlgorithm alg)
    : alg_(alg), ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), evp_for(alg), nullptr) != 1) {
        failed_ = true;
    }
}

Hasher::~Hasher() = default;

void Hasher::update(const uint8_t* data, size_t len) {
    if (failed_ || len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        failed_ = true;
    }
}

void Hasher::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Result<std::vector<uint8_t>> Hasher::finalize() {
    if (failed_) {
        return CrabbyError{CrabbyError::IO,
            std::string("OpenSSL ") + algorithm_name(alg_) + " digest failed"};
    }
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
        failed_ = true;
        return CrabbyError{CrabbyError::IO,
            std::string("OpenSSL ") + algorithm_name(alg_) + " finalize failed"};
    }
    return Result<std::vector<uint8_t>>::ok(std::vector<uint8_t>(out, out + out_len));
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

std::string to_hex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return CrabbyError{CrabbyError::Parse, "odd-length hex string"};
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return CrabbyError{CrabbyError::Parse, "invalid hex digit in '" + hex + "'"};
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

std::string to_base64(const std::vector<uint8_t>& bytes) {
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            bytes.data(), static_cast<int>(bytes.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

Result<std::vector<uint8_t>> from_base64(const std::string& b64) {
    if (b64.empty() || b64.size() % 4 != 0) {
        return CrabbyError{CrabbyError::Parse, "invalid base64 length"};
    }
    std::vector<uint8_t> out(b64.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(b64.data()),
                            static_cast<int>(b64.size()));
    if (n < 0) {
        return CrabbyError{CrabbyError::Parse, "invalid base64 data"};
    }
    // EVP_DecodeBlock counts padding as output bytes
    size_t padding = 0;
    if (b64[b64.size() - 1] == '=') ++padding;
    if (b64[b64.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Integrity
// ---------------------------------------------------------------------------

static Result<Integrity> parse_single(const std::string& token) {
    size_t dash = token.find('-');
    if (dash == std::string::npos) {
        // Legacy shasum: bare hex, algorithm implied by length
        Integrity in;
        switch (token.size()) {
            case 40:  in.algorithm = HashAlgorithm::Sha1; break;
            case 64:  in.algorithm = HashAlgorithm::Sha256; break;
            case 128: in.algorithm = HashAlgorithm::Sha512; break;
            default:
                return CrabbyError{CrabbyError::Parse,
                    "unrecognized integrity '" + token + "'",
                    "expected '<algorithm>-<base64>' or a hex shasum"};
        }
        auto bytes = from_hex(token);
        if (bytes.is_err()) return std::move(bytes).error();
        in.digest = std::move(bytes).value();
        return Result<Integrity>::ok(std::move(in));
    }

    auto alg = parse_algorithm(token.substr(0, dash));
    if (!alg) {
        return CrabbyError{CrabbyError::Parse,
            "unsupported integrity algorithm '" + token.substr(0, dash) + "'"};
    }
    std::string body = token.substr(dash + 1);
    // SRI allows "?options" after the digest
    size_t q = body.find('?');
    if (q != std::string::npos) body = body.substr(0, q);

    auto bytes = from_base64(body);
    if (bytes.is_err()) return std::move(bytes).error();
    if (bytes.value().size() != digest_size(*alg)) {
        return CrabbyError{CrabbyError::Parse,
            "integrity digest has wrong length for " + std::string(algorithm_name(*alg))};
    }
    Integrity in;
    in.algorithm = *alg;
    in.digest = std::move(bytes).value();
    return Result<Integrity>::ok(std::move(in));
}

Result<Integrity> Integrity::parse(const std::string& s) {
    std::optional<Integrity> best;
    std::optional<CrabbyError> first_error;
    size_t start = 0;
    while (start < s.size()) {
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
        size_t end = start;
        while (end < s.size() && !std::isspace(static_cast<unsigned char>(s[end]))) ++end;
        if (end > start) {
            auto one = parse_single(s.substr(start, end - start));
            if (one.is_ok()) {
                if (!best || strength(one.value().algorithm) > strength(best->algorithm)) {
                    best = std::move(one).value();
                }
            } else if (!first_error) {
                first_error = std::move(one).error();
            }
        }
        start = end;
    }
    if (best) return Result<Integrity>::ok(std::move(*best));
    if (first_error) return *first_error;
    return CrabbyError{CrabbyError::Parse, "empty integrity string"};
}

Result<Integrity> Integrity::compute(HashAlgorithm alg, const std::string& bytes) {
    Hasher h(alg);
    h.update(bytes);
    auto digest = h.finalize();
    if (digest.is_err()) return std::move(digest).error();
    Integrity in;
    in.algorithm = alg;
    in.digest = std::move(digest).value();
    return Result<Integrity>::ok(std::move(in));
}

std::string Integrity::to_string() const {
    return std::string(algorithm_name(algorithm)) + "-" + to_base64(digest);
}

Status Integrity::verify(const std::string& bytes) const {
    auto actual = compute(algorithm, bytes);
    if (actual.is_err()) return std::move(actual).error();
    if (actual.value().digest != digest) {
        return CrabbyError{CrabbyError::IntegrityMismatch,
            "integrity check failed: expected " + to_string() +
            ", got " + actual.value().to_string()};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// One-shot helpers
// ---------------------------------------------------------------------------

Result<std::string> sha256_hex(const std::string& input) {
    Hasher h(HashAlgorithm::Sha256);
    h.update(input);
    auto digest = h.finalize();
    if (digest.is_err()) return std::move(digest).error();
    return Result<std::string>::ok(to_hex(digest.value()));
}

Result<std::string> hash_file_hex(HashAlgorithm alg, const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return CrabbyError{CrabbyError::IO, "cannot open " + path.string()};
    }
    Hasher h(alg);
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        h.update(reinterpret_cast<const uint8_t*>(buffer),
                 static_cast<size_t>(file.gcount()));
    }
    auto digest = h.finalize();
    if (digest.is_err()) return std::move(digest).error();
    return Result<std::string>::ok(to_hex(digest.value()));
}

} // namespace crabby
