#include "wfsync/workflow/hasher.hpp"

#include <openssl/evp.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace wfsync::workflow {
namespace {

Document canonicalize(const Document& value) {
    if (value.is_object()) {
        // nlohmann::json objects are std::map backed: keys come out sorted
        Document out = Document::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = canonicalize(it.value());
        }
        return out;
    }

    if (value.is_array()) {
        Document out = Document::array();
        for (const auto& item : value) {
            out.push_back(canonicalize(item));
        }
        return out;
    }

    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isfinite(number) && std::trunc(number) == number &&
            number >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
            number <= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return Document(static_cast<std::int64_t>(number));
        }
    }

    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        if (number <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Document(static_cast<std::int64_t>(number));
        }
    }

    return value;
}

} // namespace

std::string CanonicalHasher::canonical_text(const Document& document) {
    return canonicalize(document).dump(-1, ' ', false, Document::error_handler_t::replace);
}

std::string CanonicalHasher::hash(const Document& document) {
    return sha256_hex(canonical_text(document));
}

std::string CanonicalHasher::sha256_hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    EVP_MD_CTX_free(ctx);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(kHex[(digest[i] >> 4) & 0xF]);
        hex.push_back(kHex[digest[i] & 0xF]);
    }
    return hex;
}

} // namespace wfsync::workflow
