#include "crypto/Hash.hpp"

#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

using namespace es::crypto;

std::string Hash::hex(const Algorithm algo, const uint8_t* data, const size_t len) {
    const EVP_MD* md = algo == Algorithm::MD5 ? EVP_md5() : EVP_sha256();

    const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1)
        throw std::runtime_error("OpenSSL digest failed");

    std::ostringstream oss;
    for (unsigned int i = 0; i < digestLen; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return oss.str();
}

Hash::Algorithm Hash::parseAlgorithm(const std::string_view name) {
    if (name == "md5") return Algorithm::MD5;
    if (name == "sha256") return Algorithm::SHA256;
    throw std::invalid_argument("Unsupported checksum algorithm: " + std::string(name));
}

std::string_view Hash::toString(const Algorithm algo) {
    switch (algo) {
        case Algorithm::MD5: return "md5";
        case Algorithm::SHA256: return "sha256";
        default: return "unknown";
    }
}
