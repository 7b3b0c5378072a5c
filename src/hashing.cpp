#include "hashing.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace thumbgrid {

std::string sha256_hex(const std::string& input) {
    const EVP_MD* md = EVP_sha256();
    if (md == nullptr) {
        throw std::runtime_error("EVP_sha256 unavailable");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context) {
        throw std::runtime_error("Failed to allocate EVP_MD_CTX");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_DigestInit_ex(context.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), hash, &hash_length) != 1) {
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace thumbgrid
