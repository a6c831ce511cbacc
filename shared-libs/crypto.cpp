#include "crypto.hpp"
#include "Errors.hpp"

#include <climits>

namespace unik {
    void OpenSSLEntropySource::fill(std::uint8_t* buffer, std::size_t length) {
        if (length > static_cast<std::size_t>(INT_MAX)) {
            throw GenerationError(GenerationErrorKind::EntropySourceUnavailable, "Random buffer too large.");
        }
        if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
            throw GenerationError(GenerationErrorKind::EntropySourceUnavailable, "Unable to read random bytes from OpenSSL.");
        }
    }

    std::vector<std::uint8_t> Crypto::digest(const EVP_MD* algorithm, const std::string& data) {
        std::vector<std::uint8_t> hash(EVP_MAX_MD_SIZE);
        unsigned int hashLength = 0;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (ctx == nullptr) {
            throw GenerationError(GenerationErrorKind::DigestFailure, "Failed to create EVP_MD_CTX.");
        }

        if (EVP_DigestInit_ex(ctx, algorithm, nullptr) != 1 ||
            EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
            EVP_DigestFinal_ex(ctx, hash.data(), &hashLength) != 1) {
            EVP_MD_CTX_free(ctx);
            throw GenerationError(GenerationErrorKind::DigestFailure, "Unable to compute digest.");
        }

        EVP_MD_CTX_free(ctx);
        hash.resize(hashLength);
        return hash;
    }

    std::vector<std::uint8_t> Crypto::sha1(const std::string& data) {
        return digest(EVP_sha1(), data);
    }

    std::vector<std::uint8_t> Crypto::md5(const std::string& data) {
        return digest(EVP_md5(), data);
    }
}
