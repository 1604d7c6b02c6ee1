#pragma once

#include <string>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace ChatStorage {

/**
 * @brief Upload fingerprint used by the resume handshake.
 *
 * The server keys resumable uploads on the hex MD5 of the file NAME, not
 * its content: two different files with the same name collide, and that
 * is what the server expects.
 */
class Fingerprint {
public:
    static std::string ofFileName(const std::string& fileName) {
        return md5Hex(fileName);
    }

    /// Hex MD5 of arbitrary bytes, empty string if the digest fails
    static std::string md5Hex(const std::string& input) {
        unsigned char digest[EVP_MAX_MD_SIZE];

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        if (EVP_DigestUpdate(ctx, input.data(), input.size()) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        unsigned int digestLen = 0;
        if (EVP_DigestFinal_ex(ctx, digest, &digestLen) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        EVP_MD_CTX_free(ctx);

        std::stringstream ss;
        for (unsigned int i = 0; i < digestLen; ++i) {
            ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
        }
        return ss.str();
    }
};

} // namespace ChatStorage
