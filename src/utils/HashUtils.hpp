#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

#include "StringUtils.hpp"

namespace surge::utils {

class HashUtils {
public:
    /**
     * SHA-256 of a file as lower-case hex
     * @return Empty string if the file cannot be read or hashed
     */
    static std::string sha256File(const std::string& filePath) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return "";

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            return "";
        }

        char buffer[8192];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
                return "";
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
            return "";
        }

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

    /**
     * Compare a file's SHA-256 against an expected hex digest (case-insensitive)
     */
    static bool verifySha256(const std::string& filePath, const std::string& expectedHex) {
        std::string actual = sha256File(filePath);
        return !actual.empty() && actual == StringUtils::toLower(StringUtils::trim(expectedHex));
    }
};

} // namespace surge::utils
