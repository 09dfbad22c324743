#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <cstdint>
#include <openssl/evp.h>

#include "StringUtils.hpp"

namespace takeout::utils {

class HashUtils {
public:
    static std::string sha1Bytes(const std::vector<uint8_t>& data) {
        return digestBytes(EVP_sha1(), data.data(), data.size());
    }

    static std::string md5String(const std::string& data) {
        return digestBytes(EVP_md5(), reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }

    static std::string md5File(const std::string& filePath) {
        return digestFile(EVP_md5(), filePath);
    }

private:
    static std::string digestBytes(const EVP_MD* md, const unsigned char* data, size_t size) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_Digest(data, size, hash, &hashLen, md, nullptr) != 1) {
            return "";
        }
        return StringUtils::hexEncode(hash, hashLen);
    }

    // Returns an empty string if the file cannot be read
    static std::string digestFile(const EVP_MD* md, const std::string& filePath) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return "";

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        char buffer[8192];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount()));
        }

        if (file.bad()) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);

        return StringUtils::hexEncode(hash, hashLen);
    }
};

} // namespace takeout::utils
