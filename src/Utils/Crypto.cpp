// src/Utils/Crypto.cpp
#include <Kiln/Utils/Crypto.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace Kiln::Utils {

    namespace {

        std::string bytesToHexString(const unsigned char *bytes, size_t len) {
            std::ostringstream ss;
            ss << std::hex << std::setfill('0');
            for (size_t i = 0; i < len; ++i) {
                ss << std::setw(2) << static_cast<int>(bytes[i]);
            }
            return ss.str();
        }

        const EVP_MD* digestFor(HashAlgorithm algorithm) {
            return algorithm == HashAlgorithm::SHA1 ? EVP_sha1() : EVP_sha256();
        }

        const char* nameOf(HashAlgorithm algorithm) {
            return algorithm == HashAlgorithm::SHA1 ? "SHA1" : "SHA256";
        }

        using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    } // namespace

    HashAlgorithm hashAlgorithmForHex(const std::string& hexDigest) {
        switch (hexDigest.size()) {
            case 40: return HashAlgorithm::SHA1;
            case 64: return HashAlgorithm::SHA256;
            default:
                throw std::invalid_argument("Unsupported hash length: " + std::to_string(hexDigest.size()) +
                                            ". Expected 40 (SHA1) or 64 (SHA256) characters.");
        }
    }

    std::string calculateFileHash(const std::filesystem::path& filePath, HashAlgorithm algorithm) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            KILN_LOG_ERROR("[Crypto] Could not open file for {} calculation: {}", nameOf(algorithm), filePath.string());
            return "";
        }

        DigestContext mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!mdctx) {
            KILN_LOG_ERROR("[Crypto] EVP_MD_CTX_new failed for {} on file: {}", nameOf(algorithm), filePath.string());
            return "";
        }

        if (1 != EVP_DigestInit_ex(mdctx.get(), digestFor(algorithm), nullptr)) {
            KILN_LOG_ERROR("[Crypto] EVP_DigestInit_ex for {} failed on file: {}", nameOf(algorithm), filePath.string());
            return "";
        }

        constexpr size_t bufferSize = 64 * 1024;
        std::vector<char> buffer(bufferSize);

        while (file.good()) {
            file.read(buffer.data(), bufferSize);
            std::streamsize bytesRead = file.gcount();
            if (bytesRead > 0) {
                if (1 != EVP_DigestUpdate(mdctx.get(), buffer.data(), static_cast<size_t>(bytesRead))) {
                    KILN_LOG_ERROR("[Crypto] EVP_DigestUpdate failed for {} on file: {}", nameOf(algorithm), filePath.string());
                    return "";
                }
            }
        }
        if (file.bad()) {
            KILN_LOG_ERROR("[Crypto] Read error while hashing file: {}", filePath.string());
            return "";
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (1 != EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen)) {
            KILN_LOG_ERROR("[Crypto] EVP_DigestFinal_ex failed for {} on file: {}", nameOf(algorithm), filePath.string());
            return "";
        }

        return bytesToHexString(hash, hashLen);
    }

    std::string calculateFileSHA1(const std::filesystem::path& filePath) {
        return calculateFileHash(filePath, HashAlgorithm::SHA1);
    }

    std::string calculateFileSHA256(const std::filesystem::path& filePath) {
        return calculateFileHash(filePath, HashAlgorithm::SHA256);
    }

    std::string calculateHash(const std::string& data, HashAlgorithm algorithm) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (1 != EVP_Digest(data.data(), data.size(), hash, &hashLen, digestFor(algorithm), nullptr)) {
            KILN_LOG_ERROR("[Crypto] EVP_Digest failed for {} on {} byte buffer", nameOf(algorithm), data.size());
            return "";
        }
        return bytesToHexString(hash, hashLen);
    }

    bool verifyFileHash(const std::filesystem::path& filePath, const std::string& expectedHex) {
        HashAlgorithm algorithm = hashAlgorithmForHex(expectedHex);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(filePath, ec)) {
            return false;
        }

        std::string actual = calculateFileHash(filePath, algorithm);
        if (actual.empty()) {
            return false;
        }

        std::string expected = expectedHex;
        std::transform(expected.begin(), expected.end(), expected.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return actual == expected;
    }

} // namespace Kiln::Utils
