// include/Kiln/Utils/Crypto.hpp
#ifndef KILN_CRYPTO_UTIL_HPP
#define KILN_CRYPTO_UTIL_HPP

#include <filesystem>
#include <string>

namespace Kiln {
    namespace Utils {

        enum class HashAlgorithm {
            SHA1,
            SHA256
        };

        /**
         * @brief Picks the digest algorithm from the length of a hex-encoded hash.
         * @throws std::invalid_argument for any length other than 40 (SHA1) or 64 (SHA256).
         */
        HashAlgorithm hashAlgorithmForHex(const std::string& hexDigest);

        /**
         * @brief Calculates the hash of a file.
         * @return Lower-case hex digest, or an empty string when the file cannot be read or OpenSSL fails.
         */
        std::string calculateFileHash(const std::filesystem::path& filePath, HashAlgorithm algorithm);

        std::string calculateFileSHA1(const std::filesystem::path& filePath);
        std::string calculateFileSHA256(const std::filesystem::path& filePath);

        // Hash of an in-memory buffer, lower-case hex.
        std::string calculateHash(const std::string& data, HashAlgorithm algorithm);

        /**
         * @brief Compares the file digest with the expected one, case-insensitively.
         * @throws std::invalid_argument if the expected hash has an unsupported length.
         */
        bool verifyFileHash(const std::filesystem::path& filePath, const std::string& expectedHex);

    } // namespace Utils
} // namespace Kiln

#endif // KILN_CRYPTO_UTIL_HPP
