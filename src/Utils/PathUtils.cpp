// src/Utils/PathUtils.cpp
#include <Kiln/Utils/PathUtils.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace Kiln::Utils {

    namespace {

        constexpr size_t MaxComponentLength = 255;

        constexpr std::string_view IllegalAsciiChars = " |/\\:\"<>!?$&~#%^*";

        const char* const ReservedFolderNames[] = {
            ".", "..", "CON", "PRN", "AUX", "NUL",
            "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
            "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
        };

        bool isProblematicCodePoint(uint32_t cp) {
            if (cp < 0x20 || cp == 0x7F)
                return true;
            if (cp >= 0x80 && cp <= 0x9F) // C1 controls
                return true;
            if (cp == 0x00A0 || (cp >= 0x2000 && cp <= 0x200F) || (cp >= 0x202A && cp <= 0x202E) ||
                cp == 0x2060 || (cp >= 0x2066 && cp <= 0x2069) || cp == 0xFEFF || (cp >= 0xFFF9 && cp <= 0xFFFD))
                return true;
            if (cp >= 0xFDD0 && cp <= 0xFDEF)
                return true;
            if ((cp & 0xFFFE) == 0xFFFE) // U+xxFFFE and U+xxFFFF in every plane
                return true;
            if (cp >= 0xD800 && cp <= 0xDFFF)
                return true;
            return cp > 0x10FFFF;
        }

        bool isIllegalAscii(char c) {
            return IllegalAsciiChars.find(c) != std::string_view::npos;
        }

        // Decodes one UTF-8 sequence starting at i. Returns the sequence length, or 0 if malformed.
        size_t decodeUtf8(const std::string& s, size_t i, uint32_t& cp) {
            auto byte = static_cast<unsigned char>(s[i]);
            size_t len;
            if (byte < 0x80) {
                cp = byte;
                return 1;
            } else if ((byte & 0xE0) == 0xC0) {
                cp = byte & 0x1F;
                len = 2;
            } else if ((byte & 0xF0) == 0xE0) {
                cp = byte & 0x0F;
                len = 3;
            } else if ((byte & 0xF8) == 0xF0) {
                cp = byte & 0x07;
                len = 4;
            } else {
                return 0;
            }
            if (i + len > s.size())
                return 0;
            for (size_t k = 1; k < len; ++k) {
                auto cont = static_cast<unsigned char>(s[i + k]);
                if ((cont & 0xC0) != 0x80)
                    return 0;
                cp = (cp << 6) | (cont & 0x3F);
            }
            // Overlong encodings
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return 0;
            return len;
        }

        std::string toUpperAscii(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        bool isReservedName(const std::string& upper) {
            return std::any_of(std::begin(ReservedFolderNames), std::end(ReservedFolderNames),
                               [&](const char* reserved) { return upper == reserved; });
        }

        bool iequals(const std::string& a, const std::string& b) {
            return a.size() == b.size() && toUpperAscii(a) == toUpperAscii(b);
        }

        std::string trimDotsAndSpaces(const std::string& s) {
            auto first = s.find_first_not_of(". ");
            if (first == std::string::npos)
                return "";
            auto last = s.find_last_not_of(". ");
            return s.substr(first, last - first + 1);
        }

    } // namespace

    std::string sanitizeDirectoryName(const std::string& name, char replacement) {
        bool blank = std::all_of(name.begin(), name.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
        if (name.empty() || blank) {
            throw std::invalid_argument("Name cannot be empty nor just whitespace");
        }
        auto replacementByte = static_cast<unsigned char>(replacement);
        if (replacementByte < 0x20 || replacementByte >= 0x7F || isIllegalAscii(replacement)) {
            throw std::invalid_argument("Replacement character is an illegal character");
        }

        std::string cleaned = trimDotsAndSpaces(name);

        std::string result;
        result.reserve(cleaned.size());
        for (size_t i = 0; i < cleaned.size();) {
            uint32_t cp = 0;
            size_t len = decodeUtf8(cleaned, i, cp);
            if (len == 0) {
                result += replacement;
                ++i;
                continue;
            }
            if (isProblematicCodePoint(cp) || (len == 1 && isIllegalAscii(static_cast<char>(cp)))) {
                result += replacement;
            } else {
                result.append(cleaned, i, len);
            }
            i += len;
        }

        // "NUL." is as reserved as "NUL"
        std::string upper = toUpperAscii(result);
        std::string upperNoDots = upper;
        while (!upperNoDots.empty() && upperNoDots.back() == '.')
            upperNoDots.pop_back();
        if (isReservedName(upper) || (upper != upperNoDots && isReservedName(upperNoDots))) {
            result += replacement;
        }

        if (result.size() > MaxComponentLength) {
            size_t cut = MaxComponentLength;
            while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80)
                --cut;
            result.resize(cut);
        }

        if (result.empty()) {
            throw std::invalid_argument("Sanitized name is empty");
        }
        return result;
    }

    std::string incrementNumberedFolderNameIfExistsAndSanitize(const std::string& rawFolderName,
                                                               const std::vector<std::string>& existingFolders) {
        std::string sanitized = sanitizeDirectoryName(rawFolderName);
        if (existingFolders.empty()) {
            return sanitized;
        }

        bool collides = false;
        long long maxNumber = 0;
        const std::string prefix = toUpperAscii(sanitized) + "_(";

        for (const auto& existing : existingFolders) {
            if (iequals(existing, sanitized)) {
                collides = true;
                continue;
            }
            std::string upper = toUpperAscii(existing);
            if (upper.size() <= prefix.size() + 1 || upper.compare(0, prefix.size(), prefix) != 0 || upper.back() != ')')
                continue;

            std::string digits = upper.substr(prefix.size(), upper.size() - prefix.size() - 1);
            if (digits.empty() || digits.size() > 18 ||
                !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
                continue;
            maxNumber = std::max(maxNumber, std::stoll(digits));
        }

        if (!collides) {
            return sanitized;
        }
        return sanitized + "_(" + std::to_string(maxNumber + 1) + ")";
    }

} // namespace Kiln::Utils
