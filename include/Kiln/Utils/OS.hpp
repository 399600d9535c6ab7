// include/Kiln/Utils/OS.hpp
#ifndef KILN_OS_UTIL_HPP
#define KILN_OS_UTIL_HPP

#include <optional>
#include <string>

namespace Kiln {
    namespace Utils {

        enum class OperatingSystem {
            WINDOWS,
            MACOS,
            LINUX,
            UNKNOWN
        };

        enum class Architecture {
            X86,        // 32-bit x86
            X64,        // 64-bit x86_64/amd64
            ARM64,      // 64-bit ARM (aarch64)
            ARM32,      // 32-bit ARM
            UNKNOWN
        };

        struct OSVersion {
            unsigned int major = 0;
            unsigned int minor = 0;
            unsigned int build = 0;
        };

        OperatingSystem getCurrentOS();
        Architecture getCurrentArch();

        // Kernel/OS release of the running system. Only implemented for Windows.
        std::optional<OSVersion> getCurrentOSVersion();

        // Names used by "os.name" in version rules: "windows", "osx", "linux"
        std::string getOSNameForRules(OperatingSystem os);
        // Values matched by "os.arch" in version rules: "x86", "x86_64", "arm64", "arm"
        std::string getArchNameForRules(Architecture arch);
        // Replacement for "${arch}" in native classifier keys, from a rules arch name
        std::string getArchBitness(const std::string& archName);

        // Eclipse Temurin API
        std::string getOSStringForAdoptium(OperatingSystem os);
        std::string getArchStringForAdoptium(Architecture arch);
        // "zip" on Windows, "tar.gz" elsewhere
        std::string getRuntimeArchiveExtension(OperatingSystem os);

        char getPathListSeparator();

    } // namespace Utils
} // namespace Kiln

#endif // KILN_OS_UTIL_HPP
