// src/Utils/OS.cpp
#include <Kiln/Utils/OS.hpp>

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#endif

namespace Kiln {
namespace Utils {

OperatingSystem getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OperatingSystem::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OperatingSystem::MACOS;
    #elif defined(__linux__)
        return OperatingSystem::LINUX;
    #else
        return OperatingSystem::UNKNOWN;
    #endif
}

Architecture getCurrentArch() {
    #if defined(_M_AMD64) || defined(__amd64__) || defined(__x86_64__)
        return Architecture::X64;
    #elif defined(_M_IX86) || defined(__i386__)
        return Architecture::X86;
    #elif defined(__aarch64__) || defined(_M_ARM64)
        return Architecture::ARM64;
    #elif defined(__arm__) || defined(_M_ARM)
        return Architecture::ARM32;
    #else
        return Architecture::UNKNOWN;
    #endif
}

std::optional<OSVersion> getCurrentOSVersion() {
#if defined(_WIN32) || defined(_WIN64)
    // GetVersionEx lies about the version without a manifest, RtlGetVersion does not
    using RtlGetVersionFn = LONG (WINAPI *)(PRTL_OSVERSIONINFOW);
    HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
    if (!ntdll) {
        return std::nullopt;
    }
    auto rtlGetVersion = reinterpret_cast<RtlGetVersionFn>(GetProcAddress(ntdll, "RtlGetVersion"));
    if (!rtlGetVersion) {
        return std::nullopt;
    }
    RTL_OSVERSIONINFOW info{};
    info.dwOSVersionInfoSize = sizeof(info);
    if (rtlGetVersion(&info) != 0) {
        return std::nullopt;
    }
    return OSVersion{info.dwMajorVersion, info.dwMinorVersion, info.dwBuildNumber};
#else
    return std::nullopt;
#endif
}

std::string getOSNameForRules(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "osx";
        case OperatingSystem::LINUX: return "linux";
        default: return "unknown";
    }
}

std::string getArchNameForRules(Architecture arch) {
    switch (arch) {
        case Architecture::X86: return "x86";
        case Architecture::X64: return "x86_64";
        case Architecture::ARM64: return "arm64";
        case Architecture::ARM32: return "arm";
        default: return "unknown";
    }
}

std::string getArchBitness(const std::string& archName) {
    return archName == "x86" || archName == "arm" ? "32" : "64";
}

std::string getOSStringForAdoptium(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "mac";
        case OperatingSystem::LINUX: return "linux";
        default: return "";
    }
}

std::string getArchStringForAdoptium(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x64";
        case Architecture::X86: return "x86"; // 32-bit Windows only
        case Architecture::ARM64: return "aarch64";
        case Architecture::ARM32: return "arm";
        default: return "";
    }
}

std::string getRuntimeArchiveExtension(OperatingSystem os) {
    return os == OperatingSystem::WINDOWS ? "zip" : "tar.gz";
}

char getPathListSeparator() {
    #if defined(_WIN32) || defined(_WIN64)
        return ';';
    #else
        return ':';
    #endif
}

} // namespace Utils
} // namespace Kiln
