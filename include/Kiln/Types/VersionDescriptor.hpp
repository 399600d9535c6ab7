// include/Kiln/Types/VersionDescriptor.hpp
#ifndef KILN_VERSION_DESCRIPTOR_HPP
#define KILN_VERSION_DESCRIPTOR_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace Kiln {

    // A version document resolved for the current platform. Argument lists still contain
    // ${...} placeholders; player-specific values are substituted at launch.
    struct VersionDescriptor {
        std::string versionId;
        std::string type;
        unsigned int requiredJavaVersion = 8;
        std::filesystem::path clientJarPath;
        std::string mainClass;
        std::filesystem::path installationFolder;
        std::filesystem::path librariesFolder;
        std::filesystem::path nativeLibrariesFolder;
        std::filesystem::path assetsFolder;
        std::string assetIndex;
        std::vector<std::string> classPath; // relative to librariesFolder, '/' separated
        std::vector<std::string> gameArguments;
        std::vector<std::string> jvmArguments;
    };

} // namespace Kiln

#endif // KILN_VERSION_DESCRIPTOR_HPP
