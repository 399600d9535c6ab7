// include/Kiln/Types/Library.hpp
#ifndef KILN_LIBRARY_HPP
#define KILN_LIBRARY_HPP

#include <Kiln/Types/Rule.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Kiln {

    struct LibraryArtifact {
        std::string path;
        std::string sha1;
        uint64_t size = 0;
        std::string url;

        static LibraryArtifact from_json(const json& j);
    };

    struct LibraryDownloads {
        std::optional<LibraryArtifact> artifact;
        std::map<std::string, LibraryArtifact> classifiers; // Key: e.g., "natives-linux"

        static LibraryDownloads from_json(const json& j);
    };

    struct LibraryExtractRule {
        std::vector<std::string> exclude;

        static LibraryExtractRule from_json(const json& j);
    };

    struct Library {
        std::string name;
        std::optional<LibraryDownloads> downloads;
        std::vector<Rule> rules;
        std::map<std::string, std::string> natives; // OS to classifier key e.g. "linux": "natives-linux"
        std::optional<LibraryExtractRule> extract;

        static Library from_json(const json& j);
    };

} // namespace Kiln

#endif // KILN_LIBRARY_HPP
