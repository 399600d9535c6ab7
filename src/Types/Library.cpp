// src/Types/Library.cpp
#include <Kiln/Types/Library.hpp>

namespace Kiln {

namespace {
    // Members of an optional object or array, empty when the key is absent or of another type
    const json& memberOrEmpty(const json& j, const char* key, json::value_t type) {
        static const json EMPTY_OBJECT = json::object();
        static const json EMPTY_ARRAY = json::array();
        auto it = j.find(key);
        if (it != j.end() && it->type() == type)
            return *it;
        return type == json::value_t::array ? EMPTY_ARRAY : EMPTY_OBJECT;
    }
} // namespace

LibraryArtifact LibraryArtifact::from_json(const json& j) {
    LibraryArtifact artifact;
    artifact.path = j.value("path", std::string{});
    artifact.sha1 = j.value("sha1", std::string{});
    artifact.size = j.value("size", uint64_t{0});
    artifact.url = j.value("url", std::string{});
    return artifact;
}

LibraryDownloads LibraryDownloads::from_json(const json& j) {
    LibraryDownloads downloads;
    if (auto it = j.find("artifact"); it != j.end() && it->is_object())
        downloads.artifact = LibraryArtifact::from_json(*it);

    for (const auto& [classifier, artifact] : memberOrEmpty(j, "classifiers", json::value_t::object).items())
        downloads.classifiers.emplace(classifier, LibraryArtifact::from_json(artifact));
    return downloads;
}

LibraryExtractRule LibraryExtractRule::from_json(const json& j) {
    LibraryExtractRule rule;
    rule.exclude = j.value("exclude", std::vector<std::string>{});
    return rule;
}

Library Library::from_json(const json& j) {
    Library library;
    library.name = j.at("name").get<std::string>();

    if (auto it = j.find("downloads"); it != j.end() && it->is_object())
        library.downloads = LibraryDownloads::from_json(*it);

    for (const auto& rule : memberOrEmpty(j, "rules", json::value_t::array))
        library.rules.push_back(Rule::from_json(rule));

    library.natives = j.value("natives", std::map<std::string, std::string>{});

    if (auto it = j.find("extract"); it != j.end() && it->is_object())
        library.extract = LibraryExtractRule::from_json(*it);

    return library;
}

} // namespace Kiln
