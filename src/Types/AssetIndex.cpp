// src/Types/AssetIndex.cpp
#include <Kiln/Types/AssetIndex.hpp>

namespace Kiln {

AssetIndex AssetIndex::from_json(const json& j) {
    AssetIndex index;
    index.id = j.at("id").get<std::string>();
    if (j.contains("sha1")) index.sha1 = j.at("sha1").get<std::string>();
    if (j.contains("size")) index.size = j.at("size").get<uint64_t>();
    if (j.contains("totalSize")) index.totalSize = j.at("totalSize").get<uint64_t>();
    index.url = j.at("url").get<std::string>();
    return index;
}

AssetObject AssetObject::from_json(const json& j) {
    AssetObject object;
    object.hash = j.at("hash").get<std::string>();
    if (j.contains("size")) object.size = j.at("size").get<uint64_t>();
    return object;
}

AssetIndexFile AssetIndexFile::from_json(const json& j) {
    AssetIndexFile file;
    if (j.contains("objects") && j.at("objects").is_object()) {
        for (auto& [name, object_json] : j.at("objects").items()) {
            file.objects[name] = AssetObject::from_json(object_json);
        }
    }
    return file;
}

} // namespace Kiln
