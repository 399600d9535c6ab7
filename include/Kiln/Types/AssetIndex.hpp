// include/Kiln/Types/AssetIndex.hpp
#ifndef KILN_ASSET_INDEX_HPP
#define KILN_ASSET_INDEX_HPP

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace Kiln {
    using json = nlohmann::json;

    // "assetIndex" entry of a version document
    struct AssetIndex {
        std::string id;
        std::string sha1;
        uint64_t size = 0;
        uint64_t totalSize = 0;
        std::string url;

        static AssetIndex from_json(const json& j);
    };

    struct AssetObject {
        std::string hash;
        uint64_t size = 0;

        // objects/<first two hash chars>/<hash>
        std::string relativePath() const { return hash.substr(0, 2) + "/" + hash; }

        static AssetObject from_json(const json& j);
    };

    // The downloaded index document: logical name -> object
    struct AssetIndexFile {
        std::map<std::string, AssetObject> objects;

        static AssetIndexFile from_json(const json& j);
    };

} // namespace Kiln

#endif // KILN_ASSET_INDEX_HPP
