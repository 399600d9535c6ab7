// include/Kiln/Types/JavaVersion.hpp
#ifndef KILN_JAVA_VERSION_HPP
#define KILN_JAVA_VERSION_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Kiln {
    using json = nlohmann::json;

    // Versions that predate the "javaVersion" field run on Java 8
    constexpr unsigned int DEFAULT_JAVA_MAJOR_VERSION = 8;

    struct JavaVersion {
        std::string component;
        unsigned int majorVersion = DEFAULT_JAVA_MAJOR_VERSION;

        static JavaVersion from_json(const json& j);
    };

} // namespace Kiln

#endif // KILN_JAVA_VERSION_HPP
