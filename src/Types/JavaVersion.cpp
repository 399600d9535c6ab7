// src/Types/JavaVersion.cpp
#include <Kiln/Types/JavaVersion.hpp>

namespace Kiln {

JavaVersion JavaVersion::from_json(const json& j) {
    JavaVersion javaVersion;
    javaVersion.component = j.value("component", std::string{});
    javaVersion.majorVersion = j.value("majorVersion", DEFAULT_JAVA_MAJOR_VERSION);
    return javaVersion;
}

} // namespace Kiln
