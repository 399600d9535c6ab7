// include/Kiln/Types/VersionArguments.hpp
#ifndef KILN_VERSION_ARGUMENTS_HPP
#define KILN_VERSION_ARGUMENTS_HPP

#include <Kiln/Types/Rule.hpp>

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Kiln {

    // A declared argument is either a bare string or {rules, value: string | [string]};
    // both shapes are normalized to rules + tokens while parsing.
    struct Argument {
        std::vector<Rule> rules; // empty for bare strings
        std::vector<std::string> tokens;

        static Argument from_json(const json& j);
    };

    struct Arguments {
        std::vector<Argument> game;
        std::vector<Argument> jvm;

        static Arguments from_json(const json& j);
        static std::vector<Argument> parse_argument_array(const json& arr);

        // Old documents only carry a "minecraftArguments" string
        static Arguments from_legacy(const std::string& minecraftArguments);
    };

} // namespace Kiln

#endif // KILN_VERSION_ARGUMENTS_HPP
