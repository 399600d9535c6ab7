// src/Types/VersionArguments.cpp
#include <Kiln/Types/VersionArguments.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <sstream>
#include <stdexcept>

namespace Kiln {

Argument Argument::from_json(const json& j) {
    Argument arg;
    if (j.is_string()) {
        arg.tokens.push_back(j.get<std::string>());
        return arg;
    }
    if (!j.is_object()) {
        throw std::runtime_error("Argument must be a string or an object, got: " + std::string(j.type_name()));
    }

    if (j.contains("rules") && j.at("rules").is_array()) {
        for (const auto& rule_json : j.at("rules")) {
            arg.rules.push_back(Rule::from_json(rule_json));
        }
    }
    if (j.contains("value")) {
        const auto& value = j.at("value");
        if (value.is_string()) {
            arg.tokens.push_back(value.get<std::string>());
        } else if (value.is_array()) {
            for (const auto& item : value) {
                arg.tokens.push_back(item.get<std::string>());
            }
        }
    }
    return arg;
}

std::vector<Argument> Arguments::parse_argument_array(const json& arr) {
    std::vector<Argument> result_args;
    if (!arr.is_array()) {
        return result_args;
    }
    for (const auto& arg_item_json : arr) {
        if (arg_item_json.is_string() || arg_item_json.is_object()) {
            result_args.push_back(Argument::from_json(arg_item_json));
        } else {
            KILN_LOG_WARN("[VersionArgsParser] Unknown argument type in array: {}", arg_item_json.dump());
        }
    }
    return result_args;
}

Arguments Arguments::from_json(const json& j) {
    Arguments args;
    if (j.contains("game")) {
        args.game = parse_argument_array(j.at("game"));
    }
    if (j.contains("jvm")) {
        args.jvm = parse_argument_array(j.at("jvm"));
    }
    return args;
}

Arguments Arguments::from_legacy(const std::string& minecraftArguments) {
    Arguments args;
    std::istringstream stream(minecraftArguments);
    std::string token;
    while (stream >> token) {
        args.game.push_back(Argument{{}, {token}});
    }
    args.jvm.push_back(Argument{{}, {"-Djava.library.path=${natives_directory}"}});
    args.jvm.push_back(Argument{{}, {"-cp", "${classpath}"}});
    return args;
}

} // namespace Kiln
