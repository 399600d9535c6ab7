// include/Kiln/Types/Rule.hpp
#ifndef KILN_RULE_HPP
#define KILN_RULE_HPP

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace Kiln {
    using json = nlohmann::json;

    enum class RuleAction {
        ALLOW = 1,
        DISALLOW = 2,
    };

    RuleAction string_to_rule_action(const std::string& s);

    using Features = std::map<std::string, bool>;

    struct OS {
        std::optional<std::string> name;
        std::optional<std::string> version; // regex in the documents, not evaluated
        std::optional<std::string> arch;

        static OS from_json(const json& j);
    };

    struct Rule {
        RuleAction action = RuleAction::ALLOW;
        std::optional<OS> os;
        std::optional<Features> features;

        static Rule from_json(const json& j);
    };

} // namespace Kiln

#endif // KILN_RULE_HPP
