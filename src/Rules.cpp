// src/Rules.cpp
#include <Kiln/Rules.hpp>
#include <Kiln/Utils/OS.hpp>

#include <algorithm>
#include <cctype>

namespace Kiln {

    namespace {
        bool iequals(const std::string& a, const std::string& b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        }

        bool osMatches(const OS& os, const PlatformState& platform) {
            if (os.name && !iequals(*os.name, platform.osName))
                return false;
            if (os.arch && !iequals(*os.arch, platform.archName))
                return false;
            return true;
        }

        bool featuresMatch(const Features& features, const PlatformState& platform) {
            for (const auto& [name, required] : features) {
                auto it = platform.features.find(name);
                bool available = it != platform.features.end() && it->second;
                if (available != required)
                    return false;
            }
            return true;
        }
    } // namespace

    PlatformState PlatformState::current() {
        PlatformState state;
        state.osName = Utils::getOSNameForRules(Utils::getCurrentOS());
        state.archName = Utils::getArchNameForRules(Utils::getCurrentArch());
        return state;
    }

    bool ruleMatches(const Rule& rule, const PlatformState& platform) {
        if (rule.os && !osMatches(*rule.os, platform))
            return false;
        if (rule.features && !featuresMatch(*rule.features, platform))
            return false;
        return true;
    }

    bool isArgumentAllowed(const std::vector<Rule>& rules, const PlatformState& platform) {
        return std::all_of(rules.begin(), rules.end(), [&](const Rule& rule) {
            bool matches = ruleMatches(rule, platform);
            return rule.action == RuleAction::ALLOW ? matches : !matches;
        });
    }

    bool isLibraryAllowed(const Library& library, const PlatformState& platform) {
        bool allowed = true;
        for (const auto& rule : library.rules) {
            if (!rule.os)
                continue;
            bool matches = osMatches(*rule.os, platform);
            allowed = rule.action == RuleAction::ALLOW ? matches : !matches;
        }
        return allowed;
    }

    std::vector<std::string> flattenArguments(const std::vector<Argument>& arguments, const PlatformState& platform) {
        std::vector<std::string> result;
        for (const auto& argument : arguments) {
            if (isArgumentAllowed(argument.rules, platform)) {
                result.insert(result.end(), argument.tokens.begin(), argument.tokens.end());
            }
        }
        return result;
    }

} // namespace Kiln
