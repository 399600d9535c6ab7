// include/Kiln/Rules.hpp
#ifndef KILN_RULES_HPP
#define KILN_RULES_HPP

#include <Kiln/Types/Library.hpp>
#include <Kiln/Types/Rule.hpp>
#include <Kiln/Types/VersionArguments.hpp>

#include <string>
#include <vector>

namespace Kiln {

    // What rules are evaluated against. Features missing from the map count as false.
    struct PlatformState {
        std::string osName;   // "windows", "osx", "linux"
        std::string archName; // "x86", "x86_64", "arm64", "arm"
        Features features;

        static PlatformState current();
    };

    // True when the rule's os and features predicates both hold (absent predicates hold).
    bool ruleMatches(const Rule& rule, const PlatformState& platform);

    // Every rule must be satisfied: allow rules when they match, disallow rules when they don't.
    bool isArgumentAllowed(const std::vector<Rule>& rules, const PlatformState& platform);

    // Folds the library rules in order; rules without an os block are ignored.
    bool isLibraryAllowed(const Library& library, const PlatformState& platform);

    std::vector<std::string> flattenArguments(const std::vector<Argument>& arguments, const PlatformState& platform);

} // namespace Kiln

#endif // KILN_RULES_HPP
