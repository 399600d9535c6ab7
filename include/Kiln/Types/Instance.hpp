// include/Kiln/Types/Instance.hpp
#ifndef KILN_INSTANCE_HPP
#define KILN_INSTANCE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace Kiln {

    // Unknown is what a corrupt or legacy row reads back as; it can never be written.
    enum class InstanceState {
        Unknown,
        Installing,
        Ready,
    };

    InstanceState instance_state_from_string(const std::string& raw);
    // Throws std::invalid_argument for InstanceState::Unknown
    std::string instance_state_to_string(InstanceState state);

    struct Instance {
        std::string id;
        std::string versionId;
        InstanceState state = InstanceState::Unknown;
        std::string type;
        std::string folder;
        unsigned int requiredJavaVersion = 8;
        std::string clientJarPath;
        std::string mainClass;
        std::string assetIndex;
        std::vector<std::string> classPath;
        std::vector<std::string> gameArguments;
        std::vector<std::string> jvmArguments;
    };

    enum class XboxAccountState {
        Unknown,
        Ok,
        Missing,
        Banned,
        NotAvailable,
        AgeVerificationMissing,
    };

    XboxAccountState xbox_account_state_from_string(const std::string& raw);
    std::string xbox_account_state_to_string(XboxAccountState state);

    struct Account {
        std::string id;
        XboxAccountState xboxAccountState = XboxAccountState::Unknown;
        std::string minecraftUserId;
        std::string xboxUserId;
        std::string username;
        bool hasMinecraftLicense = false;
        std::string skinUrl;
        std::string capeUrl;
        std::string accessToken;
        std::string refreshToken;
        int64_t expiresAt = 0; // unix seconds

        // Offline identity used when no stored account matches.
        static Account offline(const std::string& username);
    };

} // namespace Kiln

#endif // KILN_INSTANCE_HPP
