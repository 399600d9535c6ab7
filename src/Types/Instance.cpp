// src/Types/Instance.cpp
#include <Kiln/Types/Instance.hpp>
#include <stdexcept>

namespace Kiln {

InstanceState instance_state_from_string(const std::string& raw) {
    if (raw == "INSTALLING") return InstanceState::Installing;
    if (raw == "READY") return InstanceState::Ready;
    return InstanceState::Unknown;
}

std::string instance_state_to_string(InstanceState state) {
    switch (state) {
        case InstanceState::Installing: return "INSTALLING";
        case InstanceState::Ready: return "READY";
        case InstanceState::Unknown: break;
    }
    throw std::invalid_argument("The Unknown instance state cannot be stored");
}

XboxAccountState xbox_account_state_from_string(const std::string& raw) {
    if (raw == "OK") return XboxAccountState::Ok;
    if (raw == "MISSING") return XboxAccountState::Missing;
    if (raw == "BANNED") return XboxAccountState::Banned;
    if (raw == "NOT_AVAILABLE") return XboxAccountState::NotAvailable;
    if (raw == "AGE_VERIFICATION_MISSING") return XboxAccountState::AgeVerificationMissing;
    return XboxAccountState::Unknown;
}

std::string xbox_account_state_to_string(XboxAccountState state) {
    switch (state) {
        case XboxAccountState::Ok: return "OK";
        case XboxAccountState::Missing: return "MISSING";
        case XboxAccountState::Banned: return "BANNED";
        case XboxAccountState::NotAvailable: return "NOT_AVAILABLE";
        case XboxAccountState::AgeVerificationMissing: return "AGE_VERIFICATION_MISSING";
        case XboxAccountState::Unknown: break;
    }
    return "UNKNOWN";
}

Account Account::offline(const std::string& username) {
    Account account;
    account.id = "offline:" + username;
    account.username = username;
    account.minecraftUserId = "00000000-0000-0000-0000-000000000000";
    account.xboxUserId = "0";
    account.accessToken = "0";
    return account;
}

} // namespace Kiln
