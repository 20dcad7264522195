//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialStore.hpp
// Purpose: Allow-list oracle for API keys and Basic-auth users
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace authgate::auth {

//==========================================================================================================
// ICredentialStore
// Purpose: Decides whether presented API keys and Basic-auth credentials are acceptable.
//   IsValidApiKey: true when the key is allowed.
//   Authenticate: true when the username exists and the password matches (users registered without a
//                 password accept only an absent password).
// Implementations may throw; callers report such failures as internal errors.
//==========================================================================================================
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;
    virtual bool IsValidApiKey(const std::string& key) const = 0;
    virtual bool Authenticate(const std::string& username, const std::optional<std::string>& password) const = 0;
};

//==========================================================================================================
// StaticCredentialStore
// Purpose: Immutable in-memory allow-list. Comparisons are constant-time per candidate.
//==========================================================================================================
class StaticCredentialStore : public ICredentialStore {
public:
    StaticCredentialStore() = default;
    StaticCredentialStore(std::vector<std::string> apiKeys,
                          std::unordered_map<std::string, std::optional<std::string>> users);

    bool IsValidApiKey(const std::string& key) const override;
    bool Authenticate(const std::string& username, const std::optional<std::string>& password) const override;

    size_t ApiKeyCount() const { return apiKeys.size(); }
    size_t UserCount() const { return users.size(); }

private:
    std::vector<std::string> apiKeys;
    std::unordered_map<std::string, std::optional<std::string>> users;
};

} // namespace authgate::auth
