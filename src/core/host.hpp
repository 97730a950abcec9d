#pragma once

#include <string>
#include <optional>
#include <vector>
#include "types.hpp"

// Resolve the auth method once: a key file takes precedence over a password
// when both are supplied. Returns Err when neither is usable.
Result<AuthMethod> resolve_auth(const std::optional<std::string>& password,
                                const std::optional<std::string>& key_filename,
                                const std::string& passphrase = "");

// Validating constructor for inventory entries and programmatic callers.
Result<HostIdentity> make_host_identity(const std::string& hostname,
                                        const std::string& username,
                                        const std::optional<std::string>& password,
                                        const std::optional<std::string>& key_filename,
                                        int port,
                                        int timeout_secs,
                                        std::vector<std::string> tags = {});

// "password" or "key"
std::string auth_kind(const AuthMethod& auth);
