#include "host.hpp"
#include <fmt/format.h>

HostIdentity::HostIdentity(std::string hostname, int port, std::string username,
                           AuthMethod auth, int timeout_secs,
                           std::vector<std::string> tags)
    : hostname_(std::move(hostname)), port_(port), username_(std::move(username)),
      auth_(std::move(auth)), timeout_secs_(timeout_secs), tags_(std::move(tags)) {}

std::string HostIdentity::key() const {
    return fmt::format("{}@{}:{}", username_, hostname_, port_);
}

Result<AuthMethod> resolve_auth(const std::optional<std::string>& password,
                                const std::optional<std::string>& key_filename,
                                const std::string& passphrase) {
    if (key_filename && !key_filename->empty()) {
        return Result<AuthMethod>::Ok(KeyFileAuth{*key_filename, passphrase});
    }
    if (password) {
        return Result<AuthMethod>::Ok(PasswordAuth{*password});
    }
    return Result<AuthMethod>::Err("no password or key_filename given");
}

Result<HostIdentity> make_host_identity(const std::string& hostname,
                                        const std::string& username,
                                        const std::optional<std::string>& password,
                                        const std::optional<std::string>& key_filename,
                                        int port,
                                        int timeout_secs,
                                        std::vector<std::string> tags) {
    auto fail = [](const std::string& msg) { return Result<HostIdentity>::Err(msg); };

    if (hostname.empty()) return fail("hostname is empty");
    if (username.empty()) return fail("username is empty");
    if (port <= 0 || port > 65535) return fail(fmt::format("port {} out of range", port));
    if (timeout_secs <= 0) return fail(fmt::format("timeout {} must be positive", timeout_secs));

    auto auth = resolve_auth(password, key_filename);
    if (auth.is_err()) return fail(auth.error);

    return Result<HostIdentity>::Ok(
        HostIdentity(hostname, port, username, auth.value, timeout_secs, std::move(tags)));
}

std::string auth_kind(const AuthMethod& auth) {
    return std::holds_alternative<KeyFileAuth>(auth) ? "key" : "password";
}
