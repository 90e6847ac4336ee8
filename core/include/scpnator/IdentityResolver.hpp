// Resolves which private key (if any) ssh/scp should use, and keeps a stable
// permission-restricted copy of it so agent/keychain integrations remember
// the passphrase per path.
#pragma once
#include "AccessGrant.hpp"
#include "RemoteTypes.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scpnator {

struct IdentityResolution {
    std::optional<std::string> key_path;    // clave privada elegida
    std::optional<std::string> scoped_path; // requiere ScopedAccess mientras se use
    bool from_grant = false;
    bool from_fallback = false;
};

struct StableIdentity {
    std::string path;      // ruta a pasar con -i
    bool        copied = false;
    std::string error;     // KeyCopy: se usa la ruta original
};

// "~/.ssh/id_rsa.pub" -> "~/.ssh/id_rsa"; otherwise unchanged.
std::string stripPublicKeySuffix(const std::string& path);

// Expands a leading "~" or "~/" against `home`.
std::string expandUserPath(const std::string& path, const std::string& home);

// $HOME, or the passwd entry when unset.
std::string currentHomeDirectory();

// Per-user application data folder for stable key copies.
std::string defaultKeysDirectory();

class IdentityResolver {
public:
    IdentityResolver(AccessGrantProvider* grants,
                     std::string keysDir,
                     std::string homeDir = currentHomeDirectory());

    // Priority: grant token, configured path, ~/.ssh fallbacks, none (agent).
    IdentityResolution resolve(const CredentialContext& ctx) const;

    // Copies `keyPath` into the keys folder (0600) when missing, resized or
    // older than the source. Falls back to the original path on failure.
    // Safe to call from several sessions at once.
    StableIdentity stabilize(const std::string& keyPath) const;

    const std::vector<std::string>& fallbackCandidates() const { return fallbacks_; }
    const std::string& keysDirectory() const { return keysDir_; }

    void setLogSink(LogSink sink) { log_ = std::move(sink); }

private:
    AccessGrantProvider* grants_ = nullptr; // no es propiedad
    std::string keysDir_;
    std::string home_;
    std::vector<std::string> fallbacks_;
    mutable std::mutex copyMtx_; // serializa stabilize()
    LogSink log_;
};

} // namespace scpnator
