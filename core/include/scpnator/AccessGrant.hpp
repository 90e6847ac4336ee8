// Persisted, revocable access grants ("security-scoped bookmarks") for the
// identity key and the local root folder. Platforms without sandboxing use
// plain paths as tokens and treat start/stop as no-ops.
#pragma once
#include <optional>
#include <string>

namespace scpnator {

struct ResolvedGrant {
    std::string path;
    bool        stale = false;
};

class AccessGrantProvider {
public:
    virtual ~AccessGrantProvider() = default;

    // Crea un token opaco para `path`; vacío si no se pudo.
    virtual std::string save(const std::string& path) = 0;
    virtual std::optional<ResolvedGrant> resolve(const std::string& token) = 0;

    virtual bool startAccess(const std::string& path) = 0;
    virtual void stopAccess(const std::string& path) = 0;
};

// Acquires access in the constructor and releases it on every exit path.
class ScopedAccess {
public:
    ScopedAccess(AccessGrantProvider* provider, const std::optional<std::string>& path)
        : provider_(provider) {
        if (provider_ && path && !path->empty() && provider_->startAccess(*path))
            path_ = *path;
    }
    ~ScopedAccess() {
        if (provider_ && path_)
            provider_->stopAccess(*path_);
    }
    ScopedAccess(const ScopedAccess&) = delete;
    ScopedAccess& operator=(const ScopedAccess&) = delete;

    bool active() const { return path_.has_value(); }

private:
    AccessGrantProvider* provider_ = nullptr;
    std::optional<std::string> path_;
};

} // namespace scpnator
