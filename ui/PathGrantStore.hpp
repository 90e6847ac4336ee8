#pragma once
#include "scpnator/AccessGrant.hpp"
#include <map>
#include <mutex>

// AccessGrantProvider for the desktop app. On macOS tokens are base64
// security-scoped bookmarks; access is started on the URL the bookmark
// resolved to, so a path must go through resolve() (or save()) first.
// Elsewhere the token is the absolute path and access calls are no-ops.
// Used from the GUI thread and the worker threads.
class PathGrantStore : public scpnator::AccessGrantProvider {
public:
    PathGrantStore() = default;
    ~PathGrantStore() override;
    PathGrantStore(const PathGrantStore&) = delete;
    PathGrantStore& operator=(const PathGrantStore&) = delete;

    std::string save(const std::string& path) override;
    std::optional<scpnator::ResolvedGrant> resolve(const std::string& token) override;
    bool startAccess(const std::string& path) override;
    void stopAccess(const std::string& path) override;

private:
    std::mutex mtx_;
    // ruta -> CFURLRef resuelto desde el bookmark (sólo macOS)
    std::map<std::string, const void*> resolved_;
};
