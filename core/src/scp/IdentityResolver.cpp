// Identity key resolution and stable-copy maintenance.
#include "scpnator/IdentityResolver.hpp"
#include "scpnator/RuntimeLogging.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace scpnator {

static const char* const kPublicKeySuffix = ".pub";

std::string stripPublicKeySuffix(const std::string& path) {
    const std::string suffix(kPublicKeySuffix);
    if (path.size() >= suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0)
        return path.substr(0, path.size() - suffix.size());
    return path;
}

std::string expandUserPath(const std::string& path, const std::string& home) {
    if (home.empty())
        return path;
    if (path == "~")
        return home;
    if (path.rfind("~/", 0) == 0)
        return (fs::path(home) / path.substr(2)).string();
    return path;
}

std::string currentHomeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home)
        return home;
    if (const passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir)
            return pw->pw_dir;
    }
    return {};
}

std::string defaultKeysDirectory() {
    const std::string home = currentHomeDirectory();
#ifdef __APPLE__
    return (fs::path(home) / "Library" / "Application Support" / "SCPNator" / "Keys").string();
#else
    const char* xdg = std::getenv("XDG_DATA_HOME");
    const fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home) / ".local" / "share";
    return (base / "scpnator" / "Keys").string();
#endif
}

IdentityResolver::IdentityResolver(AccessGrantProvider* grants,
                                   std::string keysDir,
                                   std::string homeDir)
    : grants_(grants), keysDir_(std::move(keysDir)), home_(std::move(homeDir)) {
    // Orden de búsqueda cuando no hay clave configurada.
    const fs::path sshDir = fs::path(home_) / ".ssh";
    fallbacks_ = {(sshDir / "id_rsa").string(), (sshDir / "id_ed25519").string()};
}

IdentityResolution IdentityResolver::resolve(const CredentialContext& ctx) const {
    IdentityResolution r;

    if (grants_ && ctx.identity_key_token && !ctx.identity_key_token->empty()) {
        const auto grant = grants_->resolve(*ctx.identity_key_token);
        if (grant && !grant->path.empty()) {
            if (grant->stale)
                emitLog(log_, LogLevel::Warning,
                        "Identity key grant is stale; re-select the key to refresh it");
            r.key_path = stripPublicKeySuffix(grant->path);
            r.scoped_path = grant->path;
            r.from_grant = true;
            return r;
        }
        emitLog(log_, LogLevel::Warning,
                "Identity key grant could not be resolved; using configured path");
    }

    std::string path = ctx.identity_key_path.value_or(std::string());
    path = stripPublicKeySuffix(path);
    if (!path.empty()) {
        r.key_path = path;
        return r;
    }

    for (const auto& candidate : fallbacks_) {
        std::error_code ec;
        if (fs::exists(candidate, ec)) {
            r.key_path = candidate;
            r.from_fallback = true;
            return r;
        }
    }
    // Sin clave: autenticación vía agente.
    return r;
}

StableIdentity IdentityResolver::stabilize(const std::string& keyPath) const {
    StableIdentity out;
    out.path = keyPath;

    const fs::path src(expandUserPath(keyPath, home_));
    const fs::path name = src.filename();
    auto fail = [&](const std::string& what, const std::error_code& ec) {
        out.error = what + (ec ? ": " + ec.message() : std::string());
        emitLog(log_, LogLevel::Warning,
                "Stable identity copy failed (" + out.error + "); using original key path");
        return out;
    };

    if (keysDir_.empty() || name.empty())
        return fail("no keys directory or key file name", {});

    std::error_code ec;
    fs::create_directories(keysDir_, ec);
    if (ec)
        return fail("cannot create " + keysDir_, ec);

    const fs::path dst = fs::path(keysDir_) / name;
    // Listado y transferencia comparten el mismo destino y el mismo .tmp.
    std::lock_guard<std::mutex> lk(copyMtx_);

    bool needsCopy = true;
    std::error_code srcEc, dstEc;
    const auto srcSize = fs::file_size(src, srcEc);
    const auto dstSize = fs::file_size(dst, dstEc);
    if (!srcEc && !dstEc) {
        const auto srcTime = fs::last_write_time(src, srcEc);
        const auto dstTime = fs::last_write_time(dst, dstEc);
        if (!srcEc && !dstEc)
            needsCopy = srcSize != dstSize || srcTime > dstTime;
    }

    if (needsCopy) {
        const fs::path tmp = fs::path(dst.string() + ".tmp");
        fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code ignore;
            fs::remove(tmp, ignore);
            return fail("cannot copy " + src.string(), ec);
        }
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (!ec)
            fs::rename(tmp, dst, ec);
        if (ec) {
            std::error_code ignore;
            fs::remove(tmp, ignore);
            return fail("cannot install " + dst.string(), ec);
        }
        out.copied = true;
        if (sensitiveLoggingEnabled())
            emitLog(log_, LogLevel::Debug, "Refreshed stable identity copy at " + dst.string());
    }

    out.path = dst.string();
    return out;
}

} // namespace scpnator
