#include "PathGrantStore.hpp"
#include "Logging.hpp"
#include <QByteArray>
#include <QFileInfo>
#include <QString>

#ifdef __APPLE__
#include <CoreFoundation/CoreFoundation.h>

namespace {

CFURLRef urlForPath(const std::string& path, bool isDir) {
    return CFURLCreateFromFileSystemRepresentation(
        kCFAllocatorDefault, reinterpret_cast<const UInt8*>(path.c_str()),
        static_cast<CFIndex>(path.size()), isDir);
}

CFURLRef asUrl(const void* p) {
    return static_cast<CFURLRef>(p);
}

} // namespace

PathGrantStore::~PathGrantStore() {
    for (auto& kv : resolved_)
        CFRelease(asUrl(kv.second));
}

std::string PathGrantStore::save(const std::string& path) {
    const bool isDir = QFileInfo(QString::fromStdString(path)).isDir();
    CFURLRef url = urlForPath(path, isDir);
    if (!url) return {};
    CFErrorRef error = nullptr;
    CFDataRef data = CFURLCreateBookmarkData(kCFAllocatorDefault, url,
                                             kCFURLBookmarkCreationWithSecurityScope,
                                             nullptr, nullptr, &error);
    CFRelease(url);
    if (!data) {
        if (error) CFRelease(error);
        qWarning(scSettings) << "Could not create a bookmark for the selected path";
        return {};
    }
    const QByteArray raw(reinterpret_cast<const char*>(CFDataGetBytePtr(data)),
                         static_cast<int>(CFDataGetLength(data)));
    CFRelease(data);
    const std::string token = raw.toBase64().toStdString();
    // Deja la URL con ámbito de seguridad lista para startAccess().
    if (!resolve(token))
        qWarning(scSettings) << "New bookmark could not be resolved";
    return token;
}

std::optional<scpnator::ResolvedGrant> PathGrantStore::resolve(const std::string& token) {
    if (token.empty()) return std::nullopt;
    const QByteArray raw = QByteArray::fromBase64(QByteArray::fromStdString(token));
    CFDataRef data = CFDataCreate(kCFAllocatorDefault,
                                  reinterpret_cast<const UInt8*>(raw.constData()), raw.size());
    if (!data) return std::nullopt;
    Boolean stale = false;
    CFErrorRef error = nullptr;
    CFURLRef url = CFURLCreateByResolvingBookmarkData(kCFAllocatorDefault, data,
                                                      kCFURLBookmarkResolutionWithSecurityScope,
                                                      nullptr, nullptr, &stale, &error);
    CFRelease(data);
    if (!url) {
        if (error) CFRelease(error);
        return std::nullopt;
    }
    char buf[4096];
    if (!CFURLGetFileSystemRepresentation(url, true, reinterpret_cast<UInt8*>(buf),
                                          sizeof(buf))) {
        CFRelease(url);
        return std::nullopt;
    }
    const std::string path(buf);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = resolved_.find(path);
        if (it != resolved_.end()) {
            CFRelease(asUrl(it->second));
            it->second = url;
        } else {
            resolved_.emplace(path, url);
        }
    }
    return scpnator::ResolvedGrant{path, stale != 0};
}

bool PathGrantStore::startAccess(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto it = resolved_.find(path);
    if (it == resolved_.end())
        return false; // sin bookmark: acceso normal del proceso
    return CFURLStartAccessingSecurityScopedResource(asUrl(it->second));
}

void PathGrantStore::stopAccess(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto it = resolved_.find(path);
    if (it != resolved_.end())
        CFURLStopAccessingSecurityScopedResource(asUrl(it->second));
}

#else

PathGrantStore::~PathGrantStore() = default;

std::string PathGrantStore::save(const std::string& path) {
    return QFileInfo(QString::fromStdString(path)).absoluteFilePath().toStdString();
}

std::optional<scpnator::ResolvedGrant> PathGrantStore::resolve(const std::string& token) {
    if (token.empty()) return std::nullopt;
    return scpnator::ResolvedGrant{token, !QFileInfo::exists(QString::fromStdString(token))};
}

bool PathGrantStore::startAccess(const std::string&) { return true; }
void PathGrantStore::stopAccess(const std::string&) {}

#endif
