#include "scpnator/LocalBrowser.hpp"

#include <algorithm>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>

namespace scpnator {

namespace fs = std::filesystem;

namespace {

std::string normalized(const std::string& path) {
    if (path.empty())
        return path;
    std::string p = fs::path(path).lexically_normal().string();
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    return p;
}

} // namespace

void sortLocalEntries(std::vector<LocalEntry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const LocalEntry& a, const LocalEntry& b) {
        if (a.mtime != b.mtime)
            return a.mtime > b.mtime;
        return a.name < b.name;
    });
}

bool listLocalDirectory(const std::string& dir,
                        std::vector<LocalEntry>& out,
                        std::string& err) {
    out.clear();
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err = "No se pudo leer " + dir + ": " + ec.message();
        return false;
    }
    std::vector<LocalEntry> entries;
    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        const fs::path p = it->path();
        const std::string name = p.filename().string();
        if (name.empty() || name[0] == '.')
            continue;
        LocalEntry e;
        e.absolute_path = p.string();
        e.id = e.absolute_path;
        e.name = name;
        struct stat st {};
        if (::stat(e.absolute_path.c_str(), &st) == 0) {
            e.is_dir = S_ISDIR(st.st_mode);
            e.mtime = static_cast<std::int64_t>(st.st_mtime);
        } else {
            // Enlace roto: se muestra como archivo sin fecha
            e.is_dir = false;
        }
        entries.push_back(std::move(e));
    }
    if (ec) {
        err = "Error al recorrer " + dir + ": " + ec.message();
        return false;
    }
    sortLocalEntries(entries);
    out = std::move(entries);
    return true;
}

bool localEntryExists(const std::string& dir, const std::string& name) {
    std::error_code ec;
    const fs::path p = fs::path(dir) / name;
    return fs::exists(fs::symlink_status(p, ec));
}

LocalNavigator::LocalNavigator(std::string root)
    : root_(normalized(root)), current_(root_) {}

void LocalNavigator::setRoot(const std::string& root) {
    root_ = normalized(root);
    current_ = root_;
}

bool LocalNavigator::contains(const std::string& path) const {
    const std::string p = normalized(path);
    if (p == root_)
        return true;
    if (root_ == "/")
        return !p.empty() && p[0] == '/';
    return p.size() > root_.size() && p.compare(0, root_.size(), root_) == 0 &&
           p[root_.size()] == '/';
}

void LocalNavigator::setCurrent(const std::string& path) {
    current_ = contains(path) ? normalized(path) : root_;
}

bool LocalNavigator::enter(const LocalEntry& entry) {
    if (!entry.is_dir)
        return false;
    setCurrent(entry.absolute_path);
    return true;
}

void LocalNavigator::goUp() {
    if (isAtRoot())
        return;
    setCurrent(fs::path(current_).parent_path().string());
}

} // namespace scpnator
