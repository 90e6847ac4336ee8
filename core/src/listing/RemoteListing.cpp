// Parser for `ls -laF --group-directories-first` output.
#include "scpnator/RemoteListing.hpp"
#include "scpnator/RemotePath.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace scpnator {

namespace {

// permisos + 7 campos de metadatos + inicio del nombre
constexpr std::size_t kMinListingFields = 9;

std::string trimmed(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream in(line);
    std::string f;
    while (in >> f)
        fields.push_back(f);
    return fields;
}

std::string lowered(const std::string& s) {
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

} // namespace

std::string buildListCommand(const std::string& path) {
    static const std::string kLs = "ls -laF --group-directories-first ";
    if (path.empty())
        return kLs + "'.' 2>/dev/null";
    if (isHomeRelative(path)) {
        std::string suffix = path.substr(1);
        if (!suffix.empty() && suffix.front() == '/')
            suffix.erase(0, 1);
        const std::string target = suffix.empty() ? "." : suffix;
        return "cd ~ && " + kLs + shellQuote(target) + " 2>/dev/null";
    }
    return kLs + shellQuote(path) + " 2>/dev/null";
}

std::string buildExistsCommand(const std::string& path) {
    std::string prefix;
    std::string target = path;
    if (isHomeRelative(path)) {
        prefix = "cd ~ && ";
        target = path.substr(1);
        if (!target.empty() && target.front() == '/')
            target.erase(0, 1);
        if (target.empty())
            target = ".";
    }
    return prefix + "if [ -e " + shellQuote(target) +
           " ]; then echo exists; else echo missing; fi";
}

RemoteEntryKind classifyListingName(const std::string& permissions,
                                    std::string& name) {
    const char type = permissions.empty() ? '-' : permissions.front();

    // Con -l los enlaces se muestran como "nombre -> destino"; el indicador
    // de -F aplica entonces al destino, no al enlace.
    if (type == 'l') {
        const auto arrow = name.find(" -> ");
        if (arrow != std::string::npos) {
            name.erase(arrow);
            return RemoteEntryKind::Symlink;
        }
    }

    if (!name.empty() && name.back() == '/') {
        name.pop_back();
        return RemoteEntryKind::Directory;
    }
    if (!name.empty() && name.back() == '@') {
        name.pop_back();
        return type == 'l' ? RemoteEntryKind::Symlink : RemoteEntryKind::File;
    }
    if (type == 'd')
        return RemoteEntryKind::Directory;
    if (type == 'l')
        return RemoteEntryKind::Symlink;
    return RemoteEntryKind::File;
}

void sortRemoteEntries(std::vector<RemoteEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const RemoteEntry& a, const RemoteEntry& b) {
                         if (a.isDirectory() != b.isDirectory())
                             return a.isDirectory(); // dirs primero
                         const std::string la = lowered(a.name);
                         const std::string lb = lowered(b.name);
                         if (la != lb)
                             return la < lb;
                         return a.name < b.name;
                     });
}

std::vector<RemoteEntry> parseLongListing(const std::string& text) {
    std::vector<RemoteEntry> entries;
    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        const std::string line = trimmed(raw);
        if (line.empty() || line.rfind("total ", 0) == 0 || line == "total")
            continue;
        const auto fields = splitFields(line);
        if (fields.size() < kMinListingFields)
            continue; // línea no parseable: se descarta

        std::string name = fields[kMinListingFields - 1];
        for (std::size_t i = kMinListingFields; i < fields.size(); ++i)
            name += " " + fields[i];

        const RemoteEntryKind kind = classifyListingName(fields[0], name);
        if (name.empty())
            continue;
        entries.push_back(makeRemoteEntry(name, kind));
    }
    sortRemoteEntries(entries);
    return entries;
}

} // namespace scpnator
