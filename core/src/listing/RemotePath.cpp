#include "scpnator/RemotePath.hpp"

namespace scpnator {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string remoteParent(const std::string& path) {
    if (path == "/" || path == "~")
        return path;
    std::string p = path;
    if (!p.empty() && p.back() == '/')
        p.pop_back();
    const auto slash = p.rfind('/');
    if (slash == std::string::npos)
        return path;
    if (slash == 0)
        return "/";
    return p.substr(0, slash);
}

bool isHomeRelative(const std::string& path) {
    return path == "~" || path.rfind("~/", 0) == 0;
}

std::string shellEscapeSingleQuotes(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    return out;
}

std::string shellQuote(const std::string& input) {
    return "'" + shellEscapeSingleQuotes(input) + "'";
}

std::string lastPathComponent(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto slash = p.rfind('/');
    if (slash == std::string::npos)
        return p;
    return p.substr(slash + 1);
}

} // namespace scpnator
