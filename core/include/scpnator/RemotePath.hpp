// Textual helpers for remote paths. Remote paths are plain strings joined
// with '/', never validated against a path grammar.
#pragma once
#include <string>

namespace scpnator {

// Exactly one '/' between base and name, whether or not base ends in '/'.
std::string joinRemotePath(const std::string& base, const std::string& name);

// Parent of a remote path: one trailing '/' removed, then cut at the last
// '/'. "~/a" -> "~", "/a" -> "/", "~" and "/" stay unchanged.
std::string remoteParent(const std::string& path);

// True for "~" and "~/..." (tilde is not expanded inside quoted arguments).
bool isHomeRelative(const std::string& path);

// Escapes single quotes for embedding inside '...' in a POSIX shell.
std::string shellEscapeSingleQuotes(const std::string& input);

// '<input>' with embedded quotes escaped.
std::string shellQuote(const std::string& input);

// Last path component of a local or remote path ("a/b/" -> "b").
std::string lastPathComponent(const std::string& path);

} // namespace scpnator
