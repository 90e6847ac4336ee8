// Remote directory listing: command construction and parsing of the text
// produced by `ls -laF --group-directories-first`.
#pragma once
#include "RemoteTypes.hpp"
#include <string>
#include <vector>

namespace scpnator {

// Builds the remote shell command that lists `path`. Paths rooted at "~"
// are listed relative to the home directory after `cd ~`, since tilde
// expansion does not happen inside a quoted argument.
std::string buildListCommand(const std::string& path);

// Remote probe that prints "exists" or "missing" for `path`.
std::string buildExistsCommand(const std::string& path);

// Parses long-format listing output into entries, sorted directories first
// and then case-insensitively by name. Blank lines, "total" lines and lines
// with fewer than 9 fields are dropped.
std::vector<RemoteEntry> parseLongListing(const std::string& text);

// Classifies one entry from its permission string and the -F decorated
// name. `name` is stripped of the indicator on return.
RemoteEntryKind classifyListingName(const std::string& permissions,
                                    std::string& name);

// Directories first, then case-insensitive ascending by name.
void sortRemoteEntries(std::vector<RemoteEntry>& entries);

} // namespace scpnator
