// Local pane: directory snapshots and navigation confined to a root folder.
#pragma once
#include "RemoteTypes.hpp"
#include <string>
#include <vector>

namespace scpnator {

// Scans `dir` (hidden entries skipped), newest modification time first,
// ties by name. On failure `out` is left empty and `err` describes the
// LocalIO failure.
bool listLocalDirectory(const std::string& dir,
                        std::vector<LocalEntry>& out,
                        std::string& err);

// True if `dir`/`name` exists (file, folder or dangling link).
bool localEntryExists(const std::string& dir, const std::string& name);

// Sort used by listLocalDirectory.
void sortLocalEntries(std::vector<LocalEntry>& entries);

class LocalNavigator {
public:
    explicit LocalNavigator(std::string root);

    const std::string& root() const { return root_; }
    const std::string& current() const { return current_; }

    // Resets the root and moves to it.
    void setRoot(const std::string& root);

    // Moves to `path` if it lies inside the root; otherwise to the root.
    void setCurrent(const std::string& path);

    // Enters a directory entry of the current listing; files are ignored.
    bool enter(const LocalEntry& entry);

    // Parent of the current directory, clamped to the root.
    void goUp();

    bool isAtRoot() const { return current_ == root_; }
    bool contains(const std::string& path) const;

private:
    std::string root_;
    std::string current_;
};

} // namespace scpnator
