// JSON payloads carried by drags between the two panes.
//   remote -> anywhere: {"items": [{"name": "...", "dir": true}]}
//   local  -> remote:   {"paths": ["/abs/path", ...]}
#pragma once
#include "scpnator/RemoteTypes.hpp"
#include <QByteArray>
#include <QStringList>
#include <vector>

class QMimeData;

namespace DragPayload {

inline constexpr const char* kRemoteItemsMime = "application/x-scpnator-remote-items";
inline constexpr const char* kLocalPathsMime = "application/x-scpnator-local-paths";

QByteArray encodeRemoteItems(const std::vector<scpnator::RemoteEntry>& entries);
// false on malformed JSON; entries without a name are skipped.
bool decodeRemoteItems(const QByteArray& json, std::vector<scpnator::RemoteEntry>& out);

QByteArray encodeLocalPaths(const QStringList& paths);
bool decodeLocalPaths(const QByteArray& json, QStringList& out);

// Local paths from our own payload or, failing that, from file URLs
// (drops coming from the system file manager).
QStringList localPathsFromMime(const QMimeData* mime);

} // namespace DragPayload
