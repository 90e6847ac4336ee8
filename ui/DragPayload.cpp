#include "DragPayload.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMimeData>
#include <QUrl>

namespace DragPayload {

QByteArray encodeRemoteItems(const std::vector<scpnator::RemoteEntry>& entries) {
    QJsonArray items;
    for (const auto& e : entries) {
        QJsonObject o;
        o.insert("name", QString::fromStdString(e.name));
        o.insert("dir", e.isDirectory());
        items.append(o);
    }
    QJsonObject root;
    root.insert("items", items);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

bool decodeRemoteItems(const QByteArray& json, std::vector<scpnator::RemoteEntry>& out) {
    out.clear();
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject())
        return false;
    const QJsonValue items = doc.object().value("items");
    if (!items.isArray())
        return false;
    for (const QJsonValue& v : items.toArray()) {
        const QJsonObject o = v.toObject();
        const QString name = o.value("name").toString();
        if (name.isEmpty())
            continue;
        out.push_back(scpnator::makeRemoteEntry(
            name.toStdString(), o.value("dir").toBool() ? scpnator::RemoteEntryKind::Directory
                                                        : scpnator::RemoteEntryKind::File));
    }
    return true;
}

QByteArray encodeLocalPaths(const QStringList& paths) {
    QJsonObject root;
    root.insert("paths", QJsonArray::fromStringList(paths));
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

bool decodeLocalPaths(const QByteArray& json, QStringList& out) {
    out.clear();
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject())
        return false;
    const QJsonValue paths = doc.object().value("paths");
    if (!paths.isArray())
        return false;
    for (const QJsonValue& v : paths.toArray()) {
        const QString p = v.toString();
        if (!p.isEmpty())
            out << p;
    }
    return true;
}

QStringList localPathsFromMime(const QMimeData* mime) {
    QStringList out;
    if (!mime)
        return out;
    if (mime->hasFormat(kLocalPathsMime) && decodeLocalPaths(mime->data(kLocalPathsMime), out))
        return out;
    for (const QUrl& u : mime->urls()) {
        if (u.isLocalFile())
            out << u.toLocalFile();
    }
    return out;
}

} // namespace DragPayload
