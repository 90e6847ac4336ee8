#include "RemoteModel.hpp"
#include "DragPayload.hpp"
#include <QApplication>
#include <QMimeData>
#include <QSet>
#include <QStyle>

RemoteModel::RemoteModel(QObject* parent) : QAbstractListModel(parent) {}

int RemoteModel::rowCount(const QModelIndex& parent) const {
  if (parent.isValid()) return 0;
  return static_cast<int>(items_.size());
}

QVariant RemoteModel::data(const QModelIndex& index, int role) const {
  const auto* e = entryAt(index);
  if (!e) return {};
  if (role == Qt::DisplayRole) {
    return QString::fromStdString(e->name) + (e->isDirectory() ? "/" : "");
  }
  if (role == Qt::DecorationRole) {
    const auto sp = e->isDirectory() ? QStyle::SP_DirIcon : QStyle::SP_FileIcon;
    return QApplication::style()->standardIcon(sp);
  }
  if (role == Qt::ToolTipRole) {
    switch (e->kind) {
      case scpnator::RemoteEntryKind::Directory: return tr("Folder");
      case scpnator::RemoteEntryKind::Symlink: return tr("Symbolic link");
      case scpnator::RemoteEntryKind::File: return tr("File");
      case scpnator::RemoteEntryKind::Other: break;
    }
    return tr("Other");
  }
  return {};
}

Qt::ItemFlags RemoteModel::flags(const QModelIndex& index) const {
  if (!index.isValid()) return Qt::ItemIsDropEnabled;
  const auto* e = entryAt(index);
  Qt::ItemFlags f = Qt::ItemIsEnabled | Qt::ItemIsSelectable;
  // "." y ".." no se arrastran
  if (e && e->name != "." && e->name != "..") f |= Qt::ItemIsDragEnabled;
  return f;
}

QStringList RemoteModel::mimeTypes() const {
  return {QString::fromLatin1(DragPayload::kRemoteItemsMime),
          QString::fromLatin1(DragPayload::kLocalPathsMime),
          QStringLiteral("text/uri-list")};
}

QMimeData* RemoteModel::mimeData(const QModelIndexList& indexes) const {
  const auto entries = entriesAt(indexes);
  if (entries.empty()) return nullptr;
  auto* md = new QMimeData();
  md->setData(DragPayload::kRemoteItemsMime, DragPayload::encodeRemoteItems(entries));
  return md;
}

bool RemoteModel::canDropMimeData(const QMimeData* data, Qt::DropAction, int, int,
                                  const QModelIndex&) const {
  if (!data || data->hasFormat(DragPayload::kRemoteItemsMime)) return false;
  return data->hasFormat(DragPayload::kLocalPathsMime) || data->hasUrls();
}

bool RemoteModel::dropMimeData(const QMimeData* data, Qt::DropAction action, int row,
                               int column, const QModelIndex& parent) {
  if (!canDropMimeData(data, action, row, column, parent)) return false;
  const QStringList paths = DragPayload::localPathsFromMime(data);
  if (paths.isEmpty()) return false;
  emit localPathsDropped(paths);
  return true;
}

void RemoteModel::setEntries(std::vector<scpnator::RemoteEntry> entries) {
  beginResetModel();
  items_ = std::move(entries);
  endResetModel();
}

void RemoteModel::clear() {
  setEntries({});
}

const scpnator::RemoteEntry* RemoteModel::entryAt(const QModelIndex& idx) const {
  if (!idx.isValid() || idx.row() < 0 || idx.row() >= static_cast<int>(items_.size()))
    return nullptr;
  return &items_[static_cast<std::size_t>(idx.row())];
}

std::vector<scpnator::RemoteEntry> RemoteModel::entriesAt(const QModelIndexList& indexes) const {
  std::vector<scpnator::RemoteEntry> out;
  QSet<int> seen;
  for (const auto& idx : indexes) {
    if (seen.contains(idx.row())) continue;
    seen.insert(idx.row());
    const auto* e = entryAt(idx);
    if (e && e->name != "." && e->name != "..") out.push_back(*e);
  }
  return out;
}
