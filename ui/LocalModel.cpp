#include "LocalModel.hpp"
#include "DragPayload.hpp"
#include "TimeUtils.hpp"
#include <QApplication>
#include <QMimeData>
#include <QStyle>
#include <QUrl>

LocalModel::LocalModel(QObject* parent) : QAbstractListModel(parent) {}

int LocalModel::rowCount(const QModelIndex& parent) const {
  if (parent.isValid()) return 0;
  return static_cast<int>(items_.size());
}

QVariant LocalModel::data(const QModelIndex& index, int role) const {
  const auto* e = entryAt(index);
  if (!e) return {};
  if (role == Qt::DisplayRole) return QString::fromStdString(e->name);
  if (role == Qt::DecorationRole) {
    return QApplication::style()->standardIcon(e->is_dir ? QStyle::SP_DirIcon
                                                         : QStyle::SP_FileIcon);
  }
  if (role == Qt::ToolTipRole) {
    return tr("Modified: %1").arg(scpnatorui::localShortTime(static_cast<quint64>(e->mtime)));
  }
  return {};
}

Qt::ItemFlags LocalModel::flags(const QModelIndex& index) const {
  if (!index.isValid()) return Qt::ItemIsDropEnabled;
  return Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsDragEnabled;
}

QStringList LocalModel::mimeTypes() const {
  return {QString::fromLatin1(DragPayload::kRemoteItemsMime)};
}

QMimeData* LocalModel::mimeData(const QModelIndexList& indexes) const {
  QStringList paths;
  QList<QUrl> urls;
  for (const auto& idx : indexes) {
    const auto* e = entryAt(idx);
    if (!e) continue;
    const QString p = QString::fromStdString(e->absolute_path);
    if (paths.contains(p)) continue;
    paths << p;
    urls << QUrl::fromLocalFile(p);
  }
  if (paths.isEmpty()) return nullptr;
  auto* md = new QMimeData();
  md->setData(DragPayload::kLocalPathsMime, DragPayload::encodeLocalPaths(paths));
  md->setUrls(urls);
  return md;
}

bool LocalModel::canDropMimeData(const QMimeData* data, Qt::DropAction, int, int,
                                 const QModelIndex&) const {
  return data && data->hasFormat(DragPayload::kRemoteItemsMime);
}

bool LocalModel::dropMimeData(const QMimeData* data, Qt::DropAction action, int row,
                              int column, const QModelIndex& parent) {
  if (!canDropMimeData(data, action, row, column, parent)) return false;
  std::vector<scpnator::RemoteEntry> items;
  if (!DragPayload::decodeRemoteItems(data->data(DragPayload::kRemoteItemsMime), items) ||
      items.empty())
    return false;
  emit remoteItemsDropped(items);
  return true;
}

void LocalModel::setEntries(std::vector<scpnator::LocalEntry> entries) {
  beginResetModel();
  items_ = std::move(entries);
  endResetModel();
}

void LocalModel::clear() {
  setEntries({});
}

const scpnator::LocalEntry* LocalModel::entryAt(const QModelIndex& idx) const {
  if (!idx.isValid() || idx.row() < 0 || idx.row() >= static_cast<int>(items_.size()))
    return nullptr;
  return &items_[static_cast<std::size_t>(idx.row())];
}
