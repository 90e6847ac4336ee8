#pragma once
#include <QAbstractListModel>
#include <vector>
#include "scpnator/RemoteTypes.hpp"

// Local pane model over a LocalEntry snapshot (newest first). Drags carry
// both our path payload and file URLs; remote items dropped here are
// forwarded as a download request.
class LocalModel : public QAbstractListModel {
  Q_OBJECT
public:
  explicit LocalModel(QObject* parent = nullptr);

  int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  QVariant data(const QModelIndex& index, int role) const override;
  Qt::ItemFlags flags(const QModelIndex& index) const override;

  QStringList mimeTypes() const override;
  QMimeData* mimeData(const QModelIndexList& indexes) const override;
  Qt::DropActions supportedDropActions() const override { return Qt::CopyAction; }
  Qt::DropActions supportedDragActions() const override { return Qt::CopyAction; }
  bool canDropMimeData(const QMimeData* data, Qt::DropAction action, int row,
                       int column, const QModelIndex& parent) const override;
  bool dropMimeData(const QMimeData* data, Qt::DropAction action, int row,
                    int column, const QModelIndex& parent) override;

  void setEntries(std::vector<scpnator::LocalEntry> entries);
  void clear();
  const scpnator::LocalEntry* entryAt(const QModelIndex& idx) const;

signals:
  void remoteItemsDropped(const std::vector<scpnator::RemoteEntry>& items);

private:
  std::vector<scpnator::LocalEntry> items_;
};
