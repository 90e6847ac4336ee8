#pragma once
#include <QAbstractListModel>
#include <QStringList>
#include <vector>
#include "scpnator/RemoteTypes.hpp"

// Remote pane model: a snapshot of the last successful listing. Dragging
// out encodes the selected entries; dropping local paths emits a request.
class RemoteModel : public QAbstractListModel {
  Q_OBJECT
public:
  explicit RemoteModel(QObject* parent = nullptr);

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

  void setEntries(std::vector<scpnator::RemoteEntry> entries);
  void clear();

  const scpnator::RemoteEntry* entryAt(const QModelIndex& idx) const;
  std::vector<scpnator::RemoteEntry> entriesAt(const QModelIndexList& indexes) const;

signals:
  void localPathsDropped(const QStringList& paths);

private:
  std::vector<scpnator::RemoteEntry> items_;
};
