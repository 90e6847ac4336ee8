#pragma once
#include "BrowserController.hpp"
#include "PathGrantStore.hpp"
#include <QHash>
#include <QMainWindow>

class QAction;
class QLabel;
class QListView;
class QModelIndex;
class QPlainTextEdit;
class QTableWidget;
class LocalModel;
class RemoteModel;
class SecretStore;
class SettingsStore;

// Two panes (local left, remote right) over the BrowserController, with the
// current batch's statuses and the ssh/scp diagnostic stream below.
class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(SettingsStore* settings, QWidget* parent = nullptr);

private slots:
    void openSettings();
    void chooseLocalRoot();
    void transferSelected();
    void remoteActivated(const QModelIndex& idx);
    void localActivated(const QModelIndex& idx);

    void showBatch(const QVector<TransferRow>& rows);
    void updateRow(const TransferRow& row);
    void appendDiagnostic(quint64 itemId, const QString& text);
    void batchDone(int succeeded, int failed);

private:
    void updateActions();

    SettingsStore* settings_ = nullptr; // no es propiedad
    PathGrantStore grants_;
    BrowserController* controller_ = nullptr;

    LocalModel* localModel_ = nullptr;
    RemoteModel* remoteModel_ = nullptr;
    QListView* localView_ = nullptr;
    QListView* remoteView_ = nullptr;
    QLabel* localPathLabel_ = nullptr;
    QLabel* remotePathLabel_ = nullptr;
    QTableWidget* transfers_ = nullptr;
    QPlainTextEdit* diagnostics_ = nullptr;
    QHash<quint64, int> rowById_;

    QAction* actTransfer_ = nullptr;
    QAction* actCancel_ = nullptr;
    QAction* actRefresh_ = nullptr;
};
