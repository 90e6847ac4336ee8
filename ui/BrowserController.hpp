#pragma once
#include "PathGrantStore.hpp"
#include "SettingsStore.hpp"
#include "scpnator/LocalBrowser.hpp"
#include "scpnator/RemoteTypes.hpp"
#include "scpnator/TransferBatch.hpp"
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <functional>
#include <memory>
#include <vector>

// One row of the transfer status list as shown by the UI.
struct TransferRow {
    quint64 id = 0;
    QString name;
    scpnator::TransferState state = scpnator::TransferState::Pending;
    QString message;
};

// View model for the two panes. Listings and transfers run on worker
// threads; results come back to the GUI thread through queued calls and are
// published with the signals below. Remote listing and transfers each have
// a busy flag: a listing request while one is in flight is dropped, a
// transfer while a batch runs is rejected.
class BrowserController : public QObject {
    Q_OBJECT
public:
    explicit BrowserController(SettingsStore* settings, QObject* parent = nullptr);
    ~BrowserController() override;

    // Asked (on the GUI thread) before overwriting; true = overwrite.
    void setOverwritePrompt(std::function<bool(const QStringList&)> prompt) {
        overwritePrompt_ = std::move(prompt);
    }

    void start();

    QString remotePath() const { return remotePath_; }
    QString localPath() const;
    QString localRoot() const;
    bool remoteBusy() const { return remoteBusy_; }
    bool transferBusy() const { return transferBusy_; }
    bool usingMockRemote() const;

public slots:
    void refreshRemote();
    void openRemote(const scpnator::RemoteEntry& entry);
    void goRemoteUp();
    void goRemoteHome();

    void refreshLocal();
    void openLocal(const scpnator::LocalEntry& entry);
    void goLocalUp();
    void setLocalRoot(const QString& path);

    void transferSelection(const std::vector<scpnator::RemoteEntry>& entries);
    void dropRemoteOnLocal(const std::vector<scpnator::RemoteEntry>& entries);
    void dropLocalOnRemote(const QStringList& paths);
    void cancelTransfers();

signals:
    void remoteListingChanged(const std::vector<scpnator::RemoteEntry>& entries);
    void remoteListingFailed(const QString& message);
    void remotePathChanged(const QString& path);
    void remoteBusyChanged(bool busy);

    void localListingChanged(const std::vector<scpnator::LocalEntry>& entries);
    void localListingFailed(const QString& message);
    void localPathChanged(const QString& path);

    void transferBusyChanged(bool busy);
    void batchStarted(const QVector<TransferRow>& rows);
    void transferItemChanged(const TransferRow& row);
    void transferDiagnostic(quint64 itemId, const QString& text);
    void batchFinished(int succeeded, int failed);
    void statusMessage(const QString& text, int timeoutMs);

private:
    struct Backend;
    class Bridge;

    void setRemotePath(const QString& path);
    void setTransferBusy(bool busy);
    bool confirmOverwrite(const QStringList& names);
    template <typename Job> void runBatch(Job job);

    SettingsStore* settings_ = nullptr; // no es propiedad
    std::shared_ptr<Backend> backend_;
    scpnator::LocalNavigator navigator_;
    std::function<bool(const QStringList&)> overwritePrompt_;

    QString remotePath_;
    bool remoteBusy_ = false;
    bool transferBusy_ = false;
};
