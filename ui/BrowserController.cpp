#include "BrowserController.hpp"
#include "Logging.hpp"
#include "scpnator/IdentityResolver.hpp"
#include "scpnator/MockRemoteSession.hpp"
#include "scpnator/RemotePath.hpp"
#include "scpnator/RuntimeLogging.hpp"
#include "scpnator/ScpSession.hpp"
#include "scpnator/TransferOrchestrator.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QMetaObject>
#include <QPointer>
#include <thread>

namespace {

TransferRow toRow(const scpnator::TransferItemStatus& s) {
    TransferRow r;
    r.id = s.id();
    r.name = QString::fromStdString(s.item().name);
    r.state = s.state();
    r.message = QString::fromStdString(s.message());
    return r;
}

QString expandHome(const QString& path) {
    if (path == "~") return QDir::homePath();
    if (path.startsWith("~/")) return QDir::homePath() + path.mid(1);
    return path;
}

} // namespace

// Observer for the orchestrator; every notification is re-posted to the
// GUI thread.
class BrowserController::Bridge : public scpnator::TransferObserver {
public:
    explicit Bridge(QPointer<BrowserController> owner) : owner_(std::move(owner)) {}

    void batchStarted(const scpnator::TransferBatch& batch) override {
        QVector<TransferRow> rows;
        for (const auto& it : batch.items()) rows.push_back(toRow(it));
        post([rows](BrowserController* c) { emit c->batchStarted(rows); });
    }
    void itemChanged(const scpnator::TransferItemStatus& item) override {
        const TransferRow row = toRow(item);
        if (item.state() == scpnator::TransferState::Failed)
            qWarning(scTransfer) << "Transfer failed:" << row.name
                                 << QString::fromStdString(scpnator::diagnosticSummary(item.message()));
        post([row](BrowserController* c) { emit c->transferItemChanged(row); });
    }
    void diagnostic(const scpnator::DiagnosticChunk& chunk) override {
        const quint64 id = chunk.item_id;
        const QString text = QString::fromStdString(chunk.text);
        post([id, text](BrowserController* c) { emit c->transferDiagnostic(id, text); });
    }
    void batchFinished(const scpnator::TransferBatch& batch) override {
        const int ok = static_cast<int>(batch.count(scpnator::TransferState::Succeeded));
        const int failed = static_cast<int>(batch.count(scpnator::TransferState::Failed));
        post([ok, failed](BrowserController* c) { emit c->batchFinished(ok, failed); });
    }

private:
    template <typename F> void post(F fn) {
        QPointer<BrowserController> owner = owner_;
        QObject* app = QCoreApplication::instance();
        if (!app) return;
        QMetaObject::invokeMethod(
            app,
            [owner, fn]() {
                if (owner) fn(owner.data());
            },
            Qt::QueuedConnection);
    }

    QPointer<BrowserController> owner_;
};

// Objects shared with the worker threads; kept alive by every thread that
// uses them.
struct BrowserController::Backend {
    PathGrantStore grants;
    scpnator::PosixProcessRunner runner;
    scpnator::IdentityResolver identity{&grants, scpnator::defaultKeysDirectory()};
    std::shared_ptr<scpnator::RemoteSession> listing;
    std::shared_ptr<scpnator::RemoteSession> transfer;
    std::unique_ptr<scpnator::TransferOrchestrator> orchestrator;
    std::unique_ptr<Bridge> bridge;
    bool mock = false;

    // Sólo las sesiones reales llevan credenciales; el mock las ignora.
    static void applyCredentials(scpnator::RemoteSession& session,
                                 const scpnator::CredentialContext& ctx) {
        if (auto* s = dynamic_cast<scpnator::ScpSession*>(&session)) s->setCredentials(ctx);
    }
};

BrowserController::BrowserController(SettingsStore* settings, QObject* parent)
    : QObject(parent),
      settings_(settings),
      backend_(std::make_shared<Backend>()),
      navigator_(SettingsStore::defaultLocalRoot().toStdString()) {
    auto sink = qtLogSink(scSession);
    backend_->identity.setLogSink(sink);

    if (scpnator::mockRemoteRequested()) {
        auto mock = std::make_shared<scpnator::MockRemoteSession>();
        mock->setMaterializeDownloads(true);
        backend_->listing = mock;
        backend_->transfer = mock;
        backend_->mock = true;
        qInfo(scSession) << "Using in-memory mock remote";
    } else {
        // Sesiones separadas: el listado no compite con las transferencias.
        auto listing = std::make_shared<scpnator::ScpSession>(backend_->runner, backend_->identity,
                                                              &backend_->grants);
        auto transfer = std::make_shared<scpnator::ScpSession>(backend_->runner, backend_->identity,
                                                               &backend_->grants);
        listing->setLogSink(sink);
        transfer->setLogSink(sink);
        backend_->listing = listing;
        backend_->transfer = transfer;
    }

    backend_->orchestrator = std::make_unique<scpnator::TransferOrchestrator>(*backend_->transfer);
    backend_->bridge = std::make_unique<Bridge>(QPointer<BrowserController>(this));
    auto& orch = *backend_->orchestrator;
    orch.setObserver(backend_->bridge.get());
    orch.setLogSink(qtLogSink(scTransfer));

    QPointer<BrowserController> self(this);
    orch.setConfirmOverwrite([self](const std::vector<std::string>& names) {
        QStringList list;
        for (const auto& n : names) list << QString::fromStdString(n);
        bool answer = false;
        if (!self) return false;
        QMetaObject::invokeMethod(
            self,
            [&answer, self, list] {
                if (self) answer = self->confirmOverwrite(list);
            },
            Qt::BlockingQueuedConnection);
        return answer;
    });
    orch.setLocalRefresh([self] {
        QMetaObject::invokeMethod(
            QCoreApplication::instance(),
            [self] {
                if (self) self->refreshLocal();
            },
            Qt::QueuedConnection);
    });
    orch.setRemoteRefresh([self] {
        QMetaObject::invokeMethod(
            QCoreApplication::instance(),
            [self] {
                if (self) self->refreshRemote();
            },
            Qt::QueuedConnection);
    });
}

BrowserController::~BrowserController() {
    // El hilo de la transferencia conserva el backend; sólo se le pide parar.
    if (backend_ && backend_->orchestrator) backend_->orchestrator->cancel();
}

bool BrowserController::usingMockRemote() const {
    return backend_->mock;
}

QString BrowserController::localPath() const {
    return QString::fromStdString(navigator_.current());
}

QString BrowserController::localRoot() const {
    return QString::fromStdString(navigator_.root());
}

void BrowserController::start() {
    QString root = expandHome(SettingsStore::defaultLocalRoot());
    const QString token = settings_->localAccessBookmark();
    if (!token.isEmpty()) {
        if (auto grant = backend_->grants.resolve(token.toStdString())) {
            root = QString::fromStdString(grant->path);
            if (grant->stale)
                qWarning(scSettings) << "Local folder grant is stale; choose the folder again";
        } else {
            qWarning(scSettings) << "Local folder grant could not be resolved";
        }
    }
    QDir().mkpath(root);
    navigator_.setRoot(root.toStdString());
    navigator_.setCurrent(expandHome(settings_->lastLocalPath()).toStdString());
    emit localPathChanged(localPath());

    setRemotePath(settings_->baseDirectory().isEmpty() ? QStringLiteral("~")
                                                       : settings_->baseDirectory());
    refreshLocal();
    refreshRemote();
}

// ------------------------------------------------------------------ remote

void BrowserController::setRemotePath(const QString& path) {
    remotePath_ = path;
    settings_->setLastRemotePath(path);
    emit remotePathChanged(path);
}

void BrowserController::refreshRemote() {
    if (remoteBusy_) return; // ya hay un listado en curso
    const auto ctx = settings_->credentialContext();
    if (!backend_->mock && (ctx.server_address.empty() || ctx.username.empty())) {
        emit remoteListingChanged({});
        emit remoteListingFailed(tr("Set the server and username in Settings"));
        return;
    }
    remoteBusy_ = true;
    emit remoteBusyChanged(true);

    const QString path = remotePath_;
    auto backend = backend_;
    QPointer<BrowserController> self(this);
    std::thread([self, backend, ctx, path]() {
        Backend::applyCredentials(*backend->listing, ctx);
        std::vector<scpnator::RemoteEntry> entries;
        std::string err;
        const bool ok = backend->listing->list(path.toStdString(), entries, err);
        const QString qerr = QString::fromStdString(err);
        QObject* app = QCoreApplication::instance();
        if (!app) return;
        QMetaObject::invokeMethod(
            app,
            [self, ok, entries = std::move(entries), qerr, path]() mutable {
                if (!self) return;
                self->remoteBusy_ = false;
                emit self->remoteBusyChanged(false);
                if (path != self->remotePath_) {
                    // Se navegó mientras tanto: listar la ruta actual.
                    self->refreshRemote();
                    return;
                }
                if (!ok) {
                    const QString summary =
                        QString::fromStdString(scpnator::diagnosticSummary(qerr.toStdString()));
                    qWarning(scListing) << "Remote listing failed:" << summary;
                    emit self->remoteListingChanged({});
                    emit self->remoteListingFailed(summary.isEmpty() ? qerr : summary);
                    return;
                }
                qDebug(scListing) << "Listed" << entries.size() << "remote entries";
                emit self->remoteListingChanged(entries);
            },
            Qt::QueuedConnection);
    }).detach();
}

void BrowserController::openRemote(const scpnator::RemoteEntry& entry) {
    if (!entry.isDirectory()) return;
    if (entry.name == ".") {
        refreshRemote();
        return;
    }
    if (entry.name == "..") {
        goRemoteUp();
        return;
    }
    setRemotePath(QString::fromStdString(
        scpnator::joinRemotePath(remotePath_.toStdString(), entry.name)));
    refreshRemote();
}

void BrowserController::goRemoteUp() {
    const QString parent = QString::fromStdString(scpnator::remoteParent(remotePath_.toStdString()));
    if (parent == remotePath_) return;
    setRemotePath(parent);
    refreshRemote();
}

void BrowserController::goRemoteHome() {
    setRemotePath(settings_->baseDirectory().isEmpty() ? QStringLiteral("~")
                                                       : settings_->baseDirectory());
    refreshRemote();
}

// ------------------------------------------------------------------- local

void BrowserController::refreshLocal() {
    std::vector<scpnator::LocalEntry> entries;
    std::string err;
    scpnator::ScopedAccess access(&backend_->grants, navigator_.root());
    if (!scpnator::listLocalDirectory(navigator_.current(), entries, err)) {
        qWarning(scListing) << "Local listing failed:" << QString::fromStdString(err);
        emit localListingChanged({});
        emit localListingFailed(QString::fromStdString(err));
        return;
    }
    emit localListingChanged(entries);
}

void BrowserController::openLocal(const scpnator::LocalEntry& entry) {
    if (!navigator_.enter(entry)) return;
    settings_->setLastLocalPath(localPath());
    emit localPathChanged(localPath());
    refreshLocal();
}

void BrowserController::goLocalUp() {
    if (navigator_.isAtRoot()) return;
    navigator_.goUp();
    settings_->setLastLocalPath(localPath());
    emit localPathChanged(localPath());
    refreshLocal();
}

void BrowserController::setLocalRoot(const QString& path) {
    if (transferBusy_) {
        emit statusMessage(tr("Wait for the running transfer to finish"), 4000);
        return;
    }
    QString abs = QFileInfo(path).absoluteFilePath();
    const std::string token = backend_->grants.save(abs.toStdString());
    settings_->setLocalAccessBookmark(QString::fromStdString(token));
    // La raíz es la ruta a la que resolvió el bookmark: es la que tiene acceso.
    if (const auto grant = backend_->grants.resolve(token))
        abs = QString::fromStdString(grant->path);
    navigator_.setRoot(abs.toStdString());
    settings_->setLastLocalPath(localPath());
    emit localPathChanged(localPath());
    refreshLocal();
}

// --------------------------------------------------------------- transfers

bool BrowserController::confirmOverwrite(const QStringList& names) {
    if (!overwritePrompt_) return false;
    return overwritePrompt_(names);
}

void BrowserController::setTransferBusy(bool busy) {
    if (transferBusy_ == busy) return;
    transferBusy_ = busy;
    emit transferBusyChanged(busy);
}

template <typename Job> void BrowserController::runBatch(Job job) {
    if (transferBusy_ || backend_->orchestrator->isBusy()) {
        emit statusMessage(tr("A transfer is already running"), 4000);
        return;
    }
    const auto ctx = settings_->credentialContext();
    if (!backend_->mock && (ctx.server_address.empty() || ctx.username.empty())) {
        emit statusMessage(tr("Set the server and username in Settings"), 5000);
        return;
    }
    Backend::applyCredentials(*backend_->transfer, ctx);
    backend_->orchestrator->setLocalAccess(&backend_->grants, navigator_.root());
    setTransferBusy(true);

    auto backend = backend_;
    QPointer<BrowserController> self(this);
    std::thread([self, backend, job]() {
        const scpnator::BatchOutcome outcome = job(*backend->orchestrator);
        QObject* app = QCoreApplication::instance();
        if (!app) return;
        QMetaObject::invokeMethod(
            app,
            [self, outcome]() {
                if (!self) return;
                self->setTransferBusy(false);
                if (outcome == scpnator::BatchOutcome::Declined)
                    emit self->statusMessage(tr("Transfer canceled: nothing was overwritten"), 4000);
                else if (outcome == scpnator::BatchOutcome::Canceled)
                    emit self->statusMessage(tr("Transfer canceled"), 3000);
                else if (outcome == scpnator::BatchOutcome::Rejected)
                    emit self->statusMessage(tr("Nothing to transfer"), 3000);
            },
            Qt::QueuedConnection);
    }).detach();
}

void BrowserController::transferSelection(const std::vector<scpnator::RemoteEntry>& entries) {
    if (entries.empty()) {
        emit statusMessage(tr("Select remote items to transfer"), 3000);
        return;
    }
    const std::string remoteDir = remotePath_.toStdString();
    const std::string localDir = navigator_.current();
    runBatch([entries, remoteDir, localDir](scpnator::TransferOrchestrator& o) {
        return o.downloadSelection(entries, remoteDir, localDir);
    });
}

void BrowserController::dropRemoteOnLocal(const std::vector<scpnator::RemoteEntry>& entries) {
    const std::string remoteDir = remotePath_.toStdString();
    const std::string localDir = navigator_.current();
    runBatch([entries, remoteDir, localDir](scpnator::TransferOrchestrator& o) {
        return o.downloadEntries(entries, remoteDir, localDir);
    });
}

void BrowserController::dropLocalOnRemote(const QStringList& paths) {
    std::vector<std::string> local;
    for (const auto& p : paths) local.push_back(p.toStdString());
    const std::string remoteDir = remotePath_.toStdString();
    runBatch([local, remoteDir](scpnator::TransferOrchestrator& o) {
        return o.uploadPaths(local, remoteDir);
    });
}

void BrowserController::cancelTransfers() {
    if (!transferBusy_) return;
    backend_->orchestrator->cancel();
    emit statusMessage(tr("Canceling transfer..."), 3000);
}
