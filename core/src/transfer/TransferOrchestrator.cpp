#include "scpnator/TransferOrchestrator.hpp"
#include "scpnator/LocalBrowser.hpp"
#include "scpnator/RemotePath.hpp"
#include "scpnator/RuntimeLogging.hpp"

#include <filesystem>
#include <system_error>
#include <thread>

namespace scpnator {

// Marks the orchestrator busy for one batch; a second batch is refused.
// A pending cancel is consumed when the owning batch ends.
class TransferOrchestrator::BusyGuard {
public:
    BusyGuard(std::atomic<bool>& flag, std::atomic<bool>& cancel)
        : flag_(flag), cancel_(cancel) {
        bool expected = false;
        owns_ = flag_.compare_exchange_strong(expected, true);
    }
    ~BusyGuard() {
        if (owns_) {
            cancel_ = false;
            flag_ = false;
        }
    }
    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

    bool owns() const { return owns_; }

private:
    std::atomic<bool>& flag_;
    std::atomic<bool>& cancel_;
    bool owns_ = false;
};

TransferOrchestrator::TransferOrchestrator(RemoteSession& session)
    : session_(session) {}

void TransferOrchestrator::setLocalAccess(AccessGrantProvider* grants,
                                          std::optional<std::string> root) {
    grants_ = grants;
    localRoot_ = std::move(root);
}

TransferBatch TransferOrchestrator::lastBatch() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return batch_;
}

bool TransferOrchestrator::confirmCollisions(const std::vector<std::string>& collisions) {
    if (collisions.empty())
        return true;
    if (!confirm_) {
        emitLog(log_, LogLevel::Warning, "Overwrite confirmation unavailable; batch aborted");
        return false;
    }
    return confirm_(collisions);
}

void TransferOrchestrator::notifyItem(const TransferItemStatus& item) {
    if (observer_)
        observer_->itemChanged(item);
}

BatchOutcome TransferOrchestrator::downloadSelection(const std::vector<RemoteEntry>& entries,
                                                     const std::string& remoteDir,
                                                     const std::string& localDir) {
    if (entries.empty())
        return BatchOutcome::Rejected;
    BusyGuard guard(busy_, cancelRequested_);
    if (!guard.owns())
        return BatchOutcome::Rejected;

    TransferBatch batch(TransferDirection::RemoteToLocal, localDir);
    for (const auto& e : entries)
        batch.add(e, joinRemotePath(remoteDir, e.name));
    return run(std::move(batch));
}

BatchOutcome TransferOrchestrator::downloadEntries(const std::vector<RemoteEntry>& entries,
                                                   const std::string& remoteDir,
                                                   const std::string& localDir) {
    if (entries.empty())
        return BatchOutcome::Rejected;
    BusyGuard guard(busy_, cancelRequested_);
    if (!guard.owns())
        return BatchOutcome::Rejected;

    std::vector<std::string> collisions;
    for (const auto& e : entries) {
        if (localEntryExists(localDir, e.name))
            collisions.push_back(e.name);
    }
    if (cancelRequested_)
        return BatchOutcome::Canceled;
    if (!confirmCollisions(collisions))
        return BatchOutcome::Declined;
    if (cancelRequested_)
        return BatchOutcome::Canceled;

    TransferBatch batch(TransferDirection::RemoteToLocal, localDir);
    for (const auto& e : entries)
        batch.add(e, joinRemotePath(remoteDir, e.name));
    return run(std::move(batch));
}

BatchOutcome TransferOrchestrator::uploadPaths(const std::vector<std::string>& localPaths,
                                               const std::string& remoteDir) {
    if (localPaths.empty())
        return BatchOutcome::Rejected;
    BusyGuard guard(busy_, cancelRequested_);
    if (!guard.owns())
        return BatchOutcome::Rejected;

    std::vector<std::string> collisions;
    for (const auto& p : localPaths) {
        if (cancelRequested_)
            return BatchOutcome::Canceled;
        const std::string name = lastPathComponent(p);
        bool found = false;
        std::string err;
        if (!session_.exists(joinRemotePath(remoteDir, name), found, err)) {
            // Si la sonda falla se asume que no existe.
            emitLog(log_, LogLevel::Warning, "Remote existence probe failed: " + err);
            found = false;
        }
        if (found)
            collisions.push_back(name);
    }
    if (cancelRequested_)
        return BatchOutcome::Canceled;
    if (!confirmCollisions(collisions))
        return BatchOutcome::Declined;
    if (cancelRequested_)
        return BatchOutcome::Canceled;

    TransferBatch batch(TransferDirection::LocalToRemote, remoteDir);
    for (const auto& p : localPaths) {
        std::error_code ec;
        const bool isDir = std::filesystem::is_directory(p, ec);
        batch.add(makeRemoteEntry(lastPathComponent(p),
                                  isDir ? RemoteEntryKind::Directory : RemoteEntryKind::File),
                  p);
    }
    return run(std::move(batch));
}

BatchOutcome TransferOrchestrator::run(TransferBatch batch) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        batch_ = batch;
    }
    if (observer_)
        observer_->batchStarted(batch);

    // Consumidor explícito del flujo de diagnóstico.
    DiagnosticChannel channel;
    TransferObserver* observer = observer_;
    std::thread consumer([&channel, observer] {
        DiagnosticChunk chunk;
        while (channel.pop(chunk)) {
            if (observer)
                observer->diagnostic(chunk);
        }
    });

    const bool download = batch.direction() == TransferDirection::RemoteToLocal;
    auto shouldCancel = [this] { return cancelRequested_.load(); };

    for (std::size_t i = 0; i < batch.size(); ++i) {
        TransferItemStatus& item = batch.at(i);
        item.advance(TransferState::Running);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            batch_ = batch;
        }
        notifyItem(item);

        if (cancelRequested_) {
            item.advance(TransferState::Failed, "Canceled", FailureKind::Canceled);
        } else {
            const std::uint64_t id = item.id();
            auto progress = [&channel, id](const std::string& text) {
                channel.push(DiagnosticChunk{id, text});
            };
            std::string err;
            bool ok = false;
            {
                ScopedAccess access(grants_, localRoot_);
                ok = download
                         ? session_.download(item.source(), item.item().isDirectory(),
                                             batch.destination(), err, progress, shouldCancel)
                         : session_.upload(item.source(), item.item().isDirectory(),
                                           batch.destination(), err, progress, shouldCancel);
            }
            if (ok) {
                item.advance(TransferState::Succeeded);
            } else {
                FailureKind kind = session_.lastFailure();
                if (kind == FailureKind::None)
                    kind = FailureKind::AuthenticationOrConnection;
                item.advance(TransferState::Failed, err, kind);
                emitLog(log_, LogLevel::Warning,
                        "Transfer of " + item.item().name + " failed" +
                            (sensitiveLoggingEnabled() ? ": " + err : std::string()));
            }
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
            batch_ = batch;
        }
        notifyItem(item);

        if (item.state() == TransferState::Succeeded) {
            if (download && refreshLocal_)
                refreshLocal_();
            else if (!download && refreshRemote_)
                refreshRemote_();
        }
    }

    channel.close();
    consumer.join();

    emitLog(log_, LogLevel::Info,
            "Batch finished: " + std::to_string(batch.count(TransferState::Succeeded)) +
                " succeeded, " + std::to_string(batch.count(TransferState::Failed)) +
                " failed");
    if (observer_)
        observer_->batchFinished(batch);
    return BatchOutcome::Completed;
}

} // namespace scpnator
