// Sequential transfer batches over a RemoteSession. Runs on the caller's
// (worker) thread; observers are notified from that thread, except
// diagnostic chunks, which come from the batch's consumer thread.
#pragma once
#include "AccessGrant.hpp"
#include "DiagnosticChannel.hpp"
#include "RemoteSession.hpp"
#include "TransferBatch.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scpnator {

class TransferObserver {
public:
    virtual ~TransferObserver() = default;
    virtual void batchStarted(const TransferBatch&) {}
    virtual void itemChanged(const TransferItemStatus&) {}
    virtual void diagnostic(const DiagnosticChunk&) {}
    virtual void batchFinished(const TransferBatch&) {}
};

enum class BatchOutcome {
    Completed, // todos los ítems terminaron (con éxito o no)
    Rejected,  // entrada vacía u otro lote en curso
    Declined,  // colisión sin confirmar: no se ejecutó nada
    Canceled   // cancelado antes de lanzar el primer ítem
};

// Receives the colliding names; true means overwrite.
using ConfirmOverwriteCB = std::function<bool(const std::vector<std::string>&)>;
using RefreshCB = std::function<void()>;

class TransferOrchestrator {
public:
    explicit TransferOrchestrator(RemoteSession& session);

    void setObserver(TransferObserver* observer) { observer_ = observer; }
    void setConfirmOverwrite(ConfirmOverwriteCB cb) { confirm_ = std::move(cb); }
    void setLocalRefresh(RefreshCB cb) { refreshLocal_ = std::move(cb); }
    void setRemoteRefresh(RefreshCB cb) { refreshRemote_ = std::move(cb); }
    void setLogSink(LogSink sink) { log_ = std::move(sink); }
    // Acceso al directorio raíz local mientras corre cada subproceso.
    void setLocalAccess(AccessGrantProvider* grants, std::optional<std::string> root);

    // Selected remote entries into localDir, without collision check.
    BatchOutcome downloadSelection(const std::vector<RemoteEntry>& entries,
                                   const std::string& remoteDir,
                                   const std::string& localDir);

    // Remote entries dropped on the local pane; local names are probed first.
    BatchOutcome downloadEntries(const std::vector<RemoteEntry>& entries,
                                 const std::string& remoteDir,
                                 const std::string& localDir);

    // Local paths dropped on the remote pane; remote names are probed first.
    BatchOutcome uploadPaths(const std::vector<std::string>& localPaths,
                             const std::string& remoteDir);

    // Terminates the running copy; remaining items fail without launching.
    // Also honoured during the collision check, and by a batch whose entry
    // point has not yet started (the flag is cleared when a batch ends).
    void cancel() { cancelRequested_ = true; }
    bool isBusy() const { return busy_.load(); }

    TransferBatch lastBatch() const;

private:
    class BusyGuard;

    bool confirmCollisions(const std::vector<std::string>& collisions);
    BatchOutcome run(TransferBatch batch);
    void notifyItem(const TransferItemStatus& item);

    RemoteSession& session_;
    TransferObserver* observer_ = nullptr;
    ConfirmOverwriteCB confirm_;
    RefreshCB refreshLocal_;
    RefreshCB refreshRemote_;
    LogSink log_;
    AccessGrantProvider* grants_ = nullptr;
    std::optional<std::string> localRoot_;

    std::atomic<bool> busy_{false};
    std::atomic<bool> cancelRequested_{false};

    mutable std::mutex mtx_; // protege batch_
    TransferBatch batch_;
};

} // namespace scpnator
