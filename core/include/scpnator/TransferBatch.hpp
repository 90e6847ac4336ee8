// Transfer batch model: one status per item with enforced one-way
// transitions (Pending -> Running -> Succeeded | Failed).
#pragma once
#include "RemoteTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace scpnator {

enum class TransferState { Pending, Running, Succeeded, Failed };

enum class TransferDirection { RemoteToLocal, LocalToRemote };

const char* toString(TransferState s);

class TransferItemStatus {
public:
    TransferItemStatus(std::uint64_t id, RemoteEntry item, std::string source);

    std::uint64_t id() const { return id_; }
    const RemoteEntry& item() const { return item_; }
    // Ruta de origen de la copia (remota en descargas, local en subidas).
    const std::string& source() const { return source_; }
    TransferState state() const { return state_; }
    const std::string& message() const { return message_; }
    FailureKind failure() const { return failure_; }

    bool isFinished() const {
        return state_ == TransferState::Succeeded || state_ == TransferState::Failed;
    }

    // Applies a transition. Illegal ones return false and change nothing.
    bool advance(TransferState next, std::string message = {},
                 FailureKind failure = FailureKind::None);

    static bool canTransition(TransferState from, TransferState to);

private:
    std::uint64_t id_ = 0;
    RemoteEntry   item_;
    std::string   source_;
    TransferState state_ = TransferState::Pending;
    std::string   message_;
    FailureKind   failure_ = FailureKind::None;
};

class TransferBatch {
public:
    TransferBatch() = default;
    TransferBatch(TransferDirection direction, std::string destination);

    TransferDirection direction() const { return direction_; }
    const std::string& destination() const { return destination_; }

    // Appends a Pending item with a fresh process-unique id.
    TransferItemStatus& add(RemoteEntry item, std::string source);

    const std::vector<TransferItemStatus>& items() const { return items_; }
    TransferItemStatus& at(std::size_t i) { return items_.at(i); }

    bool empty() const { return items_.empty(); }
    std::size_t size() const { return items_.size(); }
    std::size_t count(TransferState s) const;
    bool isFinished() const;

private:
    TransferDirection direction_ = TransferDirection::RemoteToLocal;
    std::string destination_;
    std::vector<TransferItemStatus> items_;
};

} // namespace scpnator
