#include "scpnator/TransferBatch.hpp"

#include <algorithm>
#include <atomic>

namespace scpnator {

namespace {
std::atomic<std::uint64_t> g_nextItemId{1};
}

const char* toString(TransferState s) {
    switch (s) {
    case TransferState::Pending:
        return "pending";
    case TransferState::Running:
        return "running";
    case TransferState::Succeeded:
        return "succeeded";
    case TransferState::Failed:
        return "failed";
    }
    return "unknown";
}

TransferItemStatus::TransferItemStatus(std::uint64_t id, RemoteEntry item,
                                       std::string source)
    : id_(id), item_(std::move(item)), source_(std::move(source)) {}

bool TransferItemStatus::canTransition(TransferState from, TransferState to) {
    switch (from) {
    case TransferState::Pending:
        return to == TransferState::Running;
    case TransferState::Running:
        return to == TransferState::Succeeded || to == TransferState::Failed;
    case TransferState::Succeeded:
    case TransferState::Failed:
        return false;
    }
    return false;
}

bool TransferItemStatus::advance(TransferState next, std::string message,
                                 FailureKind failure) {
    if (!canTransition(state_, next))
        return false;
    state_ = next;
    message_ = std::move(message);
    failure_ = next == TransferState::Failed ? failure : FailureKind::None;
    return true;
}

TransferBatch::TransferBatch(TransferDirection direction, std::string destination)
    : direction_(direction), destination_(std::move(destination)) {}

TransferItemStatus& TransferBatch::add(RemoteEntry item, std::string source) {
    items_.emplace_back(g_nextItemId.fetch_add(1), std::move(item), std::move(source));
    return items_.back();
}

std::size_t TransferBatch::count(TransferState s) const {
    return static_cast<std::size_t>(std::count_if(
        items_.begin(), items_.end(),
        [s](const TransferItemStatus& it) { return it.state() == s; }));
}

bool TransferBatch::isFinished() const {
    return std::all_of(items_.begin(), items_.end(),
                       [](const TransferItemStatus& it) { return it.isFinished(); });
}

} // namespace scpnator
