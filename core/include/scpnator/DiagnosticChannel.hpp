// Thread-safe chunk queue between a subprocess producer (worker thread) and
// an explicit progress consumer. The producer never touches UI state.
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace scpnator {

struct DiagnosticChunk {
    std::uint64_t item_id = 0;
    std::string   text;
};

class DiagnosticChannel {
public:
    void push(DiagnosticChunk chunk) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_)
                return;
            queue_.push_back(std::move(chunk));
        }
        cv_.notify_one();
    }

    // No further pushes are accepted; pending chunks can still be popped.
    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Blocks until a chunk is available. Returns false once the channel is
    // closed and drained.
    bool pop(DiagnosticChunk& out) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool tryPop(DiagnosticChunk& out) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<DiagnosticChunk> queue_;
    bool closed_ = false;
};

} // namespace scpnator
