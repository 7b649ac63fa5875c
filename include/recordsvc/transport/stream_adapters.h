#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace recordsvc::transport {

/// How a streaming loop ended.
enum class StreamOutcome {
    Completed,   // source exhausted / client half-closed
    Cancelled,   // the call's cancellation flag was seen
    Aborted      // the visitor refused an item (e.g. write to a gone client)
};

const char* streamOutcomeName(StreamOutcome outcome);

struct StreamResult {
    StreamOutcome outcome  = StreamOutcome::Completed;
    size_t        messages = 0;   // items visited successfully
};

/// Polled between messages. Returns true once the caller gave up.
using CancelCheck = std::function<bool()>;

// ── Iteration primitive ───────────────────────────────────────────────────

/// Pull items with `next(T&)` and hand each one to `visit(const T&)` until
/// the source runs dry, `visit` returns false, or `cancelled()` is set.
///
/// Cancellation is checked before every pull and once more when the
/// source ends, so a source that stops because the call was torn down is
/// reported as Cancelled rather than Completed. A null CancelCheck means
/// "never cancelled".
template <typename T, typename Next, typename Visit>
StreamResult forEachUntilCancelled(Next&& next, Visit&& visit,
                                   const CancelCheck& cancelled) {
    auto isCancelled = [&cancelled] { return cancelled && cancelled(); };

    StreamResult result;
    T item{};
    for (;;) {
        if (isCancelled()) {
            result.outcome = StreamOutcome::Cancelled;
            return result;
        }
        if (!next(item)) {
            result.outcome = isCancelled() ? StreamOutcome::Cancelled
                                           : StreamOutcome::Completed;
            return result;
        }
        if (!visit(static_cast<const T&>(item))) {
            result.outcome = StreamOutcome::Aborted;
            return result;
        }
        ++result.messages;
    }
}

// ── Producer side ─────────────────────────────────────────────────────────

/// Write every element of `snapshot` in order with `write(const T&)`,
/// sleeping `interval` between consecutive writes (not after the last).
/// `write` returns false when the peer can no longer receive.
template <typename T, typename Write>
StreamResult emitSnapshot(const std::vector<T>& snapshot, Write&& write,
                          const CancelCheck& cancelled,
                          std::chrono::milliseconds interval) {
    size_t index = 0;

    auto next = [&](T& out) {
        if (index >= snapshot.size()) return false;
        out = snapshot[index++];
        return true;
    };
    auto visit = [&](const T& item) {
        if (!write(item)) return false;
        if (interval.count() > 0 && index < snapshot.size()) {
            std::this_thread::sleep_for(interval);
        }
        return true;
    };

    return forEachUntilCancelled<T>(next, visit, cancelled);
}

// ── Consumer side ─────────────────────────────────────────────────────────

/// Read messages with `read(T&)` until it returns false, passing each one
/// to `fold(const T&)` in arrival order. One message at a time.
template <typename T, typename Read, typename Fold>
StreamResult consumeStream(Read&& read, Fold&& fold,
                           const CancelCheck& cancelled) {
    auto visit = [&](const T& item) {
        fold(item);
        return true;
    };
    return forEachUntilCancelled<T>(read, visit, cancelled);
}

} // namespace recordsvc::transport
