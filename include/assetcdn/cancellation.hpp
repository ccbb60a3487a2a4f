#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace assetcdn {

/// Read side of a cooperative cancellation signal.
///
/// A default-constructed token can never be cancelled. Tokens are cheap to
/// copy and observe the source they came from, plus every parent the source
/// was linked to.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const {
        for (auto* s = state_.get(); s; s = s->parent.get()) {
            if (s->cancelled.load(std::memory_order_acquire)) return true;
        }
        return false;
    }

    bool can_be_cancelled() const { return state_ != nullptr; }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/// Write side of a cancellation signal. cancel() is lock-free and idempotent.
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

    /// Create a source that also reports cancelled when `parent` is.
    explicit CancellationSource(const CancellationToken& parent) : CancellationSource() {
        state_->parent = parent.state_;
    }

    void cancel() { state_->cancelled.store(true, std::memory_order_release); }

    bool is_cancelled() const { return token().is_cancelled(); }

    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<CancellationToken::State> state_;
};

/// Sleep for `delay` in short slices, waking early when `token` is cancelled
/// or `deadline` passes. Returns true only if the whole delay elapsed.
inline bool sleep_unless_cancelled(std::chrono::milliseconds delay, const CancellationToken& token,
                                   std::chrono::steady_clock::time_point deadline =
                                       std::chrono::steady_clock::time_point::max()) {
    constexpr auto kSlice = std::chrono::milliseconds(10);
    auto until = std::chrono::steady_clock::now() + delay;
    if (deadline < until) until = deadline;
    for (;;) {
        if (token.is_cancelled()) return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= until) break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSlice, until - now));
    }
    return std::chrono::steady_clock::now() < deadline;
}

}  // namespace assetcdn
