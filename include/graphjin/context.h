#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/context.h — Per-request cancellation handle
// ═══════════════════════════════════════════════════════════════════
//
//  auto ctx = Context::withTimeout(std::chrono::seconds(5));
//  auto rows = conn.query(dsl, args, ctx);
//  ctx.cancel();   // from any thread
//
//  Copies share the same cancellation state.
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace graphjin {

class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() : state_(std::make_shared<State>()) {}

    static Context background() { return Context(); }

    static Context withTimeout(Clock::duration timeout) {
        Context ctx;
        ctx.state_->deadline = Clock::now() + timeout;
        return ctx;
    }

    void cancel() const { state_->cancelled.store(true); }

    bool isCancelled() const {
        if (state_->cancelled.load()) return true;
        return state_->deadline && Clock::now() >= *state_->deadline;
    }

    // Time left before the deadline, if one was set
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!state_->deadline) return std::nullopt;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *state_->deadline - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    void throwIfCancelled() const {
        if (isCancelled()) {
            throw Error(ErrorKind::Cancelled, "operation cancelled");
        }
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
    };
    std::shared_ptr<State> state_;
};

} // namespace graphjin
