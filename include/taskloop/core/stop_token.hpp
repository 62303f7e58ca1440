// ============================================================================
// taskloop/core/stop_token.hpp - Cooperative Stop Signal
// ============================================================================
//
// A StopSource is created for every Start() of a TaskLoop and handed, as
// StopTokens, to the consumer and each job runner. RequestStop() flips the
// shared flag and runs the registered callbacks, which is how a runner
// sleeping out a long interval gets woken without waiting for its timer.
//
// Stopping is COOPERATIVE: nothing is interrupted mid-execution. Code checks
// StopRequested() at its own suspension points, or registers a callback
// that reschedules it.
//
// Like everything the scheduler owns, sources and tokens are used from the
// executor's thread only.
//
// USAGE:
// ------
//   StopSource source;
//   DetachedTask runner = Runner(source.GetToken());
//   ...
//   source.RequestStop();   // runners see it at their next suspension point
//
// ============================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace taskloop {

using StopCallbackId = std::size_t;

// Returned when a callback ran immediately and nothing stays registered.
inline constexpr StopCallbackId kNoStopCallback = 0;

class StopState {
   public:
    StopState() = default;

    StopState(const StopState&) = delete;
    StopState& operator=(const StopState&) = delete;

    bool StopRequested() const noexcept { return stopped_; }

    // Returns false if a stop had already been requested.
    bool RequestStop() {
        if (stopped_) return false;
        stopped_ = true;

        // Callbacks may register or unregister others; run a detached copy.
        auto callbacks = std::move(callbacks_);
        callbacks_.clear();
        for (auto& [id, callback] : callbacks) {
            callback();
        }
        return true;
    }

    StopCallbackId AddCallback(std::function<void()> callback) {
        if (stopped_) {
            callback();
            return kNoStopCallback;
        }
        StopCallbackId id = next_id_++;
        callbacks_.emplace_back(id, std::move(callback));
        return id;
    }

    void RemoveCallback(StopCallbackId id) {
        if (id == kNoStopCallback) return;
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->first == id) {
                callbacks_.erase(it);
                return;
            }
        }
    }

    size_t CallbackCount() const noexcept { return callbacks_.size(); }

   private:
    bool stopped_ = false;
    StopCallbackId next_id_ = kNoStopCallback + 1;
    std::vector<std::pair<StopCallbackId, std::function<void()>>> callbacks_;
};

// ============================================================================
// StopToken - read side handed to runners
// ============================================================================
class StopToken {
   public:
    // A default token never stops
    StopToken() = default;

    bool StopRequested() const noexcept { return state_ && state_->StopRequested(); }

    // Runs immediately if a stop was already requested.
    StopCallbackId OnStop(std::function<void()> callback) const {
        if (!state_) return kNoStopCallback;
        return state_->AddCallback(std::move(callback));
    }

    void RemoveCallback(StopCallbackId id) const {
        if (state_) state_->RemoveCallback(id);
    }

    bool CanStop() const noexcept { return state_ != nullptr; }

   private:
    friend class StopSource;

    explicit StopToken(std::shared_ptr<StopState> state) : state_(std::move(state)) {}

    std::shared_ptr<StopState> state_;
};

// ============================================================================
// StopSource - write side owned by the controller
// ============================================================================
class StopSource {
   public:
    StopSource() : state_(std::make_shared<StopState>()) {}

    StopSource(const StopSource&) = delete;
    StopSource& operator=(const StopSource&) = delete;
    StopSource(StopSource&&) = default;
    StopSource& operator=(StopSource&&) = default;

    [[nodiscard]] StopToken GetToken() const { return StopToken(state_); }

    bool RequestStop() { return state_ && state_->RequestStop(); }

    bool StopRequested() const noexcept { return state_ && state_->StopRequested(); }

   private:
    std::shared_ptr<StopState> state_;
};

}  // namespace taskloop
