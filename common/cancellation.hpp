#pragma once

#include "cm_ctors.h" // IWYU pragma: keep

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace utility {

class CCancellationSource;

/// @brief Read side of the cooperative cancellation. Copies share the same state with the source
/// which created them.
class CCancellationToken
{
  public:
    using TCallback = std::function<void()>;

    CCancellationToken() = delete;
    ~CCancellationToken() = default;
    DEFAULT_COPYMOVE(CCancellationToken);

    [[nodiscard]]
    bool IsCancellationRequested() const
    {
        return state->cancelled.load();
    }

    /// @brief Registers callback which is called once, on the thread which cancels the source.
    /// If cancellation was requested already, callback is called immediately.
    void OnCancellationRequested(TCallback callback) const
    {
        {
            const std::lock_guard lock(state->mutex);
            if (!state->cancelled.load())
            {
                state->callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback();
    }

  private:
    friend class CCancellationSource;

    struct TState
    {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::vector<TCallback> callbacks;
    };

    explicit CCancellationToken(std::shared_ptr<TState> state) :
        state(std::move(state))
    {
    }

    std::shared_ptr<TState> state;
};

/// @brief Owner side of the cooperative cancellation, one per cancellable operation.
class CCancellationSource
{
  public:
    CCancellationSource() :
        state(std::make_shared<CCancellationToken::TState>())
    {
    }

    ~CCancellationSource() = default;
    NO_COPYMOVE(CCancellationSource);

    /// @brief Requests cancellation. Only the first call has effect.
    /// @returns true if this call did cancel, false if it was cancelled before.
    bool Cancel()
    {
        std::vector<CCancellationToken::TCallback> toCall;
        {
            const std::lock_guard lock(state->mutex);
            if (state->cancelled.exchange(true))
            {
                return false;
            }
            std::swap(toCall, state->callbacks);
        }
        for (const auto &callback : toCall)
        {
            callback();
        }
        return true;
    }

    [[nodiscard]]
    bool IsCancellationRequested() const
    {
        return state->cancelled.load();
    }

    [[nodiscard]]
    CCancellationToken Token() const
    {
        return CCancellationToken(state);
    }

  private:
    std::shared_ptr<CCancellationToken::TState> state;
};

} // namespace utility
