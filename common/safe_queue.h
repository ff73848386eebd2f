#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility> // IWYU pragma: keep

template <typename taStoredType, typename taMutex = std::mutex,
          typename taQueueType = std::queue<taStoredType>>
class SafeQueue
{
  public:
    using value_type = taStoredType;
    using mutex_type = taMutex;
    using queue_type = taQueueType;

    /// @brief Pushes new element to the underlaying queue and wakes up one waiting reader.
    void push(taStoredType item)
    {
        {
            std::lock_guard<taMutex> lock(mutex);
            dataQueue.push(std::move(item));
        }
        conditional_queue.notify_one();
    }

    /// @brief Pops element from the queue, waiting up to timeout for it to appear.
    /// @returns std::nullopt if nothing was pushed during timeout, value otherwise.
    template <typename taRep, typename taPeriod>
    [[nodiscard]]
    std::optional<taStoredType> wait_pop(const std::chrono::duration<taRep, taPeriod> &timeout)
    {
        std::unique_lock<taMutex> lock(mutex);
        conditional_queue.wait_for(lock, timeout, [this]() {
            return !dataQueue.empty();
        });
        return popLocked();
    }

  private:
    std::optional<taStoredType> popLocked()
    {
        if (dataQueue.empty())
        {
            return std::nullopt;
        }
        auto item = std::move(dataQueue.front());
        dataQueue.pop();
        return item;
    }

    taQueueType dataQueue;
    taMutex mutex;
    std::condition_variable conditional_queue;
};
