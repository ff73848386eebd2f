#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <type_traits>

namespace utility {
using runnerint_t = std::shared_ptr<std::atomic<bool>>;
using runner_f_t = std::function<void(const runnerint_t should_int)>;

/// @brief Owning pointer of the running thread. Resetting it interrupts and joins the thread.
using runner_t = std::shared_ptr<std::thread>;

/// @brief Executes lambda in its own thread. When the last copy of returned shared_ptr is
/// cleared it stores true into interrupt flag and join()s, so 1 pointer has only 1 running thread
/// always for the same task.
/// @param func - callable with 1 parameter which accepts runnerint_t. If stored value into atomic
/// is true, callable should exit.
/// @returns runner_t of the new thread.
template <typename taCallable>
runner_t startNewRunner(taCallable &&func)
{
    static_assert(std::is_assignable_v<runner_f_t, taCallable>,
                  "Callable should accepts runnerint_t as parameter");
    static_assert(std::is_invocable_v<taCallable, runnerint_t>,
                  "Callable should be invocable with runnerint_t as parameter");

    auto stop = std::make_shared<std::atomic<bool>>(false);
    return runner_t(new std::thread(std::forward<taCallable>(func), stop), [stop](auto ptrToDelete) {
        stop->store(true);
        if (ptrToDelete)
        {
            if (ptrToDelete->joinable())
            {
                ptrToDelete->join();
            }
            delete ptrToDelete;
        }
    });
}

/// @returns true if runner was asked to stop.
inline bool isInterrupted(const runnerint_t &should_int)
{
    return should_int && should_int->load();
}

///@returns some ID of the current thread. It is system dependant.
inline std::size_t currentThreadId()
{
    return std::hash<std::thread::id>{}(std::this_thread::get_id());
}
} // namespace utility
