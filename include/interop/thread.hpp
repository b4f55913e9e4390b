#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include "traits.hpp"

namespace interop::thread {

// ============================================================================
// JoinHandle - detaches on drop if not joined
// ============================================================================

template<typename T>
class JoinHandle {
private:
    std::thread thread_;
    std::future<T> future_;
    bool joined_ = false;

    void join_thread() {
        if (joined_) {
            throw std::runtime_error("Thread already joined");
        }
        if (!thread_.joinable()) {
            throw std::runtime_error("Thread not joinable");
        }
        thread_.join();
        joined_ = true;
    }

public:
    JoinHandle(std::thread&& t, std::future<T>&& f)
        : thread_(std::move(t))
        , future_(std::move(f))
    {}

    // Block until the thread completes and return its result.
    // Rethrows any exception raised inside the thread.
    T join() {
        join_thread();
        return future_.get();
    }

    void detach() {
        if (joined_) {
            throw std::runtime_error("Thread already joined");
        }
        if (thread_.joinable()) {
            thread_.detach();
        }
    }

    // get() in join() releases the future's state, so a joined handle
    // answers from joined_ alone
    [[nodiscard]] bool is_finished() const {
        if (joined_) {
            return true;
        }
        return future_.wait_for(std::chrono::seconds(0)) ==
               std::future_status::ready;
    }

    [[nodiscard]] bool joinable() const {
        return thread_.joinable() && !joined_;
    }

    JoinHandle(const JoinHandle&) = delete;
    JoinHandle& operator=(const JoinHandle&) = delete;
    JoinHandle(JoinHandle&&) = default;
    JoinHandle& operator=(JoinHandle&&) = default;

    ~JoinHandle() {
        if (thread_.joinable() && !joined_) {
            thread_.detach();
        }
    }
};

// ============================================================================
// spawn() - Launch a thread; every argument must be Send
//
// Handle<T> and RCHandle<T> only qualify when the build defines
// INTEROP_SEND_SYNC. Values captured by the lambda itself are not checked.
// ============================================================================

template<typename F, typename... Args,
         typename = std::enable_if_t<(Send<std::decay_t<Args>> && ...) &&
                                      std::is_invocable_v<std::decay_t<F>, std::decay_t<Args>...>>>
auto spawn(F&& func, Args&&... args)
    -> JoinHandle<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>> {
    using ReturnType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        [func = std::forward<F>(func),
         args_tuple = std::make_tuple(std::forward<Args>(args)...)]() mutable -> ReturnType {
            return std::apply([&func](auto&&... args) -> ReturnType {
                return std::invoke(func, std::forward<decltype(args)>(args)...);
            }, std::move(args_tuple));
        }
    );

    auto future = task->get_future();

    std::thread thread([task = std::move(task)]() {
        (*task)();
    });

    return JoinHandle<ReturnType>(std::move(thread), std::move(future));
}

} // namespace interop::thread
