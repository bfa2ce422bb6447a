#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace coderag {

/**
 * @brief Bounded pool for CPU-bound work (chunk parsing, BM25 scoring, vector math).
 *
 * submit() posts the task and hands back a future; callers wait on it, so the work is
 * offloaded but never fire-and-forget.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn> auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        boost::asio::post(*pool_, [task]() { (*task)(); });
        return future;
    }

    std::size_t threadCount() const { return threads_; }

    void stop();

private:
    std::size_t threads_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace coderag
