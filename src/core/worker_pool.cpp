#include <coderag/core/worker_pool.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace coderag {

WorkerPool::WorkerPool(std::size_t threads) : threads_(threads) {
    if (threads_ == 0) {
        threads_ = std::max(2u, std::thread::hardware_concurrency());
    }
    pool_ = std::make_unique<boost::asio::thread_pool>(threads_);
    spdlog::debug("[WorkerPool] Initialized with {} threads", threads_);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    if (pool_) {
        pool_->join();
        pool_.reset();
    }
}

} // namespace coderag
