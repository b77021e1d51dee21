#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace service {

// Fixed set of threads draining a bounded FIFO. Provider calls and their backoff sleeps run here,
// never on the HTTP event loop.
class WorkerPool {
public:
	WorkerPool(int workers, std::size_t maxQueued);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	// false when the queue is full or the pool is stopping; the task is not run.
	bool submit(std::function<void()> task);
	void stop();

	std::size_t queued();
	int workers() const { return static_cast<int>(threads_.size()); }

private:
	void workerLoop();

	std::atomic<bool> running_{false};
	std::size_t maxQueued_{0};
	std::vector<std::thread> threads_;
	std::queue<std::function<void()>> queue_;
	std::mutex mu_;
	std::condition_variable cv_;
};

} // namespace service
