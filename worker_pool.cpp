#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace service {

WorkerPool::WorkerPool(int workers, std::size_t maxQueued) : maxQueued_(std::max<std::size_t>(1, maxQueued)) {
	int count = std::max(1, workers);
	running_ = true;
	threads_.reserve(count);
	for (int i = 0; i < count; i++) {
		threads_.emplace_back([this]() { workerLoop(); });
	}
}

WorkerPool::~WorkerPool() {
	stop();
}

bool WorkerPool::submit(std::function<void()> task) {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!running_ || queue_.size() >= maxQueued_) return false;
		queue_.push(std::move(task));
	}
	cv_.notify_one();
	return true;
}

void WorkerPool::stop() {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!running_) return;
		running_ = false;
	}
	cv_.notify_all();
	for (auto &t : threads_) {
		if (t.joinable()) t.join();
	}
	threads_.clear();
}

std::size_t WorkerPool::queued() {
	std::lock_guard<std::mutex> lock(mu_);
	return queue_.size();
}

void WorkerPool::workerLoop() {
	while (true) {
		std::function<void()> task;
		{
			std::unique_lock<std::mutex> lock(mu_);
			cv_.wait(lock, [&]() { return !running_ || !queue_.empty(); });
			// queued work is drained before the thread exits
			if (!running_ && queue_.empty()) return;
			task = std::move(queue_.front());
			queue_.pop();
		}
		try {
			task();
		} catch (const std::exception &e) {
			std::cerr << "[WorkerPool] task failed: " << e.what() << std::endl;
		}
	}
}

} // namespace service
