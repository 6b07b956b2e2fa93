#include <tilestream/common/thread_pool.hpp>

#include <tilestream/os/futex.hpp>
#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/futex_work_counter.hpp>
#include <tilestream/util/log.hpp>

#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <tuple>

namespace tilestream
{

namespace
{

// Leave one hardware thread to the main (ticking) thread
constexpr size_t STD_THREAD_COUNT_OFFSET = 1;
// Used when `std` can't tell the hardware concurrency
constexpr size_t DEFAULT_THREAD_COUNT = 4;

} // namespace

struct ThreadPool::WorkerState {
	FutexWorkCounter work_counter;

	os::FutexLock queue_lock;
	std::queue<TaskPtr> tasks_queue;
};

struct ThreadPool::Worker {
	std::thread thread;
	WorkerState state;
};

ThreadPool::ThreadPool(Config cfg)
{
	if (cfg.thread_count == 0) {
		size_t std_hint = std::thread::hardware_concurrency();
		if (std_hint <= STD_THREAD_COUNT_OFFSET) {
			cfg.thread_count = DEFAULT_THREAD_COUNT;
		} else {
			cfg.thread_count = std_hint - STD_THREAD_COUNT_OFFSET;
		}
	}

	Log::info("Starting thread pool with {} threads", cfg.thread_count);
	m_workers.reserve(cfg.thread_count);
	for (size_t i = 0; i < cfg.thread_count; i++) {
		makeWorker(i);
	}
}

ThreadPool::~ThreadPool() noexcept
{
	stop();
}

void ThreadPool::stop() noexcept
{
	if (m_workers.empty()) {
		return;
	}

	for (auto &worker : m_workers) {
		worker->state.work_counter.requestStop();
	}

	for (auto &worker : m_workers) {
		if (worker->thread.joinable()) {
			worker->thread.join();
		}
	}

	m_workers.clear();
	Log::debug("Thread pool stopped");
}

void ThreadPool::doEnqueueTask(TaskPtr task)
{
	Worker *target = nullptr;
	uint32_t min_pending = UINT32_MAX;

	for (auto &worker : m_workers) {
		uint32_t pending = worker->state.work_counter.loadRelaxed().first;
		if (pending < min_pending) {
			min_pending = pending;
			target = worker.get();
		}
	}

	if (!target) [[unlikely]] {
		throw Exception::fromError(TileStreamErrc::UnknownError, "thread pool is stopped");
	}

	{
		std::lock_guard lock(target->state.queue_lock);
		target->state.tasks_queue.emplace(std::move(task));
	}

	target->state.work_counter.addWork(1);
}

void ThreadPool::makeWorker(size_t index)
{
	auto worker = std::make_unique<Worker>();
	worker->thread = std::thread(&ThreadPool::workerFunction, index, &worker->state);
	m_workers.push_back(std::move(worker));
}

void ThreadPool::workerFunction(size_t index, WorkerState *state)
{
	Log::trace("Worker {} started", index);

	uint32_t work_remaining = 0;
	bool exit = false;

	auto pop_task = [state]() -> TaskPtr {
		std::lock_guard lock(state->queue_lock);
		if (state->tasks_queue.empty()) {
			return nullptr;
		}

		TaskPtr task = std::move(state->tasks_queue.front());
		state->tasks_queue.pop();
		return task;
	};

	while (!exit || work_remaining > 0) {
		std::tie(work_remaining, exit) = state->work_counter.wait();

		uint32_t popped = 0;
		for (TaskPtr task = pop_task(); task; task = pop_task()) {
			popped++;
			task->call();
		}

		std::tie(work_remaining, exit) = state->work_counter.removeWork(popped);
	}

	Log::trace("Worker {} stopped", index);
}

} // namespace tilestream
