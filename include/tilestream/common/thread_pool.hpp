#pragma once

#include <tilestream/visibility.hpp>

#include <future>
#include <memory>
#include <type_traits>
#include <vector>

namespace tilestream
{

// Fixed-size pool of worker threads with per-worker task queues.
// Tasks go to the worker with the fewest pending items.
// Destruction drains every queued task before joining the workers.
class TILESTREAM_API ThreadPool final {
public:
	struct Config {
		// 0 - pick automatically from hardware concurrency
		size_t thread_count = 0;
	};

	explicit ThreadPool(Config cfg);
	ThreadPool(ThreadPool &&) = delete;
	ThreadPool(const ThreadPool &) = delete;
	ThreadPool &operator=(ThreadPool &&) = delete;
	ThreadPool &operator=(const ThreadPool &) = delete;
	~ThreadPool() noexcept;

	// Exceptions escaping `f` are stored in the returned future.
	// Throws `Exception` with `UnknownError` if the pool is stopped.
	template<typename F>
	std::future<std::invoke_result_t<F>> enqueueTask(F &&f)
	{
		using R = std::invoke_result_t<F>;
		std::promise<R> promise;
		std::future<R> future = promise.get_future();

		doEnqueueTask(std::make_unique<TErasedTask<R, std::decay_t<F>>>(std::move(promise), std::forward<F>(f)));
		return future;
	}

	// Finish every queued task and join the workers. Further `enqueueTask`
	// calls throw `Exception` with `UnknownError`. Called by the destructor.
	void stop() noexcept;

	// Zero after `stop()`
	size_t threadCount() const noexcept { return m_workers.size(); }

private:
	struct WorkerState;
	struct Worker;

	class IErasedTask {
	public:
		virtual ~IErasedTask() = default;

		// Runs the task and fulfills its promise with a value or an exception
		virtual void call() noexcept = 0;
	};

	// Behaves like `std::packaged_task<R()>`
	template<typename R, typename F>
	class TErasedTask final : public IErasedTask {
	public:
		template<typename G>
		TErasedTask(std::promise<R> &&promise, G &&fn) : m_promise(std::move(promise)), m_fn(std::forward<G>(fn))
		{}
		~TErasedTask() override = default;

		void call() noexcept override
		{
			try {
				if constexpr (std::is_void_v<R>) {
					m_fn();
					m_promise.set_value();
				} else {
					m_promise.set_value(m_fn());
				}
			}
			catch (...) {
				// Rethrown to whoever waits on the future
				m_promise.set_exception(std::current_exception());
			}
		}

	private:
		std::promise<R> m_promise;
		F m_fn;
	};

	using TaskPtr = std::unique_ptr<IErasedTask>;

	void doEnqueueTask(TaskPtr task);
	void makeWorker(size_t index);

	static void workerFunction(size_t index, WorkerState *state);

	std::vector<std::unique_ptr<Worker>> m_workers;
};

} // namespace tilestream
