#ifndef THREAD_POOL_H

#define THREAD_POOL_H

#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "dispatch_channel.h"

typedef std::function<void(void)> task;

struct work_item {
	enum class kind { new_task, terminate };

	kind type = kind::terminate;
	task fn;
};

class worker {
		std::thread thread;
		size_t id = 0;

		static void run(size_t id, dispatch_channel<work_item> *channel);

	public:
		worker(size_t id, dispatch_channel<work_item> *channel);
		worker(const worker&) = delete;
		worker& operator=(const worker&) = delete;
		~worker();

		void join();
};

// Fixed-size pool of workers sharing one dispatch channel. Each worker stops after it
// receives a terminate item, and terminate() sends one such item per worker, so that
// every queued task submitted before it still runs.
class thread_pool {
		dispatch_channel<work_item> channel;
		std::vector<std::unique_ptr<worker>> workers;
		bool terminated = false;

		void join_workers();

	public:
		explicit thread_pool(size_t size);
		thread_pool(const thread_pool&) = delete;
		thread_pool& operator=(const thread_pool&) = delete;
		~thread_pool();

		void execute(task fn);
		// Calls terminate() unless it has already been called and waits for every worker
		// to exit.
		void shutdown();
		void terminate();

		size_t size() const noexcept
		{
			return workers.size();
		}
};

#endif // THREAD_POOL_H
