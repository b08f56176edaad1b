#include <boost/log/trivial.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "thread_pool.h"

worker::worker(size_t id, dispatch_channel<work_item> *channel) :
    thread(&worker::run, id, channel), id(id)
{
}

worker::~worker()
{
	join();
}

void worker::join()
{
	if (thread.joinable()) {
		BOOST_LOG_TRIVIAL(debug) << "Shutting down worker " << id;
		thread.join();
	}
}

void worker::run(size_t id, dispatch_channel<work_item> *channel)
{
	for (;;) {
		work_item item;

		if (!channel->receive(&item)) {
			BOOST_LOG_TRIVIAL(error) << "Worker " << id << " lost its dispatch channel.";
			break;
		}

		if (item.type == work_item::kind::terminate) {
			BOOST_LOG_TRIVIAL(info) << "Worker " << id << " was told to terminate.";
			break;
		}

		BOOST_LOG_TRIVIAL(debug) << "Worker " << id << " got a task; executing.";
		item.fn();
	}
}

thread_pool::thread_pool(size_t size)
{
	if (!size)
		throw std::invalid_argument("thread pool size must be positive");

	workers.reserve(size);

	try {
		for (size_t id = 0; id < size; id++)
			workers.push_back(std::make_unique<worker>(id, &channel));
	}
	catch (const std::system_error& e) {
		BOOST_LOG_TRIVIAL(fatal) << "Failed to start worker " << workers.size() << ": "
					 << e.what();
		shutdown();
		throw;
	}

	BOOST_LOG_TRIVIAL(debug) << "Started " << size << " workers.";
}

thread_pool::~thread_pool()
{
	shutdown();
	channel.close();
}

void thread_pool::execute(task fn)
{
	if (terminated)
		BOOST_LOG_TRIVIAL(warning) << "Task submitted after terminate(); it may never run.";

	channel.send(work_item {work_item::kind::new_task, std::move(fn)});
}

void thread_pool::join_workers()
{
	for (auto& w : workers)
		w->join();
}

void thread_pool::shutdown()
{
	if (!terminated)
		terminate();

	join_workers();
}

void thread_pool::terminate()
{
	for (size_t i = 0; i < workers.size(); i++)
		channel.send(work_item {work_item::kind::terminate, task {}});

	terminated = true;
}
