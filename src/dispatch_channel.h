#ifndef DISPATCH_CHANNEL_H

#define DISPATCH_CHANNEL_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

// Unbounded FIFO hand-off between any number of producers and consumers. Every item that
// is sent is received by exactly one consumer.
template<typename T> class dispatch_channel {
		std::deque<T> items;
		mutable std::mutex mutex;
		std::condition_variable available;
		bool closed = false;

	public:
		dispatch_channel() = default;
		dispatch_channel(const dispatch_channel&) = delete;
		dispatch_channel& operator=(const dispatch_channel&) = delete;

		// Wakes every blocked consumer. Items that are still queued can be received.
		void close()
		{
			{
				std::lock_guard<std::mutex> lock {mutex};

				closed = true;
			}

			available.notify_all();
		}

		bool is_closed() const
		{
			std::lock_guard<std::mutex> lock {mutex};

			return closed;
		}

		// Blocks until an item is available. Returns false once the channel is closed
		// and drained.
		bool receive(T *item)
		{
			std::unique_lock<std::mutex> lock {mutex};

			available.wait(lock, [this] { return !items.empty() || closed; });

			if (items.empty())
				return false;

			*item = std::move(items.front());
			items.pop_front();
			return true;
		}

		// Never blocks. Throws std::logic_error if the channel has been closed.
		void send(T&& item)
		{
			{
				std::lock_guard<std::mutex> lock {mutex};

				if (closed)
					throw std::logic_error("send on a closed dispatch channel");

				items.push_back(std::move(item));
			}

			available.notify_one();
		}

		size_t size() const
		{
			std::lock_guard<std::mutex> lock {mutex};

			return items.size();
		}
};

#endif // DISPATCH_CHANNEL_H
