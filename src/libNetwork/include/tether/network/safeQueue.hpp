#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace tether::network {

//! Thread safe FIFO with a bounded blocking Pop.
template <class Entry>
class SafeQueue {
public:
	//! Push element onto the queue.
	void Push(Entry value);

	//! Wait at most timeout for an element.
	//! \returns std::nullopt on timeout or when the queue was released and is empty.
	template <class Rep, class Period>
	std::optional<Entry> Pop(std::chrono::duration<Rep, Period> timeout);

	//! Returns true if the queue is empty; false otherwise.
	bool Empty() const;

	std::size_t Size() const;

	//! Wake all waiting threads. Subsequent pops no longer wait.
	void Release();

	bool Released() const;

private:
	std::deque<Entry> m_queue;           //!< Stores the entries.
	mutable std::mutex m_mutex;          //!< Manage access to the queue.
	std::condition_variable m_condition; //!< Notify that element can be popped.
	bool m_released{false};              //!< Pop stops waiting once set.
};


template <class Entry>
void SafeQueue<Entry>::Push(Entry value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(std::move(value));
	}
	m_condition.notify_one();
}

template <class Entry>
template <class Rep, class Period>
std::optional<Entry> SafeQueue<Entry>::Pop(std::chrono::duration<Rep, Period> timeout) {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_condition.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_released; });

	if (m_queue.empty()) {
		return std::nullopt;
	}

	auto element = std::move(m_queue.front());
	m_queue.pop_front();
	return element;
}

template <class Entry>
bool SafeQueue<Entry>::Empty() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.empty();
}

template <class Entry>
std::size_t SafeQueue<Entry>::Size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.size();
}

template <class Entry>
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_released = true;
	}
	m_condition.notify_all();
}

template <class Entry>
bool SafeQueue<Entry>::Released() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_released;
}

} // namespace tether::network
