#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tether::network {

//! Multicast hook. Handlers run synchronously on the triggering thread, in registration order.
//! \note Handlers cannot be removed. Exceptions thrown by a handler reach the caller of trigger().
template <class... Args>
class Event {
public:
	using Handler = std::function<void(Args...)>;

	//! Append a handler.
	void subscribe(Handler handler);

	//! Call every handler. No-op without handlers.
	void trigger(Args... args) const;

	std::size_t size() const;

private:
	mutable std::mutex m_mutex;
	std::vector<Handler> m_handlers;
};


template <class... Args>
void Event<Args...>::subscribe(Handler handler) {
	if (!handler) {
		return;
	}

	std::lock_guard<std::mutex> lock(m_mutex);
	m_handlers.push_back(std::move(handler));
}

template <class... Args>
void Event<Args...>::trigger(Args... args) const {
	std::vector<Handler> handlers;
	{
		// Copy so handlers may subscribe without deadlocking.
		std::lock_guard<std::mutex> lock(m_mutex);
		handlers = m_handlers;
	}

	for (const auto& handler: handlers) {
		handler(args...);
	}
}

template <class... Args>
std::size_t Event<Args...>::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_handlers.size();
}

} // namespace tether::network
