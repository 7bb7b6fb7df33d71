#include "tether/network/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace tether::gtest {

TEST(Event, TriggerWithoutHandlers) {
	network::Event<int> event;
	EXPECT_NO_THROW(event.trigger(1));
	EXPECT_EQ(event.size(), 0u);
}

TEST(Event, HandlersRunInRegistrationOrder) {
	network::Event<const std::string&> event;
	std::vector<std::string> calls;

	event.subscribe([&](const std::string& value) { calls.push_back("first:" + value); });
	event.subscribe([&](const std::string& value) { calls.push_back("second:" + value); });
	event.trigger("a");
	event.trigger("b");

	EXPECT_EQ(calls, (std::vector<std::string>{"first:a", "second:a", "first:b", "second:b"}));
}

TEST(Event, EmptyHandlerIsIgnored) {
	network::Event<> event;
	event.subscribe({});
	EXPECT_EQ(event.size(), 0u);
	EXPECT_NO_THROW(event.trigger());
}

TEST(Event, PassesReferences) {
	network::Event<int&> event;
	event.subscribe([](int& value) { ++value; });
	event.subscribe([](int& value) { value *= 10; });

	int value = 1;
	event.trigger(value);
	EXPECT_EQ(value, 20);
}

TEST(Event, HandlerExceptionReachesCaller) {
	network::Event<> event;
	bool secondCalled = false;
	event.subscribe([] { throw std::runtime_error("handler failed"); });
	event.subscribe([&] { secondCalled = true; });

	EXPECT_THROW(event.trigger(), std::runtime_error);
	EXPECT_FALSE(secondCalled);
}

TEST(Event, SubscribeFromHandler) {
	network::Event<> event;
	int calls = 0;
	event.subscribe([&] {
		++calls;
		event.subscribe([&] { ++calls; });
	});

	event.trigger(); // Added handler runs from the next trigger on.
	EXPECT_EQ(calls, 1);
	EXPECT_EQ(event.size(), 2u);
}

} // namespace tether::gtest
