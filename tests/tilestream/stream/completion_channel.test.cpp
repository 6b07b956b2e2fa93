#include <tilestream/stream/completion_channel.hpp>

#include "../../test_common.hpp"

#include <memory>
#include <set>
#include <thread>
#include <vector>

namespace tilestream::stream
{

TEST_CASE("'CompletionChannel' FIFO behavior", "[tilestream::stream::completion_channel]")
{
	CompletionChannel<std::unique_ptr<int>> channel;

	CHECK_FALSE(channel.tryPop().has_value());
	CHECK(channel.sizeApprox() == 0);

	channel.push(std::make_unique<int>(1));
	channel.push(std::make_unique<int>(2));
	CHECK(channel.sizeApprox() == 2);

	auto first = channel.tryPop();
	REQUIRE(first.has_value());
	CHECK(**first == 1);

	auto second = channel.tryPop();
	REQUIRE(second.has_value());
	CHECK(**second == 2);

	CHECK_FALSE(channel.tryPop().has_value());
}

TEST_CASE("'CompletionChannel' concurrent producers", "[tilestream::stream::completion_channel]")
{
	CompletionChannel<int> channel;

	constexpr int PRODUCERS = 4;
	constexpr int ITEMS = 1000;

	std::vector<std::thread> producers;
	for (int p = 0; p < PRODUCERS; p++) {
		producers.emplace_back([&channel, p]() {
			for (int i = 0; i < ITEMS; i++) {
				channel.push(p * ITEMS + i);
			}
		});
	}

	std::set<int> received;
	std::vector<int> last_per_producer(PRODUCERS, -1);

	while (received.size() < size_t(PRODUCERS * ITEMS)) {
		if (auto item = channel.tryPop(); item.has_value()) {
			int producer = *item / ITEMS;
			// Items of one producer arrive in push order
			CHECK(*item > last_per_producer[size_t(producer)]);
			last_per_producer[size_t(producer)] = *item;
			received.insert(*item);
		} else {
			std::this_thread::yield();
		}
	}

	for (auto &thread : producers) {
		thread.join();
	}

	CHECK(received.size() == size_t(PRODUCERS * ITEMS));
	CHECK_FALSE(channel.tryPop().has_value());
}

} // namespace tilestream::stream
