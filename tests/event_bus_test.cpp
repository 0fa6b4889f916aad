// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file event_bus_test.cpp
 * @brief Unit tests for failover events and the event bus
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <kcenon/database_failover/events/failover_events.h>

using namespace database_failover::events;

// ============================================================================
// Event Type Tests
// ============================================================================

TEST(FailoverEventTest, EventTypeNames)
{
	EXPECT_STREQ(to_string(failover_event_type::primary_down), "primary_down");
	EXPECT_STREQ(to_string(failover_event_type::switched_to_failover), "switched_to_failover");
	EXPECT_STREQ(to_string(failover_event_type::limited_functionality_activated),
				 "limited_functionality_activated");
	EXPECT_STREQ(to_string(failover_event_type::cache_unavailable), "cache_unavailable");
}

TEST(FailoverEventTest, SwitchEventCarriesPreviousConnection)
{
	auto first = failover_event::for_switch(failover_event_type::switched_to_primary,
											std::nullopt, "primary");
	auto later = failover_event::for_switch(failover_event_type::switched_to_primary,
											"blocking", "primary");

	EXPECT_EQ(first.connection_name, "primary");
	EXPECT_FALSE(first.previous_connection.has_value());
	ASSERT_TRUE(later.previous_connection.has_value());
	EXPECT_EQ(*later.previous_connection, "blocking");
}

TEST(FailoverEventTest, CacheErrorEventCarriesError)
{
	auto event = failover_event::for_cache_error(
		kcenon::common::error_info{ -2, "connection refused", "state_cache" });

	EXPECT_EQ(event.type, failover_event_type::cache_unavailable);
	ASSERT_TRUE(event.error.has_value());
	EXPECT_EQ(event.error->message, "connection refused");
}

// ============================================================================
// Event Bus Tests
// ============================================================================

TEST(EventBusTest, DeliversToAllSubscribersInOrder)
{
	event_bus bus;
	std::vector<std::string> received;

	bus.subscribe([&](const failover_event& e) { received.push_back("a:" + e.connection_name); });
	bus.subscribe([&](const failover_event& e) { received.push_back("b:" + e.connection_name); });

	bus.dispatch(failover_event::for_connection(failover_event_type::primary_down, "primary"));

	ASSERT_EQ(received.size(), 2u);
	EXPECT_EQ(received[0], "a:primary");
	EXPECT_EQ(received[1], "b:primary");
}

TEST(EventBusTest, DispatchSetsTimestamp)
{
	event_bus bus;
	uint64_t timestamp = 0;

	bus.subscribe([&](const failover_event& e) { timestamp = e.timestamp; });
	bus.dispatch(failover_event::for_connection(failover_event_type::connection_healthy, "x"));

	EXPECT_GT(timestamp, 0u);
}

TEST(EventBusTest, UnsubscribeStopsDelivery)
{
	event_bus bus;
	int calls = 0;

	auto id = bus.subscribe([&](const failover_event&) { ++calls; });
	EXPECT_EQ(bus.subscriber_count(), 1u);

	EXPECT_TRUE(bus.unsubscribe(id));
	EXPECT_FALSE(bus.unsubscribe(id));

	bus.dispatch(failover_event::for_connection(failover_event_type::primary_down, "primary"));
	EXPECT_EQ(calls, 0);
	EXPECT_EQ(bus.subscriber_count(), 0u);
}

TEST(EventBusTest, ThrowingSubscriberDoesNotStopOthers)
{
	event_bus bus;
	int calls = 0;

	bus.subscribe([](const failover_event&) { throw std::runtime_error("listener failed"); });
	bus.subscribe([&](const failover_event&) { ++calls; });

	EXPECT_NO_THROW(bus.dispatch(
		failover_event::for_connection(failover_event_type::failover_down, "failover")));
	EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, SubscriberThrowingNonStandardTypeDoesNotStopOthers)
{
	event_bus bus;
	int calls = 0;

	bus.subscribe([](const failover_event&) { throw 5; });
	bus.subscribe([&](const failover_event&) { ++calls; });

	EXPECT_NO_THROW(bus.dispatch(
		failover_event::for_connection(failover_event_type::primary_down, "primary")));
	EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, SubscriberMayUnsubscribeDuringDispatch)
{
	event_bus bus;
	int calls = 0;
	event_bus::subscription_id id = 0;

	id = bus.subscribe(
		[&](const failover_event&)
		{
			++calls;
			bus.unsubscribe(id);
		});

	bus.dispatch(failover_event::for_connection(failover_event_type::primary_down, "primary"));
	bus.dispatch(failover_event::for_connection(failover_event_type::primary_down, "primary"));

	EXPECT_EQ(calls, 1);
}
