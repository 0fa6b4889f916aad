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
 * @file failover_events.h
 * @brief Failover notifications and the in-process event bus
 *
 * Every observable transition of the failover system is published as a
 * failover_event: probe outcomes, role-specific down/restored
 * transitions, connection switches, limited functionality mode, state
 * cache failures and health check command lifecycle.
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace database_failover::events
{

/**
 * @enum failover_event_type
 * @brief Kinds of failover notifications
 */
enum class failover_event_type : uint8_t
{
	connection_healthy = 1,
	primary_down = 2,
	failover_down = 3,
	primary_restored = 4,
	failover_restored = 5,
	switched_to_primary = 6,
	switched_to_failover = 7,
	limited_functionality_activated = 8,
	exited_limited_functionality = 9,
	cache_unavailable = 10,
	health_check_started = 11,
	health_check_finished = 12
};

/**
 * @brief Convert failover_event_type to string
 */
constexpr const char* to_string(failover_event_type type) noexcept
{
	switch (type)
	{
	case failover_event_type::connection_healthy:
		return "connection_healthy";
	case failover_event_type::primary_down:
		return "primary_down";
	case failover_event_type::failover_down:
		return "failover_down";
	case failover_event_type::primary_restored:
		return "primary_restored";
	case failover_event_type::failover_restored:
		return "failover_restored";
	case failover_event_type::switched_to_primary:
		return "switched_to_primary";
	case failover_event_type::switched_to_failover:
		return "switched_to_failover";
	case failover_event_type::limited_functionality_activated:
		return "limited_functionality_activated";
	case failover_event_type::exited_limited_functionality:
		return "exited_limited_functionality";
	case failover_event_type::cache_unavailable:
		return "cache_unavailable";
	case failover_event_type::health_check_started:
		return "health_check_started";
	case failover_event_type::health_check_finished:
		return "health_check_finished";
	default:
		return "unknown";
	}
}

/**
 * @struct failover_event
 * @brief A single failover notification
 *
 * Field usage by type:
 * - health and switch events: connection_name is the affected (new)
 *   connection; switch events also carry previous_connection, empty on
 *   the first decision of a failover manager
 * - cache_unavailable: error holds the underlying state cache error
 * - health_check_started / health_check_finished: connections lists the
 *   targeted or processed connections, exit_code is set on finish
 */
struct failover_event
{
	failover_event_type type;
	std::string connection_name;
	std::optional<std::string> previous_connection;
	std::optional<kcenon::common::error_info> error;
	std::vector<std::string> connections;
	int exit_code = 0;
	uint64_t timestamp = 0; ///< Unix epoch ms, set by event_bus::dispatch if zero

	static failover_event for_connection(failover_event_type type, std::string name);

	static failover_event for_switch(failover_event_type type,
									 std::optional<std::string> previous,
									 std::string name);

	static failover_event for_cache_error(kcenon::common::error_info error);

	static failover_event for_health_check(failover_event_type type,
										   std::vector<std::string> connections,
										   int exit_code = 0);
};

/**
 * @brief Subscriber callback type
 */
using event_callback_t = std::function<void(const failover_event&)>;

/**
 * @class event_bus
 * @brief Synchronous publish/subscribe dispatcher for failover events
 *
 * Callbacks run in the dispatching thread, after the subscriber list has
 * been copied, so a callback may subscribe or unsubscribe. A callback
 * that throws std::exception is logged and skipped; the remaining
 * subscribers still receive the event.
 *
 * @code
 * auto bus = std::make_shared<event_bus>();
 * bus->subscribe([](const failover_event& event) {
 *     if (event.type == failover_event_type::limited_functionality_activated) {
 *         page_on_call(event.connection_name);
 *     }
 * });
 * @endcode
 */
class event_bus
{
public:
	using subscription_id = uint64_t;

	explicit event_bus(std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	event_bus(const event_bus&) = delete;
	event_bus& operator=(const event_bus&) = delete;

	/**
	 * @brief Register a callback for every event
	 * @return Identifier accepted by unsubscribe()
	 */
	subscription_id subscribe(event_callback_t callback);

	/**
	 * @brief Remove a callback
	 * @return true if the subscription existed
	 */
	bool unsubscribe(subscription_id id);

	/**
	 * @brief Deliver an event to all current subscribers
	 */
	void dispatch(failover_event event);

	[[nodiscard]] size_t subscriber_count() const;

private:
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	mutable std::mutex mutex_;
	std::vector<std::pair<subscription_id, event_callback_t>> subscribers_;
	subscription_id next_id_ = 1;
};

} // namespace database_failover::events
