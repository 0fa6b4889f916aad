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

#include <kcenon/database_failover/events/failover_events.h>
#include <kcenon/database_failover/logging/console_logger.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace database_failover::events
{

using kcenon::common::interfaces::log_level;

failover_event failover_event::for_connection(failover_event_type type, std::string name)
{
	failover_event event{ type };
	event.connection_name = std::move(name);
	return event;
}

failover_event failover_event::for_switch(failover_event_type type,
										  std::optional<std::string> previous,
										  std::string name)
{
	failover_event event{ type };
	event.connection_name = std::move(name);
	event.previous_connection = std::move(previous);
	return event;
}

failover_event failover_event::for_cache_error(kcenon::common::error_info error)
{
	failover_event event{ failover_event_type::cache_unavailable };
	event.error = std::move(error);
	return event;
}

failover_event failover_event::for_health_check(failover_event_type type,
											  std::vector<std::string> connections,
											  int exit_code)
{
	failover_event event{ type };
	event.connections = std::move(connections);
	event.exit_code = exit_code;
	return event;
}

event_bus::event_bus(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: logger_(std::move(logger))
{
}

event_bus::subscription_id event_bus::subscribe(event_callback_t callback)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto id = next_id_++;
	subscribers_.emplace_back(id, std::move(callback));
	return id;
}

bool event_bus::unsubscribe(subscription_id id)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
						   [id](const auto& entry) { return entry.first == id; });
	if (it == subscribers_.end())
	{
		return false;
	}
	subscribers_.erase(it);
	return true;
}

void event_bus::dispatch(failover_event event)
{
	if (event.timestamp == 0)
	{
		event.timestamp = static_cast<uint64_t>(
			std::chrono::duration_cast<std::chrono::milliseconds>(
				std::chrono::system_clock::now().time_since_epoch())
				.count());
	}

	std::vector<std::pair<subscription_id, event_callback_t>> snapshot;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		snapshot = subscribers_;
	}

	for (const auto& [id, callback] : snapshot)
	{
		if (!callback)
		{
			continue;
		}

		try
		{
			callback(event);
		}
		catch (const std::exception& e)
		{
			logging::write_log(logger_, log_level::error,
							   std::string("Subscriber ") + std::to_string(id) + " failed on '"
								   + to_string(event.type) + "' event: " + e.what());
		}
		catch (...)
		{
			logging::write_log(logger_, log_level::error,
							   std::string("Subscriber ") + std::to_string(id) + " failed on '"
								   + to_string(event.type) + "' event with an unknown exception");
		}
	}
}

size_t event_bus::subscriber_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return subscribers_.size();
}

} // namespace database_failover::events
