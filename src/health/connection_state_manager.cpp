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

#include <kcenon/database_failover/health/connection_state_manager.h>
#include <kcenon/database_failover/logging/console_logger.h>

#include <charconv>
#include <exception>
#include <system_error>
#include <utility>

namespace database_failover::health
{

using kcenon::common::interfaces::log_level;
using events::failover_event;
using events::failover_event_type;

namespace
{

std::optional<uint32_t> parse_count(const std::string& value)
{
	uint32_t parsed = 0;
	auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
	if (ec != std::errc{} || ptr != value.data() + value.size())
	{
		return std::nullopt;
	}
	return parsed;
}

} // namespace

connection_state_manager::connection_state_manager(
	std::shared_ptr<health_probe> probe,
	std::shared_ptr<cache::state_cache> cache,
	std::shared_ptr<events::event_bus> events,
	const failover_config& config,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: probe_(std::move(probe))
	, cache_(std::move(cache))
	, events_(std::move(events))
	, logger_(std::move(logger))
	, roles_(config.resolved_connections())
	, failure_threshold_(config.health_check.failure_threshold)
	, ttl_(config.cache.ttl())
	, prefix_(config.cache.prefix)
	, tag_(config.cache.tag)
{
	if (failure_threshold_ == 0)
	{
		logging::write_log(logger_, log_level::warning,
						   "Failure threshold of 0 is invalid, using 1");
		failure_threshold_ = 1;
	}

	if (cache_ && !tag_.empty() && !cache_->supports_tags())
	{
		logging::write_log(logger_, log_level::warning,
						   "The configured state cache does not support tags. "
						   "flush_all_statuses() will be unavailable.");
	}
}

void connection_state_manager::update_connection_status(const std::string& connection_name)
{
	metrics_.probes.fetch_add(1, std::memory_order_relaxed);

	bool healthy = false;
	if (probe_)
	{
		try
		{
			healthy = probe_->is_healthy(connection_name);
		}
		catch (const std::exception& e)
		{
			logging::write_log(logger_, log_level::warning,
							   "Probe for connection '" + connection_name
								   + "' threw: " + e.what());
		}
		catch (...)
		{
			logging::write_log(logger_, log_level::warning,
							   "Probe for connection '" + connection_name
								   + "' threw an unknown exception");
		}
	}

	auto previous = get_connection_status(connection_name);

	if (healthy)
	{
		on_probe_success(connection_name, previous);
	}
	else
	{
		on_probe_failure(connection_name, previous);
	}
}

void connection_state_manager::on_probe_success(const std::string& connection_name,
												connection_status previous)
{
	set_connection_status(connection_name, connection_status::healthy, 0);
	if (events_)
	{
		events_->dispatch(failover_event::for_connection(failover_event_type::connection_healthy,
														 connection_name));
	}

	if (previous != connection_status::down)
	{
		return;
	}

	metrics_.restorations.fetch_add(1, std::memory_order_relaxed);

	switch (roles_.classify(connection_name))
	{
	case connection_role::primary:
		logging::write_log(logger_, log_level::info,
						   "Primary connection '" + connection_name + "' restored.");
		if (events_)
		{
			events_->dispatch(failover_event::for_connection(
				failover_event_type::primary_restored, connection_name));
		}
		break;
	case connection_role::failover:
		logging::write_log(logger_, log_level::info,
						   "Failover connection '" + connection_name + "' restored.");
		if (events_)
		{
			events_->dispatch(failover_event::for_connection(
				failover_event_type::failover_restored, connection_name));
		}
		break;
	default:
		logging::write_log(logger_, log_level::info,
						   "Connection '" + connection_name + "' restored.");
		break;
	}
}

void connection_state_manager::on_probe_failure(const std::string& connection_name,
												connection_status previous)
{
	metrics_.probe_failures.fetch_add(1, std::memory_order_relaxed);

	// Not atomic across processes; a lost increment only delays DOWN by one cycle
	const uint32_t failures = get_failure_count(connection_name) + 1;

	if (failures < failure_threshold_)
	{
		set_connection_status(connection_name, connection_status::unknown, failures);
		logging::write_log(logger_, log_level::debug,
						   "Connection '" + connection_name + "' unhealthy, failure count: "
							   + std::to_string(failures) + " of "
							   + std::to_string(failure_threshold_));
		return;
	}

	set_connection_status(connection_name, connection_status::down, failures);

	if (previous == connection_status::down)
	{
		logging::write_log(logger_, log_level::debug,
						   "Connection '" + connection_name + "' still DOWN, failure count: "
							   + std::to_string(failures));
		return;
	}

	metrics_.down_transitions.fetch_add(1, std::memory_order_relaxed);
	logging::write_log(logger_, log_level::warning,
					   "Connection '" + connection_name + "' marked as DOWN after "
						   + std::to_string(failures) + " failures.");

	switch (roles_.classify(connection_name))
	{
	case connection_role::primary:
		if (events_)
		{
			events_->dispatch(
				failover_event::for_connection(failover_event_type::primary_down, connection_name));
		}
		break;
	case connection_role::failover:
		if (events_)
		{
			events_->dispatch(failover_event::for_connection(failover_event_type::failover_down,
															 connection_name));
		}
		break;
	default:
		logging::write_log(logger_, log_level::warning,
						   "No role-specific down event for unmonitored connection '"
							   + connection_name + "'");
		break;
	}
}

connection_status connection_state_manager::get_connection_status(
	const std::string& connection_name)
{
	auto result = read(status_key(connection_name));
	if (result.is_err())
	{
		report_cache_error("retrieve connection status for '" + connection_name + "'",
						   result.error());
		return connection_status::unknown;
	}

	const auto& value = result.value();
	if (!value.has_value())
	{
		return connection_status::unknown;
	}

	auto status = status_from_string(*value);
	if (!status.has_value())
	{
		logging::write_log(logger_, log_level::warning,
						   "Invalid status value '" + *value + "' found in cache for '"
							   + connection_name + "'. Returning UNKNOWN.");
		return connection_status::unknown;
	}

	return *status;
}

uint32_t connection_state_manager::get_failure_count(const std::string& connection_name)
{
	auto result = read(failure_count_key(connection_name));
	if (result.is_err())
	{
		report_cache_error("retrieve failure count for '" + connection_name + "'",
						   result.error());
		return 0;
	}

	const auto& value = result.value();
	if (!value.has_value())
	{
		return 0;
	}

	auto count = parse_count(*value);
	if (!count.has_value())
	{
		logging::write_log(logger_, log_level::warning,
						   "Invalid failure count '" + *value + "' found in cache for '"
							   + connection_name + "'. Returning 0.");
		return 0;
	}

	return *count;
}

connection_health_record connection_state_manager::get_record(const std::string& connection_name)
{
	connection_health_record record;
	record.connection_name = connection_name;
	record.status = get_connection_status(connection_name);
	record.consecutive_failures = get_failure_count(connection_name);
	return record;
}

void connection_state_manager::set_connection_status(const std::string& connection_name,
													 connection_status status,
													 std::optional<uint32_t> failure_count)
{
	uint32_t stored_count = 0;
	switch (status)
	{
	case connection_status::healthy:
		stored_count = 0;
		break;
	case connection_status::down:
		stored_count = failure_count.value_or(failure_threshold_);
		break;
	case connection_status::unknown:
		stored_count = failure_count.value_or(0);
		break;
	}

	// A record must never read HEALTHY with failures left over. Clear the
	// count before marking healthy, and leave HEALTHY before raising it.
	auto write_status = [&]() {
		auto result = write(status_key(connection_name), to_string(status));
		if (result.is_err())
		{
			report_cache_error("set connection status for '" + connection_name + "'",
							   result.error());
			return false;
		}
		return true;
	};
	auto write_count = [&]() {
		auto result = write(failure_count_key(connection_name), std::to_string(stored_count));
		if (result.is_err())
		{
			report_cache_error("set failure count for '" + connection_name + "'",
							   result.error());
			return false;
		}
		return true;
	};

	const bool written = status == connection_status::healthy
							 ? write_count() && write_status()
							 : write_status() && write_count();
	if (!written)
	{
		return;
	}

	logging::write_log(logger_, log_level::debug,
					   "Connection '" + connection_name + "' status set to '" + to_string(status)
						   + "' (failures: " + std::to_string(stored_count) + ")");
}

void connection_state_manager::flush_all_statuses()
{
	if (!cache_ || tag_.empty() || !cache_->supports_tags())
	{
		logging::write_log(logger_, log_level::warning,
						   "State cache does not support tags or no tag configured. "
						   "Connection statuses were not flushed; clear the cache manually.");
		return;
	}

	kcenon::common::VoidResult result = kcenon::common::ok();
	try
	{
		result = cache_->flush_tag(tag_);
	}
	catch (const std::exception& e)
	{
		result = kcenon::common::error_info{ -2, e.what(), "state_cache" };
	}
	catch (...)
	{
		result = kcenon::common::error_info{ -2, "Unknown exception", "state_cache" };
	}

	if (result.is_err())
	{
		report_cache_error("flush connection statuses", result.error());
		return;
	}

	logging::write_log(logger_, log_level::info,
					   "All connection statuses flushed from cache using tag '" + tag_ + "'.");
}

bool connection_state_manager::is_connection_healthy(const std::string& connection_name)
{
	return get_connection_status(connection_name) == connection_status::healthy;
}

bool connection_state_manager::is_connection_down(const std::string& connection_name)
{
	return get_connection_status(connection_name) == connection_status::down;
}

bool connection_state_manager::is_connection_unknown(const std::string& connection_name)
{
	return get_connection_status(connection_name) == connection_status::unknown;
}

const connection_roles& connection_state_manager::roles() const noexcept
{
	return roles_;
}

uint32_t connection_state_manager::failure_threshold() const noexcept
{
	return failure_threshold_;
}

const metrics::state_metrics& connection_state_manager::metrics() const noexcept
{
	return metrics_;
}

std::string connection_state_manager::status_key(const std::string& connection_name) const
{
	return prefix_ + "_conn_status_" + connection_name;
}

std::string connection_state_manager::failure_count_key(const std::string& connection_name) const
{
	return prefix_ + "_conn_failure_count_" + connection_name;
}

kcenon::common::Result<std::optional<std::string>> connection_state_manager::read(
	const std::string& key)
{
	if (!cache_)
	{
		return kcenon::common::error_info{ -1, "No state cache configured", "state_cache" };
	}

	try
	{
		return cache_->get(key);
	}
	catch (const std::exception& e)
	{
		return kcenon::common::error_info{ -2, e.what(), "state_cache" };
	}
	catch (...)
	{
		return kcenon::common::error_info{ -2, "Unknown exception", "state_cache" };
	}
}

kcenon::common::VoidResult connection_state_manager::write(const std::string& key,
														   const std::string& value)
{
	if (!cache_)
	{
		return kcenon::common::error_info{ -1, "No state cache configured", "state_cache" };
	}

	try
	{
		return cache_->put(key, value, ttl_, tag_);
	}
	catch (const std::exception& e)
	{
		return kcenon::common::error_info{ -2, e.what(), "state_cache" };
	}
	catch (...)
	{
		return kcenon::common::error_info{ -2, "Unknown exception", "state_cache" };
	}
}

void connection_state_manager::report_cache_error(const std::string& operation,
												  const kcenon::common::error_info& error)
{
	metrics_.cache_errors.fetch_add(1, std::memory_order_relaxed);
	logging::write_log(logger_, log_level::critical,
					   "Failed to " + operation + " in cache: " + error.message);
	if (events_)
	{
		events_->dispatch(failover_event::for_cache_error(error));
	}
}

} // namespace database_failover::health
