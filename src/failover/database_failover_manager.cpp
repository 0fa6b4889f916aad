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

#include <kcenon/database_failover/failover/database_failover_manager.h>
#include <kcenon/database_failover/logging/console_logger.h>

#include <utility>

namespace database_failover::failover
{

using kcenon::common::interfaces::log_level;
using events::failover_event;
using events::failover_event_type;

namespace
{

std::string describe(const std::optional<std::string>& name)
{
	return name.has_value() ? "'" + *name + "'" : "(none)";
}

} // namespace

database_failover_manager::database_failover_manager(
	const failover_config& config,
	std::shared_ptr<health::connection_state_manager> state_manager,
	std::shared_ptr<connection_manager> connections,
	std::shared_ptr<events::event_bus> events,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: roles_(config.resolved_connections())
	, default_to_primary_on_empty_state_(config.default_to_primary_on_empty_state)
	, state_manager_(std::move(state_manager))
	, connections_(std::move(connections))
	, events_(std::move(events))
	, logger_(std::move(logger))
{
	for (const auto& warning : config.validation_warnings())
	{
		logging::write_log(logger_, log_level::warning, warning);
	}
}

kcenon::common::Result<std::string> database_failover_manager::determine_and_set_connection()
{
	metrics_.decisions.fetch_add(1, std::memory_order_relaxed);

	auto target = resolve_active_connection();

	auto applied = apply_connection(target, "health state");
	if (applied.is_err())
	{
		return applied.error();
	}

	return target;
}

std::string database_failover_manager::resolve_active_connection()
{
	if (!state_manager_)
	{
		logging::write_log(logger_, log_level::warning,
						   "No state manager configured. Defaulting to primary connection '"
							   + roles_.primary + "'.");
		return roles_.primary;
	}

	const auto primary_status = state_manager_->get_connection_status(roles_.primary);
	const auto failover_status = state_manager_->get_connection_status(roles_.failover);

	// Empty state reads the same whether never probed, expired or flushed
	if (default_to_primary_on_empty_state_ && primary_status == connection_status::unknown
		&& failover_status == connection_status::unknown
		&& state_manager_->get_failure_count(roles_.primary) == 0
		&& state_manager_->get_failure_count(roles_.failover) == 0)
	{
		logging::write_log(logger_, log_level::warning,
						   "Connection statuses not yet determined or cache unavailable. "
						   "Defaulting to primary connection '"
							   + roles_.primary + "'.");
		return roles_.primary;
	}

	if (primary_status == connection_status::healthy)
	{
		logging::write_log(logger_, log_level::debug,
						   "Primary connection '" + roles_.primary + "' is HEALTHY.");
		return roles_.primary;
	}

	logging::write_log(logger_, log_level::warning,
					   "Primary connection '" + roles_.primary + "' is not healthy (Status: "
						   + to_string(primary_status) + "). Checking failover.");

	if (failover_status == connection_status::healthy)
	{
		logging::write_log(logger_, log_level::info,
						   "Failover connection '" + roles_.failover + "' is HEALTHY.");
		return roles_.failover;
	}

	logging::write_log(logger_, log_level::error,
					   "Both primary ('" + roles_.primary + "' - Status: "
						   + to_string(primary_status) + ") and failover ('" + roles_.failover
						   + "' - Status: " + to_string(failover_status)
						   + ") connections are unavailable. Activating blocking connection.");
	return roles_.blocking;
}

kcenon::common::VoidResult database_failover_manager::force_switch_to_primary()
{
	logging::write_log(logger_, log_level::info,
					   "Forcing switch to primary connection '" + roles_.primary + "'.");

	if (state_manager_)
	{
		state_manager_->set_connection_status(roles_.primary, connection_status::healthy, 0);
		state_manager_->set_connection_status(roles_.failover, connection_status::healthy, 0);
	}

	return apply_connection(roles_.primary, "forced switch");
}

kcenon::common::VoidResult database_failover_manager::force_switch_to_failover()
{
	logging::write_log(logger_, log_level::info,
					   "Forcing switch to failover connection '" + roles_.failover + "'.");

	return apply_connection(roles_.failover, "forced switch");
}

std::string database_failover_manager::get_current_active_connection_name() const
{
	{
		std::lock_guard<std::mutex> lock(state_mutex_);
		if (current_active_.has_value())
		{
			return *current_active_;
		}
	}

	return connections_ ? connections_->active_connection() : std::string{};
}

std::optional<std::string> database_failover_manager::last_applied_connection() const
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	return current_active_;
}

const connection_roles& database_failover_manager::roles() const noexcept
{
	return roles_;
}

const metrics::switch_metrics& database_failover_manager::metrics() const noexcept
{
	return metrics_;
}

kcenon::common::VoidResult database_failover_manager::apply_connection(const std::string& target,
																	   const std::string& reason)
{
	std::vector<failover_event> pending;
	{
		std::lock_guard<std::mutex> switch_lock(switch_mutex_);

		std::optional<std::string> previous;
		{
			std::lock_guard<std::mutex> lock(state_mutex_);
			previous = current_active_;
		}

		if (previous == target)
		{
			logging::write_log(logger_, log_level::debug,
							   "No change in active connection. Still using '" + target + "'.");
			return kcenon::common::ok();
		}

		logging::write_log(logger_, log_level::info,
						   "Switching active connection from " + describe(previous) + " to '"
							   + target + "' (" + reason + ").");

		if (!connections_)
		{
			metrics_.failed_switches.fetch_add(1, std::memory_order_relaxed);
			return kcenon::common::error_info{ -1, "No connection manager configured",
											   "database_failover_manager" };
		}

		// state_mutex_ is free here so the host may read the coordinator
		auto result = connections_->set_active_connection(target);
		if (result.is_err())
		{
			metrics_.failed_switches.fetch_add(1, std::memory_order_relaxed);
			logging::write_log(logger_, log_level::error,
							   "Failed to switch active connection to '" + target
								   + "': " + result.error().message);
			return result;
		}

		{
			std::lock_guard<std::mutex> lock(state_mutex_);
			current_active_ = target;
		}
		metrics_.switches.fetch_add(1, std::memory_order_relaxed);
		pending = switch_events(previous, target);
	}

	if (events_)
	{
		for (auto& event : pending)
		{
			events_->dispatch(std::move(event));
		}
	}

	return kcenon::common::ok();
}

std::vector<failover_event> database_failover_manager::switch_events(
	const std::optional<std::string>& previous, const std::string& target)
{
	std::vector<failover_event> pending;
	const bool leaving_blocking = previous.has_value() && *previous == roles_.blocking;

	switch (roles_.classify(target))
	{
	case connection_role::primary:
		logging::write_log(logger_, log_level::info,
						   "Switched to PRIMARY connection '" + target + "' from "
							   + describe(previous) + ".");
		pending.push_back(failover_event::for_switch(failover_event_type::switched_to_primary,
													 previous, target));
		break;
	case connection_role::failover:
		logging::write_log(logger_, log_level::info,
						   "Switched to FAILOVER connection '" + target + "' from "
							   + describe(previous) + ".");
		pending.push_back(failover_event::for_switch(failover_event_type::switched_to_failover,
													 previous, target));
		break;
	case connection_role::blocking:
		if (!leaving_blocking)
		{
			metrics_.limited_mode_activations.fetch_add(1, std::memory_order_relaxed);
			logging::write_log(logger_, log_level::warning,
							   "Switched to blocking connection '" + target
								   + "'. Limited functionality mode activated.");
			pending.push_back(failover_event::for_connection(
				failover_event_type::limited_functionality_activated, target));
		}
		return pending;
	default:
		logging::write_log(logger_, log_level::warning,
						   "Switched to connection '" + target + "' which has no failover role.");
		return pending;
	}

	if (leaving_blocking)
	{
		logging::write_log(logger_, log_level::info,
						   "Exiting limited functionality mode. Switched to '" + target + "'.");
		pending.push_back(failover_event::for_connection(
			failover_event_type::exited_limited_functionality, target));
	}

	return pending;
}

} // namespace database_failover::failover
