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

#include <kcenon/database_failover/command/health_check_command.h>
#include <kcenon/database_failover/logging/console_logger.h>

#include <exception>
#include <utility>

namespace database_failover::command
{

using kcenon::common::interfaces::log_level;
using events::failover_event;
using events::failover_event_type;

health_check_command::health_check_command(
	std::shared_ptr<health::connection_state_manager> state_manager,
	std::shared_ptr<health::connection_resolver> resolver,
	std::shared_ptr<events::event_bus> events,
	const failover_config& config,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: state_manager_(std::move(state_manager))
	, resolver_(std::move(resolver))
	, events_(std::move(events))
	, logger_(std::move(logger))
	, roles_(config.resolved_connections())
	, dispatch_lifecycle_events_(config.dispatch_command_lifecycle_events)
{
}

health_check_report health_check_command::execute(const std::optional<std::string>& connection,
												  std::optional<bool> dispatch_events)
{
	const bool dispatch = dispatch_events.value_or(dispatch_lifecycle_events_) && events_;
	const bool specific = connection.has_value() && !connection->empty();

	health_check_report report;
	std::vector<std::string> targets = specific ? std::vector<std::string>{ *connection }
												: monitored_connections();

	if (dispatch)
	{
		events_->dispatch(
			failover_event::for_health_check(failover_event_type::health_check_started, targets));
	}

	info("Starting database health checks...");

	if (specific)
	{
		if (!resolver_ || !resolver_->has_connection(*connection))
		{
			logging::write_log(logger_, log_level::error,
							   "Connection '" + *connection
								   + "' is not configured in your database settings.");
			report.exit_code = EXIT_FAILURE_CODE;
			if (dispatch)
			{
				events_->dispatch(failover_event::for_health_check(
					failover_event_type::health_check_finished, report.processed,
					report.exit_code));
			}
			return report;
		}
		info("Performing health check for specific connection: " + *connection);
	}
	else
	{
		info("Performing health checks for configured primary and failover connections.");
	}

	if (!state_manager_)
	{
		logging::write_log(logger_, log_level::error,
						   "No connection state manager configured. Skipping health checks.");
		report.exit_code = EXIT_FAILURE_CODE;
		targets.clear();
	}

	for (const auto& name : targets)
	{
		report.processed.push_back(name);
		info("Checking health of connection: " + name + "...");

		try
		{
			state_manager_->update_connection_status(name);

			connection_check_result result;
			result.connection = name;
			result.status = state_manager_->get_connection_status(name);
			result.failure_count = state_manager_->get_failure_count(name);

			info("Connection '" + name + "' status: " + std::string(to_string(result.status))
				 + ", Failures: " + std::to_string(result.failure_count));
			report.results.push_back(std::move(result));
		}
		catch (const std::exception& e)
		{
			logging::write_log(logger_, log_level::error,
							   "Failed to check health for connection '" + name + "': " + e.what());
		}
		catch (...)
		{
			logging::write_log(logger_, log_level::error,
							   "Failed to check health for connection '" + name
								   + "': unknown exception");
		}
	}

	info("Database health checks completed.");

	if (dispatch)
	{
		events_->dispatch(failover_event::for_health_check(
			failover_event_type::health_check_finished, report.processed, report.exit_code));
	}

	return report;
}

std::vector<std::string> health_check_command::monitored_connections() const
{
	std::vector<std::string> names;
	names.push_back(roles_.primary);
	if (roles_.failover != roles_.primary)
	{
		names.push_back(roles_.failover);
	}
	return names;
}

void health_check_command::info(const std::string& message)
{
	logging::write_log(logger_, log_level::info, message);
}

} // namespace database_failover::command
