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
 * @file health_check_command.h
 * @brief Manual or scheduled trigger for connection health checks
 */

#pragma once

#include <kcenon/database_failover/core/connection_status.h>
#include <kcenon/database_failover/core/failover_config.h>
#include <kcenon/database_failover/events/failover_events.h>
#include <kcenon/database_failover/health/connection_resolver.h>
#include <kcenon/database_failover/health/connection_state_manager.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace database_failover::command
{

constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_FAILURE_CODE = 1;

/**
 * @struct connection_check_result
 * @brief State of one connection after its check
 */
struct connection_check_result
{
	std::string connection;
	connection_status status = connection_status::unknown;
	uint32_t failure_count = 0;
};

/**
 * @struct health_check_report
 * @brief Outcome of one health_check_command::execute() run
 */
struct health_check_report
{
	int exit_code = EXIT_SUCCESS_CODE;
	std::vector<connection_check_result> results;
	std::vector<std::string> processed; ///< Connections a check was attempted for

	[[nodiscard]] bool succeeded() const noexcept { return exit_code == EXIT_SUCCESS_CODE; }
};

/**
 * @class health_check_command
 * @brief Runs update_connection_status over the monitored connections
 *
 * Without an explicit connection the configured primary and failover
 * connections are checked. A named connection must be known to the
 * resolver. A check that throws is logged and the run continues with
 * the next connection.
 *
 * Lifecycle events (health_check_started, health_check_finished) are
 * dispatched when failover_config::dispatch_command_lifecycle_events is
 * set, unless a per-run override says otherwise.
 */
class health_check_command
{
public:
	health_check_command(std::shared_ptr<health::connection_state_manager> state_manager,
						 std::shared_ptr<health::connection_resolver> resolver,
						 std::shared_ptr<events::event_bus> events,
						 const failover_config& config,
						 std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	/**
	 * @brief Check one connection or all monitored connections
	 * @param connection Connection to check; all monitored if empty
	 * @param dispatch_events Override for lifecycle event dispatch
	 * @return Report with exit code and per-connection results
	 */
	health_check_report execute(const std::optional<std::string>& connection = std::nullopt,
								std::optional<bool> dispatch_events = std::nullopt);

	/**
	 * @brief Connections checked when no connection is named
	 */
	[[nodiscard]] std::vector<std::string> monitored_connections() const;

private:
	void info(const std::string& message);

	std::shared_ptr<health::connection_state_manager> state_manager_;
	std::shared_ptr<health::connection_resolver> resolver_;
	std::shared_ptr<events::event_bus> events_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	connection_roles roles_;
	bool dispatch_lifecycle_events_;
};

} // namespace database_failover::command
