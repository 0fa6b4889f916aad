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
 * @file failover_service.h
 * @brief Host wiring and scheduler loop for database failover
 *
 * Assembles the failover components around host-supplied connections:
 * - connection_health_checker probing through the host resolver
 * - connection_state_manager persisting health in a state cache
 * - database_failover_manager applying decisions to the host
 *   connection manager
 * - health_check_command as the scheduled trigger
 *
 * A host either calls handle_request() at the start of each request and
 * schedules run_health_checks() itself, or hands the calling thread to
 * run(), which alternates check cycles and decisions every
 * health_check.interval_seconds.
 */

#pragma once

#include "command/health_check_command.h"
#include "core/failover_config.h"
#include "failover/connection_manager.h"
#include "failover/database_failover_manager.h"
#include "health/connection_health_checker.h"
#include "health/connection_state_manager.h"

#include <kcenon/database_failover/cache/state_cache.h>
#include <kcenon/database_failover/events/failover_events.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace database_failover
{

/**
 * @enum service_state
 * @brief Lifecycle of a failover_service
 */
enum class service_state
{
	uninitialized, ///< initialize() has not succeeded yet
	initialized,   ///< Components are wired, run() not entered
	running,       ///< run() loop is active
	stopping,      ///< Stop requested, run() is returning
	stopped        ///< run() has returned
};

/**
 * @class failover_service
 * @brief Owns and wires the failover components for one host
 *
 * Thread Safety:
 * - stop() is thread-safe and may be triggered by SIGINT/SIGTERM
 * - handle_request() and run_health_checks() may be called from any
 *   thread once initialized
 *
 * Usage Example:
 * @code
 *   auto registry = std::make_shared<failover::connection_registry>("primary");
 *   registry->register_connection("primary", primary_backend);
 *   registry->register_connection("failover", failover_backend);
 *   registry->register_connection("blocking", std::make_shared<failover::blocking_backend>());
 *
 *   database_failover::failover_service service;
 *   if (service.initialize("failover.conf", registry, registry).is_err()) {
 *       return 1;
 *   }
 *   return service.run();
 * @endcode
 */
class failover_service
{
public:
	failover_service();
	~failover_service();

	failover_service(const failover_service&) = delete;
	failover_service& operator=(const failover_service&) = delete;
	failover_service(failover_service&&) = delete;
	failover_service& operator=(failover_service&&) = delete;

	/**
	 * @brief Load configuration from a file and wire the components
	 * @param config_path key=value configuration file
	 * @param resolver Host resolver for named connections
	 * @param connections Host connection manager receiving decisions
	 * @param cache State cache; a memory_state_cache when null
	 * @param logger Logger for all components; console loggers when null
	 */
	kcenon::common::VoidResult initialize(
		const std::string& config_path,
		std::shared_ptr<health::connection_resolver> resolver,
		std::shared_ptr<failover::connection_manager> connections,
		std::shared_ptr<cache::state_cache> cache = nullptr,
		std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	/**
	 * @brief Wire the components from a configuration object
	 */
	kcenon::common::VoidResult initialize(
		const failover_config& config,
		std::shared_ptr<health::connection_resolver> resolver,
		std::shared_ptr<failover::connection_manager> connections,
		std::shared_ptr<cache::state_cache> cache = nullptr,
		std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	/**
	 * @brief Per-request entry point: decide and apply the active connection
	 */
	kcenon::common::Result<std::string> handle_request();

	/**
	 * @brief Run the health check command once
	 */
	command::health_check_report run_health_checks(
		const std::optional<std::string>& connection = std::nullopt,
		std::optional<bool> dispatch_events = std::nullopt);

	/**
	 * @brief Run check cycles until stop() or SIGINT/SIGTERM
	 * @return 0 on a clean stop, 1 if the service was not initialized
	 */
	int run();

	/**
	 * @brief Request the run() loop to return
	 */
	void stop();

	[[nodiscard]] service_state state() const;
	[[nodiscard]] bool is_running() const;
	[[nodiscard]] const failover_config& config() const;

	[[nodiscard]] std::shared_ptr<events::event_bus> events() const;
	[[nodiscard]] std::shared_ptr<health::connection_state_manager> state_manager() const;
	[[nodiscard]] std::shared_ptr<failover::database_failover_manager> failover_manager() const;

private:
	void setup_signal_handlers();
	void run_cycle();
	void do_cleanup();

	std::atomic<service_state> state_;
	failover_config config_;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> health_logger_;

	std::shared_ptr<events::event_bus> events_;
	std::shared_ptr<cache::state_cache> cache_;
	std::shared_ptr<health::connection_resolver> resolver_;
	std::shared_ptr<failover::connection_manager> connections_;

	std::shared_ptr<health::connection_health_checker> checker_;
	std::shared_ptr<health::connection_state_manager> state_manager_;
	std::shared_ptr<failover::database_failover_manager> failover_manager_;
	std::unique_ptr<command::health_check_command> command_;

	static std::atomic<failover_service*> instance_;
	static void signal_handler(int signal);
};

} // namespace database_failover
