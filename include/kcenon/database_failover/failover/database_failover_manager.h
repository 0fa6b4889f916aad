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
 * @file database_failover_manager.h
 * @brief Chooses and applies the active database connection
 *
 * Decision policy (resolve_active_connection):
 * 1. primary and failover both UNKNOWN with zero failures: primary
 *    (empty state is treated optimistically, configurable through
 *    failover_config::default_to_primary_on_empty_state)
 * 2. primary HEALTHY: primary
 * 3. failover HEALTHY: failover
 * 4. otherwise: blocking
 *
 * The manager remembers the connection it applied last. It applies a
 * decision and emits switch events only when the decision differs from
 * that memory. The memory is per instance and never read back from the
 * host, so a new instance re-announces its first decision.
 */

#pragma once

#include "connection_manager.h"

#include <kcenon/database_failover/core/failover_config.h>
#include <kcenon/database_failover/events/failover_events.h>
#include <kcenon/database_failover/health/connection_state_manager.h>
#include <kcenon/database_failover/metrics/failover_metrics.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace database_failover::failover
{

/**
 * @class database_failover_manager
 * @brief Failover coordinator
 *
 * Events emitted on an applied change:
 * - onto primary: switched_to_primary(previous, primary)
 * - onto failover: switched_to_failover(previous, failover)
 * - onto blocking: limited_functionality_activated(blocking)
 * - leaving blocking for primary/failover: exited_limited_functionality
 *   after the switch event
 *
 * Thread Safety:
 * - State cache reads are not serialized. Comparing the decision with
 *   the remembered connection and applying it are serialized, so
 *   concurrent callers in one process announce a given change once.
 * - The remembered connection has its own short-lived lock that is not
 *   held across connection_manager::set_active_connection(). The host
 *   may call get_current_active_connection_name() or
 *   last_applied_connection() from inside it, but must not start another
 *   switch from there.
 * - Events are dispatched after every lock is released.
 *
 * Usage Example:
 * @code
 *   database_failover_manager manager(config, state_manager, registry, bus, logger);
 *
 *   // per request
 *   auto active = manager.determine_and_set_connection();
 *   if (active.is_err()) {
 *       // host could not switch connections
 *   }
 * @endcode
 */
class database_failover_manager
{
public:
	/**
	 * @param config Failover configuration; blank role names fall back to
	 *        the built-in defaults with a warning
	 * @param state_manager Source of connection health
	 * @param connections Host connection manager receiving decisions
	 * @param events Notification sink
	 * @param logger Optional logger
	 */
	database_failover_manager(const failover_config& config,
							  std::shared_ptr<health::connection_state_manager> state_manager,
							  std::shared_ptr<connection_manager> connections,
							  std::shared_ptr<events::event_bus> events,
							  std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	database_failover_manager(const database_failover_manager&) = delete;
	database_failover_manager& operator=(const database_failover_manager&) = delete;

	/**
	 * @brief Resolve the active connection and apply it if it changed
	 * @return The resolved connection name, or the error returned by
	 *         connection_manager::set_active_connection()
	 */
	kcenon::common::Result<std::string> determine_and_set_connection();

	/**
	 * @brief Apply the decision policy to the current state
	 * @return Name of the connection that should be active
	 */
	[[nodiscard]] std::string resolve_active_connection();

	/**
	 * @brief Switch to primary and mark primary and failover HEALTHY
	 */
	kcenon::common::VoidResult force_switch_to_primary();

	/**
	 * @brief Switch to failover without touching persisted health
	 */
	kcenon::common::VoidResult force_switch_to_failover();

	/**
	 * @brief Last applied connection, or the host default before the
	 *        first decision
	 */
	[[nodiscard]] std::string get_current_active_connection_name() const;

	/**
	 * @brief Last applied connection of this instance
	 */
	[[nodiscard]] std::optional<std::string> last_applied_connection() const;

	[[nodiscard]] const connection_roles& roles() const noexcept;
	[[nodiscard]] const metrics::switch_metrics& metrics() const noexcept;

private:
	/**
	 * @brief Apply a target if it differs from the remembered connection
	 * @param target Connection to apply
	 * @param reason Text for log lines
	 * @return Error from set_active_connection(), if any
	 */
	kcenon::common::VoidResult apply_connection(const std::string& target,
												const std::string& reason);

	/**
	 * @brief Events announcing a change from previous to target
	 */
	std::vector<events::failover_event> switch_events(const std::optional<std::string>& previous,
													  const std::string& target);

	connection_roles roles_;
	bool default_to_primary_on_empty_state_;

	std::shared_ptr<health::connection_state_manager> state_manager_;
	std::shared_ptr<connection_manager> connections_;
	std::shared_ptr<events::event_bus> events_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	std::mutex switch_mutex_;        ///< Serializes apply_connection()
	mutable std::mutex state_mutex_; ///< Guards current_active_ only
	std::optional<std::string> current_active_;

	metrics::switch_metrics metrics_;
};

} // namespace database_failover::failover
