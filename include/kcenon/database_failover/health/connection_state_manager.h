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
 * @file connection_state_manager.h
 * @brief Threshold state machine over persisted connection health
 *
 * Turns a stream of probe results into a per-connection status with
 * hysteresis: a connection becomes DOWN only after failure_threshold
 * consecutive failed probes, and any successful probe makes it HEALTHY
 * again with the failure count reset.
 *
 * State machine (driven only by update_connection_status):
 * @code
 *   UNKNOWN --ok--> HEALTHY
 *   UNKNOWN --fail, count < threshold--> UNKNOWN (count++)
 *   UNKNOWN --fail, count reaches threshold--> DOWN (role *_down event)
 *   HEALTHY --ok--> HEALTHY (count reset)
 *   HEALTHY --fail--> UNKNOWN (count 1), or DOWN when threshold == 1
 *   DOWN    --ok--> HEALTHY (role *_restored event)
 *   DOWN    --fail--> DOWN (count and TTL refreshed, no repeated event)
 * @endcode
 */

#pragma once

#include "connection_health_checker.h"

#include <kcenon/database_failover/cache/state_cache.h>
#include <kcenon/database_failover/core/connection_status.h>
#include <kcenon/database_failover/core/failover_config.h>
#include <kcenon/database_failover/events/failover_events.h>
#include <kcenon/database_failover/metrics/failover_metrics.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace database_failover::health
{

/**
 * @class connection_state_manager
 * @brief Persists connection health and emits transition events
 *
 * Error Handling:
 * - No public method lets a state cache failure escape. Reads fall back
 *   to UNKNOWN / 0, writes are skipped, and a cache_unavailable event is
 *   published for every failing cache call.
 *
 * Thread Safety:
 * - Methods may be called concurrently. There is no lock around the
 *   read-increment-write of the failure count: concurrent failing probes
 *   of the same connection can lose one increment, which delays DOWN by
 *   one probe cycle at most. The state cache is the synchronization
 *   point between processes.
 */
class connection_state_manager
{
public:
	/**
	 * @param probe Liveness probe used by update_connection_status()
	 * @param cache Persistence for health records
	 * @param events Notification sink
	 * @param config Failover configuration (roles, threshold, cache keys)
	 * @param logger Optional logger
	 */
	connection_state_manager(std::shared_ptr<health_probe> probe,
							 std::shared_ptr<cache::state_cache> cache,
							 std::shared_ptr<events::event_bus> events,
							 const failover_config& config,
							 std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	connection_state_manager(const connection_state_manager&) = delete;
	connection_state_manager& operator=(const connection_state_manager&) = delete;

	/**
	 * @brief Probe a connection and apply the result to its record
	 */
	void update_connection_status(const std::string& connection_name);

	/**
	 * @brief Current status, UNKNOWN if absent, unparsable or unreadable
	 */
	[[nodiscard]] connection_status get_connection_status(const std::string& connection_name);

	/**
	 * @brief Current consecutive failure count, 0 if absent or unreadable
	 */
	[[nodiscard]] uint32_t get_failure_count(const std::string& connection_name);

	/**
	 * @brief Full record for a connection
	 */
	[[nodiscard]] connection_health_record get_record(const std::string& connection_name);

	/**
	 * @brief Overwrite a record without emitting health events
	 * @param connection_name Connection to update
	 * @param status New status
	 * @param failure_count Stored count; defaults to 0 for HEALTHY and
	 *        UNKNOWN and to failure_threshold for DOWN. Ignored for HEALTHY.
	 */
	void set_connection_status(const std::string& connection_name,
							   connection_status status,
							   std::optional<uint32_t> failure_count = std::nullopt);

	/**
	 * @brief Remove all records through the cache tag
	 *
	 * Stores without tag support are left untouched and a warning is
	 * logged.
	 */
	void flush_all_statuses();

	[[nodiscard]] bool is_connection_healthy(const std::string& connection_name);
	[[nodiscard]] bool is_connection_down(const std::string& connection_name);
	[[nodiscard]] bool is_connection_unknown(const std::string& connection_name);

	[[nodiscard]] const connection_roles& roles() const noexcept;
	[[nodiscard]] uint32_t failure_threshold() const noexcept;
	[[nodiscard]] const metrics::state_metrics& metrics() const noexcept;

	/**
	 * @brief Cache key holding the status of a connection
	 */
	[[nodiscard]] std::string status_key(const std::string& connection_name) const;

	/**
	 * @brief Cache key holding the failure count of a connection
	 */
	[[nodiscard]] std::string failure_count_key(const std::string& connection_name) const;

private:
	kcenon::common::Result<std::optional<std::string>> read(const std::string& key);
	kcenon::common::VoidResult write(const std::string& key, const std::string& value);
	void report_cache_error(const std::string& operation, const kcenon::common::error_info& error);

	void on_probe_success(const std::string& connection_name, connection_status previous);
	void on_probe_failure(const std::string& connection_name, connection_status previous);

	std::shared_ptr<health_probe> probe_;
	std::shared_ptr<cache::state_cache> cache_;
	std::shared_ptr<events::event_bus> events_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	connection_roles roles_;
	uint32_t failure_threshold_;
	std::chrono::seconds ttl_;
	std::string prefix_;
	std::string tag_;

	metrics::state_metrics metrics_;
};

} // namespace database_failover::health
