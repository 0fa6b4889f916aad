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
 * @file failover_config.h
 * @brief Failover configuration structures
 *
 * Defines the configuration consumed by the health checker, the state
 * manager, the failover manager and the health check command. All values
 * are fixed for the lifetime of a running instance.
 *
 * ## Thread Safety
 * Configuration structs are plain data structures with no internal
 * synchronization. Populate them before constructing components; the
 * components keep their own copies.
 *
 * @code
 * using namespace database_failover;
 *
 * auto config = failover_config::load_from_file("failover.conf");
 * if (config.has_value() && !config->validate()) {
 *     for (const auto& err : config->validation_errors()) {
 *         std::cerr << "Config error: " << err << std::endl;
 *     }
 * }
 *
 * auto cfg = failover_config::default_config();
 * cfg.connections.primary = "mysql";
 * cfg.connections.failover = "mysql_failover";
 * cfg.health_check.failure_threshold = 1;
 * @endcode
 */

#pragma once

#include "connection_roles.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace database_failover
{

/**
 * @struct health_check_config
 * @brief Probe settings shared by the primary and failover connections
 */
struct health_check_config
{
	std::string query = "SELECT 1";  ///< Liveness query
	uint32_t interval_seconds = 60;  ///< Scheduled check cadence
	uint32_t timeout_seconds = 5;    ///< Per-probe query timeout
	uint32_t failure_threshold = 3;  ///< Consecutive failures before DOWN

	[[nodiscard]] std::chrono::milliseconds timeout() const
	{
		return std::chrono::seconds(timeout_seconds);
	}

	[[nodiscard]] std::chrono::seconds interval() const
	{
		return std::chrono::seconds(interval_seconds);
	}
};

/**
 * @struct state_cache_config
 * @brief Persistence settings for health records
 */
struct state_cache_config
{
	std::string prefix = "dynamic_db_failover_status"; ///< Key prefix
	std::string tag = "dynamic-db-failover";           ///< Group tag (empty disables)
	uint32_t ttl_seconds = 300;                        ///< Record time-to-live
	size_t max_entries = 1024;                         ///< In-memory store bound

	[[nodiscard]] std::chrono::seconds ttl() const
	{
		return std::chrono::seconds(ttl_seconds);
	}
};

/**
 * @struct logging_config
 * @brief Logging configuration
 */
struct logging_config
{
	std::string level = "info"; ///< Log level (debug, info, warn, error)
};

/**
 * @struct failover_config
 * @brief Main failover configuration
 */
struct failover_config
{
	connection_roles connections;       ///< Role names
	health_check_config health_check;   ///< Probe settings
	state_cache_config cache;           ///< Persistence settings
	logging_config logging;             ///< Logging settings

	/// Emit health_check_started / health_check_finished from the command
	bool dispatch_command_lifecycle_events = true;

	/// Route to primary when both records are UNKNOWN with zero failures
	bool default_to_primary_on_empty_state = true;

	/**
	 * @brief Load configuration from a key=value file
	 * @param path Path to the configuration file
	 * @return Loaded configuration, or std::nullopt if the file is missing
	 *         or contains a malformed number
	 */
	static std::optional<failover_config> load_from_file(const std::string& path);

	/**
	 * @brief Create a default configuration
	 */
	static failover_config default_config();

	/**
	 * @brief Validate the configuration
	 * @return true if there are no validation errors
	 */
	bool validate() const;

	/**
	 * @brief Get validation error messages
	 */
	std::vector<std::string> validation_errors() const;

	/**
	 * @brief Non-fatal problems, currently blank connection names
	 */
	std::vector<std::string> validation_warnings() const;

	/**
	 * @brief Connection names with blank entries replaced by defaults
	 */
	connection_roles resolved_connections() const;
};

} // namespace database_failover
