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
 * @file connection_health_checker.h
 * @brief Single-shot liveness probe for named database connections
 *
 * The checker runs the configured liveness query once against a named
 * connection. Every failure mode (unknown connection, query error,
 * thrown exception, timeout) is reported as "not healthy" so that the
 * state manager can count failures uniformly.
 */

#pragma once

#include "connection_resolver.h"

#include <kcenon/database_failover/core/failover_config.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <chrono>
#include <memory>
#include <string>

namespace database_failover::health
{

/**
 * @class health_probe
 * @brief Interface of a liveness probe
 */
class health_probe
{
public:
	virtual ~health_probe() = default;

	/**
	 * @brief Probe a connection
	 * @param connection_name Connection to probe
	 * @return true if the liveness query succeeded within the timeout
	 */
	virtual bool is_healthy(const std::string& connection_name) = 0;
};

/**
 * @class connection_health_checker
 * @brief health_probe backed by a connection_resolver
 *
 * Per probe:
 * - resolve the backend by name
 * - narrow its query timeout (when the resolver supports it)
 * - run the liveness query through select_query()
 * - restore the previous timeout on every exit path
 *
 * A query that succeeds but takes longer than the configured timeout is
 * counted as a timeout, since drivers without timeout support cannot
 * abort it.
 *
 * Thread Safety:
 * - is_healthy() holds no state of its own and may be called
 *   concurrently; thread safety of the backends is the resolver's concern
 *
 * Example Usage:
 * @code
 *   health_check_config config;
 *   config.query = "SELECT 1";
 *   config.timeout_seconds = 2;
 *
 *   connection_health_checker checker(resolver, config, logger);
 *   if (!checker.is_healthy("primary")) {
 *       // counted as a failed probe by the state manager
 *   }
 * @endcode
 */
class connection_health_checker : public health_probe
{
public:
	connection_health_checker(std::shared_ptr<connection_resolver> resolver,
							  health_check_config config,
							  std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	bool is_healthy(const std::string& connection_name) override;

	[[nodiscard]] const health_check_config& config() const noexcept;

private:
	kcenon::common::VoidResult execute_probe(const std::string& connection_name);

	std::shared_ptr<connection_resolver> resolver_;
	health_check_config config_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace database_failover::health
