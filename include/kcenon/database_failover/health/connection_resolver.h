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
 * @file connection_resolver.h
 * @brief Host contract for turning a connection name into a backend
 */

#pragma once

#include <database/core/database_backend.h>

#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace database_failover::health
{

/**
 * @class connection_resolver
 * @brief Resolves named connections for the health checker
 *
 * The query-timeout hooks are optional. A resolver that can narrow the
 * statement timeout of a pooled handle overrides both; the health
 * checker restores the previous value after every probe.
 */
class connection_resolver
{
public:
	virtual ~connection_resolver() = default;

	/**
	 * @brief Resolve a connection by name
	 * @param connection_name Configured connection name
	 * @return Backend ready to run a query, or an error
	 */
	virtual kcenon::common::Result<std::shared_ptr<database::core::database_backend>> resolve(
		const std::string& connection_name)
		= 0;

	/**
	 * @brief Whether a connection with this name is configured
	 */
	[[nodiscard]] virtual bool has_connection(const std::string& connection_name) const = 0;

	/**
	 * @brief Apply a query timeout to a resolved backend
	 * @param backend Backend returned by resolve()
	 * @param timeout Timeout for the next query
	 * @return The timeout previously in effect (std::nullopt for none), or
	 *         an error if overriding is unsupported or failed
	 */
	virtual kcenon::common::Result<std::optional<std::chrono::milliseconds>> apply_query_timeout(
		database::core::database_backend& backend, std::chrono::milliseconds timeout)
	{
		(void)backend;
		(void)timeout;
		return kcenon::common::error_info{ -1, "Query timeout override not supported",
										   "connection_resolver" };
	}

	/**
	 * @brief Restore the timeout returned by apply_query_timeout()
	 * @return Error if the previous timeout could not be put back; the
	 *         probe logs it and keeps its result
	 */
	virtual kcenon::common::VoidResult restore_query_timeout(
		database::core::database_backend& backend, std::optional<std::chrono::milliseconds> previous)
	{
		(void)backend;
		(void)previous;
		return kcenon::common::ok();
	}
};

} // namespace database_failover::health
