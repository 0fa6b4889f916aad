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
 * @file connection_registry.h
 * @brief Named backend registry acting as resolver and connection manager
 *
 * A host that has no connection manager of its own registers its
 * backends here; the registry then serves both the health checker
 * (connection_resolver) and the failover manager (connection_manager).
 */

#pragma once

#include "connection_manager.h"

#include <kcenon/database_failover/health/connection_resolver.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace database_failover::failover
{

/**
 * @class connection_registry
 * @brief Thread-safe map of connection name to backend
 *
 * @code
 *   auto registry = std::make_shared<connection_registry>("primary");
 *   registry->register_connection("primary", primary_backend);
 *   registry->register_connection("failover", proxy_backend);
 *   registry->register_connection("blocking", std::make_shared<blocking_backend>());
 *
 *   auto active = registry->resolve(registry->active_connection());
 * @endcode
 */
class connection_registry : public health::connection_resolver, public connection_manager
{
public:
	/**
	 * @param default_connection Connection reported by active_connection()
	 *        until set_active_connection() succeeds
	 */
	explicit connection_registry(std::string default_connection = "");

	connection_registry(const connection_registry&) = delete;
	connection_registry& operator=(const connection_registry&) = delete;

	/**
	 * @brief Add or replace a named backend
	 * @return Error for a blank name or null backend
	 */
	kcenon::common::VoidResult register_connection(
		const std::string& connection_name,
		std::shared_ptr<database::core::database_backend> backend);

	/**
	 * @brief Remove a named backend
	 * @return true if it was registered
	 */
	bool remove_connection(const std::string& connection_name);

	[[nodiscard]] std::vector<std::string> connection_names() const;

	// connection_resolver
	kcenon::common::Result<std::shared_ptr<database::core::database_backend>> resolve(
		const std::string& connection_name) override;

	[[nodiscard]] bool has_connection(const std::string& connection_name) const override;

	// connection_manager
	kcenon::common::VoidResult set_active_connection(const std::string& connection_name) override;

	[[nodiscard]] std::string active_connection() const override;

	/**
	 * @brief Backend of the active connection, or nullptr
	 */
	[[nodiscard]] std::shared_ptr<database::core::database_backend> active_backend() const;

private:
	mutable std::shared_mutex mutex_;
	std::unordered_map<std::string, std::shared_ptr<database::core::database_backend>> backends_;
	std::string active_;
};

} // namespace database_failover::failover
