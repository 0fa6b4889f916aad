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
 * @file blocking_backend.h
 * @brief Inert database backend used in limited functionality mode
 *
 * When neither the primary nor the failover connection is usable, the
 * failover manager routes to the blocking connection. Every query and
 * transaction call against it fails immediately with
 * BLOCKING_ERROR_MESSAGE instead of waiting on a dead socket.
 */

#pragma once

#include <database/core/database_backend.h>
#include <database/database_types.h>

#include <atomic>
#include <map>
#include <string>

namespace database_failover::failover
{

/// Error code returned by every blocked operation
inline constexpr int BLOCKING_ERROR_CODE = -503;

/// Error message returned by every blocked operation
inline constexpr const char* BLOCKING_ERROR_MESSAGE
	= "All configured database connections (primary and failover) are currently unavailable. "
	  "Application is in limited functionality mode.";

/**
 * @class blocking_backend
 * @brief database_backend whose queries always fail
 *
 * initialize() and shutdown() succeed so the backend can be registered
 * like any other connection.
 */
class blocking_backend : public database::core::database_backend
{
public:
	blocking_backend() = default;
	~blocking_backend() override = default;

	[[nodiscard]] database::database_types type() const override;

	kcenon::common::VoidResult initialize(const database::core::connection_config& config) override;
	kcenon::common::VoidResult shutdown() override;
	[[nodiscard]] bool is_initialized() const override;

	kcenon::common::Result<uint64_t> insert_query(const std::string& query_string) override;
	kcenon::common::Result<uint64_t> update_query(const std::string& query_string) override;
	kcenon::common::Result<uint64_t> delete_query(const std::string& query_string) override;
	kcenon::common::Result<database::core::database_result> select_query(
		const std::string& query_string) override;
	kcenon::common::VoidResult execute_query(const std::string& query_string) override;

	kcenon::common::VoidResult begin_transaction() override;
	kcenon::common::VoidResult commit_transaction() override;
	kcenon::common::VoidResult rollback_transaction() override;
	[[nodiscard]] bool in_transaction() const override;

	[[nodiscard]] std::string last_error() const override;
	[[nodiscard]] std::map<std::string, std::string> connection_info() const override;

	/**
	 * @brief Number of operations rejected since construction
	 */
	[[nodiscard]] uint64_t rejected_operations() const noexcept;

private:
	kcenon::common::error_info reject();

	std::atomic<bool> initialized_{ false };
	std::atomic<uint64_t> rejected_{ 0 };
};

} // namespace database_failover::failover
