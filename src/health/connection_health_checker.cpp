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

#include <kcenon/database_failover/health/connection_health_checker.h>
#include <kcenon/database_failover/logging/console_logger.h>

#include <exception>
#include <optional>
#include <utility>

namespace database_failover::health
{

using kcenon::common::interfaces::log_level;

namespace
{

/**
 * @brief Applies a query timeout for the lifetime of one probe
 */
class scoped_query_timeout
{
public:
	scoped_query_timeout(connection_resolver& resolver,
						 database::core::database_backend& backend,
						 std::chrono::milliseconds timeout,
						 const std::string& connection_name,
						 const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger)
		: resolver_(resolver)
		, backend_(backend)
		, connection_name_(connection_name)
		, logger_(logger)
	{
		auto result = resolver_.apply_query_timeout(backend_, timeout);
		if (result.is_ok())
		{
			applied_ = true;
			previous_ = result.value();
		}
	}

	~scoped_query_timeout()
	{
		if (!applied_)
		{
			return;
		}

		kcenon::common::VoidResult result = kcenon::common::ok();
		try
		{
			result = resolver_.restore_query_timeout(backend_, previous_);
		}
		catch (const std::exception& e)
		{
			result = kcenon::common::error_info{ -4, e.what(), "connection_health_checker" };
		}
		catch (...)
		{
			result = kcenon::common::error_info{ -4, "Unknown exception",
												 "connection_health_checker" };
		}

		if (result.is_err())
		{
			logging::write_log(logger_, log_level::warning,
							   "Failed to restore query timeout for connection '"
								   + connection_name_ + "': " + result.error().message);
		}
	}

	scoped_query_timeout(const scoped_query_timeout&) = delete;
	scoped_query_timeout& operator=(const scoped_query_timeout&) = delete;

	[[nodiscard]] bool applied() const noexcept { return applied_; }

private:
	connection_resolver& resolver_;
	database::core::database_backend& backend_;
	const std::string& connection_name_;
	const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger_;
	bool applied_ = false;
	std::optional<std::chrono::milliseconds> previous_;
};

} // namespace

connection_health_checker::connection_health_checker(
	std::shared_ptr<connection_resolver> resolver,
	health_check_config config,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: resolver_(std::move(resolver))
	, config_(std::move(config))
	, logger_(std::move(logger))
{
}

bool connection_health_checker::is_healthy(const std::string& connection_name)
{
	kcenon::common::VoidResult result = kcenon::common::ok();
	try
	{
		result = execute_probe(connection_name);
	}
	catch (const std::exception& e)
	{
		result = kcenon::common::error_info{ -2, e.what(), "connection_health_checker" };
	}
	catch (...)
	{
		result = kcenon::common::error_info{ -2, "Unknown exception", "connection_health_checker" };
	}

	if (result.is_err())
	{
		logging::write_log(logger_, log_level::warning,
						   "Health check for connection '" + connection_name
							   + "' failed: " + result.error().message);
		return false;
	}

	logging::write_log(logger_, log_level::debug,
					   "Health check for connection '" + connection_name + "' passed.");
	return true;
}

const health_check_config& connection_health_checker::config() const noexcept
{
	return config_;
}

kcenon::common::VoidResult connection_health_checker::execute_probe(
	const std::string& connection_name)
{
	if (!resolver_)
	{
		return kcenon::common::error_info{ -1, "No connection resolver configured",
										   "connection_health_checker" };
	}

	auto resolved = resolver_->resolve(connection_name);
	if (resolved.is_err())
	{
		return resolved.error();
	}

	auto backend = resolved.value();
	if (!backend)
	{
		return kcenon::common::error_info{ -1, "Connection resolved to a null backend",
										   "connection_health_checker" };
	}

	const auto timeout = config_.timeout();
	scoped_query_timeout timeout_guard(*resolver_, *backend, timeout, connection_name, logger_);
	if (!timeout_guard.applied())
	{
		logging::write_log(logger_, log_level::debug,
						   "Query timeout override unavailable for '" + connection_name
							   + "', relying on driver timeout");
	}

	auto start = std::chrono::steady_clock::now();
	auto query_result = backend->select_query(config_.query);
	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start);

	if (query_result.is_err())
	{
		return query_result.error();
	}

	if (elapsed > timeout)
	{
		return kcenon::common::error_info{
			-3,
			"Liveness query exceeded timeout (" + std::to_string(elapsed.count()) + "ms > "
				+ std::to_string(timeout.count()) + "ms)",
			"connection_health_checker"
		};
	}

	return kcenon::common::ok();
}

} // namespace database_failover::health
