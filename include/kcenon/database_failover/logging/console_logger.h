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
 * @file console_logger.h
 * @brief Console logger for the failover components
 *
 * ILogger implementation writing one line per message to stdout (below
 * warning) or stderr (warning and above). Each logger carries a channel
 * name so health-check runs and failover decisions can be told apart in
 * a shared log.
 *
 * Thread Safety:
 * - All logging methods are thread-safe
 * - Level changes are atomic
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace database_failover::logging
{

/// Channel used by the health check command
inline constexpr const char* HEALTH_CHECK_CHANNEL = "db_health_checks";

/// Channel used by the state manager and failover manager
inline constexpr const char* FAILOVER_CHANNEL = "db_failover";

/**
 * @class console_logger
 * @brief Channel-tagged console logger implementing ILogger
 *
 * Output format:
 * @code
 * [2025-01-01 12:00:00.000] [WARNING] [db_failover] Connection 'primary' marked as DOWN
 * @endcode
 */
class console_logger : public kcenon::common::interfaces::ILogger
{
public:
	explicit console_logger(
		std::string channel = FAILOVER_CHANNEL,
		kcenon::common::interfaces::log_level min_level
		= kcenon::common::interfaces::log_level::info);

	~console_logger() override = default;

	console_logger(const console_logger&) = delete;
	console_logger& operator=(const console_logger&) = delete;

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override;

	kcenon::common::VoidResult log(
		kcenon::common::interfaces::log_level level,
		std::string_view message,
		const kcenon::common::source_location& loc
		= kcenon::common::source_location::current()) override;

	kcenon::common::VoidResult log(
		const kcenon::common::interfaces::log_entry& entry) override;

	bool is_enabled(kcenon::common::interfaces::log_level level) const override;

	kcenon::common::VoidResult set_level(
		kcenon::common::interfaces::log_level level) override;

	kcenon::common::interfaces::log_level get_level() const override;

	kcenon::common::VoidResult flush() override;

	/**
	 * @brief Channel name printed with every line
	 */
	[[nodiscard]] const std::string& channel() const noexcept;

private:
	void write_line(kcenon::common::interfaces::log_level level,
					const std::string& message,
					const std::string& file = "",
					int line = 0);

	std::string timestamp() const;

	std::string channel_;
	std::atomic<kcenon::common::interfaces::log_level> min_level_;
	mutable std::mutex output_mutex_;
};

/**
 * @brief Map a configuration level name to a log level
 * @param name One of debug, info, warn, error
 * @return Matching level, or std::nullopt for unknown names
 */
std::optional<kcenon::common::interfaces::log_level> parse_log_level(const std::string& name);

/**
 * @brief Create a console logger for a channel
 */
std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	const std::string& channel = FAILOVER_CHANNEL,
	kcenon::common::interfaces::log_level min_level
	= kcenon::common::interfaces::log_level::info);

/**
 * @brief Log through an optional logger
 *
 * Components hold a possibly-null logger; a null logger disables output.
 */
inline void write_log(const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger,
					  kcenon::common::interfaces::log_level level,
					  const std::string& message)
{
	if (logger && logger->is_enabled(level))
	{
		[[maybe_unused]] auto result = logger->log(level, message);
	}
}

} // namespace database_failover::logging
