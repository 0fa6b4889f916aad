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

#include <kcenon/database_failover/failover_service.h>

#include <kcenon/database_failover/cache/memory_state_cache.h>
#include <kcenon/database_failover/logging/console_logger.h>

#include <chrono>
#include <csignal>
#include <thread>
#include <utility>

namespace database_failover
{

using kcenon::common::interfaces::log_level;

std::atomic<failover_service*> failover_service::instance_{ nullptr };

failover_service::failover_service() : state_(service_state::uninitialized)
{
}

failover_service::~failover_service()
{
	stop();
	do_cleanup();
}

kcenon::common::VoidResult failover_service::initialize(
	const std::string& config_path,
	std::shared_ptr<health::connection_resolver> resolver,
	std::shared_ptr<failover::connection_manager> connections,
	std::shared_ptr<cache::state_cache> cache,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	auto loaded_config = failover_config::load_from_file(config_path);
	if (!loaded_config)
	{
		return kcenon::common::error_info{ -1,
										   "Failed to load configuration from: " + config_path,
										   "failover_service" };
	}

	return initialize(*loaded_config, std::move(resolver), std::move(connections),
					  std::move(cache), std::move(logger));
}

kcenon::common::VoidResult failover_service::initialize(
	const failover_config& config,
	std::shared_ptr<health::connection_resolver> resolver,
	std::shared_ptr<failover::connection_manager> connections,
	std::shared_ptr<cache::state_cache> cache,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	if (state_ != service_state::uninitialized)
	{
		return kcenon::common::error_info{ -1, "Failover service already initialized",
										   "failover_service" };
	}

	if (!config.validate())
	{
		std::string message = "Configuration validation failed:";
		for (const auto& error : config.validation_errors())
		{
			message += "\n  - " + error;
		}
		return kcenon::common::error_info{ -2, message, "failover_service" };
	}

	if (!resolver || !connections)
	{
		return kcenon::common::error_info{
			-3, "A connection resolver and a connection manager are required", "failover_service"
		};
	}

	config_ = config;

	if (logger)
	{
		logger_ = logger;
		health_logger_ = logger;
	}
	else
	{
		auto level = logging::parse_log_level(config_.logging.level).value_or(log_level::info);
		logger_ = logging::create_console_logger(logging::FAILOVER_CHANNEL, level);
		health_logger_ = logging::create_console_logger(logging::HEALTH_CHECK_CHANNEL, level);
	}

	cache_ = std::move(cache);
	if (!cache_)
	{
		cache_ = std::make_shared<database_failover::cache::memory_state_cache>(config_.cache.max_entries);
	}
	resolver_ = std::move(resolver);
	connections_ = std::move(connections);
	events_ = std::make_shared<events::event_bus>(logger_);

	checker_ = std::make_shared<health::connection_health_checker>(resolver_, config_.health_check,
																   logger_);
	state_manager_ = std::make_shared<health::connection_state_manager>(checker_, cache_, events_,
																		config_, logger_);
	failover_manager_ = std::make_shared<failover::database_failover_manager>(
		config_, state_manager_, connections_, events_, logger_);
	command_ = std::make_unique<command::health_check_command>(state_manager_, resolver_, events_,
															   config_, health_logger_);

	const auto& roles = failover_manager_->roles();
	for (const auto& name : { roles.primary, roles.failover, roles.blocking })
	{
		if (!resolver_->has_connection(name))
		{
			logging::write_log(logger_, log_level::warning,
							   "Connection '" + name + "' is not registered with the resolver.");
		}
	}

	logging::write_log(logger_, log_level::info,
					   "Failover service initialized (primary '" + roles.primary + "', failover '"
						   + roles.failover + "', blocking '" + roles.blocking + "').");

	state_ = service_state::initialized;
	return kcenon::common::ok();
}

kcenon::common::Result<std::string> failover_service::handle_request()
{
	if (!failover_manager_)
	{
		return kcenon::common::error_info{ -1, "Failover service not initialized",
										   "failover_service" };
	}

	return failover_manager_->determine_and_set_connection();
}

command::health_check_report failover_service::run_health_checks(
	const std::optional<std::string>& connection, std::optional<bool> dispatch_events)
{
	if (!command_)
	{
		command::health_check_report report;
		report.exit_code = command::EXIT_FAILURE_CODE;
		return report;
	}

	return command_->execute(connection, dispatch_events);
}

int failover_service::run()
{
	auto expected = service_state::initialized;
	if (!state_.compare_exchange_strong(expected, service_state::running))
	{
		logging::write_log(logger_, log_level::error, "Failover service not initialized");
		return 1;
	}

	setup_signal_handlers();

	logging::write_log(logger_, log_level::info,
					   "Failover service running. Health checks every "
						   + std::to_string(config_.health_check.interval_seconds) + "s.");

	while (state_ == service_state::running)
	{
		run_cycle();

		const auto next_cycle = std::chrono::steady_clock::now() + config_.health_check.interval();
		while (state_ == service_state::running && std::chrono::steady_clock::now() < next_cycle)
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(100));
		}
	}

	state_ = service_state::stopped;
	logging::write_log(logger_, log_level::info, "Failover service stopped");

	return 0;
}

void failover_service::stop()
{
	auto expected = service_state::running;
	state_.compare_exchange_strong(expected, service_state::stopping);
}

service_state failover_service::state() const
{
	return state_.load();
}

bool failover_service::is_running() const
{
	return state_ == service_state::running;
}

const failover_config& failover_service::config() const
{
	return config_;
}

std::shared_ptr<events::event_bus> failover_service::events() const
{
	return events_;
}

std::shared_ptr<health::connection_state_manager> failover_service::state_manager() const
{
	return state_manager_;
}

std::shared_ptr<failover::database_failover_manager> failover_service::failover_manager() const
{
	return failover_manager_;
}

void failover_service::run_cycle()
{
	auto report = command_->execute();
	if (!report.succeeded())
	{
		logging::write_log(health_logger_, log_level::error,
						   "Health check run finished with exit code "
							   + std::to_string(report.exit_code));
	}

	auto decision = failover_manager_->determine_and_set_connection();
	if (decision.is_err())
	{
		logging::write_log(logger_, log_level::error,
						   "Failed to apply active connection: " + decision.error().message);
	}
}

void failover_service::do_cleanup()
{
	command_.reset();
	failover_manager_.reset();
	state_manager_.reset();
	checker_.reset();

	failover_service* self = this;
	instance_.compare_exchange_strong(self, nullptr);
}

void failover_service::setup_signal_handlers()
{
	instance_ = this;

#ifdef _WIN32
	std::signal(SIGINT, signal_handler);
	std::signal(SIGTERM, signal_handler);
#else
	struct sigaction sa;
	sa.sa_handler = signal_handler;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;

	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
#endif
}

void failover_service::signal_handler(int signal)
{
	(void)signal;
	auto* service = instance_.load();
	if (service != nullptr)
	{
		service->stop();
	}
}

} // namespace database_failover
