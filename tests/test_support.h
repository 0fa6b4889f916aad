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
 * @file test_support.h
 * @brief Shared doubles for the failover unit tests
 */

#pragma once

#include <kcenon/database_failover/cache/state_cache.h>
#include <kcenon/database_failover/events/failover_events.h>
#include <kcenon/database_failover/failover/connection_manager.h>
#include <kcenon/database_failover/health/connection_health_checker.h>
#include <kcenon/database_failover/health/connection_resolver.h>

#include <database/core/database_backend.h>
#include <database/database_types.h>

#include <kcenon/common/patterns/result.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace database_failover::testing
{

// ============================================================================
// Scripted Database Backend
// ============================================================================

/**
 * @brief database_backend whose liveness query outcome is set by the test
 */
class scripted_backend : public database::core::database_backend
{
public:
	enum class outcome
	{
		succeed,
		fail,
		throw_exception,
		throw_non_standard
	};

	scripted_backend() = default;

	void set_outcome(outcome value) { outcome_ = value; }
	void set_healthy(bool healthy) { outcome_ = healthy ? outcome::succeed : outcome::fail; }
	void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

	[[nodiscard]] int select_calls() const { return select_calls_.load(); }

	[[nodiscard]] std::string last_query() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return last_query_;
	}

	database::database_types type() const override { return database::database_types::postgres; }

	kcenon::common::VoidResult initialize(const database::core::connection_config& /*config*/) override
	{
		initialized_ = true;
		return kcenon::common::ok();
	}

	kcenon::common::VoidResult shutdown() override
	{
		initialized_ = false;
		return kcenon::common::ok();
	}

	bool is_initialized() const override { return initialized_; }

	kcenon::common::Result<uint64_t> insert_query(const std::string& /*query_string*/) override
	{
		return uint64_t{ 1 };
	}

	kcenon::common::Result<uint64_t> update_query(const std::string& /*query_string*/) override
	{
		return uint64_t{ 1 };
	}

	kcenon::common::Result<uint64_t> delete_query(const std::string& /*query_string*/) override
	{
		return uint64_t{ 1 };
	}

	kcenon::common::Result<database::core::database_result> select_query(
		const std::string& query_string) override
	{
		select_calls_.fetch_add(1);
		{
			std::lock_guard<std::mutex> lock(mutex_);
			last_query_ = query_string;
		}

		if (delay_ms_.load() > 0)
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
		}

		switch (outcome_.load())
		{
		case outcome::fail:
			return kcenon::common::error_info{ -1, "Connection refused", "scripted_backend" };
		case outcome::throw_exception:
			throw std::runtime_error("driver crashed");
		case outcome::throw_non_standard:
			throw 42;
		default:
			break;
		}

		database::core::database_row row;
		row["1"] = std::string("1");
		return database::core::database_result{ row };
	}

	kcenon::common::VoidResult execute_query(const std::string& /*query_string*/) override
	{
		return kcenon::common::ok();
	}

	kcenon::common::VoidResult begin_transaction() override { return kcenon::common::ok(); }
	kcenon::common::VoidResult commit_transaction() override { return kcenon::common::ok(); }
	kcenon::common::VoidResult rollback_transaction() override { return kcenon::common::ok(); }

	bool in_transaction() const override { return false; }

	std::string last_error() const override { return {}; }

	std::map<std::string, std::string> connection_info() const override { return {}; }

private:
	std::atomic<outcome> outcome_{ outcome::succeed };
	std::atomic<int64_t> delay_ms_{ 0 };
	std::atomic<int> select_calls_{ 0 };
	bool initialized_ = true;

	mutable std::mutex mutex_;
	std::string last_query_;
};

// ============================================================================
// Scripted Resolver
// ============================================================================

/**
 * @brief Resolver over scripted backends, recording timeout overrides
 */
class scripted_resolver : public health::connection_resolver
{
public:
	std::shared_ptr<scripted_backend> add(const std::string& name)
	{
		auto backend = std::make_shared<scripted_backend>();
		backends_[name] = backend;
		return backend;
	}

	void enable_timeout_override(std::optional<std::chrono::milliseconds> previous)
	{
		supports_timeout_ = true;
		previous_timeout_ = previous;
	}

	kcenon::common::Result<std::shared_ptr<database::core::database_backend>> resolve(
		const std::string& connection_name) override
	{
		auto it = backends_.find(connection_name);
		if (it == backends_.end())
		{
			return kcenon::common::error_info{ -404, "Unknown connection " + connection_name,
											   "scripted_resolver" };
		}
		return std::shared_ptr<database::core::database_backend>(it->second);
	}

	bool has_connection(const std::string& connection_name) const override
	{
		return backends_.count(connection_name) > 0;
	}

	kcenon::common::Result<std::optional<std::chrono::milliseconds>> apply_query_timeout(
		database::core::database_backend& /*backend*/, std::chrono::milliseconds timeout) override
	{
		if (!supports_timeout_)
		{
			return kcenon::common::error_info{ -1, "unsupported", "scripted_resolver" };
		}
		applied_timeouts.push_back(timeout);
		return previous_timeout_;
	}

	kcenon::common::VoidResult restore_query_timeout(
		database::core::database_backend& /*backend*/,
		std::optional<std::chrono::milliseconds> previous) override
	{
		restored_timeouts.push_back(previous);
		switch (restore_failure)
		{
		case restore_mode::error:
			return kcenon::common::error_info{ -1, "timeout not restored", "scripted_resolver" };
		case restore_mode::throw_exception:
			throw std::runtime_error("driver rejected timeout");
		case restore_mode::throw_non_standard:
			throw 7;
		default:
			break;
		}
		return kcenon::common::ok();
	}

	enum class restore_mode
	{
		none,
		error,
		throw_exception,
		throw_non_standard
	};

	restore_mode restore_failure = restore_mode::none;
	std::vector<std::chrono::milliseconds> applied_timeouts;
	std::vector<std::optional<std::chrono::milliseconds>> restored_timeouts;

private:
	std::map<std::string, std::shared_ptr<scripted_backend>> backends_;
	bool supports_timeout_ = false;
	std::optional<std::chrono::milliseconds> previous_timeout_;
};

// ============================================================================
// Scripted Probe
// ============================================================================

/**
 * @brief health_probe answering from a per-connection table
 */
class scripted_probe : public health::health_probe
{
public:
	void set(const std::string& name, bool healthy)
	{
		std::lock_guard<std::mutex> lock(mutex_);
		results_[name] = healthy;
	}

	bool is_healthy(const std::string& connection_name) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		++calls_;
		if (raising_.count(connection_name) > 0)
		{
			throw 99;
		}
		auto it = results_.find(connection_name);
		return it != results_.end() && it->second;
	}

	// Answers for the connection by throwing a non-standard type
	void set_raising(const std::string& name)
	{
		std::lock_guard<std::mutex> lock(mutex_);
		raising_.insert(name);
	}

	[[nodiscard]] int calls() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return calls_;
	}

private:
	mutable std::mutex mutex_;
	std::map<std::string, bool> results_;
	std::set<std::string> raising_;
	int calls_ = 0;
};

// ============================================================================
// Event Recorder
// ============================================================================

/**
 * @brief Captures every event dispatched on a bus
 */
class event_recorder
{
public:
	explicit event_recorder(const std::shared_ptr<events::event_bus>& bus)
	{
		bus->subscribe(
			[this](const events::failover_event& event)
			{
				std::lock_guard<std::mutex> lock(mutex_);
				events_.push_back(event);
			});
	}

	[[nodiscard]] std::vector<events::failover_event> events() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return events_;
	}

	[[nodiscard]] std::vector<events::failover_event_type> types() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		std::vector<events::failover_event_type> result;
		for (const auto& event : events_)
		{
			result.push_back(event.type);
		}
		return result;
	}

	[[nodiscard]] size_t count(events::failover_event_type type) const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
												 [type](const auto& e) { return e.type == type; }));
	}

	void clear()
	{
		std::lock_guard<std::mutex> lock(mutex_);
		events_.clear();
	}

private:
	mutable std::mutex mutex_;
	std::vector<events::failover_event> events_;
};

// ============================================================================
// Failing State Caches
// ============================================================================

/**
 * @brief state_cache whose every call throws
 *
 * With non_standard set it throws an int instead of a std::exception.
 */
class throwing_cache : public cache::state_cache
{
public:
	explicit throwing_cache(bool non_standard = false)
		: non_standard_(non_standard)
	{
	}

	kcenon::common::Result<std::optional<std::string>> get(const std::string& /*key*/) override
	{
		raise();
		return std::optional<std::string>{};
	}

	kcenon::common::VoidResult put(const std::string& /*key*/,
								   const std::string& /*value*/,
								   std::chrono::seconds /*ttl*/,
								   const std::string& /*tag*/) override
	{
		raise();
		return kcenon::common::ok();
	}

	bool supports_tags() const noexcept override { return true; }

	kcenon::common::VoidResult flush_tag(const std::string& /*tag*/) override
	{
		raise();
		return kcenon::common::ok();
	}

private:
	void raise() const
	{
		if (non_standard_)
		{
			throw 13;
		}
		throw std::runtime_error("cache store unreachable");
	}

	bool non_standard_;
};

/**
 * @brief Tagless in-memory state_cache that can be switched to return errors
 */
class plain_cache : public cache::state_cache
{
public:
	kcenon::common::Result<std::optional<std::string>> get(const std::string& key) override
	{
		if (failing)
		{
			return kcenon::common::error_info{ -1, "read failed", "plain_cache" };
		}
		auto it = values.find(key);
		if (it == values.end())
		{
			return std::optional<std::string>{};
		}
		return std::optional<std::string>{ it->second };
	}

	kcenon::common::VoidResult put(const std::string& key,
								   const std::string& value,
								   std::chrono::seconds /*ttl*/,
								   const std::string& /*tag*/) override
	{
		if (failing
			|| (!fail_writes_containing.empty()
				&& key.find(fail_writes_containing) != std::string::npos))
		{
			return kcenon::common::error_info{ -1, "write failed", "plain_cache" };
		}
		values[key] = value;
		return kcenon::common::ok();
	}

	bool failing = false;
	// Writes to keys containing this text fail; empty disables it
	std::string fail_writes_containing;
	std::map<std::string, std::string> values;
};

// ============================================================================
// Recording Connection Manager
// ============================================================================

/**
 * @brief connection_manager recording every applied connection
 */
class recording_connection_manager : public failover::connection_manager
{
public:
	explicit recording_connection_manager(std::string default_connection = "primary")
		: default_connection_(std::move(default_connection))
	{
	}

	kcenon::common::VoidResult set_active_connection(const std::string& connection_name) override
	{
		if (on_switch)
		{
			on_switch(connection_name);
		}
		if (fail_switches)
		{
			return kcenon::common::error_info{ -1, "switch rejected", "recording_connection_manager" };
		}
		applied.push_back(connection_name);
		return kcenon::common::ok();
	}

	std::string active_connection() const override
	{
		return applied.empty() ? default_connection_ : applied.back();
	}

	bool fail_switches = false;
	// Runs inside set_active_connection() before the switch is recorded
	std::function<void(const std::string&)> on_switch;
	std::vector<std::string> applied;

private:
	std::string default_connection_;
};

} // namespace database_failover::testing
