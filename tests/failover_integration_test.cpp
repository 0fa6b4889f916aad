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
 * @file integration_test.cpp
 * @brief End-to-end failover tests
 *
 * Tests cover:
 * - Full failover cycle through real probes, cache and coordinator
 * - Limited functionality round trip
 * - failover_service wiring and run loop
 */

#include <gtest/gtest.h>

#include "test_support.h"

#include <chrono>
#include <memory>
#include <thread>

#include <kcenon/database_failover/cache/memory_state_cache.h>
#include <kcenon/database_failover/failover/blocking_backend.h>
#include <kcenon/database_failover/failover/connection_registry.h>
#include <kcenon/database_failover/failover/database_failover_manager.h>
#include <kcenon/database_failover/failover_service.h>
#include <kcenon/database_failover/health/connection_health_checker.h>
#include <kcenon/database_failover/health/connection_state_manager.h>

using namespace database_failover;
using namespace database_failover::events;
using namespace database_failover::failover;
using namespace database_failover::health;
using namespace database_failover::testing;
using namespace std::chrono_literals;

// ============================================================================
// Full Failover Cycle Tests
// ============================================================================

class FullFailoverCycleTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_.health_check.failure_threshold = 1;
		config_.cache.ttl_seconds = 60;

		registry_ = std::make_shared<connection_registry>("primary");
		primary_ = std::make_shared<scripted_backend>();
		failover_ = std::make_shared<scripted_backend>();
		ASSERT_TRUE(registry_->register_connection("primary", primary_).is_ok());
		ASSERT_TRUE(registry_->register_connection("failover", failover_).is_ok());
		ASSERT_TRUE(
			registry_->register_connection("blocking", std::make_shared<blocking_backend>()).is_ok());

		bus_ = std::make_shared<event_bus>();
		recorder_ = std::make_unique<event_recorder>(bus_);

		auto checker = std::make_shared<connection_health_checker>(registry_, config_.health_check);
		state_manager_ = std::make_shared<connection_state_manager>(
			checker, std::make_shared<cache::memory_state_cache>(), bus_, config_);
		manager_ = std::make_unique<database_failover_manager>(config_, state_manager_, registry_,
															   bus_);
	}

	failover_config config_;
	std::shared_ptr<connection_registry> registry_;
	std::shared_ptr<scripted_backend> primary_;
	std::shared_ptr<scripted_backend> failover_;
	std::shared_ptr<event_bus> bus_;
	std::unique_ptr<event_recorder> recorder_;
	std::shared_ptr<connection_state_manager> state_manager_;
	std::unique_ptr<database_failover_manager> manager_;
};

TEST_F(FullFailoverCycleTest, PrimaryFailoverBlockingAndBack)
{
	// Primary fails: DOWN after a single failure
	primary_->set_healthy(false);
	state_manager_->update_connection_status("primary");
	EXPECT_EQ(state_manager_->get_connection_status("primary"), connection_status::down);
	EXPECT_EQ(state_manager_->get_failure_count("primary"), 1u);
	EXPECT_EQ(recorder_->count(failover_event_type::primary_down), 1u);

	failover_->set_healthy(true);
	state_manager_->update_connection_status("failover");
	EXPECT_EQ(state_manager_->get_connection_status("failover"), connection_status::healthy);

	recorder_->clear();
	auto first = manager_->determine_and_set_connection();
	ASSERT_TRUE(first.is_ok());
	EXPECT_EQ(first.value(), "failover");
	EXPECT_EQ(registry_->active_connection(), "failover");
	{
		auto events = recorder_->events();
		ASSERT_EQ(events.size(), 1u);
		EXPECT_EQ(events[0].type, failover_event_type::switched_to_failover);
		EXPECT_FALSE(events[0].previous_connection.has_value());
		EXPECT_EQ(events[0].connection_name, "failover");
	}

	// Failover fails too: limited functionality
	failover_->set_healthy(false);
	state_manager_->update_connection_status("failover");
	EXPECT_EQ(recorder_->count(failover_event_type::failover_down), 1u);

	recorder_->clear();
	auto second = manager_->determine_and_set_connection();
	ASSERT_TRUE(second.is_ok());
	EXPECT_EQ(second.value(), "blocking");
	{
		auto events = recorder_->events();
		ASSERT_EQ(events.size(), 1u);
		EXPECT_EQ(events[0].type, failover_event_type::limited_functionality_activated);
		EXPECT_EQ(events[0].connection_name, "blocking");
	}

	auto blocked = registry_->active_backend()->select_query("SELECT * FROM orders");
	ASSERT_TRUE(blocked.is_err());
	EXPECT_EQ(blocked.error().message, BLOCKING_ERROR_MESSAGE);

	// Primary recovers
	primary_->set_healthy(true);
	recorder_->clear();
	state_manager_->update_connection_status("primary");
	EXPECT_EQ(recorder_->count(failover_event_type::primary_restored), 1u);

	recorder_->clear();
	auto third = manager_->determine_and_set_connection();
	ASSERT_TRUE(third.is_ok());
	EXPECT_EQ(third.value(), "primary");
	EXPECT_EQ(registry_->active_connection(), "primary");
	{
		auto events = recorder_->events();
		ASSERT_EQ(events.size(), 2u);
		EXPECT_EQ(events[0].type, failover_event_type::switched_to_primary);
		ASSERT_TRUE(events[0].previous_connection.has_value());
		EXPECT_EQ(*events[0].previous_connection, "blocking");
		EXPECT_EQ(events[0].connection_name, "primary");
		EXPECT_EQ(events[1].type, failover_event_type::exited_limited_functionality);
		EXPECT_EQ(events[1].connection_name, "primary");
	}
}

TEST_F(FullFailoverCycleTest, LimitedFunctionalityActivatedOnceWhileBothDown)
{
	primary_->set_healthy(false);
	failover_->set_healthy(false);

	for (int i = 0; i < 3; ++i)
	{
		state_manager_->update_connection_status("primary");
		state_manager_->update_connection_status("failover");
		auto result = manager_->determine_and_set_connection();
		ASSERT_TRUE(result.is_ok());
		EXPECT_EQ(result.value(), "blocking");
	}

	EXPECT_EQ(recorder_->count(failover_event_type::primary_down), 1u);
	EXPECT_EQ(recorder_->count(failover_event_type::failover_down), 1u);
	EXPECT_EQ(recorder_->count(failover_event_type::limited_functionality_activated), 1u);

	primary_->set_healthy(true);
	state_manager_->update_connection_status("primary");
	ASSERT_TRUE(manager_->determine_and_set_connection().is_ok());
	ASSERT_TRUE(manager_->determine_and_set_connection().is_ok());

	EXPECT_EQ(recorder_->count(failover_event_type::primary_restored), 1u);
	EXPECT_EQ(recorder_->count(failover_event_type::switched_to_primary), 1u);
	EXPECT_EQ(recorder_->count(failover_event_type::exited_limited_functionality), 1u);
}

// ============================================================================
// Failover Service Tests
// ============================================================================

class FailoverServiceTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_.health_check.failure_threshold = 1;
		config_.health_check.interval_seconds = 1;

		registry_ = std::make_shared<connection_registry>("primary");
		primary_ = std::make_shared<scripted_backend>();
		failover_ = std::make_shared<scripted_backend>();
		ASSERT_TRUE(registry_->register_connection("primary", primary_).is_ok());
		ASSERT_TRUE(registry_->register_connection("failover", failover_).is_ok());
		ASSERT_TRUE(
			registry_->register_connection("blocking", std::make_shared<blocking_backend>()).is_ok());
	}

	failover_config config_;
	std::shared_ptr<connection_registry> registry_;
	std::shared_ptr<scripted_backend> primary_;
	std::shared_ptr<scripted_backend> failover_;
};

TEST_F(FailoverServiceTest, RejectsInvalidConfiguration)
{
	config_.health_check.query = "";
	failover_service service;

	auto result = service.initialize(config_, registry_, registry_);

	EXPECT_TRUE(result.is_err());
	EXPECT_EQ(service.state(), service_state::uninitialized);
}

TEST_F(FailoverServiceTest, RejectsMissingHostContracts)
{
	failover_service service;

	EXPECT_TRUE(service.initialize(config_, nullptr, registry_).is_err());
}

TEST_F(FailoverServiceTest, RejectsSecondInitialization)
{
	failover_service service;

	ASSERT_TRUE(service.initialize(config_, registry_, registry_).is_ok());
	EXPECT_TRUE(service.initialize(config_, registry_, registry_).is_err());
}

TEST_F(FailoverServiceTest, RequestBeforeInitializeFails)
{
	failover_service service;

	EXPECT_TRUE(service.handle_request().is_err());
	EXPECT_EQ(service.run(), 1);
}

TEST_F(FailoverServiceTest, HealthChecksDriveRequests)
{
	failover_service service;
	ASSERT_TRUE(service.initialize(config_, registry_, registry_).is_ok());
	EXPECT_EQ(service.state(), service_state::initialized);

	primary_->set_healthy(false);
	auto report = service.run_health_checks();
	EXPECT_TRUE(report.succeeded());

	auto active = service.handle_request();
	ASSERT_TRUE(active.is_ok());
	EXPECT_EQ(active.value(), "failover");
	EXPECT_EQ(registry_->active_connection(), "failover");
	EXPECT_TRUE(service.state_manager()->is_connection_down("primary"));
}

TEST_F(FailoverServiceTest, RunLoopStopsOnRequest)
{
	failover_service service;
	ASSERT_TRUE(service.initialize(config_, registry_, registry_).is_ok());

	int exit_code = -1;
	std::thread runner([&]() { exit_code = service.run(); });

	while (!service.is_running())
	{
		std::this_thread::sleep_for(10ms);
	}
	// Let the first cycle finish
	std::this_thread::sleep_for(200ms);

	service.stop();
	runner.join();

	EXPECT_EQ(exit_code, 0);
	EXPECT_EQ(service.state(), service_state::stopped);
	EXPECT_TRUE(service.state_manager()->is_connection_healthy("primary"));
	EXPECT_EQ(registry_->active_connection(), "primary");
}
