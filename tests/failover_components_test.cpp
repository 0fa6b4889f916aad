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
 * @file failover_components_test.cpp
 * @brief Unit tests for the blocking backend and the connection registry
 */

#include <gtest/gtest.h>

#include "test_support.h"

#include <memory>
#include <string>

#include <kcenon/database_failover/failover/blocking_backend.h>
#include <kcenon/database_failover/failover/connection_registry.h>

using namespace database_failover::failover;
using namespace database_failover::testing;

// ============================================================================
// Blocking Backend Tests
// ============================================================================

class BlockingBackendTest : public ::testing::Test
{
protected:
	blocking_backend backend_;
};

TEST_F(BlockingBackendTest, LifecycleSucceeds)
{
	EXPECT_FALSE(backend_.is_initialized());
	EXPECT_TRUE(backend_.initialize(database::core::connection_config{}).is_ok());
	EXPECT_TRUE(backend_.is_initialized());
	EXPECT_TRUE(backend_.shutdown().is_ok());
	EXPECT_FALSE(backend_.is_initialized());
}

TEST_F(BlockingBackendTest, QueriesAreRejected)
{
	auto select = backend_.select_query("SELECT * FROM users");
	ASSERT_TRUE(select.is_err());
	EXPECT_EQ(select.error().code, BLOCKING_ERROR_CODE);
	EXPECT_EQ(select.error().message, BLOCKING_ERROR_MESSAGE);

	EXPECT_TRUE(backend_.insert_query("INSERT INTO t VALUES (1)").is_err());
	EXPECT_TRUE(backend_.update_query("UPDATE t SET a = 1").is_err());
	EXPECT_TRUE(backend_.delete_query("DELETE FROM t").is_err());
	EXPECT_TRUE(backend_.execute_query("CREATE TABLE t (a INT)").is_err());

	EXPECT_EQ(backend_.rejected_operations(), 5u);
}

TEST_F(BlockingBackendTest, TransactionsAreRejected)
{
	EXPECT_TRUE(backend_.begin_transaction().is_err());
	EXPECT_TRUE(backend_.commit_transaction().is_err());
	EXPECT_TRUE(backend_.rollback_transaction().is_err());
	EXPECT_FALSE(backend_.in_transaction());
}

TEST_F(BlockingBackendTest, ReportsLimitedFunctionality)
{
	EXPECT_EQ(backend_.type(), database::database_types::none);
	EXPECT_EQ(backend_.last_error(), BLOCKING_ERROR_MESSAGE);

	auto info = backend_.connection_info();
	EXPECT_EQ(info["state"], "limited_functionality");
}

// ============================================================================
// Connection Registry Tests
// ============================================================================

class ConnectionRegistryTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		primary_ = std::make_shared<scripted_backend>();
		ASSERT_TRUE(registry_.register_connection("primary", primary_).is_ok());
		ASSERT_TRUE(
			registry_.register_connection("blocking", std::make_shared<blocking_backend>()).is_ok());
	}

	connection_registry registry_{ "primary" };
	std::shared_ptr<scripted_backend> primary_;
};

TEST_F(ConnectionRegistryTest, ResolvesRegisteredConnection)
{
	auto resolved = registry_.resolve("primary");

	ASSERT_TRUE(resolved.is_ok());
	EXPECT_EQ(resolved.value().get(), primary_.get());
	EXPECT_TRUE(registry_.has_connection("blocking"));
}

TEST_F(ConnectionRegistryTest, UnknownConnectionFailsToResolve)
{
	auto resolved = registry_.resolve("reporting");

	ASSERT_TRUE(resolved.is_err());
	EXPECT_EQ(resolved.error().code, -404);
	EXPECT_FALSE(registry_.has_connection("reporting"));
}

TEST_F(ConnectionRegistryTest, RejectsInvalidRegistration)
{
	EXPECT_TRUE(registry_.register_connection("", primary_).is_err());
	EXPECT_TRUE(registry_.register_connection("failover", nullptr).is_err());
}

TEST_F(ConnectionRegistryTest, ConnectionNamesAreSorted)
{
	auto names = registry_.connection_names();

	ASSERT_EQ(names.size(), 2u);
	EXPECT_EQ(names[0], "blocking");
	EXPECT_EQ(names[1], "primary");
}

TEST_F(ConnectionRegistryTest, ActiveConnectionStartsAtDefault)
{
	EXPECT_EQ(registry_.active_connection(), "primary");
	EXPECT_EQ(registry_.active_backend().get(), primary_.get());
}

TEST_F(ConnectionRegistryTest, SetActiveConnectionSwitchesBackend)
{
	ASSERT_TRUE(registry_.set_active_connection("blocking").is_ok());

	EXPECT_EQ(registry_.active_connection(), "blocking");
	auto backend = registry_.active_backend();
	ASSERT_NE(backend, nullptr);
	EXPECT_TRUE(backend->select_query("SELECT 1").is_err());
}

TEST_F(ConnectionRegistryTest, SetActiveConnectionRejectsUnknownName)
{
	auto result = registry_.set_active_connection("failover");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(registry_.active_connection(), "primary");
}

TEST_F(ConnectionRegistryTest, RemoveConnection)
{
	EXPECT_TRUE(registry_.remove_connection("blocking"));
	EXPECT_FALSE(registry_.remove_connection("blocking"));
	EXPECT_FALSE(registry_.has_connection("blocking"));
}
