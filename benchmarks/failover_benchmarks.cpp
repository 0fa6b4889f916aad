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
 * @file failover_benchmarks.cpp
 * @brief Performance benchmarks for the per-request failover path
 *
 * Benchmarks cover:
 * - In-memory state cache get/put throughput
 * - Decision path (resolve_active_connection) over the memory cache
 * - determine_and_set_connection with an unchanged decision, the common
 *   per-request case
 */

#include <benchmark/benchmark.h>

#include <chrono>
#include <memory>
#include <string>

#include <kcenon/database_failover/cache/memory_state_cache.h>
#include <kcenon/database_failover/failover/database_failover_manager.h>
#include <kcenon/database_failover/health/connection_state_manager.h>

using namespace database_failover;

namespace
{

class fixed_probe : public health::health_probe
{
public:
	bool is_healthy(const std::string& /*connection_name*/) override { return true; }
};

class noop_connection_manager : public failover::connection_manager
{
public:
	kcenon::common::VoidResult set_active_connection(const std::string& connection_name) override
	{
		active_ = connection_name;
		return kcenon::common::ok();
	}

	std::string active_connection() const override { return active_; }

private:
	std::string active_ = "primary";
};

} // namespace

// ============================================================================
// State Cache Benchmarks
// ============================================================================

static void BM_MemoryCachePut(benchmark::State& state)
{
	cache::memory_state_cache cache(1024);
	int64_t i = 0;

	for (auto _ : state)
	{
		auto result = cache.put("status_" + std::to_string(i++ % 64), "HEALTHY",
								std::chrono::seconds(300), "dynamic-db-failover");
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MemoryCachePut);

static void BM_MemoryCacheGetHit(benchmark::State& state)
{
	cache::memory_state_cache cache(1024);
	(void)cache.put("status_primary", "HEALTHY", std::chrono::seconds(300));

	for (auto _ : state)
	{
		auto result = cache.get("status_primary");
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MemoryCacheGetHit);

// ============================================================================
// Decision Path Benchmarks
// ============================================================================

class DecisionBenchmarkFixture : public benchmark::Fixture
{
public:
	void SetUp(const benchmark::State& /*state*/) override
	{
		auto bus = std::make_shared<events::event_bus>();
		state_manager_ = std::make_shared<health::connection_state_manager>(
			std::make_shared<fixed_probe>(), std::make_shared<cache::memory_state_cache>(), bus,
			config_);
		manager_ = std::make_unique<failover::database_failover_manager>(
			config_, state_manager_, std::make_shared<noop_connection_manager>(), bus);
	}

	void TearDown(const benchmark::State& /*state*/) override
	{
		manager_.reset();
		state_manager_.reset();
	}

protected:
	failover_config config_;
	std::shared_ptr<health::connection_state_manager> state_manager_;
	std::unique_ptr<failover::database_failover_manager> manager_;
};

BENCHMARK_DEFINE_F(DecisionBenchmarkFixture, ResolvePrimaryHealthy)(benchmark::State& state)
{
	state_manager_->set_connection_status("primary", connection_status::healthy);
	state_manager_->set_connection_status("failover", connection_status::healthy);

	for (auto _ : state)
	{
		auto target = manager_->resolve_active_connection();
		benchmark::DoNotOptimize(target);
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(DecisionBenchmarkFixture, ResolvePrimaryHealthy);

BENCHMARK_DEFINE_F(DecisionBenchmarkFixture, ResolveToBlocking)(benchmark::State& state)
{
	state_manager_->set_connection_status("primary", connection_status::down);
	state_manager_->set_connection_status("failover", connection_status::down);

	for (auto _ : state)
	{
		auto target = manager_->resolve_active_connection();
		benchmark::DoNotOptimize(target);
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(DecisionBenchmarkFixture, ResolveToBlocking);

BENCHMARK_DEFINE_F(DecisionBenchmarkFixture, DetermineUnchanged)(benchmark::State& state)
{
	state_manager_->set_connection_status("primary", connection_status::healthy);
	(void)manager_->determine_and_set_connection();

	for (auto _ : state)
	{
		auto result = manager_->determine_and_set_connection();
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(DecisionBenchmarkFixture, DetermineUnchanged);

BENCHMARK_MAIN();
