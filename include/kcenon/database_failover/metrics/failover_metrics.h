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
 * @file failover_metrics.h
 * @brief Counters for probe outcomes and connection switches
 *
 * All counters are relaxed atomics; they are monotonic between resets and
 * only meant for monitoring, never for decisions.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace database_failover::metrics
{

/**
 * @brief Percentage of part over total, 0.0 when total is zero
 */
inline double calculate_rate(uint64_t part, uint64_t total) noexcept
{
	if (total == 0)
	{
		return 0.0;
	}
	return static_cast<double>(part) / static_cast<double>(total) * 100.0;
}

/**
 * @struct state_metrics
 * @brief Statistics kept by connection_state_manager
 */
struct state_metrics
{
	std::atomic<uint64_t> probes{ 0 };            ///< update_connection_status calls
	std::atomic<uint64_t> probe_failures{ 0 };    ///< Probes that returned false
	std::atomic<uint64_t> down_transitions{ 0 };  ///< Transitions into DOWN
	std::atomic<uint64_t> restorations{ 0 };      ///< DOWN -> HEALTHY transitions
	std::atomic<uint64_t> cache_errors{ 0 };      ///< cache_unavailable events emitted

	[[nodiscard]] double check_failure_rate() const noexcept
	{
		return calculate_rate(probe_failures.load(std::memory_order_relaxed),
							  probes.load(std::memory_order_relaxed));
	}

	void reset() noexcept
	{
		probes.store(0, std::memory_order_relaxed);
		probe_failures.store(0, std::memory_order_relaxed);
		down_transitions.store(0, std::memory_order_relaxed);
		restorations.store(0, std::memory_order_relaxed);
		cache_errors.store(0, std::memory_order_relaxed);
	}
};

/**
 * @struct switch_metrics
 * @brief Statistics kept by database_failover_manager
 */
struct switch_metrics
{
	std::atomic<uint64_t> decisions{ 0 };              ///< determine_and_set_connection calls
	std::atomic<uint64_t> switches{ 0 };               ///< Applied connection changes
	std::atomic<uint64_t> limited_mode_activations{ 0 };
	std::atomic<uint64_t> failed_switches{ 0 };        ///< set_active_connection errors

	void reset() noexcept
	{
		decisions.store(0, std::memory_order_relaxed);
		switches.store(0, std::memory_order_relaxed);
		limited_mode_activations.store(0, std::memory_order_relaxed);
		failed_switches.store(0, std::memory_order_relaxed);
	}
};

} // namespace database_failover::metrics
