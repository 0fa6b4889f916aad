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
 * @file connection_status.h
 * @brief Health status values and the persisted health record
 *
 * A monitored connection is always in exactly one of three states.
 * UNKNOWN is both the initial state of a connection that has never been
 * probed and the fallback reported whenever the state cache cannot be
 * read. It is not equivalent to DOWN.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace database_failover
{

/**
 * @enum connection_status
 * @brief Health status of a monitored connection
 */
enum class connection_status : uint8_t
{
	healthy, ///< Last probe succeeded
	down,    ///< failure_threshold consecutive probes failed
	unknown  ///< Never probed, below threshold, or state unreadable
};

/**
 * @brief Converts connection_status to its persisted representation.
 * @param status The status to convert.
 * @return "HEALTHY", "DOWN" or "UNKNOWN".
 */
constexpr const char* to_string(connection_status status) noexcept
{
	switch (status)
	{
	case connection_status::healthy:
		return "HEALTHY";
	case connection_status::down:
		return "DOWN";
	case connection_status::unknown:
		return "UNKNOWN";
	default:
		return "UNKNOWN";
	}
}

/**
 * @brief Parses a persisted status value.
 * @param value Value read from the state cache.
 * @return Parsed status, or std::nullopt if the value is not recognised.
 */
std::optional<connection_status> status_from_string(std::string_view value);

/**
 * @struct connection_health_record
 * @brief Persisted health state of one connection
 *
 * Invariants maintained by connection_state_manager:
 * - status == healthy implies consecutive_failures == 0
 * - status == down implies consecutive_failures >= failure_threshold
 */
struct connection_health_record
{
	std::string connection_name;
	connection_status status = connection_status::unknown;
	uint32_t consecutive_failures = 0;
};

} // namespace database_failover
