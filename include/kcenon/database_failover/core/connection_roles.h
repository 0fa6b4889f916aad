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
 * @file connection_roles.h
 * @brief Role classification of configured connection names
 */

#pragma once

#include <cstdint>
#include <string>

namespace database_failover
{

/**
 * @enum connection_role
 * @brief Role a connection name plays in the failover policy
 */
enum class connection_role : uint8_t
{
	primary,
	failover,
	blocking,
	other
};

constexpr const char* to_string(connection_role role) noexcept
{
	switch (role)
	{
	case connection_role::primary:
		return "primary";
	case connection_role::failover:
		return "failover";
	case connection_role::blocking:
		return "blocking";
	case connection_role::other:
		return "other";
	default:
		return "other";
	}
}

/**
 * @struct connection_roles
 * @brief The three configured connection names
 *
 * Role events (PrimaryDown, FailoverRestored, ...) are selected through
 * classify() so the state machine never compares names directly.
 */
struct connection_roles
{
	std::string primary = "primary";
	std::string failover = "failover";
	std::string blocking = "blocking";

	/**
	 * @brief Classify a connection name against the configured roles
	 * @param name Connection name
	 * @return Matching role; primary wins if names collide
	 */
	[[nodiscard]] connection_role classify(const std::string& name) const noexcept
	{
		if (name == primary)
		{
			return connection_role::primary;
		}
		if (name == failover)
		{
			return connection_role::failover;
		}
		if (name == blocking)
		{
			return connection_role::blocking;
		}
		return connection_role::other;
	}
};

} // namespace database_failover
