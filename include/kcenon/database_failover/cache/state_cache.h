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
 * @file state_cache.h
 * @brief Key-value persistence contract for connection health records
 *
 * The state cache is the only source of truth shared between processes.
 * Implementations may report failures either through the returned
 * Result or by throwing std::exception; connection_state_manager handles
 * both and never lets them reach its own callers.
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <optional>
#include <string>

namespace database_failover::cache
{

/**
 * @class state_cache
 * @brief Expiring key-value store with optional group invalidation
 */
class state_cache
{
public:
	virtual ~state_cache() = default;

	/**
	 * @brief Read a value
	 * @param key Cache key
	 * @return The value, std::nullopt if absent or expired, or an error if
	 *         the store could not be read
	 */
	virtual kcenon::common::Result<std::optional<std::string>> get(const std::string& key) = 0;

	/**
	 * @brief Store a value with a time-to-live
	 * @param key Cache key
	 * @param value Value to store
	 * @param ttl Lifetime of the entry
	 * @param tag Group tag for flush_tag(); empty for none
	 */
	virtual kcenon::common::VoidResult put(const std::string& key,
										   const std::string& value,
										   std::chrono::seconds ttl,
										   const std::string& tag = "")
		= 0;

	/**
	 * @brief Whether flush_tag() is supported
	 */
	[[nodiscard]] virtual bool supports_tags() const noexcept { return false; }

	/**
	 * @brief Remove every entry stored with a tag
	 */
	virtual kcenon::common::VoidResult flush_tag(const std::string& tag)
	{
		return kcenon::common::error_info{ -1, "Tag flush not supported for tag '" + tag + "'",
										   "state_cache" };
	}
};

} // namespace database_failover::cache
