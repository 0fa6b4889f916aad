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
 * @file memory_state_cache.h
 * @brief In-process state cache with TTL expiration and tag flushing
 *
 * Suitable for a single process or for tests. Deployments with several
 * application instances need a shared store behind the state_cache
 * interface instead, since health records must be visible to every
 * instance.
 */

#pragma once

#include "state_cache.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace database_failover::cache
{

/**
 * @struct memory_cache_metrics
 * @brief Statistics for the in-memory cache
 */
struct memory_cache_metrics
{
	std::atomic<uint64_t> hits{ 0 };
	std::atomic<uint64_t> misses{ 0 };
	std::atomic<uint64_t> expirations{ 0 };
	std::atomic<uint64_t> evictions{ 0 };
	std::atomic<uint64_t> puts{ 0 };

	void reset() noexcept
	{
		hits.store(0);
		misses.store(0);
		expirations.store(0);
		evictions.store(0);
		puts.store(0);
	}
};

/**
 * @class memory_state_cache
 * @brief Thread-safe LRU-bounded map with per-entry TTL and tag index
 *
 * Expired entries are removed lazily when read. When max_entries is
 * reached the least recently used entry is evicted; with only a handful
 * of connections per process this bound is never expected to bite.
 */
class memory_state_cache : public state_cache
{
public:
	explicit memory_state_cache(size_t max_entries = 1024);

	memory_state_cache(const memory_state_cache&) = delete;
	memory_state_cache& operator=(const memory_state_cache&) = delete;

	kcenon::common::Result<std::optional<std::string>> get(const std::string& key) override;

	kcenon::common::VoidResult put(const std::string& key,
								   const std::string& value,
								   std::chrono::seconds ttl,
								   const std::string& tag = "") override;

	[[nodiscard]] bool supports_tags() const noexcept override { return true; }

	kcenon::common::VoidResult flush_tag(const std::string& tag) override;

	/**
	 * @brief Remove a single key
	 */
	void erase(const std::string& key);

	/**
	 * @brief Remove all entries
	 */
	void clear();

	[[nodiscard]] size_t size() const;

	[[nodiscard]] const memory_cache_metrics& metrics() const noexcept;

private:
	struct cache_entry
	{
		std::string key;
		std::string value;
		std::string tag;
		std::chrono::steady_clock::time_point expires_at;
	};

	using entry_list = std::list<cache_entry>;

	void remove_entry(entry_list::iterator it);

	size_t max_entries_;
	mutable std::shared_mutex mutex_;

	entry_list lru_list_; ///< front = most recently used
	std::unordered_map<std::string, entry_list::iterator> index_;
	std::unordered_map<std::string, std::unordered_set<std::string>> tag_index_;

	memory_cache_metrics metrics_;
};

} // namespace database_failover::cache
