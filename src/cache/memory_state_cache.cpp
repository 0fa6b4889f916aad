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

#include <kcenon/database_failover/cache/memory_state_cache.h>

#include <iterator>
#include <mutex>

namespace database_failover::cache
{

memory_state_cache::memory_state_cache(size_t max_entries)
	: max_entries_(max_entries > 0 ? max_entries : 1)
{
}

kcenon::common::Result<std::optional<std::string>> memory_state_cache::get(
	const std::string& key)
{
	std::unique_lock lock(mutex_);

	auto it = index_.find(key);
	if (it == index_.end())
	{
		++metrics_.misses;
		return std::optional<std::string>{};
	}

	if (std::chrono::steady_clock::now() >= it->second->expires_at)
	{
		++metrics_.expirations;
		++metrics_.misses;
		remove_entry(it->second);
		return std::optional<std::string>{};
	}

	++metrics_.hits;
	lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
	return std::optional<std::string>{ it->second->value };
}

kcenon::common::VoidResult memory_state_cache::put(const std::string& key,
													const std::string& value,
													std::chrono::seconds ttl,
													const std::string& tag)
{
	if (ttl.count() <= 0)
	{
		return kcenon::common::error_info{ -1, "TTL must be positive for key '" + key + "'",
										   "memory_state_cache" };
	}

	std::unique_lock lock(mutex_);

	auto existing = index_.find(key);
	if (existing != index_.end())
	{
		remove_entry(existing->second);
	}

	while (index_.size() >= max_entries_ && !lru_list_.empty())
	{
		remove_entry(std::prev(lru_list_.end()));
		++metrics_.evictions;
	}

	lru_list_.push_front(
		cache_entry{ key, value, tag, std::chrono::steady_clock::now() + ttl });
	index_[key] = lru_list_.begin();

	if (!tag.empty())
	{
		tag_index_[tag].insert(key);
	}

	++metrics_.puts;
	return kcenon::common::ok();
}

kcenon::common::VoidResult memory_state_cache::flush_tag(const std::string& tag)
{
	std::unique_lock lock(mutex_);

	auto it = tag_index_.find(tag);
	if (it == tag_index_.end())
	{
		return kcenon::common::ok();
	}

	auto keys = it->second;
	for (const auto& key : keys)
	{
		auto entry = index_.find(key);
		if (entry != index_.end())
		{
			remove_entry(entry->second);
		}
	}
	tag_index_.erase(tag);

	return kcenon::common::ok();
}

void memory_state_cache::erase(const std::string& key)
{
	std::unique_lock lock(mutex_);

	auto it = index_.find(key);
	if (it != index_.end())
	{
		remove_entry(it->second);
	}
}

void memory_state_cache::clear()
{
	std::unique_lock lock(mutex_);

	lru_list_.clear();
	index_.clear();
	tag_index_.clear();
}

size_t memory_state_cache::size() const
{
	std::shared_lock lock(mutex_);
	return index_.size();
}

const memory_cache_metrics& memory_state_cache::metrics() const noexcept
{
	return metrics_;
}

void memory_state_cache::remove_entry(entry_list::iterator it)
{
	if (!it->tag.empty())
	{
		auto tag_it = tag_index_.find(it->tag);
		if (tag_it != tag_index_.end())
		{
			tag_it->second.erase(it->key);
			if (tag_it->second.empty())
			{
				tag_index_.erase(tag_it);
			}
		}
	}

	index_.erase(it->key);
	lru_list_.erase(it);
}

} // namespace database_failover::cache
