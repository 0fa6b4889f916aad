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

#include <kcenon/database_failover/failover/connection_registry.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace database_failover::failover
{

connection_registry::connection_registry(std::string default_connection)
	: active_(std::move(default_connection))
{
}

kcenon::common::VoidResult connection_registry::register_connection(
	const std::string& connection_name,
	std::shared_ptr<database::core::database_backend> backend)
{
	if (connection_name.empty())
	{
		return kcenon::common::error_info{ -1, "Connection name cannot be empty",
										   "connection_registry" };
	}

	if (!backend)
	{
		return kcenon::common::error_info{
			-1, "Backend for connection '" + connection_name + "' is null", "connection_registry"
		};
	}

	std::unique_lock lock(mutex_);
	backends_[connection_name] = std::move(backend);
	return kcenon::common::ok();
}

bool connection_registry::remove_connection(const std::string& connection_name)
{
	std::unique_lock lock(mutex_);
	return backends_.erase(connection_name) > 0;
}

std::vector<std::string> connection_registry::connection_names() const
{
	std::shared_lock lock(mutex_);

	std::vector<std::string> names;
	names.reserve(backends_.size());
	for (const auto& [name, backend] : backends_)
	{
		names.push_back(name);
	}
	std::sort(names.begin(), names.end());
	return names;
}

kcenon::common::Result<std::shared_ptr<database::core::database_backend>>
connection_registry::resolve(const std::string& connection_name)
{
	std::shared_lock lock(mutex_);

	auto it = backends_.find(connection_name);
	if (it == backends_.end())
	{
		return kcenon::common::error_info{
			-404, "Connection '" + connection_name + "' is not configured", "connection_registry"
		};
	}

	return it->second;
}

bool connection_registry::has_connection(const std::string& connection_name) const
{
	std::shared_lock lock(mutex_);
	return backends_.find(connection_name) != backends_.end();
}

kcenon::common::VoidResult connection_registry::set_active_connection(
	const std::string& connection_name)
{
	std::unique_lock lock(mutex_);

	if (backends_.find(connection_name) == backends_.end())
	{
		return kcenon::common::error_info{
			-404, "Cannot activate unconfigured connection '" + connection_name + "'",
			"connection_registry"
		};
	}

	active_ = connection_name;
	return kcenon::common::ok();
}

std::string connection_registry::active_connection() const
{
	std::shared_lock lock(mutex_);
	return active_;
}

std::shared_ptr<database::core::database_backend> connection_registry::active_backend() const
{
	std::shared_lock lock(mutex_);

	auto it = backends_.find(active_);
	return it != backends_.end() ? it->second : nullptr;
}

} // namespace database_failover::failover
