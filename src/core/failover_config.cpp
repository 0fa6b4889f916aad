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

#include <kcenon/database_failover/core/failover_config.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace database_failover
{

namespace
{

bool is_blank(const std::string& value)
{
	return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool parse_bool(const std::string& value)
{
	return value == "true" || value == "1" || value == "yes" || value == "on";
}

uint32_t parse_u32(const std::string& value)
{
	size_t consumed = 0;
	auto parsed = std::stoul(value, &consumed);
	if (consumed != value.size() || parsed > UINT32_MAX)
	{
		throw std::out_of_range("value out of range: " + value);
	}
	return static_cast<uint32_t>(parsed);
}

} // namespace

std::optional<failover_config> failover_config::load_from_file(const std::string& path)
{
	if (!std::filesystem::exists(path))
	{
		return std::nullopt;
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return std::nullopt;
	}

	failover_config config = default_config();

	std::string line;
	while (std::getline(file, line))
	{
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);

		auto trim = [](std::string& s)
		{
			s.erase(0, s.find_first_not_of(" \t\r\n"));
			s.erase(s.find_last_not_of(" \t\r\n") + 1);
		};
		trim(key);
		trim(value);

		try
		{
			if (key == "connections.primary")
			{
				config.connections.primary = value;
			}
			else if (key == "connections.failover")
			{
				config.connections.failover = value;
			}
			else if (key == "connections.blocking")
			{
				config.connections.blocking = value;
			}
			else if (key == "health_check.query")
			{
				config.health_check.query = value;
			}
			else if (key == "health_check.interval_seconds")
			{
				config.health_check.interval_seconds = parse_u32(value);
			}
			else if (key == "health_check.timeout_seconds")
			{
				config.health_check.timeout_seconds = parse_u32(value);
			}
			else if (key == "health_check.failure_threshold")
			{
				config.health_check.failure_threshold = parse_u32(value);
			}
			else if (key == "cache.prefix")
			{
				config.cache.prefix = value;
			}
			else if (key == "cache.tag")
			{
				config.cache.tag = value;
			}
			else if (key == "cache.ttl_seconds")
			{
				config.cache.ttl_seconds = parse_u32(value);
			}
			else if (key == "cache.max_entries")
			{
				config.cache.max_entries = parse_u32(value);
			}
			else if (key == "logging.level")
			{
				config.logging.level = value;
			}
			else if (key == "dispatch_command_lifecycle_events")
			{
				config.dispatch_command_lifecycle_events = parse_bool(value);
			}
			else if (key == "default_to_primary_on_empty_state")
			{
				config.default_to_primary_on_empty_state = parse_bool(value);
			}
		}
		catch (const std::logic_error&)
		{
			// std::stoul reports malformed input as invalid_argument/out_of_range
			return std::nullopt;
		}
	}

	return config;
}

failover_config failover_config::default_config()
{
	failover_config config;
	return config;
}

bool failover_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> failover_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (health_check.failure_threshold == 0)
	{
		errors.push_back("Health check failure threshold must be at least 1");
	}

	if (health_check.timeout_seconds == 0)
	{
		errors.push_back("Health check timeout must be greater than 0");
	}

	if (health_check.interval_seconds == 0)
	{
		errors.push_back("Health check interval must be greater than 0");
	}

	if (is_blank(health_check.query))
	{
		errors.push_back("Health check query cannot be empty");
	}

	if (cache.ttl_seconds == 0)
	{
		errors.push_back("Cache TTL must be greater than 0");
	}

	if (cache.prefix.empty())
	{
		errors.push_back("Cache key prefix cannot be empty");
	}

	if (logging.level != "debug" && logging.level != "info" && logging.level != "warn"
		&& logging.level != "error")
	{
		errors.push_back("Invalid log level: " + logging.level
						 + " (valid: debug, info, warn, error)");
	}

	return errors;
}

std::vector<std::string> failover_config::validation_warnings() const
{
	std::vector<std::string> warnings;
	const connection_roles defaults;

	if (is_blank(connections.primary))
	{
		warnings.push_back("Primary connection name is blank, using '" + defaults.primary + "'");
	}
	if (is_blank(connections.failover))
	{
		warnings.push_back("Failover connection name is blank, using '" + defaults.failover
						   + "'");
	}
	if (is_blank(connections.blocking))
	{
		warnings.push_back("Blocking connection name is blank, using '" + defaults.blocking
						   + "'");
	}

	return warnings;
}

connection_roles failover_config::resolved_connections() const
{
	connection_roles resolved = connections;
	const connection_roles defaults;

	if (is_blank(resolved.primary))
	{
		resolved.primary = defaults.primary;
	}
	if (is_blank(resolved.failover))
	{
		resolved.failover = defaults.failover;
	}
	if (is_blank(resolved.blocking))
	{
		resolved.blocking = defaults.blocking;
	}

	return resolved;
}

} // namespace database_failover
