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

#include <kcenon/database_failover/failover/blocking_backend.h>

namespace database_failover::failover
{

database::database_types blocking_backend::type() const
{
	return database::database_types::none;
}

kcenon::common::VoidResult blocking_backend::initialize(
	const database::core::connection_config& /*config*/)
{
	initialized_ = true;
	return kcenon::common::ok();
}

kcenon::common::VoidResult blocking_backend::shutdown()
{
	initialized_ = false;
	return kcenon::common::ok();
}

bool blocking_backend::is_initialized() const
{
	return initialized_.load();
}

kcenon::common::Result<uint64_t> blocking_backend::insert_query(const std::string& /*query_string*/)
{
	return reject();
}

kcenon::common::Result<uint64_t> blocking_backend::update_query(const std::string& /*query_string*/)
{
	return reject();
}

kcenon::common::Result<uint64_t> blocking_backend::delete_query(const std::string& /*query_string*/)
{
	return reject();
}

kcenon::common::Result<database::core::database_result> blocking_backend::select_query(
	const std::string& /*query_string*/)
{
	return reject();
}

kcenon::common::VoidResult blocking_backend::execute_query(const std::string& /*query_string*/)
{
	return reject();
}

kcenon::common::VoidResult blocking_backend::begin_transaction()
{
	return reject();
}

kcenon::common::VoidResult blocking_backend::commit_transaction()
{
	return reject();
}

kcenon::common::VoidResult blocking_backend::rollback_transaction()
{
	return reject();
}

bool blocking_backend::in_transaction() const
{
	return false;
}

std::string blocking_backend::last_error() const
{
	return BLOCKING_ERROR_MESSAGE;
}

std::map<std::string, std::string> blocking_backend::connection_info() const
{
	return { { "driver", "blocking" }, { "state", "limited_functionality" } };
}

uint64_t blocking_backend::rejected_operations() const noexcept
{
	return rejected_.load();
}

kcenon::common::error_info blocking_backend::reject()
{
	++rejected_;
	return kcenon::common::error_info{ BLOCKING_ERROR_CODE, BLOCKING_ERROR_MESSAGE,
									   "blocking_backend" };
}

} // namespace database_failover::failover
