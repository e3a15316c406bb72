/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024, kcenon
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#include "kcenon/stream/http/error_handler_chain.h"
#include "kcenon/stream/http/http_status.h"
#include "kcenon/stream/integration/logger_integration.h"

#include <utility>

namespace kcenon::stream::http
{

	namespace
	{
		auto make_response(int status_code, const std::string& body) -> status_response
		{
			status_response response;
			response.status_code = status_code;
			response.reason = std::string(reason_phrase(status_code));
			response.body = body;
			return response;
		}
	} // namespace

	auto code_mapping_handler::map(int error_code, int status_code) -> code_mapping_handler&
	{
		table_[error_code] = status_code;
		return *this;
	}

	auto code_mapping_handler::handle(const error_info& err) const
		-> std::optional<status_response>
	{
		auto it = table_.find(err.code);
		if (it == table_.end())
		{
			return std::nullopt;
		}
		return make_response(it->second, err.message);
	}

	function_error_handler::function_error_handler(handler_fn fn) : fn_(std::move(fn)) {}

	auto function_error_handler::handle(const error_info& err) const
		-> std::optional<status_response>
	{
		if (!fn_)
		{
			return std::nullopt;
		}
		return fn_(err);
	}

	auto error_handler_chain::add_handler(std::shared_ptr<error_handler> handler)
		-> error_handler_chain&
	{
		if (handler)
		{
			std::lock_guard<std::mutex> lock(mutex_);
			handlers_.push_back(std::move(handler));
		}
		return *this;
	}

	auto error_handler_chain::add_handler(function_error_handler::handler_fn fn)
		-> error_handler_chain&
	{
		return add_handler(std::make_shared<function_error_handler>(std::move(fn)));
	}

	auto error_handler_chain::map(const error_info& err) const -> status_response
	{
		std::vector<std::shared_ptr<error_handler>> handlers;
		int fallback;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			handlers = handlers_;
			fallback = default_status_;
		}

		for (const auto& handler : handlers)
		{
			if (auto response = handler->handle(err))
			{
				if (response->reason.empty())
				{
					response->reason = std::string(reason_phrase(response->status_code));
				}
				return *response;
			}
		}

		STREAM_LOG_DEBUG("[error_handler_chain] No handler for code " + std::to_string(err.code) +
						 ", using " + std::to_string(fallback));
		return make_response(fallback, err.message);
	}

	auto error_handler_chain::set_default_status(int status_code) -> void
	{
		std::lock_guard<std::mutex> lock(mutex_);
		default_status_ = status_code;
	}

	auto error_handler_chain::handler_count() const -> size_t
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return handlers_.size();
	}

	auto error_handler_chain::clear() -> void
	{
		std::lock_guard<std::mutex> lock(mutex_);
		handlers_.clear();
	}

	auto make_common_error_mapping() -> std::shared_ptr<code_mapping_handler>
	{
		auto mapping = std::make_shared<code_mapping_handler>();
		mapping->map(error_codes::common_errors::not_found, 404)
			.map(error_codes::common_errors::invalid_argument, 400)
			.map(error_codes::common_errors::permission_denied, 403)
			.map(error_codes::common_errors::timeout, 504)
			.map(error_codes::common_errors::cancelled, 499)
			.map(error_codes::stream_system::cancelled, 499);
		return mapping;
	}

} // namespace kcenon::stream::http
