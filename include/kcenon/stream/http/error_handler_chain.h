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

#pragma once

#include "kcenon/stream/types/result.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::stream::http
{

	/*!
	 * \struct status_response
	 * \brief HTTP status chosen for a failure
	 */
	struct status_response
	{
		int status_code = 500;
		std::string reason;
		std::string body;
	};

	/*!
	 * \class error_handler
	 * \brief One link of an error_handler_chain
	 */
	class error_handler
	{
	public:
		virtual ~error_handler() = default;

		/*!
		 * \brief Map an error to a response
		 * \return std::nullopt to let the next handler decide
		 */
		virtual auto handle(const error_info& err) const -> std::optional<status_response> = 0;
	};

	/*!
	 * \class code_mapping_handler
	 * \brief Maps error codes to status codes through a lookup table
	 *
	 * The response body is the error message.
	 */
	class code_mapping_handler : public error_handler
	{
	public:
		/*!
		 * \brief Add or replace a mapping
		 * \return *this for chaining
		 */
		auto map(int error_code, int status_code) -> code_mapping_handler&;

		auto handle(const error_info& err) const -> std::optional<status_response> override;

		[[nodiscard]] auto size() const -> size_t { return table_.size(); }

	private:
		std::map<int, int> table_;
	};

	/*!
	 * \class function_error_handler
	 * \brief Wraps a callable as an error_handler
	 */
	class function_error_handler : public error_handler
	{
	public:
		using handler_fn = std::function<std::optional<status_response>(const error_info&)>;

		explicit function_error_handler(handler_fn fn);

		auto handle(const error_info& err) const -> std::optional<status_response> override;

	private:
		handler_fn fn_;
	};

	/*!
	 * \class error_handler_chain
	 * \brief Ordered list of handlers deciding the response for a failure
	 *
	 * map() asks each handler in insertion order and returns the first
	 * definite answer. When no handler answers the default response
	 * (500 Internal Server Error unless changed) is returned.
	 *
	 * ### Thread Safety
	 * All methods are thread-safe.
	 *
	 * ### Usage Example
	 * \code
	 * error_handler_chain chain;
	 * chain.add_handler(make_common_error_mapping());
	 * auto response = chain.map(open_result.error());   // 404 for not_found
	 * \endcode
	 */
	class error_handler_chain
	{
	public:
		error_handler_chain() = default;

		/*!
		 * \brief Append a handler; null handlers are ignored
		 * \return *this for chaining
		 */
		auto add_handler(std::shared_ptr<error_handler> handler) -> error_handler_chain&;

		/*!
		 * \brief Append a callable handler
		 */
		auto add_handler(function_error_handler::handler_fn fn) -> error_handler_chain&;

		/*!
		 * \brief Choose the response for \p err
		 */
		[[nodiscard]] auto map(const error_info& err) const -> status_response;

		/*!
		 * \brief Status used when no handler answers
		 */
		auto set_default_status(int status_code) -> void;

		[[nodiscard]] auto handler_count() const -> size_t;

		auto clear() -> void;

	private:
		mutable std::mutex mutex_;
		std::vector<std::shared_ptr<error_handler>> handlers_;
		int default_status_ = 500;
	};

	/*!
	 * \brief Table for the common error codes
	 *
	 * not_found -> 404, invalid_argument -> 400, permission_denied -> 403,
	 * timeout -> 504, cancelled (both codes) -> 499.
	 */
	auto make_common_error_mapping() -> std::shared_ptr<code_mapping_handler>;

} // namespace kcenon::stream::http
