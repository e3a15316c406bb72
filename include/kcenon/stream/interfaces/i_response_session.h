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

#include "kcenon/stream/core/chunk.h"
#include "kcenon/stream/core/flow_signal.h"
#include "kcenon/stream/types/result.h"

#include <functional>
#include <utility>
#include <string>
#include <vector>

namespace kcenon::stream::interfaces
{
    /*!
     * \struct http_header
     * \brief Response header name/value pair
     */
    struct http_header
    {
        std::string name;
        std::string value;

        http_header() = default;
        http_header(std::string n, std::string v) : name(std::move(n)), value(std::move(v)) {}
    };

    /*!
     * \struct response_head
     * \brief Status line and headers written before the first chunk
     */
    struct response_head
    {
        int status_code = 200;
        std::vector<http_header> headers;
    };

    /*!
     * \class i_response_session
     * \brief Transport side of one request/response exchange
     *
     * The session owns the write path to the peer. A stream_writer is its
     * only user for the lifetime of the stream. Framing of chunk bytes onto
     * the wire is the session's responsibility.
     *
     * ### Call order
     * write_headers() once, then any number of write_chunk(), then exactly one
     * of close() or abort(). Each write returns a flow_signal fulfilled when
     * the data has left the local send buffer, or with an error when the
     * transport could not deliver it.
     */
    class i_response_session
    {
    public:
        using cancel_callback_t = std::function<void()>;

        virtual ~i_response_session() = default;

        /*!
         * \brief Write the response status line and headers
         */
        virtual auto write_headers(const response_head& head) -> Result<core::flow_signal> = 0;

        /*!
         * \brief Write one chunk; ownership of the payload moves to the session
         */
        virtual auto write_chunk(core::chunk data) -> Result<core::flow_signal> = 0;

        /*!
         * \brief Finish the response normally
         */
        virtual auto close() -> VoidResult = 0;

        /*!
         * \brief Terminate the response abnormally
         * \param reason Failure that caused the abort
         */
        virtual auto abort(const error_info& reason) -> VoidResult = 0;

        /*!
         * \brief Subscribe to cancellation (peer disconnect, request cancel)
         *
         * The callback may run on any thread. If the session is already
         * cancelled it is invoked immediately.
         */
        virtual auto on_cancelled(cancel_callback_t callback) -> void = 0;

        [[nodiscard]] virtual auto is_cancelled() const -> bool = 0;
    };

} // namespace kcenon::stream::interfaces
