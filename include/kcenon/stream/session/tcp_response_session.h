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

#include "kcenon/stream/session/response_session_base.h"

#include <asio/ip/tcp.hpp>
#include <asio/strand.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::stream::session
{
    /*!
     * \class tcp_response_session
     * \brief HTTP/1.1 chunked response over a connected TCP socket
     *
     * write_headers() sends the status line and headers with
     * "Transfer-Encoding: chunked" and "Connection: close"; each write_chunk() sends one chunk frame
     * (hex size, CRLF, payload, CRLF). close() sends the terminating
     * zero-size chunk and shuts the connection down once it is written;
     * abort() closes the socket immediately so the peer sees a truncated
     * body.
     *
     * The flow signal of a write is fulfilled when async_write completes,
     * i.e. when the bytes are in the kernel send buffer. A slow reader
     * therefore stalls the writer through TCP flow control.
     *
     * All socket operations run on an internal strand built on the socket's
     * executor, so the session may be driven from any thread.
     *
     * ### Disconnect Detection
     * start_monitoring() keeps a read pending on the socket. EOF or a read
     * error raises cancellation. Bytes the peer sends are discarded, and
     * once the session has finished the read is no longer re-armed, so the
     * session is released as soon as the peer's pending read completes.
     */
    class tcp_response_session : public response_session_base,
                                 public std::enable_shared_from_this<tcp_response_session>
    {
    public:
        static auto create(asio::ip::tcp::socket socket) -> std::shared_ptr<tcp_response_session>;

        ~tcp_response_session() override;

        /*!
         * \brief Watch the socket for peer disconnect
         */
        auto start_monitoring() -> void;

        //! Bytes fully written to the socket, framing included
        [[nodiscard]] auto bytes_sent() const -> uint64_t;

        //! Remote address as "host:port", empty if unknown
        [[nodiscard]] auto remote_address() const -> const std::string&;

    protected:
        auto do_write_headers(const interfaces::response_head& head)
            -> Result<core::flow_signal> override;
        auto do_write_chunk(core::chunk data) -> Result<core::flow_signal> override;
        auto do_close() -> VoidResult override;
        auto do_abort(const error_info& reason) -> VoidResult override;

    private:
        explicit tcp_response_session(asio::ip::tcp::socket socket);

        auto send(std::vector<uint8_t> data, bool shutdown_after) -> core::flow_signal;
        auto do_read() -> void;
        auto close_socket() -> void;

        asio::ip::tcp::socket socket_;
        asio::strand<asio::ip::tcp::socket::executor_type> strand_;
        std::array<uint8_t, 1024> read_buffer_{};
        std::string remote_address_;

        std::atomic<bool> monitoring_{false};
        std::atomic<uint64_t> bytes_sent_{0};
    };

    /*!
     * \brief Serialize a response head as an HTTP/1.1 chunked header block
     *
     * Content-Length, Transfer-Encoding and Connection supplied by the caller
     * are dropped; the block always ends with "Connection: close".
     */
    auto format_chunked_head(const interfaces::response_head& head) -> std::string;

    /*!
     * \brief Frame one chunk payload ("<hex size>\r\n<payload>\r\n")
     */
    auto frame_chunk(const std::vector<uint8_t>& payload) -> std::vector<uint8_t>;

} // namespace kcenon::stream::session
