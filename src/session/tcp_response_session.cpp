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

#include "kcenon/stream/session/tcp_response_session.h"
#include "kcenon/stream/http/http_status.h"
#include "kcenon/stream/integration/logger_integration.h"

#include <asio/bind_executor.hpp>
#include <asio/buffer.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>

#include <cctype>
#include <cstdio>
#include <string_view>

namespace kcenon::stream::session
{
    namespace
    {
        constexpr std::string_view crlf = "\r\n";
        constexpr std::string_view last_chunk = "0\r\n\r\n";

        auto iequals(std::string_view a, std::string_view b) -> bool
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i])))
                {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    auto format_chunked_head(const interfaces::response_head& head) -> std::string
    {
        std::string out = "HTTP/1.1 " + std::to_string(head.status_code) + " " +
                          std::string(http::reason_phrase(head.status_code));
        out.append(crlf);

        for (const auto& header : head.headers)
        {
            if (iequals(header.name, "Content-Length") ||
                iequals(header.name, "Transfer-Encoding") || iequals(header.name, "Connection"))
            {
                continue;
            }
            out += header.name + ": " + header.value;
            out.append(crlf);
        }

        // One response per connection; the send side is shut down after it.
        out += "Transfer-Encoding: chunked";
        out.append(crlf);
        out += "Connection: close";
        out.append(crlf);
        out.append(crlf);
        return out;
    }

    auto frame_chunk(const std::vector<uint8_t>& payload) -> std::vector<uint8_t>
    {
        char size_line[32];
        const int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", payload.size());

        std::vector<uint8_t> frame;
        frame.reserve(static_cast<size_t>(n) + payload.size() + crlf.size());
        frame.insert(frame.end(), size_line, size_line + n);
        frame.insert(frame.end(), payload.begin(), payload.end());
        frame.insert(frame.end(), crlf.begin(), crlf.end());
        return frame;
    }

    auto tcp_response_session::create(asio::ip::tcp::socket socket)
        -> std::shared_ptr<tcp_response_session>
    {
        return std::shared_ptr<tcp_response_session>(new tcp_response_session(std::move(socket)));
    }

    tcp_response_session::tcp_response_session(asio::ip::tcp::socket socket)
        : socket_(std::move(socket)), strand_(asio::make_strand(socket_.get_executor()))
    {
        std::error_code ec;
        auto endpoint = socket_.remote_endpoint(ec);
        if (!ec)
        {
            remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
    }

    tcp_response_session::~tcp_response_session()
    {
        std::error_code ec;
        socket_.close(ec);
    }

    auto tcp_response_session::start_monitoring() -> void
    {
        if (monitoring_.exchange(true))
        {
            return;
        }
        asio::post(strand_, [self = shared_from_this()]() { self->do_read(); });
    }

    auto tcp_response_session::do_read() -> void
    {
        auto self = shared_from_this();
        socket_.async_read_some(
            asio::buffer(read_buffer_),
            asio::bind_executor(strand_, [this, self](std::error_code ec, std::size_t) {
                if (ec)
                {
                    if (!is_finished())
                    {
                        STREAM_LOG_DEBUG("[tcp_response_session] Peer " + remote_address_ +
                                         " gone: " + ec.message());
                    }
                    notify_cancelled();
                    return;
                }
                if (is_finished())
                {
                    // The response is complete; further request bytes are ignored.
                    return;
                }
                do_read();
            }));
    }

    auto tcp_response_session::send(std::vector<uint8_t> data, bool shutdown_after)
        -> core::flow_signal
    {
        core::flow_signal drained;
        auto buffer = std::make_shared<std::vector<uint8_t>>(std::move(data));

        asio::post(strand_, [self = shared_from_this(), buffer, drained, shutdown_after]() {
            asio::async_write(
                self->socket_, asio::buffer(*buffer),
                asio::bind_executor(
                    self->strand_,
                    [self, buffer, drained, shutdown_after](std::error_code ec, std::size_t sent) {
                        self->bytes_sent_.fetch_add(sent, std::memory_order_relaxed);
                        if (ec)
                        {
                            STREAM_LOG_DEBUG("[tcp_response_session] Write to " +
                                             self->remote_address_ + " failed: " + ec.message());
                        }
                        if (shutdown_after)
                        {
                            std::error_code ignored;
                            self->socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
                        }
                        drained.fulfill(ec);
                    }));
        });

        return drained;
    }

    auto tcp_response_session::do_write_headers(const interfaces::response_head& head)
        -> Result<core::flow_signal>
    {
        auto text = format_chunked_head(head);
        return send(std::vector<uint8_t>(text.begin(), text.end()), false);
    }

    auto tcp_response_session::do_write_chunk(core::chunk data) -> Result<core::flow_signal>
    {
        // A zero-size frame would terminate the body.
        if (data.empty())
        {
            return core::flow_signal::fulfilled();
        }
        return send(frame_chunk(data.data()), false);
    }

    auto tcp_response_session::do_close() -> VoidResult
    {
        send(std::vector<uint8_t>(last_chunk.begin(), last_chunk.end()), true);
        return ok();
    }

    auto tcp_response_session::do_abort(const error_info& reason) -> VoidResult
    {
        STREAM_LOG_DEBUG("[tcp_response_session] Aborting response to " + remote_address_ + ": " +
                         reason.message);
        close_socket();
        return ok();
    }

    auto tcp_response_session::close_socket() -> void
    {
        asio::post(strand_, [self = shared_from_this()]() {
            std::error_code ec;
            self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            self->socket_.close(ec);
        });
    }

    auto tcp_response_session::bytes_sent() const -> uint64_t
    {
        return bytes_sent_.load(std::memory_order_relaxed);
    }

    auto tcp_response_session::remote_address() const -> const std::string&
    {
        return remote_address_;
    }

} // namespace kcenon::stream::session
