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

/**
 * @file streaming_file_server.cpp
 * @brief Serves files with HTTP/1.1 chunked streaming and backpressure
 *
 * Usage: streaming_file_server [root_dir] [port]
 *
 *   curl -v http://localhost:8080/files/big.iso -o /dev/null --limit-rate 100k
 *
 * A slow client keeps at most one chunk in flight on the server side, so
 * memory use stays flat however large the file is.
 */

#include "kcenon/stream/stream_system.h"

#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/signal_set.hpp>
#include <asio/streambuf.hpp>

#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

using namespace kcenon::stream;

namespace {

struct request_line {
    std::string method;
    std::string target;
};

auto parse_request_line(const std::string& line) -> Result<request_line> {
    auto first = line.find(' ');
    auto second = line.find(' ', first == std::string::npos ? first : first + 1);
    if (first == std::string::npos || second == std::string::npos) {
        return error<request_line>(error_codes::common_errors::invalid_argument,
                                   "Malformed request line", "file_server", line);
    }
    return ok(request_line{line.substr(0, first), line.substr(first + 1, second - first - 1)});
}

class file_server {
public:
    file_server(core::stream_context& ctx, std::filesystem::path root, unsigned short port)
        : ctx_(ctx)
        , root_(std::move(root))
        , acceptor_(ctx.io_context(), asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)) {
        errors_.add_handler(http::make_common_error_mapping());
    }

    void start() { do_accept(); }

    void stop() {
        std::error_code ec;
        acceptor_.close(ec);

        std::map<core::stream_writer*, std::shared_ptr<core::stream_writer>> active;
        {
            std::lock_guard<std::mutex> lock(writers_mutex_);
            active.swap(writers_);
        }
        for (auto& entry : active) {
            entry.second->cancel();
        }
    }

private:
    void do_accept() {
        acceptor_.async_accept(ctx_.make_strand(),
                               [this](std::error_code ec, asio::ip::tcp::socket socket) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    STREAM_LOG_WARN("[file_server] Accept failed: " + ec.message());
                }
                return;
            }
            read_request(std::make_shared<asio::ip::tcp::socket>(std::move(socket)));
            do_accept();
        });
    }

    void read_request(std::shared_ptr<asio::ip::tcp::socket> socket) {
        auto buffer = std::make_shared<asio::streambuf>();
        asio::async_read_until(*socket, *buffer, "\r\n\r\n",
                               [this, socket, buffer](std::error_code ec, std::size_t) {
            if (ec) {
                return;
            }
            std::istream in(buffer.get());
            std::string line;
            std::getline(in, line);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            respond(std::move(*socket), line);
        });
    }

    auto open_target(const std::string& line) -> Result<std::unique_ptr<sources::file_chunk_source>> {
        using source_result = Result<std::unique_ptr<sources::file_chunk_source>>;

        auto parsed = parse_request_line(line);
        if (parsed.is_err()) {
            return source_result(parsed.error());
        }
        if (parsed.value().method != "GET") {
            return error<std::unique_ptr<sources::file_chunk_source>>(
                error_codes::common_errors::permission_denied, "Only GET is served",
                "file_server", parsed.value().method);
        }

        const std::string prefix = "/files/";
        const auto& target = parsed.value().target;
        if (target.rfind(prefix, 0) != 0) {
            return error<std::unique_ptr<sources::file_chunk_source>>(
                error_codes::common_errors::not_found, "Unknown path", "file_server", target);
        }

        // "/files//etc/passwd" and symlinks out of root_ are refused here.
        return sources::file_chunk_source::open_under(root_.string(), target.substr(prefix.size()),
                                                      ctx_.config().flow.default_chunk_size);
    }

    void respond(asio::ip::tcp::socket socket, const std::string& line) {
        auto session = session::tcp_response_session::create(std::move(socket));
        session->start_monitoring();

        core::stream_options options;
        options.name = session->remote_address() + " " + line;

        std::unique_ptr<core::chunk_source> source;
        auto opened = open_target(line);
        if (opened.is_ok()) {
            options.head.headers.emplace_back("Content-Type", "application/octet-stream");
            source = std::move(opened.value());
        } else {
            auto mapped = errors_.map(opened.error());
            options.head.status_code = mapped.status_code;
            options.head.headers.emplace_back("Content-Type", "text/plain");
            source = std::make_unique<sources::buffer_chunk_source>(
                sources::buffer_chunk_source::from_string(mapped.body + "\n",
                                                          ctx_.config().flow.default_chunk_size));
            STREAM_LOG_INFO("[file_server] " + line + " -> " + std::to_string(mapped.status_code));
        }

        auto writer = core::stream_writer::create(ctx_.executor(), session, std::move(source),
                                                  options);
        {
            // Writers do not keep themselves alive; the server owns them until they complete.
            std::lock_guard<std::mutex> lock(writers_mutex_);
            writers_.emplace(writer.get(), writer);
        }

        auto started = writer->start([this, raw = writer.get(), name = options.name](
                                         const VoidResult& result) {
            if (result.is_err()) {
                STREAM_LOG_WARN("[file_server] " + name + " failed: " + result.error().message);
            }
            forget(raw);
        });
        if (started.is_err()) {
            STREAM_LOG_ERROR("[file_server] Cannot start stream: " + started.error().message);
            forget(writer.get());
        }
    }

    void forget(core::stream_writer* raw) {
        std::shared_ptr<core::stream_writer> finished;
        std::lock_guard<std::mutex> lock(writers_mutex_);
        auto it = writers_.find(raw);
        if (it != writers_.end()) {
            finished = std::move(it->second);
            writers_.erase(it);
        }
    }

    core::stream_context& ctx_;
    std::filesystem::path root_;
    asio::ip::tcp::acceptor acceptor_;
    http::error_handler_chain errors_;

    std::mutex writers_mutex_;
    std::map<core::stream_writer*, std::shared_ptr<core::stream_writer>> writers_;
};

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path root = argc > 1 ? argv[1] : ".";
    unsigned short port = argc > 2 ? static_cast<unsigned short>(std::stoi(argv[2])) : 8080;

    core::stream_context ctx(config::stream_config::development());
    auto started = ctx.start();
    if (started.is_err()) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    std::promise<void> shutdown;
    {
        file_server server(ctx, root, port);
        server.start();

        asio::signal_set signals(ctx.io_context(), SIGINT, SIGTERM);
        signals.async_wait([&](std::error_code, int) {
            server.stop();
            shutdown.set_value();
        });

        std::cout << "Serving " << std::filesystem::absolute(root) << " on port " << port
                  << std::endl;
        std::cout << "Try: curl -v http://localhost:" << port << "/files/<name>" << std::endl;

        shutdown.get_future().wait();
    }

    (void)ctx.stop();
    return 0;
}
