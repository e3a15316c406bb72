/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, kcenon
All rights reserved.
*****************************************************************************/

#include "kcenon/stream/core/stream_writer.h"
#include "kcenon/stream/session/tcp_response_session.h"
#include "kcenon/stream/sources/buffer_chunk_source.h"
#include "kcenon/stream/sources/function_chunk_source.h"
#include <gtest/gtest.h>

#include <asio/connect.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace kcenon::stream;
using kcenon::stream::core::stream_writer;
using kcenon::stream::session::tcp_response_session;

/**
 * @file tcp_streaming_test.cpp
 * @brief End-to-end streaming over loopback TCP with HTTP/1.1 chunked framing
 *
 * Tests validate:
 * - A client receives the head and a decodable chunked body
 * - A source failure truncates the body (no terminating chunk)
 * - A client that disconnects early stops the writer
 * - A finished session does not outlive its response
 */

namespace
{
	struct decoded_response
	{
		std::string head;
		std::string body;
		bool terminated{false};
	};

	/**
	 * @brief Split a raw response into its head and de-chunked body
	 */
	decoded_response decode(const std::string& raw)
	{
		decoded_response out;
		auto head_end = raw.find("\r\n\r\n");
		if (head_end == std::string::npos)
		{
			out.head = raw;
			return out;
		}
		out.head = raw.substr(0, head_end + 4);

		size_t pos = head_end + 4;
		while (pos < raw.size())
		{
			auto line_end = raw.find("\r\n", pos);
			if (line_end == std::string::npos)
			{
				break;
			}
			const auto size = std::stoul(raw.substr(pos, line_end - pos), nullptr, 16);
			pos = line_end + 2;
			if (size == 0)
			{
				out.terminated = raw.compare(pos, 2, "\r\n") == 0;
				break;
			}
			if (pos + size + 2 > raw.size())
			{
				break;
			}
			out.body.append(raw, pos, size);
			pos += size + 2;
		}
		return out;
	}
} // namespace

class TcpStreamingTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		work_guard_.emplace(asio::make_work_guard(io_));
		acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(
			io_, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
		port_ = acceptor_->local_endpoint().port();
		io_thread_ = std::thread([this] { io_.run(); });
	}

	void TearDown() override
	{
		asio::post(io_, [this] {
			std::error_code ec;
			acceptor_->close(ec);
		});
		work_guard_.reset();
		io_.stop();
		if (io_thread_.joinable())
		{
			io_thread_.join();
		}
	}

	/**
	 * @brief Accept one connection and stream @p source over it
	 */
	void serve(std::unique_ptr<core::chunk_source> source, core::stream_options options = {})
	{
		acceptor_->async_accept(
			[this, source = std::shared_ptr<core::chunk_source>(std::move(source)),
			 options](std::error_code ec, asio::ip::tcp::socket socket) mutable {
				if (ec)
				{
					return;
				}
				auto session = tcp_response_session::create(std::move(socket));
				session->start_monitoring();
				{
					std::lock_guard<std::mutex> lock(session_mutex_);
					session_ref_ = session;
				}

				auto owned = std::unique_ptr<core::chunk_source>(new forwarding_source(source));
				writer_ = stream_writer::create(io_.get_executor(), session, std::move(owned),
												options);
				writer_->start([this](const VoidResult& result) {
					completion_.set_value(result.is_ok());
				});
			});
	}

	asio::ip::tcp::socket connect_client()
	{
		asio::ip::tcp::socket client(client_io_);
		client.connect(asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), port_));
		return client;
	}

	static std::string read_all(asio::ip::tcp::socket& client)
	{
		std::string raw;
		std::error_code ec;
		asio::read(client, asio::dynamic_buffer(raw), ec);
		return raw;
	}

	bool wait_completion(bool& ok)
	{
		auto future = completion_.get_future();
		if (future.wait_for(std::chrono::seconds(10)) != std::future_status::ready)
		{
			return false;
		}
		ok = future.get();
		return true;
	}

	/**
	 * @brief Lets the accept handler hand a shared source to the writer
	 */
	class forwarding_source : public core::chunk_source
	{
	public:
		explicit forwarding_source(std::shared_ptr<core::chunk_source> inner)
			: inner_(std::move(inner))
		{
		}

		auto next(uint64_t index) -> core::next_result override { return inner_->next(index); }
		auto release() -> void override { inner_->release(); }

	private:
		std::shared_ptr<core::chunk_source> inner_;
	};

	asio::io_context io_;
	asio::io_context client_io_;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
	std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
	unsigned short port_{0};
	std::thread io_thread_;

	bool wait_session_released()
	{
		const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
		while (std::chrono::steady_clock::now() < deadline)
		{
			{
				std::lock_guard<std::mutex> lock(session_mutex_);
				if (session_ref_.expired())
				{
					return true;
				}
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(5));
		}
		return false;
	}

	std::shared_ptr<stream_writer> writer_;
	std::promise<bool> completion_;
	std::mutex session_mutex_;
	std::weak_ptr<tcp_response_session> session_ref_;
};

TEST_F(TcpStreamingTest, ClientReceivesChunkedBody)
{
	std::string body;
	for (int i = 0; i < 1000; ++i)
	{
		body += "line " + std::to_string(i) + "\n";
	}

	core::stream_options options;
	options.name = "tcp-body";
	options.head.headers.emplace_back("Content-Type", "text/plain");
	options.head.headers.emplace_back("Content-Length", "999");
	serve(std::make_unique<sources::buffer_chunk_source>(
			  sources::buffer_chunk_source::from_string(body, 1000)),
		  options);

	auto client = connect_client();
	auto response = decode(read_all(client));

	bool ok = false;
	ASSERT_TRUE(wait_completion(ok));
	EXPECT_TRUE(ok);

	EXPECT_EQ(response.head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
	EXPECT_NE(response.head.find("Content-Type: text/plain\r\n"), std::string::npos);
	EXPECT_NE(response.head.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
	EXPECT_NE(response.head.find("Connection: close\r\n"), std::string::npos);
	EXPECT_EQ(response.head.find("Content-Length"), std::string::npos);
	EXPECT_TRUE(response.terminated);
	EXPECT_EQ(response.body, body);
	EXPECT_EQ(writer_->state(), core::stream_state::closed);
}

TEST_F(TcpStreamingTest, SourceFailureTruncatesBody)
{
	serve(std::make_unique<sources::function_chunk_source>([](uint64_t index) -> core::next_result {
		if (index == 2)
		{
			return error<std::optional<core::chunk>>(error_codes::stream_system::source_error,
													 "cursor lost", "test");
		}
		return core::produced(core::chunk::from_string(index, "part" + std::to_string(index)));
	}));

	auto client = connect_client();
	auto response = decode(read_all(client));

	bool ok = true;
	ASSERT_TRUE(wait_completion(ok));
	EXPECT_FALSE(ok);

	EXPECT_EQ(response.body, "part0part1");
	EXPECT_FALSE(response.terminated);
	EXPECT_EQ(writer_->reason(), core::termination_reason::source_error);
}

TEST_F(TcpStreamingTest, EarlyDisconnectStopsWriter)
{
	// Large enough that the writer is still running when the client leaves.
	std::string body(16 * 1024 * 1024, 'x');
	serve(std::make_unique<sources::buffer_chunk_source>(
		sources::buffer_chunk_source::from_string(body, 64 * 1024)));

	{
		auto client = connect_client();
		std::string head;
		asio::read_until(client, asio::dynamic_buffer(head), "\r\n\r\n");
		std::error_code ec;
		client.close(ec);
	}

	bool ok = false;
	ASSERT_TRUE(wait_completion(ok));

	EXPECT_EQ(writer_->state(), core::stream_state::failed);
	auto reason = writer_->reason();
	EXPECT_TRUE(reason == core::termination_reason::cancelled ||
				reason == core::termination_reason::transport_error);
	EXPECT_LT(writer_->bytes_written(), body.size());
}

TEST_F(TcpStreamingTest, FinishedSessionIsReleasedWhileClientStaysConnected)
{
	serve(std::make_unique<sources::buffer_chunk_source>(
		sources::buffer_chunk_source::from_string("short body", 4)));

	auto client = connect_client();
	auto response = decode(read_all(client));

	bool ok = false;
	ASSERT_TRUE(wait_completion(ok));
	EXPECT_TRUE(ok);
	EXPECT_TRUE(response.terminated);
	EXPECT_EQ(response.body, "short body");

	// A client that keeps talking must not keep the finished session alive.
	const std::string extra = "GET /again HTTP/1.1\r\n\r\n";
	std::error_code ec;
	asio::write(client, asio::buffer(extra), ec);

	EXPECT_TRUE(wait_session_released());
}

TEST(ChunkFramingTest, HeadAndFrames)
{
	interfaces::response_head head;
	head.status_code = 404;
	head.headers.emplace_back("X-Trace", "abc");
	head.headers.emplace_back("transfer-encoding", "identity");

	head.headers.emplace_back("Connection", "keep-alive");

	EXPECT_EQ(session::format_chunked_head(head),
			  "HTTP/1.1 404 Not Found\r\nX-Trace: abc\r\nTransfer-Encoding: chunked\r\n"
			  "Connection: close\r\n\r\n");

	std::vector<uint8_t> payload(26, 'a');
	auto frame = session::frame_chunk(payload);
	std::string text(frame.begin(), frame.end());
	EXPECT_EQ(text, "1a\r\n" + std::string(26, 'a') + "\r\n");
}
