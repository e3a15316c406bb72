/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, kcenon
All rights reserved.
*****************************************************************************/

#include "kcenon/stream/config/stream_config.h"
#include "kcenon/stream/core/stream_context.h"
#include "kcenon/stream/integration/thread_integration.h"
#include <gtest/gtest.h>

#include <asio/post.hpp>

#include <chrono>
#include <future>
#include <memory>

using namespace kcenon::stream;
using kcenon::stream::config::stream_config;
using kcenon::stream::core::stream_context;

/**
 * @file stream_context_test.cpp
 * @brief Unit tests for stream_config presets and stream_context lifecycle
 */

// ============================================================================
// Configuration
// ============================================================================

TEST(StreamConfigTest, Defaults)
{
	stream_config cfg;

	EXPECT_EQ(cfg.thread_pool.worker_count, 0u);
	EXPECT_EQ(cfg.thread_pool.pool_name, "stream_pool");
	EXPECT_EQ(cfg.logger.min_level, integration::log_level::info);
	EXPECT_EQ(cfg.flow.default_chunk_size, 8192u);
}

TEST(StreamConfigTest, Presets)
{
	auto dev = stream_config::development();
	auto prod = stream_config::production();
	auto test = stream_config::testing();

	EXPECT_EQ(dev.logger.min_level, integration::log_level::debug);
	EXPECT_EQ(dev.thread_pool.worker_count, 2u);
	EXPECT_EQ(prod.flow.default_chunk_size, 64u * 1024u);
	EXPECT_EQ(test.thread_pool.worker_count, 4u);
	EXPECT_EQ(test.logger.min_level, integration::log_level::warn);
}

// ============================================================================
// stream_context
// ============================================================================

class StreamContextTest : public ::testing::Test
{
protected:
	void TearDown() override
	{
		integration::logger_integration_manager::instance().set_logger(nullptr);
	}

	static stream_config quiet(size_t workers)
	{
		auto cfg = stream_config::testing();
		cfg.thread_pool.worker_count = workers;
		cfg.logger.min_level = integration::log_level::error;
		return cfg;
	}
};

TEST_F(StreamContextTest, RunsPostedWork)
{
	stream_context ctx(quiet(2));
	ASSERT_TRUE(ctx.start().is_ok());
	EXPECT_TRUE(ctx.is_running());
	EXPECT_EQ(ctx.worker_count(), 2u);

	std::promise<void> ran;
	asio::post(ctx.executor(), [&ran] { ran.set_value(); });

	EXPECT_EQ(ran.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
	EXPECT_TRUE(ctx.stop().is_ok());
	EXPECT_FALSE(ctx.is_running());
}

TEST_F(StreamContextTest, DoubleStartFails)
{
	stream_context ctx(quiet(1));
	ASSERT_TRUE(ctx.start().is_ok());

	auto second = ctx.start();

	ASSERT_TRUE(second.is_err());
	EXPECT_EQ(second.error().code, error_codes::stream_system::context_already_running);
}

TEST_F(StreamContextTest, StopWithoutStartFails)
{
	stream_context ctx(quiet(1));

	auto result = ctx.stop();

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::stream_system::context_not_running);
}

TEST_F(StreamContextTest, RestartAfterStop)
{
	stream_context ctx(quiet(1));
	ASSERT_TRUE(ctx.start().is_ok());
	ASSERT_TRUE(ctx.stop().is_ok());
	ASSERT_TRUE(ctx.start().is_ok());

	std::promise<void> ran;
	asio::post(ctx.make_strand(), [&ran] { ran.set_value(); });

	EXPECT_EQ(ran.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST_F(StreamContextTest, UsesExternalPool)
{
	auto pool = std::make_shared<integration::basic_thread_pool>(3);
	{
		stream_context ctx(quiet(0), pool);
		ASSERT_TRUE(ctx.start().is_ok());
		EXPECT_EQ(ctx.worker_count(), 3u);
		ASSERT_TRUE(ctx.stop().is_ok());
	}

	// The context does not stop a pool it does not own.
	EXPECT_TRUE(pool->is_running());
}

TEST_F(StreamContextTest, InstallsLoggerAtConfiguredLevel)
{
	stream_context ctx(quiet(1));
	ASSERT_TRUE(ctx.start().is_ok());

	auto& manager = integration::logger_integration_manager::instance();
	EXPECT_FALSE(manager.is_level_enabled(integration::log_level::warn));
	EXPECT_TRUE(manager.is_level_enabled(integration::log_level::error));
}
