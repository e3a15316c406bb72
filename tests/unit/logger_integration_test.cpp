/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, kcenon
All rights reserved.
*****************************************************************************/

#include "kcenon/stream/integration/logger_integration.h"
#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace kcenon::stream::integration;

/**
 * @file logger_integration_test.cpp
 * @brief Unit tests for the logger integration layer and STREAM_LOG macros
 */

namespace
{
	class capture_logger : public logger_interface
	{
	public:
		explicit capture_logger(log_level min_level) : min_level_(min_level) {}

		void log(log_level level, const std::string& message) override
		{
			std::lock_guard<std::mutex> lock(mutex_);
			records_.push_back({level, message, ""});
		}

		void log(log_level level, const std::string& message, const std::string& file, int,
				 const std::string&) override
		{
			std::lock_guard<std::mutex> lock(mutex_);
			records_.push_back({level, message, file});
		}

		bool is_level_enabled(log_level level) const override
		{
			return static_cast<int>(level) >= static_cast<int>(min_level_);
		}

		void flush() override {}

		struct record
		{
			log_level level;
			std::string message;
			std::string file;
		};

		std::vector<record> records() const
		{
			std::lock_guard<std::mutex> lock(mutex_);
			return records_;
		}

	private:
		log_level min_level_;
		mutable std::mutex mutex_;
		std::vector<record> records_;
	};
} // namespace

class LoggerIntegrationTest : public ::testing::Test
{
protected:
	void TearDown() override { logger_integration_manager::instance().set_logger(nullptr); }
};

TEST_F(LoggerIntegrationTest, MacrosRouteToInstalledLogger)
{
	auto logger = std::make_shared<capture_logger>(log_level::trace);
	logger_integration_manager::instance().set_logger(logger);

	STREAM_LOG_INFO("hello");
	STREAM_LOG_ERROR(std::string("fail ") + "now");

	auto records = logger->records();
	ASSERT_EQ(records.size(), 2u);
	EXPECT_EQ(records[0].level, log_level::info);
	EXPECT_EQ(records[0].message, "hello");
	EXPECT_EQ(records[1].level, log_level::error);
	EXPECT_EQ(records[1].message, "fail now");
	EXPECT_NE(records[0].file.find("logger_integration_test"), std::string::npos);
}

TEST_F(LoggerIntegrationTest, DisabledLevelIsNotFormatted)
{
	auto logger = std::make_shared<capture_logger>(log_level::warn);
	logger_integration_manager::instance().set_logger(logger);
	int evaluated = 0;
	auto message = [&] {
		++evaluated;
		return std::string("expensive");
	};

	STREAM_LOG_DEBUG(message());
	STREAM_LOG_WARN(message());

	EXPECT_EQ(evaluated, 1);
	EXPECT_EQ(logger->records().size(), 1u);
}

TEST_F(LoggerIntegrationTest, NullRestoresDefaultLogger)
{
	auto logger = std::make_shared<capture_logger>(log_level::trace);
	logger_integration_manager::instance().set_logger(logger);

	logger_integration_manager::instance().set_logger(nullptr);

	auto current = logger_integration_manager::instance().get_logger();
	ASSERT_NE(current, nullptr);
	EXPECT_NE(current, logger);
}

TEST(BasicLoggerTest, MinLevelFilters)
{
	basic_logger logger(log_level::warn);

	EXPECT_FALSE(logger.is_level_enabled(log_level::info));
	EXPECT_TRUE(logger.is_level_enabled(log_level::warn));
	EXPECT_TRUE(logger.is_level_enabled(log_level::fatal));

	logger.set_min_level(log_level::trace);
	EXPECT_EQ(logger.get_min_level(), log_level::trace);
	EXPECT_TRUE(logger.is_level_enabled(log_level::trace));
}

TEST(BasicLoggerTest, LevelNames)
{
	EXPECT_STREQ(to_string(log_level::trace), "TRACE");
	EXPECT_STREQ(to_string(log_level::warn), "WARN ");
	EXPECT_STREQ(to_string(log_level::fatal), "FATAL");
}
