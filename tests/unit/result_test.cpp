/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, kcenon
All rights reserved.
*****************************************************************************/

#include "kcenon/stream/types/result.h"
#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>

namespace stream = kcenon::stream;

/**
 * @file result_test.cpp
 * @brief Unit tests for Result<T>, helpers and error codes
 */

// ============================================================================
// Result<T>
// ============================================================================

TEST(ResultTest, OkCarriesValue)
{
	auto result = stream::ok(42);

	EXPECT_TRUE(result.is_ok());
	EXPECT_FALSE(result.is_err());
	EXPECT_TRUE(static_cast<bool>(result));
	EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, OkFromLvalueCopies)
{
	std::string value = "hello";
	auto result = stream::ok(value);

	static_assert(std::is_same_v<decltype(result), stream::Result<std::string>>);
	EXPECT_EQ(result.value(), "hello");
	EXPECT_EQ(value, "hello");
}

TEST(ResultTest, MoveOnlyValue)
{
	auto result = stream::ok(std::make_unique<int>(7));

	ASSERT_TRUE(result.is_ok());
	auto owned = std::move(result.value());
	EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, ErrorCarriesInfo)
{
	auto result = stream::error<int>(stream::error_codes::common_errors::not_found, "missing",
									 "test", "key=a");

	ASSERT_TRUE(result.is_err());
	EXPECT_FALSE(static_cast<bool>(result));
	EXPECT_EQ(result.error().code, stream::error_codes::common_errors::not_found);
	EXPECT_EQ(result.error().message, "missing");
	EXPECT_EQ(result.error().source, "test");
	EXPECT_EQ(result.error().details, "key=a");
}

TEST(ResultTest, DefaultErrorSource)
{
	auto result = stream::error_void(stream::error_codes::stream_system::transport_error, "reset");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().source, "stream_system");
	EXPECT_TRUE(result.error().details.empty());
}

TEST(ResultTest, VoidOk)
{
	auto result = stream::ok();

	EXPECT_TRUE(result.is_ok());
}

// ============================================================================
// Error Codes
// ============================================================================

TEST(ErrorCodesTest, StreamCodesAreDistinctAndNegative)
{
	namespace codes = stream::error_codes::stream_system;
	std::set<int> values = {codes::source_error, codes::transport_error, codes::cancelled,
							codes::protocol_violation, codes::context_not_running,
							codes::context_already_running};

	EXPECT_EQ(values.size(), 6u);
	for (int v : values)
	{
		EXPECT_LT(v, 0);
		EXPECT_LE(v, -800);
		EXPECT_GT(v, -900);
	}
}

TEST(ErrorCodesTest, StreamCodesDoNotOverlapCommonCodes)
{
	namespace codes = stream::error_codes;

	EXPECT_NE(codes::stream_system::cancelled, codes::common_errors::cancelled);
	EXPECT_GT(codes::common_errors::internal_error, codes::stream_system::source_error);
}
