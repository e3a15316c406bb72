/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, kcenon
All rights reserved.
*****************************************************************************/

#include "kcenon/stream/sources/buffer_chunk_source.h"
#include "kcenon/stream/sources/file_chunk_source.h"
#include "kcenon/stream/sources/function_chunk_source.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace kcenon::stream;
using namespace kcenon::stream::sources;

/**
 * @file chunk_source_test.cpp
 * @brief Unit tests for the built-in chunk sources
 */

namespace
{
	std::string payload_of(const core::next_result& result)
	{
		const auto& data = result.value()->data();
		return std::string(data.begin(), data.end());
	}
} // namespace

// ============================================================================
// buffer_chunk_source
// ============================================================================

TEST(BufferChunkSourceTest, SplitsIntoFixedSlices)
{
	auto source = buffer_chunk_source::from_string("abcdefghij", 4);

	EXPECT_EQ(source.chunk_count(), 3u);

	auto first = source.next(0);
	ASSERT_TRUE(first.is_ok());
	ASSERT_TRUE(first.value().has_value());
	EXPECT_EQ(payload_of(first), "abcd");
	EXPECT_FALSE(first.value()->is_last());

	EXPECT_EQ(payload_of(source.next(1)), "efgh");

	auto last = source.next(2);
	EXPECT_EQ(payload_of(last), "ij");
	EXPECT_TRUE(last.value()->is_last());
	EXPECT_EQ(last.value()->index(), 2u);

	auto end = source.next(3);
	ASSERT_TRUE(end.is_ok());
	EXPECT_FALSE(end.value().has_value());
}

TEST(BufferChunkSourceTest, ExactMultipleMarksFinalSliceLast)
{
	auto source = buffer_chunk_source::from_string("abcdef", 3);

	EXPECT_FALSE(source.next(0).value()->is_last());
	EXPECT_TRUE(source.next(1).value()->is_last());
}

TEST(BufferChunkSourceTest, EmptyBodyEndsImmediately)
{
	buffer_chunk_source source({}, 16);

	auto result = source.next(0);

	ASSERT_TRUE(result.is_ok());
	EXPECT_FALSE(result.value().has_value());
}

TEST(BufferChunkSourceTest, ZeroChunkSizeIsInvalid)
{
	auto source = buffer_chunk_source::from_string("abc", 0);

	auto result = source.next(0);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::common_errors::invalid_argument);
}

// ============================================================================
// function_chunk_source
// ============================================================================

TEST(FunctionChunkSourceTest, ForwardsToCallable)
{
	function_chunk_source source([](uint64_t index) -> core::next_result {
		if (index == 2)
		{
			return core::end_of_stream();
		}
		return core::produced(core::chunk::from_string(index, "row" + std::to_string(index)));
	});

	EXPECT_EQ(payload_of(source.next(0)), "row0");
	EXPECT_EQ(payload_of(source.next(1)), "row1");
	EXPECT_FALSE(source.next(2).value().has_value());
}

TEST(FunctionChunkSourceTest, ReleaseRunsCallbackOnce)
{
	int released = 0;
	function_chunk_source source([](uint64_t) { return core::end_of_stream(); },
								 [&] { ++released; });

	source.release();
	source.release();

	EXPECT_EQ(released, 1);
	EXPECT_TRUE(source.next(0).is_err());
}

// ============================================================================
// file_chunk_source
// ============================================================================

class FileChunkSourceTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		path_ = (std::filesystem::temp_directory_path() /
				 ("stream_file_source_" + std::to_string(::testing::UnitTest::GetInstance()
															 ->random_seed()) +
				  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name()))
					.string();
	}

	void TearDown() override
	{
		std::error_code ec;
		std::filesystem::remove(path_, ec);
	}

	void write_file(const std::string& content)
	{
		std::ofstream out(path_, std::ios::binary);
		out << content;
	}

	std::string path_;
};

TEST_F(FileChunkSourceTest, ReadsSegmentsAndMarksLast)
{
	write_file("0123456789");

	auto opened = file_chunk_source::open(path_, 4);
	ASSERT_TRUE(opened.is_ok());
	auto& source = *opened.value();

	EXPECT_EQ(source.file_size(), 10u);
	EXPECT_EQ(payload_of(source.next(0)), "0123");
	EXPECT_EQ(payload_of(source.next(1)), "4567");

	auto last = source.next(2);
	EXPECT_EQ(payload_of(last), "89");
	EXPECT_TRUE(last.value()->is_last());

	EXPECT_FALSE(source.next(3).value().has_value());
}

TEST_F(FileChunkSourceTest, EmptyFileEndsImmediately)
{
	write_file("");

	auto opened = file_chunk_source::open(path_, 4);
	ASSERT_TRUE(opened.is_ok());

	auto result = opened.value()->next(0);
	ASSERT_TRUE(result.is_ok());
	EXPECT_FALSE(result.value().has_value());
}

TEST_F(FileChunkSourceTest, MissingFileIsNotFound)
{
	auto opened = file_chunk_source::open(path_ + ".missing", 4);

	ASSERT_TRUE(opened.is_err());
	EXPECT_EQ(opened.error().code, error_codes::common_errors::not_found);
}

TEST_F(FileChunkSourceTest, ReleaseClosesFile)
{
	write_file("abc");
	auto opened = file_chunk_source::open(path_, 2);
	ASSERT_TRUE(opened.is_ok());
	auto& source = *opened.value();

	source.release();

	EXPECT_FALSE(source.is_open());
	auto result = source.next(0);
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::common_errors::not_initialized);
}

TEST_F(FileChunkSourceTest, ZeroChunkSizeIsInvalid)
{
	write_file("abc");

	auto opened = file_chunk_source::open(path_, 0);

	ASSERT_TRUE(opened.is_err());
	EXPECT_EQ(opened.error().code, error_codes::common_errors::invalid_argument);
}

// ============================================================================
// file_chunk_source root confinement
// ============================================================================

class FileChunkSourceRootTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		base_ = std::filesystem::temp_directory_path() /
				("stream_file_root_" +
				 std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
				 ::testing::UnitTest::GetInstance()->current_test_info()->name());
		root_ = base_ / "served";
		std::filesystem::create_directories(root_ / "sub");
		write(root_ / "a.txt", "inside");
		write(root_ / "sub" / "b.txt", "nested");
		write(base_ / "secret.txt", "outside");
	}

	void TearDown() override
	{
		std::error_code ec;
		std::filesystem::remove_all(base_, ec);
	}

	static void write(const std::filesystem::path& path, const std::string& content)
	{
		std::ofstream out(path, std::ios::binary);
		out << content;
	}

	std::filesystem::path base_;
	std::filesystem::path root_;
};

TEST_F(FileChunkSourceRootTest, ResolvesNamesInsideRoot)
{
	auto direct = file_chunk_source::resolve_under(root_.string(), "a.txt");
	ASSERT_TRUE(direct.is_ok());
	EXPECT_EQ(std::filesystem::path(direct.value()),
			  std::filesystem::weakly_canonical(root_ / "a.txt"));

	auto nested = file_chunk_source::resolve_under(root_.string(), "sub/../sub/b.txt");
	ASSERT_TRUE(nested.is_ok());
	EXPECT_EQ(std::filesystem::path(nested.value()),
			  std::filesystem::weakly_canonical(root_ / "sub" / "b.txt"));
}

TEST_F(FileChunkSourceRootTest, AbsoluteNameIsRefused)
{
	// What "/files//etc/passwd" leaves after the route prefix.
	auto result = file_chunk_source::resolve_under(root_.string(), "/etc/passwd");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::common_errors::permission_denied);

	auto absolute_inside = file_chunk_source::resolve_under(root_.string(),
															(root_ / "a.txt").string());
	ASSERT_TRUE(absolute_inside.is_err());
	EXPECT_EQ(absolute_inside.error().code, error_codes::common_errors::permission_denied);
}

TEST_F(FileChunkSourceRootTest, TraversalOutOfRootIsRefused)
{
	for (const std::string name : {"../secret.txt", "sub/../../secret.txt", "..", "."})
	{
		auto result = file_chunk_source::resolve_under(root_.string(), name);
		ASSERT_TRUE(result.is_err()) << name;
		EXPECT_EQ(result.error().code, error_codes::common_errors::permission_denied) << name;
	}
}

TEST_F(FileChunkSourceRootTest, SymlinkOutOfRootIsRefused)
{
	std::error_code ec;
	std::filesystem::create_symlink(base_ / "secret.txt", root_ / "link.txt", ec);
	if (ec)
	{
		GTEST_SKIP() << "symlinks unavailable: " << ec.message();
	}

	auto result = file_chunk_source::resolve_under(root_.string(), "link.txt");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::common_errors::permission_denied);
}

TEST_F(FileChunkSourceRootTest, EmptyNameIsInvalid)
{
	auto result = file_chunk_source::resolve_under(root_.string(), "");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::common_errors::invalid_argument);
}

TEST_F(FileChunkSourceRootTest, OpenUnderStreamsConfinedFile)
{
	auto opened = file_chunk_source::open_under(root_.string(), "sub/b.txt", 64);
	ASSERT_TRUE(opened.is_ok());
	EXPECT_EQ(payload_of(opened.value()->next(0)), "nested");

	auto refused = file_chunk_source::open_under(root_.string(), "/etc/passwd", 64);
	ASSERT_TRUE(refused.is_err());
	EXPECT_EQ(refused.error().code, error_codes::common_errors::permission_denied);

	auto missing = file_chunk_source::open_under(root_.string(), "nope.txt", 64);
	ASSERT_TRUE(missing.is_err());
	EXPECT_EQ(missing.error().code, error_codes::common_errors::not_found);
}
