#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "utils/file_utils.hpp"
#include "utils/line_buffer.hpp"
#include "utils/string_utils.hpp"
#include "utils/uuid.hpp"

#include "temporary_directory.hpp"


using testing::ElementsAre;
using testing::Eq;
using testing::IsEmpty;
using testing::IsTrue;

namespace
{
	TEST(FileUtilsTest, ParsesUrlListSkippingCommentsAndBlanks)
	{
		TemporaryDirectory directory;
		const auto path = directory.write_file(
				"urls.txt",
				"# favourites\n"
				"https://www.youtube.com/watch?v=JC-uvbOfag4\n"
				"\n"
				"   https://youtu.be/ABC123DEF456   \r\n"
				"  # indented comment\n"
				"https://www.nicovideo.jp/watch/sm33593693"
		);

		EXPECT_THAT(
				parse_url_list_file(path),
				ElementsAre(
						"https://www.youtube.com/watch?v=JC-uvbOfag4",
						"https://youtu.be/ABC123DEF456",
						"https://www.nicovideo.jp/watch/sm33593693"
				)
		);
	}

	TEST(FileUtilsTest, EmptyListFileHasNoUrls)
	{
		TemporaryDirectory directory;
		const auto path = directory.write_file("urls.txt", "\n# nothing yet\n");

		EXPECT_THAT(parse_url_list_file(path), IsEmpty());
	}

	TEST(FileUtilsTest, MissingListFileFails)
	{
		TemporaryDirectory directory;

		EXPECT_THROW(static_cast<void>(parse_url_list_file(directory.path() / "absent.txt")), FileReadError);
	}

	TEST(StringUtilsTest, TrimsBothEnds)
	{
		EXPECT_THAT(trim("  \tvalue with spaces \n"), Eq("value with spaces"));
		EXPECT_THAT(trim("   "), Eq(""));
		EXPECT_THAT(trim(""), Eq(""));
	}

	TEST(LineBufferTest, EmitsCompleteLinesAcrossChunks)
	{
		LineBuffer buffer("\n\r");
		std::vector<std::string> lines;
		const auto collect = [&lines](std::string_view line) { lines.emplace_back(line); };

		buffer.append("first li", collect);
		buffer.append("ne\r\nsecond\n\nthi", collect);
		EXPECT_THAT(lines, ElementsAre("first line", "second"));

		buffer.flush(collect);
		EXPECT_THAT(lines, ElementsAre("first line", "second", "thi"));
	}

	TEST(UuidTest, GeneratesDistinctVersionFourIdentifiers)
	{
		const std::regex uuid_regex("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

		std::unordered_set<std::string> seen;
		for(int i = 0; i < 100; ++i)
		{
			const auto uuid = generate_uuid();
			EXPECT_THAT(std::regex_match(uuid, uuid_regex), IsTrue());
			seen.insert(uuid);
		}

		EXPECT_THAT(seen.size(), Eq(100u));
	}
}
