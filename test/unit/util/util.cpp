#include "util/util.hpp"

#include "data.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(parseInt64, Simple)
{
    EXPECT_EQ(0, Util::parseInt64("0"));
    EXPECT_EQ(1048575, Util::parseInt64("1048575"));
    EXPECT_EQ(-7, Util::parseInt64("-7"));
    EXPECT_EQ(9223372036854775807ll, Util::parseInt64("9223372036854775807"));
}

TEST(parseInt64, Bad)
{
    EXPECT_THROW(Util::parseInt64(""), std::invalid_argument);
    EXPECT_THROW(Util::parseInt64("bytes"), std::invalid_argument);
    EXPECT_THROW(Util::parseInt64(" 5"), std::invalid_argument);
    EXPECT_THROW(Util::parseInt64("5 "), std::invalid_argument);
    EXPECT_THROW(Util::parseInt64("+5"), std::invalid_argument);
    EXPECT_THROW(Util::parseInt64("1.5"), std::invalid_argument);
    EXPECT_THROW(Util::parseInt64("9223372036854775808"), std::out_of_range);
}

TEST(endsWithCaseInsensitive, Simple)
{
    EXPECT_TRUE(Util::endsWithCaseInsensitive("movie.mkv", ".mkv"));
    EXPECT_TRUE(Util::endsWithCaseInsensitive("MOVIE.MKV", ".mkv"));
    EXPECT_TRUE(Util::endsWithCaseInsensitive("movie.mkv", ".MkV"));
    EXPECT_FALSE(Util::endsWithCaseInsensitive("movie.mkv", ".mp4"));
}

TEST(endsWithCaseInsensitive, Lengths)
{
    EXPECT_TRUE(Util::endsWithCaseInsensitive(".mp4", ".mp4"));
    EXPECT_TRUE(Util::endsWithCaseInsensitive("anything", ""));
    EXPECT_FALSE(Util::endsWithCaseInsensitive("mp4", ".mp4"));
    EXPECT_FALSE(Util::endsWithCaseInsensitive("", ".mp4"));
}

TEST(endsWithCaseInsensitive, OnlyAscii)
{
    // '@' and '`' sit either side of the letters, and mustn't be folded into them.
    EXPECT_FALSE(Util::endsWithCaseInsensitive("a@", "a`"));
    EXPECT_FALSE(Util::endsWithCaseInsensitive("x[", "x{"));
}

TEST(concatenate, Parts)
{
    using Bytes = std::vector<std::byte>;
    EXPECT_EQ(Bytes(), Util::concatenate({}));
    EXPECT_EQ(Bytes({std::byte(1), std::byte(2)}), Util::concatenate({Bytes({std::byte(1), std::byte(2)})}));
    EXPECT_EQ(Bytes({std::byte(1), std::byte(2), std::byte(3)}),
              Util::concatenate({Bytes({std::byte(1)}), Bytes(), Bytes({std::byte(2), std::byte(3)})}));
}

TEST(readFile, WriteThenRead)
{
    TemporaryDirectory dir("UtilReadFile");
    Util::writeFile(dir / "segment.ts", "old contents");
    Util::writeFile(dir / "segment.ts", "new");
    std::vector<std::byte> data = Util::readFile(dir / "segment.ts");
    EXPECT_EQ("new", std::string((const char *)data.data(), data.size()));

    EXPECT_THROW(Util::readFile(dir / "missing"), std::exception);
}
