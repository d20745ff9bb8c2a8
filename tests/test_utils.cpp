#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/types.hpp>
#include <util/string_utils.hpp>

TEST(ShellQuoteTest, WrapsInSingleQuotes) {
    EXPECT_EQ(shell_quote("report.txt"), "'report.txt'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(ShellQuoteTest, EscapesEmbeddedQuote) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(ShellQuoteTest, LeavesShellMetacharactersInert) {
    EXPECT_EQ(shell_quote("$(rm -rf /); `x` \"y\""), "'$(rm -rf /); `x` \"y\"'");
}

TEST(ShellQuoteTest, TokenizerRecoversOriginalWord) {
    const std::string nasty = "a b'c\"d $HOME";
    auto words = StringUtils::tokenize("cp -- " + shell_quote(nasty));
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[2], nasty);
}

TEST(TokenizeTest, SplitsOnWhitespace) {
    auto words = StringUtils::tokenize("  ls   -S  /tmp ");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "ls");
    EXPECT_EQ(words[1], "-S");
    EXPECT_EQ(words[2], "/tmp");
}

TEST(TokenizeTest, QuotesGroupWords) {
    auto words = StringUtils::tokenize("mv \"My Documents\" 'new name'");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[1], "My Documents");
    EXPECT_EQ(words[2], "new name");
}

TEST(TokenizeTest, EmptyQuotesMakeEmptyWord) {
    auto words = StringUtils::tokenize("touch ''");
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[1], "");
}

TEST(StringUtilsTest, SplitAndTrim) {
    auto parts = StringUtils::split("a,b,,c", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(StringUtils::trim("  tab1 \n"), "tab1");
    EXPECT_EQ(StringUtils::trim("   "), "");
}

TEST(FormatTest, Mode) {
    EXPECT_EQ(format_mode(0040755), "drwxr-xr-x");
    EXPECT_EQ(format_mode(0100644), "-rw-r--r--");
    EXPECT_EQ(format_mode(0100600), "-rw-------");
}

TEST(FormatTest, Size) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(512), "512 B");
    EXPECT_EQ(format_size(1536), "1.5 KB");
    EXPECT_EQ(format_size(5ull * 1024 * 1024), "5.0 MB");
}

TEST(SafeStoiTest, FallsBack) {
    EXPECT_EQ(safe_stoi("22"), 22);
    EXPECT_EQ(safe_stoi("abc", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
}

TEST(ResultTest, CarriesKind) {
    auto ok = Result<int>::Ok(3);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.kind, ErrorKind::None);

    auto err = Result<int>::Err(ErrorKind::RemoteIO, "boom");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.kind, ErrorKind::RemoteIO);
    EXPECT_EQ(err.error, "boom");

    auto plain = Result<void>::Err("plain");
    EXPECT_EQ(plain.kind, ErrorKind::Other);
}
