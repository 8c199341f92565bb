#include "parafetch/filename_sanitizer.hpp"

#include "support/temp_dir.hpp"

#include <regex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace parafetch {
namespace {

bool looksLikeFallback(const std::string& name) {
    static const std::regex pattern{"download_[0-9a-f]{8}"};
    return std::regex_match(name, pattern);
}

TEST(FilenameSanitizerTest, KeepsOrdinaryNames) {
    EXPECT_EQ(sanitizeFilename("hello.txt"), "hello.txt");
    EXPECT_EQ(sanitizeFilename("archive.tar.gz"), "archive.tar.gz");
}

TEST(FilenameSanitizerTest, DecodesPercentEncoding) {
    EXPECT_EQ(sanitizeFilename("my%20report.pdf"), "my report.pdf");
}

TEST(FilenameSanitizerTest, ReplacesSeparatorsAfterDecoding) {
    const auto name = sanitizeFilename("..%2F..%2Fetc%2Fpasswd");
    EXPECT_EQ(name.find('/'), std::string::npos);
    EXPECT_NE(name.front(), '.');
    EXPECT_EQ(name, "_.._etc_passwd");
}

TEST(FilenameSanitizerTest, CatchesDoubleEncodedSeparators) {
    const auto name = sanitizeFilename("%252e%252e%252fsecret");
    EXPECT_EQ(name.find('/'), std::string::npos);
    EXPECT_EQ(name, "_secret");
}

TEST(FilenameSanitizerTest, StripsSurroundingWhitespaceAndDots) {
    EXPECT_EQ(sanitizeFilename("  ..file.bin.. "), "file.bin");
}

TEST(FilenameSanitizerTest, DropsControlAndReservedCharacters) {
    EXPECT_EQ(sanitizeFilename(std::string("a\x01" "b\x7f" "c")), "abc");
    EXPECT_EQ(sanitizeFilename("a<b>c:d|e?f*g\"h\\i"), "a_b_c_d_e_f_g_h_i");
}

TEST(FilenameSanitizerTest, DegenerateInputGetsRandomFallback) {
    for (const std::string raw : {"", "   ", "..", "...", " . . ", "%2e%2e"}) {
        const auto name = sanitizeFilename(raw);
        EXPECT_TRUE(looksLikeFallback(name)) << "input '" << raw << "' gave '" << name << "'";
    }
}

TEST(FilenameSanitizerTest, IsDeterministicForRegularInput) {
    EXPECT_EQ(sanitizeFilename("data%20set.csv"), sanitizeFilename("data%20set.csv"));
}

TEST(FilenameSanitizerTest, TruncatesOverlongNames) {
    const auto name = sanitizeFilename(std::string(400, 'x'));
    EXPECT_EQ(name.size(), 255u);
}

TEST(FilenameSanitizerTest, TruncationKeepsUtf8SequencesWhole) {
    // U+00E9 is two bytes; the 255-byte limit falls between them.
    const auto two_byte = sanitizeFilename(std::string(254, 'x') + "\xC3\xA9" + "tail");
    EXPECT_EQ(two_byte, std::string(254, 'x'));

    // U+20AC is three bytes starting at offset 253.
    const auto three_byte = sanitizeFilename(std::string(253, 'x') + "\xE2\x82\xAC" + "yy");
    EXPECT_EQ(three_byte, std::string(253, 'x'));

    // A sequence ending exactly at the limit is kept.
    const auto fits = sanitizeFilename(std::string(253, 'x') + "\xC3\xA9" + "zz");
    EXPECT_EQ(fits, std::string(253, 'x') + "\xC3\xA9");
}

TEST(FilenameSanitizerTest, FilenameFromUrlUsesLastPathSegment) {
    EXPECT_EQ(filenameFromUrl("http://example.com/files/hello.txt"), "hello.txt");
    EXPECT_EQ(filenameFromUrl("http://example.com/files/report.pdf?token=abc#page=2"), "report.pdf");
    EXPECT_EQ(filenameFromUrl("http://example.com/redir"), "redir");
    EXPECT_TRUE(looksLikeFallback(filenameFromUrl("http://example.com/")));
    EXPECT_TRUE(looksLikeFallback(filenameFromUrl("http://example.com")));
}

TEST(FilenameSanitizerTest, NoInputEscapesTheTargetDirectory) {
    testing::TempDir dir;
    const std::vector<std::string> hostile = {
        "../../etc/passwd", "..\\..\\boot.ini", "%2e%2e%2f%2e%2e%2fescape", "/absolute/path",
        "a/../../b", "....//....//x", "\t\n", "%00hidden", "~/.ssh/id_rsa", "..%5c..%5cwin.ini",
    };
    for (const auto& raw : hostile) {
        const auto name = sanitizeFilename(raw);
        ASSERT_FALSE(name.empty());
        EXPECT_EQ(name.find('/'), std::string::npos) << raw;
        EXPECT_EQ(name.find('\\'), std::string::npos) << raw;

        const auto destination = resolveDestination(dir.path(), name);
        EXPECT_TRUE(isDirectChild(dir.path(), destination)) << raw;
    }
}

TEST(FilenameSanitizerTest, SymlinkLeavingTheDirectoryIsReplaced) {
    testing::TempDir outside;
    testing::TempDir dir;
    std::filesystem::create_symlink(outside.path() / "target.bin", dir.path() / "link.bin");

    const auto destination = resolveDestination(dir.path(), "link.bin");
    EXPECT_NE(destination.filename().string(), "link.bin");
    EXPECT_TRUE(looksLikeFallback(destination.filename().string()));
    EXPECT_TRUE(isDirectChild(dir.path(), destination));
}

TEST(FilenameSanitizerTest, RandomFallbackNamesDiffer) {
    EXPECT_NE(randomFallbackName(), randomFallbackName());
}

} // namespace
} // namespace parafetch
