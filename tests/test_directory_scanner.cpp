#include <gtest/gtest.h>
#include "directory_scanner.hpp"
#include "zip_layout.hpp"
#include "zip_fixture.hpp"

using Names = std::vector<std::string>;

TEST(DirectoryScanner, EmptyBufferHasNoEntries) {
    EXPECT_TRUE(scanDirectory({}).empty());
    EXPECT_FALSE(findEndOfCentralDirectory({}));
}

TEST(DirectoryScanner, ShortBufferHasNoEntries) {
    std::vector<uint8_t> tiny = {0x50, 0x4B, 0x05, 0x06, 0, 0, 0, 0};
    EXPECT_TRUE(scanDirectory(tiny).empty());
}

TEST(DirectoryScanner, NoSignatureMeansNoEntries) {
    std::vector<uint8_t> noise(4096);
    for (size_t i = 0; i < noise.size(); ++i) noise[i] = static_cast<uint8_t>(i * 7 + 3);
    EXPECT_FALSE(findEndOfCentralDirectory(noise));
    EXPECT_TRUE(scanDirectory(noise).empty());
}

TEST(DirectoryScanner, BareEocdWithZeroEntries) {
    auto buffer = endOfCentralDirectory(0, 0, 0);
    ASSERT_EQ(buffer.size(), 22u);
    EXPECT_EQ(findEndOfCentralDirectory(buffer), size_t(0));
    EXPECT_TRUE(scanDirectory(buffer).empty());
}

TEST(DirectoryScanner, ZeroEntriesIgnoresDirectoryOffset) {
    // offset points far outside the buffer; with a count of 0 it is never followed
    auto buffer = endOfCentralDirectory(0, 0, 0xFFFFFFF0u);
    EXPECT_TRUE(scanDirectoryEntries(buffer).empty());
}

TEST(DirectoryScanner, SingleHeaderFollowedByEocd) {
    auto buffer = centralHeader("test.txt");
    uint32_t cdSize = static_cast<uint32_t>(buffer.size());
    append(buffer, endOfCentralDirectory(1, cdSize, 0));

    EXPECT_EQ(scanDirectory(buffer), Names{"test.txt"});
}

TEST(DirectoryScanner, ListsEntriesInDirectoryOrder) {
    auto zip = buildStoredZip({
        {"zeta.txt", "last letter", "", ""},
        {"alpha/beta.bin", std::string(300, 'x'), "", ""},
        {"alpha/", "", "", ""},
        {"middle.md", "# title", "", ""},
    });
    EXPECT_EQ(scanDirectory(zip), (Names{"zeta.txt", "alpha/beta.bin", "alpha/", "middle.md"}));
}

TEST(DirectoryScanner, SkipsExtraAndCommentFields) {
    auto zip = buildStoredZip({
        {"one", "1", std::string(17, '\x01'), "first comment"},
        {"two", "22", "", std::string(300, 'c')},
        {"three", "333", std::string(4, '\0'), ""},
    }, "archive comment");
    EXPECT_EQ(scanDirectory(zip), (Names{"one", "two", "three"}));
}

TEST(DirectoryScanner, ReadsHeaderMetadata) {
    auto zip = buildStoredZip({{"hello.txt", "hello world", "", ""}});
    auto entries = scanDirectoryEntries(zip);
    ASSERT_EQ(entries.size(), 1u);

    const auto& e = entries[0];
    EXPECT_EQ(e.name, "hello.txt");
    EXPECT_EQ(e.method, 0);
    EXPECT_EQ(e.compressedSize, 11u);
    EXPECT_EQ(e.uncompressedSize, 11u);
    EXPECT_EQ(e.crc32, 0x0D4A1185u);
    EXPECT_EQ(e.localHeaderOffset, 0u);
    EXPECT_EQ(e.headerOffset, 30u + 9u + 11u);
    EXPECT_EQ(e.modTime, 0x6000);
    EXPECT_EQ(e.modDate, 0x5A21);
}

TEST(DirectoryScanner, DeclaredCountLargerThanDirectory) {
    auto buffer = centralHeader("a.txt");
    append(buffer, centralHeader("b.txt"));
    uint32_t cdSize = static_cast<uint32_t>(buffer.size());
    append(buffer, endOfCentralDirectory(9, cdSize, 0));

    // the third header would start inside the 22-byte EOCD and cannot fit
    EXPECT_EQ(scanDirectory(buffer), (Names{"a.txt", "b.txt"}));
}

TEST(DirectoryScanner, StopsWhenHeaderRunsPastBuffer) {
    auto buffer = centralHeader("a.txt");
    append(buffer, endOfCentralDirectory(2, 0, 0));
    // directory offset placed so that the fixed prefix does not fit
    auto eocdOffset = findEndOfCentralDirectory(buffer);
    ASSERT_TRUE(eocdOffset);
    uint32_t late = static_cast<uint32_t>(buffer.size() - 10);
    buffer[*eocdOffset + ZIP_EOCD_CD_OFFSET]     = static_cast<uint8_t>(late);
    buffer[*eocdOffset + ZIP_EOCD_CD_OFFSET + 1] = static_cast<uint8_t>(late >> 8);

    EXPECT_TRUE(scanDirectory(buffer).empty());
}

TEST(DirectoryScanner, DirectoryOffsetOutsideBuffer) {
    auto buffer = centralHeader("a.txt");
    append(buffer, endOfCentralDirectory(1, 0, 0xFFFFFFFFu));
    EXPECT_TRUE(scanDirectory(buffer).empty());
}

TEST(DirectoryScanner, BadHeaderSignatureKeepsEarlierEntries) {
    auto buffer = centralHeader("good.txt");
    auto broken = centralHeader("bad.txt");
    broken[2] = 0x09;
    append(buffer, broken);
    append(buffer, centralHeader("unreached.txt"));
    uint32_t cdSize = static_cast<uint32_t>(buffer.size());
    append(buffer, endOfCentralDirectory(3, cdSize, 0));

    EXPECT_EQ(scanDirectory(buffer), Names{"good.txt"});
}

TEST(DirectoryScanner, NameRunningPastBufferIsClamped) {
    auto buffer = centralHeader("abc");
    buffer[ZIP_CDH_NAME_LENGTH] = 200;
    append(buffer, endOfCentralDirectory(2, 0, 0));

    auto names = scanDirectory(buffer);
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0].size(), 3u + 22u);
    EXPECT_EQ(names[0].substr(0, 5), std::string("abcPK"));
}

TEST(DirectoryScanner, InvalidUtf8NameIsReplacedAndWalkContinues) {
    auto buffer = centralHeader(std::string("a\xFF" "b", 3));
    append(buffer, centralHeader(std::string("\xC3\xA9t\xC3\xA9.txt")));
    append(buffer, centralHeader(std::string("cut\xE2\x82", 5)));
    append(buffer, centralHeader("ok.txt"));
    uint32_t cdSize = static_cast<uint32_t>(buffer.size());
    append(buffer, endOfCentralDirectory(4, cdSize, 0));

    EXPECT_EQ(scanDirectory(buffer), (Names{
        "a\xEF\xBF\xBD" "b",
        "\xC3\xA9t\xC3\xA9.txt",
        "cut\xEF\xBF\xBD",
        "ok.txt"}));
}

TEST(DirectoryScanner, ClosestSignatureToEndWins) {
    auto buffer = centralHeader("first.txt");
    uint32_t second = static_cast<uint32_t>(buffer.size());
    append(buffer, centralHeader("second.txt"));
    append(buffer, endOfCentralDirectory(1, 0, 0));
    size_t laterEocd = buffer.size();
    append(buffer, endOfCentralDirectory(1, 0, second));

    EXPECT_EQ(findEndOfCentralDirectory(buffer), laterEocd);
    EXPECT_EQ(scanDirectory(buffer), Names{"second.txt"});
}

TEST(DirectoryScanner, SignatureInsideEntryNameDoesNotWin) {
    std::string spoof("PK\x05\x06spoof", 9);
    auto zip = buildStoredZip({{spoof, "data", "", ""}, {"real.txt", "x", "", ""}});
    EXPECT_EQ(scanDirectory(zip), (Names{spoof, "real.txt"}));
}

TEST(DirectoryScanner, FindsEocdBehindMaximumComment) {
    auto zip = buildStoredZip({{"commented.txt", "x", "", ""}}, std::string(65535, 'c'));
    auto names = scanDirectory(zip);
    EXPECT_EQ(names, Names{"commented.txt"});
}

TEST(DirectoryScanner, IgnoresEocdOutsideSearchWindow) {
    auto zip = buildStoredZip({{"far.txt", "x", "", ""}});
    // trailing bytes push the EOCD one byte beyond the 65535 + 22 search window
    zip.resize(zip.size() + 65536, 'p');
    EXPECT_FALSE(findEndOfCentralDirectory(zip));
    EXPECT_TRUE(scanDirectory(zip).empty());
}

TEST(DirectoryScanner, ScanningDoesNotModifyBuffer) {
    auto zip = buildStoredZip({{"a", "1", "", ""}, {"b", "2", "", ""}});
    auto copy = zip;
    scanDirectoryEntries(zip);
    EXPECT_EQ(zip, copy);
}

TEST(DirectoryScanner, MethodNames) {
    EXPECT_EQ(compressionMethodName(0), "stored");
    EXPECT_EQ(compressionMethodName(8), "deflate");
    EXPECT_EQ(compressionMethodName(77), "method 77");
}
