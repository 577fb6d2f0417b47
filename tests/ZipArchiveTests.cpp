#include "DocShield/ScanTypes.hpp"
#include "DocShield/ZipArchive.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace docshield;

namespace {

std::string sampleArchive() {
    ZipWriter writer;
    writer.add("readme.txt", "plain stored member", ZipWriter::kStored);
    writer.add("data/report.xml", std::string(4096, 'a') + "<report/>");
    return writer.finish();
}

} // namespace

TEST(ZipArchiveTest, ReadsStoredAndDeflatedMembers) {
    const auto archive = sampleArchive();
    ASSERT_TRUE(looksLikeZip(archive));

    auto reader = ZipReader::open(archive);
    ASSERT_EQ(reader.entries().size(), 2u);
    EXPECT_FALSE(reader.truncated());

    const auto *stored = reader.find("readme.txt");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->method, ZipWriter::kStored);
    EXPECT_EQ(reader.read(*stored), "plain stored member");

    const auto *deflated = reader.find("data/report.xml");
    ASSERT_NE(deflated, nullptr);
    EXPECT_EQ(deflated->method, ZipWriter::kDeflated);
    EXPECT_LT(deflated->compressedSize, deflated->uncompressedSize);
    EXPECT_EQ(reader.read(*deflated), std::string(4096, 'a') + "<report/>");
    EXPECT_EQ(reader.find("missing.xml"), nullptr);
}

TEST(ZipArchiveTest, DetectsCorruptedMemberThroughCrc) {
    auto archive = sampleArchive();
    const auto member = archive.find("plain stored member");
    ASSERT_NE(member, std::string::npos);

    archive[member] ^= 0x20;
    auto damaged = ZipReader::open(archive);
    EXPECT_THROW(damaged.read(*damaged.find("readme.txt")), MalformedContainer);
}

TEST(ZipArchiveTest, EnforcesEntryAndInflationLimits) {
    const auto archive = sampleArchive();

    ZipLimits fewEntries;
    fewEntries.maxEntries = 1;
    const auto capped = ZipReader::open(archive, fewEntries);
    EXPECT_TRUE(capped.truncated());
    EXPECT_EQ(capped.entries().size(), 1u);

    ZipLimits smallEntries;
    smallEntries.maxEntryBytes = 1024;
    auto limited = ZipReader::open(archive, smallEntries);
    EXPECT_THROW(limited.read(*limited.find("data/report.xml")), ResourceLimitExceeded);
}

TEST(ZipArchiveTest, RejectsNonZipInput) {
    EXPECT_FALSE(looksLikeZip("%PDF-1.7"));
    EXPECT_THROW(ZipReader::open("not a zip archive at all, just text"), MalformedContainer);
}

TEST(ZipArchiveTest, SalvageRecoversMembersWithoutCentralDirectory) {
    const auto archive = sampleArchive();
    const auto cut = archive.substr(0, archive.find(std::string("PK\x01\x02", 4)));

    EXPECT_THROW(ZipReader::open(cut), MalformedContainer);
    auto salvaged = ZipReader::salvage(cut);
    ASSERT_EQ(salvaged.entries().size(), 2u);
    EXPECT_EQ(salvaged.read(*salvaged.find("readme.txt")), "plain stored member");
}

TEST(ZipArchiveTest, WriterOutputIsDeterministic) {
    EXPECT_EQ(sampleArchive(), sampleArchive());

    auto reader = ZipReader::open(sampleArchive());
    const auto *entry = reader.find("readme.txt");
    ASSERT_NE(entry, nullptr);
    EXPECT_GT(entry->modified, 0);
}

TEST(ZipArchiveTest, CopyingMembersKeepsContentAndTimestamps) {
    const auto archive = sampleArchive();
    auto reader = ZipReader::open(archive);

    ZipWriter copy;
    for (const auto &entry : reader.entries()) {
        copy.add(entry.name, reader.read(entry), entry.method, entry.modified);
    }
    const auto rebuilt = copy.finish();
    auto rereader = ZipReader::open(rebuilt);
    EXPECT_EQ(rereader.read(*rereader.find("data/report.xml")), std::string(4096, 'a') + "<report/>");
    EXPECT_EQ(rereader.find("readme.txt")->method, ZipWriter::kStored);
    EXPECT_EQ(rereader.find("readme.txt")->modified, reader.find("readme.txt")->modified);
}

TEST(ZipArchiveTest, InflationBudgetSpansMembers) {
    ZipWriter writer;
    writer.add("one.xml", std::string(3000, 'x'));
    writer.add("two.xml", std::string(3000, 'y'));
    const auto archive = writer.finish();

    ZipLimits limits;
    limits.maxTotalBytes = 4000;
    auto reader = ZipReader::open(archive, limits);
    EXPECT_EQ(reader.read(*reader.find("one.xml")).size(), 3000u);
    EXPECT_THROW(reader.read(*reader.find("two.xml")), ResourceLimitExceeded);
}
