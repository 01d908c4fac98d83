#include "archive/tar_reader.hpp"

#include <gtest/gtest.h>

#include "tar_builder.hpp"

using namespace kalibox::archive;
using kalibox::testing::TarBuilder;

TEST(TarReaderTests, ReadsSingleFile) {
    const auto bytes = TarBuilder().AddFile("out.txt", "hello\n").Finish();
    const auto entries = ReadTar(bytes);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "out.txt");
    EXPECT_EQ(entries[0].type, EntryType::kFile);
    EXPECT_EQ(entries[0].data, "hello\n");
}

TEST(TarReaderTests, EmptyArchiveHasNoEntries) {
    EXPECT_TRUE(ReadTar(TarBuilder().Finish()).empty());
    EXPECT_TRUE(ReadTar("").empty());
}

TEST(TarReaderTests, ReadsDataSpanningSeveralBlocks) {
    const std::string data(1500, 'x');
    const auto entries = ReadTar(TarBuilder().AddFile("big", data).AddFile("small", "y").Finish());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].data, data);
    EXPECT_EQ(entries[1].name, "small");
    EXPECT_EQ(entries[1].data, "y");
}

TEST(TarReaderTests, DirectoryEntriesCarryNoData) {
    const auto entries = ReadTar(TarBuilder().AddDirectory("logs/").AddFile("logs/a", "1").Finish());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, EntryType::kDirectory);
    EXPECT_TRUE(entries[0].data.empty());
    EXPECT_EQ(entries[1].type, EntryType::kFile);
}

TEST(TarReaderTests, PaxPathOverridesHeaderName) {
    const std::string long_name = std::string(120, 'n') + ".txt";
    const auto entries = ReadTar(TarBuilder().AddPaxPath(long_name).AddFile("short", "data").Finish());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, long_name);
    EXPECT_EQ(entries[0].data, "data");
}

TEST(TarReaderTests, GnuLongNameAppliesToNextEntryOnly) {
    const std::string long_name = "tmp/" + std::string(150, 'n') + ".txt";
    const auto entries = ReadTar(TarBuilder()
                                     .AddGnuLongName(long_name)
                                     .AddFile("truncated-name", "data")
                                     .AddFile("next.txt", "more")
                                     .Finish());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, long_name);
    EXPECT_EQ(entries[0].data, "data");
    EXPECT_EQ(entries[1].name, "next.txt");
}

TEST(TarReaderTests, SymlinkEntriesCarryNoData) {
    const auto entries = ReadTar(TarBuilder().AddSymlink("out.txt", "/tmp/real.txt").Finish());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, EntryType::kSymlink);
    EXPECT_TRUE(entries[0].data.empty());
}

TEST(TarReaderTests, MissingEndMarkerIsAccepted) {
    const auto entries = ReadTar(TarBuilder().AddFile("a", "b").Unterminated());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].data, "b");
}

TEST(TarReaderTests, CorruptChecksumThrows) {
    auto bytes = TarBuilder().AddFile("a", "b").Finish();
    bytes[0] = 'z';
    EXPECT_THROW(ReadTar(bytes), TarError);
}

TEST(TarReaderTests, TruncatedBodyThrows) {
    const auto bytes = TarBuilder().AddFile("a", std::string(600, 'q')).Unterminated();
    EXPECT_THROW(ReadTar(bytes.substr(0, 700)), TarError);
}
