// SPDX-License-Identifier: MIT

// tests/tar_reader_test.cpp
#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/epoll_event_loop.hpp"
#include "src/tar_reader.hpp"
#include "tests/archive_helpers.hpp"

using namespace wme_pipe;
using wme_pipe::testing::TarBuilder;

namespace {

struct Member {
    std::string name;
    std::optional<uint64_t> size;
    std::string body;
    bool closed = false;
};

struct MemberCollector {
    std::vector<Member> members;
    std::optional<Error> error;
    bool done = false;

    void OnEntryBegin(const TarEntryHeader& h) { members.push_back({h.name, h.size, {}, false}); }
    void OnEntryEnd() { members.back().closed = true; }
    void OnData(BufferChain& chain) {
        members.back().body += chain.ToString();
        chain.Consume(chain.Size());
    }
    void OnError(const Error& e) { error = e; }
    void OnDone() { done = true; }
};

static_assert(EntryDownstream<MemberCollector>);

class TarReaderTest : public ::testing::Test {
protected:
    void Read(std::string_view bytes, size_t step, Container container = Container::Auto) {
        reader = TarReader<MemberCollector>::Create(loop, sink, container, "stream.ndjson");
        for (size_t pos = 0; pos < bytes.size(); pos += step) {
            BufferChain chain;
            chain.AppendBytes(bytes.substr(pos, step));
            reader->OnData(chain);
        }
        reader->OnDone();
        loop.Poll(0);
    }

    EpollEventLoop loop;
    std::shared_ptr<MemberCollector> sink = std::make_shared<MemberCollector>();
    std::shared_ptr<TarReader<MemberCollector>> reader;
};

// Turn the first header into a metadata entry of `type` and fix its checksum.
void Retag(std::string& archive, char type) {
    archive[156] = type;
    std::memset(archive.data() + 148, ' ', 8);
    unsigned sum = 0;
    for (size_t i = 0; i < 512; ++i) sum += static_cast<unsigned char>(archive[i]);
    std::snprintf(archive.data() + 148, 8, "%06o", sum);
    archive[155] = ' ';
}

}  // namespace

TEST_F(TarReaderTest, ReadsMembersInOrder) {
    std::string big(3000, 'x');
    auto archive = TarBuilder()
        .File("enwiki_0.ndjson", "{\"a\":1}\n")
        .File("enwiki_1.ndjson", big)
        .Finish();

    Read(archive, 700);

    EXPECT_FALSE(sink->error.has_value());
    EXPECT_TRUE(sink->done);
    ASSERT_EQ(sink->members.size(), 2u);
    EXPECT_EQ(sink->members[0].name, "enwiki_0.ndjson");
    EXPECT_EQ(sink->members[0].size, 8u);
    EXPECT_EQ(sink->members[0].body, "{\"a\":1}\n");
    EXPECT_TRUE(sink->members[0].closed);
    EXPECT_EQ(sink->members[1].body, big);
    EXPECT_EQ(reader->DetectedContainer(), Container::Tar);
    EXPECT_EQ(reader->EntriesSeen(), 2u);
}

TEST_F(TarReaderTest, SkipsDirectories) {
    auto archive = TarBuilder()
        .Directory("snapshot/")
        .File("snapshot/part_0.ndjson", "line\n")
        .Finish();

    Read(archive, 512);

    ASSERT_EQ(sink->members.size(), 1u);
    EXPECT_EQ(sink->members[0].name, "snapshot/part_0.ndjson");
    EXPECT_TRUE(sink->done);
}

TEST_F(TarReaderTest, EmptyMember) {
    Read(TarBuilder().File("empty.ndjson", "").File("b", "b").Finish(), 4096);

    ASSERT_EQ(sink->members.size(), 2u);
    EXPECT_TRUE(sink->members[0].body.empty());
    EXPECT_TRUE(sink->members[0].closed);
    EXPECT_EQ(sink->members[1].body, "b");
}

TEST_F(TarReaderTest, PaxPathOverridesName) {
    std::string long_name(150, 'n');
    std::string record = " path=" + long_name + "\n";
    // Length prefix counts itself
    std::string pax = std::to_string(record.size() + 3) + record;
    ASSERT_EQ(pax.size(), record.size() + 3);

    TarBuilder builder;
    builder.File("PaxHeader", pax);
    std::string archive = builder.File("short", "body").Finish();
    Retag(archive, 'x');

    Read(archive, 1000);

    ASSERT_FALSE(sink->error.has_value()) << sink->error->message;
    ASSERT_EQ(sink->members.size(), 1u);
    EXPECT_EQ(sink->members[0].name, long_name);
    EXPECT_EQ(sink->members[0].body, "body");
}

TEST_F(TarReaderTest, GnuLongNameOverridesName) {
    std::string long_name = "enwiki_namespace_0/" + std::string(120, 'p') + ".ndjson";
    TarBuilder builder;
    builder.File("././@LongLink", long_name + std::string(1, '\0'));
    std::string archive = builder.File("truncated", "{}").Finish();
    Retag(archive, 'L');

    Read(archive, 300);

    ASSERT_FALSE(sink->error.has_value()) << sink->error->message;
    ASSERT_EQ(sink->members.size(), 1u);
    EXPECT_EQ(sink->members[0].name, long_name);
    EXPECT_EQ(sink->members[0].body, "{}");
}

TEST_F(TarReaderTest, TruncatedBodyIsArchiveError) {
    std::string archive = TarBuilder().File("a", std::string(2000, 'a')).Partial();
    Read(std::string_view(archive).substr(0, 1024), 256);

    ASSERT_TRUE(sink->error.has_value());
    EXPECT_EQ(sink->error->code, ErrorCode::ArchiveError);
    EXPECT_FALSE(sink->done);
}

TEST_F(TarReaderTest, MissingEndBlocksAcceptedOnBoundary) {
    Read(TarBuilder().File("a", "aaa").Partial(), 512);
    EXPECT_FALSE(sink->error.has_value());
    EXPECT_TRUE(sink->done);
    ASSERT_EQ(sink->members.size(), 1u);
}

TEST_F(TarReaderTest, BadChecksum) {
    std::string archive = TarBuilder().File("a", "aaa").Finish();
    archive[0] = 'b';
    Read(archive, 4096);

    ASSERT_TRUE(sink->error.has_value());
    EXPECT_EQ(sink->error->code, ErrorCode::ArchiveError);
    EXPECT_TRUE(sink->members.empty());
}

TEST_F(TarReaderTest, TrailingBytesAfterEndIgnored) {
    std::string archive = TarBuilder().File("a", "aaa").Finish() + "garbage";
    Read(archive, 4096);
    EXPECT_FALSE(sink->error.has_value());
    EXPECT_TRUE(sink->done);
}

TEST_F(TarReaderTest, NonTarIsSingleEntry) {
    Read("{\"a\":1}\n{\"a\":2}\n", 3);

    EXPECT_EQ(reader->DetectedContainer(), Container::None);
    ASSERT_EQ(sink->members.size(), 1u);
    EXPECT_EQ(sink->members[0].name, "stream.ndjson");
    EXPECT_FALSE(sink->members[0].size.has_value());
    EXPECT_EQ(sink->members[0].body, "{\"a\":1}\n{\"a\":2}\n");
    EXPECT_TRUE(sink->members[0].closed);
    EXPECT_TRUE(sink->done);
}

TEST_F(TarReaderTest, ForcedNoneKeepsTarBytes) {
    std::string archive = TarBuilder().File("a", "aaa").Finish();
    Read(archive, 4096, Container::None);

    ASSERT_EQ(sink->members.size(), 1u);
    EXPECT_EQ(sink->members[0].body.size(), archive.size());
}

TEST_F(TarReaderTest, EmptyStreamHasNoEntries) {
    Read("", 1);
    EXPECT_TRUE(sink->members.empty());
    EXPECT_TRUE(sink->done);
}

TEST_F(TarReaderTest, SkipsLinksAndGlobalHeaders) {
    std::string record = " comment=x\n";
    std::string pax = std::to_string(record.size() + 2) + record;
    TarBuilder builder;
    builder.File("pax_global_header", pax);
    builder.File("link", "");
    std::string archive = builder.File("a.ndjson", "{}\n").Finish();
    Retag(archive, 'g');
    std::string tail = archive.substr(1024);
    Retag(tail, '2');
    archive = archive.substr(0, 1024) + tail;

    Read(archive, 512);

    ASSERT_FALSE(sink->error.has_value()) << sink->error->message;
    ASSERT_EQ(sink->members.size(), 1u);
    EXPECT_EQ(sink->members[0].name, "a.ndjson");
    EXPECT_EQ(reader->EntriesSeen(), 1u);
}

TEST(TarHeaderTest, DecodesMemberHeader) {
    std::string archive = TarBuilder().File("dir/part_3.ndjson", "abcdef").Partial();
    auto bytes = std::as_bytes(std::span(archive.data(), tar::kBlockSize));

    auto member = tar::DecodeHeaderRun(bytes);
    ASSERT_TRUE(member.has_value()) << member.error().message;
    EXPECT_EQ(member->name, "dir/part_3.ndjson");
    EXPECT_EQ(member->size, 6u);
    EXPECT_TRUE(member->regular);
}

TEST(TarHeaderTest, Base256Size) {
    std::string archive = TarBuilder().File("big", "").Partial();
    std::memset(archive.data() + 124, 0, 12);
    archive[124] = static_cast<char>(0x80);
    archive[134] = 0x01;
    Retag(archive, '0');

    auto member = tar::DecodeHeaderRun(std::as_bytes(std::span(archive.data(), 512)));
    ASSERT_TRUE(member.has_value()) << member.error().message;
    EXPECT_EQ(member->size, 256u);
}

TEST(TarHeaderTest, CorruptHeaderIsArchiveError) {
    std::string archive = TarBuilder().File("a", "aaa").Partial();
    archive[3] = 'z';

    auto member = tar::DecodeHeaderRun(std::as_bytes(std::span(archive.data(), 512)));
    ASSERT_FALSE(member.has_value());
    EXPECT_EQ(member.error().code, ErrorCode::ArchiveError);
}

TEST(TarHeaderTest, ExtensionPayloadSize) {
    std::string archive = TarBuilder().File("././@LongLink", std::string(23, 'n')).Partial();
    auto block = std::as_bytes(std::span<const char, 512>(archive.data(), 512));
    EXPECT_FALSE(tar::IsExtensionHeader(block));

    Retag(archive, 'L');
    EXPECT_TRUE(tar::IsExtensionHeader(block));
    EXPECT_EQ(tar::ExtensionPayloadSize(block), 23u);

    std::memcpy(archive.data() + 124, "0009", 4);
    EXPECT_FALSE(tar::ExtensionPayloadSize(block).has_value());
    EXPECT_EQ(tar::Padding(23), 489u);
}
