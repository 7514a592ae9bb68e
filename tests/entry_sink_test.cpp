// SPDX-License-Identifier: MIT

// tests/entry_sink_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "src/entry_sink.hpp"

using namespace wme_pipe;

namespace {

struct Counts {
    int records = 0;
    int errors = 0;
    int completions = 0;
};

EntrySink CountingSink(Counts& counts) {
    return EntrySink([&counts](RecordResult&&) { ++counts.records; },
                     [&counts](const Error&) { ++counts.errors; },
                     [&counts] { ++counts.completions; });
}

}  // namespace

TEST(EntrySinkTest, RecordsThenCompletion) {
    Counts counts;
    EntrySink sink = CountingSink(counts);

    ArchiveEntry entry;
    entry.source = "a.ndjson";
    entry.line = 1;
    entry.document.Parse("{}");
    sink.OnRecord(std::move(entry));
    sink.OnRecord(std::unexpected(Error{ErrorCode::ParseError, "bad"}));
    sink.OnComplete();

    EXPECT_EQ(counts.records, 2);
    EXPECT_EQ(counts.errors, 0);
    EXPECT_EQ(counts.completions, 1);
    EXPECT_TRUE(sink.IsValid());
}

TEST(EntrySinkTest, OnlyFirstTerminalSignalRuns) {
    Counts counts;
    EntrySink sink = CountingSink(counts);

    sink.OnError(Error{ErrorCode::ArchiveError, "truncated"});
    sink.OnComplete();
    sink.OnError(Error{ErrorCode::ArchiveError, "again"});
    sink.OnRecord(std::unexpected(Error{ErrorCode::ParseError, "late"}));

    EXPECT_EQ(counts.errors, 1);
    EXPECT_EQ(counts.completions, 0);
    EXPECT_EQ(counts.records, 0);
}

TEST(EntrySinkTest, InvalidateDropsLaterCalls) {
    Counts counts;
    EntrySink sink = CountingSink(counts);

    sink.Invalidate();
    EXPECT_FALSE(sink.IsValid());

    sink.OnRecord(std::unexpected(Error{ErrorCode::ParseError, "x"}));
    sink.OnError(Error{ErrorCode::Cancelled, "x"});
    sink.OnComplete();
    EXPECT_EQ(counts.records + counts.errors + counts.completions, 0);
}
