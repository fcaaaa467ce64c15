#include "../src/segment.hpp"
#include "../src/errors.hpp"

#include <gtest/gtest.h>
#include <string>

using escview::Segment;
using escview::SegmentSplitError;
using escview::SequenceSGR;
namespace seqs = escview::seqs;

TEST(SegmentTests, SplitConsistentSegment) {
    Segment segment(seqs::RED, "P", "abcd", "abcd");

    Segment left = segment.split(1);

    EXPECT_EQ(left, Segment(seqs::RED, "P", "a", "a"));
    EXPECT_EQ(segment, Segment(seqs::RED, "P", "bcd", "bcd"));
}

TEST(SegmentTests, SplitKeepsCodePointsWhole) {
    Segment segment(seqs::RED, "C", "\x01\x02\x03", "\xE2\xB1\xAF\xE2\xB1\xAF\xE2\xB1\xAF");

    Segment left = segment.split(2);

    EXPECT_EQ(left.getRaw(), "\x01\x02");
    EXPECT_EQ(left.getProcessed(), "\xE2\xB1\xAF\xE2\xB1\xAF");
    EXPECT_EQ(segment.getRaw(), "\x03");
    EXPECT_EQ(segment.getProcessed(), "\xE2\xB1\xAF");
}

TEST(SegmentTests, SplitPartsReproduceWhole) {
    for (size_t k = 1; k < 3; ++k) {
        Segment right(seqs::GREEN, "P", "abc", "xyz");
        Segment left = right.split(k);
        EXPECT_EQ(left.dataLen(), k);
        EXPECT_EQ(right.dataLen(), 3 - k);
        EXPECT_EQ(left.getRaw() + right.getRaw(), "abc");
        EXPECT_EQ(left.getProcessed() + right.getProcessed(), "xyz");
    }
}

TEST(SegmentTests, SplitInconsistentSegmentThrows) {
    Segment details(seqs::RED, "*", "", "A");
    EXPECT_FALSE(details.isConsistent());
    EXPECT_THROW(details.split(0), SegmentSplitError);

    Segment escape(seqs::RED, "E", "\x1b[31m", "\xC7\x9D");
    EXPECT_THROW(escape.split(2), SegmentSplitError);
}

TEST(SegmentTests, SplitBeyondEndThrows) {
    Segment segment(seqs::RED, "P", "ab", "ab");
    EXPECT_THROW(segment.split(3), SegmentSplitError);
}

TEST(SegmentTests, NewlineFlag) {
    EXPECT_TRUE(Segment(seqs::CYAN, "S", "\n", "\xE2\x86\xB5\x1b[0m\n").isNewline());
    EXPECT_FALSE(Segment(seqs::CYAN, "S", "\n", "\xE2\x86\xB5").isNewline());
    EXPECT_FALSE(Segment(seqs::CYAN, "S", "\t", "\xE2\x87\xA5\t").isNewline());
}

TEST(SegmentTests, Utf8Helpers) {
    EXPECT_EQ(escview::utf8Length("a\xc3\xa9\xe2\x82\xac"), 3u);
    EXPECT_EQ(escview::utf8Offset("a\xc3\xa9\xe2\x82\xac", 2), 3u);
    EXPECT_EQ(escview::utf8Offset("ab", 5), 2u);
}

TEST(SegmentTests, ToStringShowsRawBytesAsHex) {
    Segment segment(seqs::RED, "E", "\x1b[1m", "b");
    EXPECT_EQ(segment.to_string(), "Segment<E>[1b 5b 31 6d]->[b]");

    Segment empty(seqs::RED, "P", "", "");
    EXPECT_EQ(empty.to_string(), "Segment<P>[]->[]");
}
