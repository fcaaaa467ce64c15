#include "test_helpers.hpp"
#include "../src/chain.hpp"
#include "../src/errors.hpp"

using namespace escview;

namespace {

Segment plain(std::string_view raw) { return Segment(SequenceSGR(), "P", raw, raw); }
Segment styled(const SequenceSGR& style, std::string_view raw) { return Segment(style, "P", raw, raw); }

size_t countMarkers(const Slice& slice, MarkerKind kind) {
    size_t count = 0;
    for (const auto& element : slice) {
        if (const auto* marker = std::get_if<StyleMarker>(&element); marker && marker->kind == kind)
            count++;
    }
    return count;
}

} // namespace

TEST(ChainTests, AttachBracketsStyledSegments) {
    Chain chain;
    chain.attach(styled(seqs::RED, "ab"));
    chain.attach(plain("cd"));

    const auto& elements = chain.getElements();
    ASSERT_EQ(elements.size(), 5u);
    EXPECT_EQ(std::get<StyleMarker>(elements[0]).kind, MarkerKind::START);
    EXPECT_TRUE(std::holds_alternative<Segment>(elements[1]));
    EXPECT_EQ(std::get<StyleMarker>(elements[2]).kind, MarkerKind::STOP);
    EXPECT_EQ(std::get<StyleMarker>(elements[3]).kind, MarkerKind::ONE_USE);
    EXPECT_EQ(std::get<StyleMarker>(elements[3]).ref, seqs::RED.closing());
    EXPECT_TRUE(std::holds_alternative<Segment>(elements[4]));
    EXPECT_EQ(chain.dataLen(), 4u);
}

TEST(ChainTests, EmptyChainIsExhausted) {
    Chain chain;
    EXPECT_THROW(chain.detachBytes(4, true), Exhausted);
    EXPECT_THROW(chain.detachLine(true), Exhausted);
}

TEST(ChainTests, ShortChainSuspendsUnlessForced) {
    Chain chain;
    chain.attach(plain("abc"));

    EXPECT_THROW(chain.detachBytes(4, false), Suspended);
    EXPECT_EQ(chain.dataLen(), 3u);

    const Slice slice = chain.detachBytes(4, true);
    EXPECT_EQ(dataLen(slice), 3u);
    EXPECT_EQ(chain.lastDetachedDataLen(), 3u);
    EXPECT_EQ(chain.dataLen(), 0u);
    EXPECT_THROW(chain.detachBytes(4, true), Exhausted);
}

TEST(ChainTests, DetachSplitsSegments) {
    Chain chain;
    chain.attach(plain("abcdef"));

    const Slice first = chain.detachBytes(4, false);
    EXPECT_EQ(render(first, SegmentPrinter::processed()), "abcd");
    EXPECT_EQ(chain.dataLen(), 2u);

    const Slice second = chain.detachBytes(4, true);
    EXPECT_EQ(render(second, SegmentPrinter::processed()), "ef");
}

TEST(ChainTests, SplitStyleIsReopenedAndClosed) {
    Chain chain;
    chain.attach(styled(seqs::BG_CYAN, "213"));

    const Slice first = chain.detachBytes(2, false);
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(std::get<StyleMarker>(first[0]).kind, MarkerKind::START);
    EXPECT_EQ(std::get<Segment>(first[1]).getRaw(), "21");
    EXPECT_EQ(std::get<StyleMarker>(first[2]).kind, MarkerKind::ONE_USE);
    EXPECT_EQ(std::get<StyleMarker>(first[2]).ref, (SequenceSGR{49}));
    EXPECT_EQ(chain.getActiveStyles().size(), 1u);

    const Slice second = chain.detachBytes(1, true);
    EXPECT_EQ(render(second, SegmentPrinter::processed()), "\x1b[46m" "3" "\x1b[49m");
    EXPECT_TRUE(chain.getActiveStyles().empty());
    EXPECT_TRUE(chain.getElements().empty());
}

TEST(ChainTests, EverySliceBalancesItsStyles) {
    Chain chain;
    chain.attach(styled(seqs::RED, "abcde"));
    chain.attach(styled(seqs::BG_CYAN, "fghij"));

    while (true) {
        Slice slice;
        try {
            slice = chain.detachBytes(3, true);
        }
        catch (const Exhausted&) {
            break;
        }
        const std::string rendered = render(slice, SegmentPrinter::processed());
        EXPECT_GE(countMarkers(slice, MarkerKind::ONE_USE), countMarkers(slice, MarkerKind::START));
        EXPECT_EQ(stripSgr(rendered).size(), dataLen(slice));
    }
    EXPECT_TRUE(chain.getActiveStyles().empty());
}

TEST(ChainTests, BoundaryStartBelongsToNextSlice) {
    Chain chain;
    chain.attach(plain("ab"));
    chain.attach(styled(seqs::RED, "cd"));

    const Slice first = chain.detachBytes(2, false);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_TRUE(chain.getActiveStyles().empty());

    const Slice second = chain.detachBytes(2, false);
    EXPECT_EQ(countMarkers(second, MarkerKind::START), 1u);
}

TEST(ChainTests, DrainTakesTrailingMarkers) {
    Chain chain;
    chain.attach(styled(seqs::RED, "ab"));

    chain.detachBytes(2, true);
    EXPECT_TRUE(chain.getElements().empty());
}

TEST(ChainTests, DetachLineStopsAfterNewline) {
    Chain chain;
    chain.attach(plain("ab"));
    chain.attach(Segment(SequenceSGR(), "S", "\n", "\n"));
    chain.attach(plain("cd"));

    const Slice line = chain.detachLine(false);
    EXPECT_EQ(render(line, SegmentPrinter::processed()), "ab\n");

    EXPECT_THROW(chain.detachLine(false), Suspended);
    const Slice rest = chain.detachLine(true);
    EXPECT_EQ(render(rest, SegmentPrinter::processed()), "cd");
}

TEST(ChainTests, HexRenderGroupsBytes) {
    Chain chain;
    chain.attach(plain("ab"));
    chain.attach(plain("cdef"));

    const Slice slice = chain.detachBytes(6, true);
    EXPECT_EQ(render(slice, SegmentPrinter::hex()), " 61 62 63 64  65 66");
    EXPECT_EQ(render(slice, SegmentPrinter::debugSafe()), "abcdef");
}

TEST(ChainTests, PlainPrinterSkipsStyles) {
    Chain chain;
    chain.attach(styled(seqs::RED, "ab"));

    const Slice slice = chain.detachBytes(2, true);
    EXPECT_EQ(render(slice, SegmentPrinter::plainProcessed()), "ab");
    EXPECT_EQ(render(slice, SegmentPrinter::processed()), "\x1b[31m" "ab" "\x1b[39m");
}
