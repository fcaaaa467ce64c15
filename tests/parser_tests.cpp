#include "test_helpers.hpp"
#include "../src/errors.hpp"

using namespace escview;

class ParserTests : public ParserTestBase {};

TEST_F(ParserTests, SgrAndPrintableInTextMode) {
    configure(textConfig());
    feedChunked("\x1b[31mA\x1b[0m");

    const auto segs = segments();
    ASSERT_EQ(segs.size(), 9u);
    EXPECT_EQ(segs[1].getProcessed(), "\xC7\x9D");   // ǝ
    EXPECT_EQ(segs[2].getProcessed(), "red");
    EXPECT_EQ(segs[4].getProcessed(), "A");
    EXPECT_EQ(segs[6].getProcessed(), "\xCE\xB8");   // θ
    EXPECT_EQ(segs[7].getProcessed(), "");
    EXPECT_EQ(joinRaw(segs), "\x1b[31mA\x1b[0m");
    EXPECT_EQ(stripSgr(joinProcessed(segs)), "\xE2\xA2\xB8\xC7\x9Dred\xE2\xA1\x87" "A" "\xE2\xA2\xB8\xCE\xB8\xE2\xA1\x87");
}

TEST_F(ParserTests, PrintableRunStaysWhole) {
    configure(textConfig());
    feedChunked("caf\xc3\xa9");

    const auto segs = segments();
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].getRaw(), "caf");
    EXPECT_EQ(segs[1].getRaw(), "\xc3\xa9");
    EXPECT_EQ(segs[1].getProcessed(), "\xc3\xa9");
}

TEST_F(ParserTests, RawBytesArePreservedInOrder) {
    configure(binaryConfig());
    const std::string input = "\x00\x01 ab\t\x1b[1;2Hcd\xe2\x82\xac\x80\xff\x1b" "7\n"s;
    feedChunked(input);

    EXPECT_EQ(joinRaw(segments()), input);
    EXPECT_EQ(chain.dataLen(), input.size());
    for (const auto& segment : segments())
        EXPECT_TRUE(segment.dataLen() == 0 || segment.isConsistent()) << segment.to_string();
}

TEST_F(ParserTests, ChunkingDoesNotChangeClassification) {
    const std::vector<std::string> inputs = {
        "ab\x1b[38;5;236mcd\xe2\x82\xac\x1b(B\n",
        "\xff\xc3\xa9",
        "\xa6\xc6\xac",
        "\xff\xfe\xc3\xa9 x\x80",
    };
    configure(textConfig());

    for (const auto& input : inputs) {
        ParserBuffer wholeBuffer;
        Chain wholeChain;
        Parser wholeParser(wholeBuffer, wholeChain, registry);
        wholeBuffer.append(input, true);
        wholeParser.parse(0);
        const auto whole = chainSegments(wholeChain);

        for (size_t chunkSize : {1u, 2u, 3u, 5u, 7u}) {
            ParserBuffer buffer;
            Chain chunkedChain;
            Parser chunkedParser(buffer, chunkedChain, registry);
            size_t pos = 0;
            for (; pos < input.size(); pos += chunkSize) {
                const size_t bufferOffset = pos - buffer.raw().size();
                buffer.append(std::string_view(input).substr(pos, chunkSize));
                chunkedParser.parse(bufferOffset);
            }
            buffer.append("", true);
            chunkedParser.parse(input.size() - buffer.raw().size());

            const auto chunked = chainSegments(chunkedChain);
            EXPECT_EQ(joinRaw(chunked), input) << "chunk size " << chunkSize;
            EXPECT_EQ(joinProcessed(chunked), joinProcessed(whole)) << "chunk size " << chunkSize;
        }
    }
}

TEST_F(ParserTests, BinaryRunWaitsForNextChunk) {
    configure(textConfig());
    feed("a\xff");
    EXPECT_EQ(parserBuffer.raw(), "\xff");

    feed("\xc3\xa9");
    EXPECT_EQ(parserBuffer.raw(), "\xff\xc3\xa9");

    feed("", true);
    const auto segs = segments();
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[1].getRaw(), "\xff\xc3\xa9");
    EXPECT_EQ(segs[1].getTypeLabel(), "B");
}

TEST_F(ParserTests, IncompleteSequenceWaitsForNextChunk) {
    configure(textConfig());
    feed("ab\x1b[3");

    EXPECT_EQ(parserBuffer.raw(), "\x1b[3");
    EXPECT_EQ(joinRaw(segments()), "ab");

    feed("1m");
    EXPECT_TRUE(parserBuffer.raw().empty());
    EXPECT_EQ(joinRaw(segments()), "ab\x1b[31m");
}

TEST_F(ParserTests, IncompleteSequenceIsFlushedAtEnd) {
    configure(textConfig());
    feed("\x1b[3");
    EXPECT_TRUE(segments().empty());

    feed("", true);
    EXPECT_EQ(joinRaw(segments()), "\x1b[3");
    EXPECT_TRUE(parserBuffer.raw().empty());
}

TEST_F(ParserTests, LoneEscapeAtEnd) {
    configure(textConfig());
    feedChunked("\x1b");

    const auto segs = segments();
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].getProcessed(), "\xE2\x88\x8C"); // ∌
}

TEST_F(ParserTests, TruncatedUtf8BecomesBinaryAtEnd) {
    configure(textConfig());
    feed("x\xe2\x82");
    EXPECT_EQ(parserBuffer.raw(), "\xe2\x82");

    feed("", true);
    const auto segs = segments();
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[1].getTypeLabel(), "B");
}

TEST_F(ParserTests, NewlineSegmentsInTextMode) {
    configure(textConfig());
    feedChunked("ab\ncd");

    const auto segs = segments();
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_TRUE(segs[1].isNewline());
    EXPECT_FALSE(segs[2].isNewline());
}

TEST(ParserBufferTests, RetainSuffixRejectsForeignBytes) {
    ParserBuffer buffer;
    buffer.append("abcdef");

    EXPECT_THROW(buffer.retainSuffix("xyz"), ParserInconsistency);
    EXPECT_THROW(buffer.retainSuffix("abcdefg"), ParserInconsistency);

    buffer.retainSuffix(std::string_view(buffer.raw()).substr(4));
    EXPECT_EQ(buffer.raw(), "ef");

    buffer.retainSuffix("");
    EXPECT_TRUE(buffer.raw().empty());
}

TEST(ParserBufferTests, ClosedFlagFollowsLastAppend) {
    ParserBuffer buffer;
    buffer.append("ab");
    EXPECT_FALSE(buffer.closed());

    buffer.append("", true);
    EXPECT_TRUE(buffer.closed());
    EXPECT_EQ(buffer.raw(), "ab");
}
