#include "../src/settings.hpp"
#include "../src/errors.hpp"

#include <gtest/gtest.h>

using namespace escview;

namespace {

size_t idx(CharClass charClass) { return static_cast<size_t>(charClass); }

} // namespace

TEST(SettingsTests, DefaultsToTextMode) {
    Settings settings;
    EXPECT_NO_THROW(settings.validate());

    EXPECT_EQ(settings.readMode(), ReadMode::TEXT);
    EXPECT_EQ(settings.effectiveMarkerDetails(), MarkerDetails::BRIEF_DETAILS);
    EXPECT_EQ(settings.chunkSize(), Reader::READ_CHUNK_SIZE);
    EXPECT_TRUE(settings.effectivePrintOffsets());
    EXPECT_TRUE(settings.outputOptions().lineNumbers);
}

TEST(SettingsTests, TextAndBinaryAreExclusive) {
    Settings settings;
    settings.text = true;
    settings.binary = true;
    EXPECT_THROW(settings.validate(), ArgumentError);
}

TEST(SettingsTests, FocusAndIgnoreOfSameClassAreExclusive) {
    Settings settings;
    settings.focus[idx(CharClass::WHITESPACE)] = true;
    settings.ignore[idx(CharClass::WHITESPACE)] = true;

    try {
        settings.validate();
        FAIL() << "Expected ArgumentError";
    } catch (const ArgumentError& e) {
        EXPECT_STREQ(e.what(), "Options --focus-space and --ignore-space are mutually exclusive");
    }
}

TEST(SettingsTests, FocusAndIgnoreOfDifferentClasses) {
    Settings settings;
    settings.focus[idx(CharClass::ESCAPE_SEQ)] = true;
    settings.ignore[idx(CharClass::PRINTABLE_CHAR)] = true;
    EXPECT_NO_THROW(settings.validate());

    const TemplateConfig config = settings.templateConfig();
    EXPECT_EQ(config.displayMode(CharClass::ESCAPE_SEQ), DisplayMode::FOCUSED);
    EXPECT_EQ(config.displayMode(CharClass::PRINTABLE_CHAR), DisplayMode::IGNORED);
    EXPECT_EQ(config.displayMode(CharClass::UTF_8_SEQ), DisplayMode::DEFAULT);
}

TEST(SettingsTests, DecimalAndNoOffsetsAreExclusive) {
    Settings settings;
    settings.decimalOffsets = true;
    settings.noOffsets = true;
    EXPECT_THROW(settings.validate(), ArgumentError);
}

TEST(SettingsTests, NegativeLimitsAreRejected) {
    Settings settings;
    settings.maxLines = -1;
    EXPECT_THROW(settings.validate(), ArgumentError);

    settings = Settings();
    settings.columns = -4;
    EXPECT_THROW(settings.validate(), ArgumentError);
}

TEST(SettingsTests, BinaryModeForcesStrictMarkers) {
    Settings settings;
    settings.binary = true;
    settings.marker = 2;

    EXPECT_EQ(settings.readMode(), ReadMode::BINARY);
    EXPECT_EQ(settings.effectiveMarkerDetails(), MarkerDetails::BINARY_STRICT);
}

TEST(SettingsTests, MarkerLevels) {
    Settings settings;
    settings.marker = 0;
    EXPECT_EQ(settings.effectiveMarkerDetails(), MarkerDetails::NO_DETAILS);
    settings.marker = 2;
    EXPECT_EQ(settings.effectiveMarkerDetails(), MarkerDetails::FULL_DETAILS);
}

TEST(SettingsTests, DebugKeepsOffsetsAndShrinksBuffer) {
    Settings settings;
    settings.noOffsets = true;
    EXPECT_FALSE(settings.effectivePrintOffsets());

    settings.debug = 1;
    EXPECT_TRUE(settings.effectivePrintOffsets());
    EXPECT_EQ(settings.chunkSize(), Reader::READ_CHUNK_SIZE_DEBUG);
    EXPECT_TRUE(settings.outputOptions().debug);

    settings.buffer = 16;
    EXPECT_EQ(settings.chunkSize(), 16u);
}

TEST(SettingsTests, ReaderOptionsCarryLimits) {
    Settings settings;
    settings.filename = "input.bin";
    settings.maxBytes = 100;
    settings.maxLines = 3;

    const ReaderOptions options = settings.readerOptions();
    EXPECT_EQ(options.filename, "input.bin");
    EXPECT_EQ(options.maxBytes, 100u);
    EXPECT_EQ(options.maxLines, 3u);
    EXPECT_EQ(options.chunkSize, Reader::READ_CHUNK_SIZE);
}
