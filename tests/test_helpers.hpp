#pragma once
#include <gtest/gtest.h>
#include "../src/chain.hpp"
#include "../src/parser.hpp"
#include "../src/parser_buffer.hpp"
#include "../src/runner.hpp"
#include "../src/settings.hpp"
#include "../src/template_registry.hpp"
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_literals;

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Segments currently held by the chain, style markers skipped
 */
inline std::vector<escview::Segment> chainSegments(const escview::Chain& chain) {
    std::vector<escview::Segment> result;
    for (const auto& element : chain.getElements()) {
        if (const auto* segment = std::get_if<escview::Segment>(&element))
            result.push_back(*segment);
    }
    return result;
}

inline std::string joinRaw(const std::vector<escview::Segment>& segments) {
    std::string result;
    for (const auto& segment : segments) result += segment.getRaw();
    return result;
}

inline std::string joinProcessed(const std::vector<escview::Segment>& segments) {
    std::string result;
    for (const auto& segment : segments) result += segment.getProcessed();
    return result;
}

inline escview::TemplateConfig textConfig(escview::MarkerDetails details = escview::MarkerDetails::BRIEF_DETAILS) {
    escview::TemplateConfig config;
    config.readMode = escview::ReadMode::TEXT;
    config.markerDetails = details;
    return config;
}

inline escview::TemplateConfig binaryConfig() {
    escview::TemplateConfig config;
    config.readMode = escview::ReadMode::BINARY;
    config.markerDetails = escview::MarkerDetails::BINARY_STRICT;
    return config;
}

// ============================================================================
// FIXTURES
// ============================================================================

/**
 * @brief Parser wired to its buffer, chain and registry, fed chunk by chunk
 */
class ParserTestBase : public ::testing::Test {
protected:
    escview::ParserBuffer parserBuffer;
    escview::Chain chain;
    escview::TemplateRegistry registry;
    escview::Parser parser{parserBuffer, chain, registry};
    size_t offset = 0;

    void configure(const escview::TemplateConfig& config) { registry.configure(config); }

    void feed(std::string_view bytes, bool final = false) {
        const size_t bufferOffset = offset - parserBuffer.raw().size();
        parserBuffer.append(bytes, final);
        parser.parse(bufferOffset);
        offset += bytes.size();
    }

    // Feeds `input` in chunks of `chunkSize` bytes (0 = all at once), then closes the buffer
    void feedChunked(std::string_view input, size_t chunkSize = 0) {
        if (chunkSize == 0)
            chunkSize = input.size();
        for (size_t pos = 0; pos < input.size(); pos += chunkSize)
            feed(input.substr(pos, chunkSize));
        feed("", true);
    }

    std::vector<escview::Segment> segments() const { return chainSegments(chain); }
};

/**
 * @brief Runs the whole pipeline over an in-memory input and keeps the output
 */
class RunnerTestBase : public ::testing::Test {
protected:
    escview::Settings settings;

    std::string run(const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        escview::ByteIoRunner runner(settings, out, in);
        runner.run();
        return out.str();
    }

    // Output with every SGR removed
    std::string runPlain(const std::string& input) { return escview::stripSgr(run(input)); }
};
