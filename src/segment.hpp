#pragma once
#include "sgr.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace escview {

// Number of code points in a UTF-8 string (continuation bytes are not counted)
size_t utf8Length(std::string_view s);

// Byte offset at which the code point with index `count` starts
size_t utf8Offset(std::string_view s, size_t count);

/**
 * @brief A classified run of raw bytes together with its display text and style
 *
 * A segment is consistent when its processed text has exactly one code point per
 * raw byte. Only consistent segments can be split.
 */
class Segment
{
    SequenceSGR openingSeq;
    std::string typeLabel;
    std::string raw;
    std::string processed;

public:
    Segment(SequenceSGR openingSeq, std::string_view typeLabel, std::string_view raw, std::string_view processed);

    // Cuts off the first `numBytes` bytes and returns them; this segment keeps the rest
    Segment split(size_t numBytes);

    size_t dataLen() const { return raw.size(); }
    bool isNewline() const { return processed.find('\n') != std::string::npos; }
    bool isConsistent() const { return utf8Length(processed) == raw.size(); }

    const SequenceSGR& getOpeningSeq() const { return openingSeq; }
    const std::string& getTypeLabel() const { return typeLabel; }
    const std::string& getRaw() const { return raw; }
    const std::string& getProcessed() const { return processed; }

    bool operator==(const Segment& other) const;

    std::string to_string() const;
};

enum class MarkerKind
{
    START,    // opens a style for the segments that follow
    STOP,     // ends the style opened by the matching START
    ONE_USE,  // emitted once, not tracked
};

// Zero-length chain element carrying a style
struct StyleMarker
{
    MarkerKind kind;
    SequenceSGR ref;
};

using Chainable = std::variant<Segment, StyleMarker>;

inline size_t dataLen(const Chainable& element) {
    if (const auto* seg = std::get_if<Segment>(&element))
        return seg->dataLen();
    return 0;
}

inline bool isNewline(const Chainable& element) {
    if (const auto* seg = std::get_if<Segment>(&element))
        return seg->isNewline();
    return false;
}

} // namespace escview
