#pragma once
#include "segment.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace escview {

// Renders a segment; `position` is the number of content bytes already rendered in the current slice
using SegmentFormatFn = std::function<std::string(const Segment& segment, size_t position)>;

/**
 * @brief Segment-to-text visitor applied to every element of a detached slice
 *
 * applySgr controls whether style markers are rendered at all, encodeSgr whether
 * they are rendered as live codes or in the escaped "[ǝ..]" diagnostic form.
 */
class SegmentPrinter
{
    bool applySgr;
    bool encodeSgr;
    SegmentFormatFn formatFn;

public:
    SegmentPrinter(bool applySgr, bool encodeSgr, SegmentFormatFn formatFn)
        : applySgr(applySgr), encodeSgr(encodeSgr), formatFn(std::move(formatFn)) {}

    std::string print(const Segment& segment, size_t position) const { return formatFn(segment, position); }
    std::string printSgr(const SequenceSGR& seq) const;

    // --- Format functions ---
    static std::string rawToHex(const Segment& segment, size_t position);
    static std::string rawToSafe(const Segment& segment, size_t position);
    static std::string processedNoop(const Segment& segment, size_t position);

    // --- Presets ---
    static SegmentPrinter hex() { return {true, false, rawToHex}; }
    static SegmentPrinter processed() { return {true, false, processedNoop}; }
    static SegmentPrinter plainProcessed() { return {false, false, processedNoop}; }
    static SegmentPrinter debugRaw() { return {false, false, rawToHex}; }
    static SegmentPrinter debugSafe() { return {false, false, rawToSafe}; }
    static SegmentPrinter debugSgr() { return {true, true, rawToSafe}; }
};

// Bytes per hex group in binary rows
constexpr size_t BYTE_CHUNK_LEN = 4;

} // namespace escview
