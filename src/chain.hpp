#pragma once
#include "printer.hpp"
#include "segment.hpp"
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace escview {

// Detached part of the chain, renderable on its own
using Slice = std::vector<Chainable>;

/**
 * @brief Ordered buffer of segments and style markers awaiting output
 *
 * Styled segments are bracketed by START/STOP markers followed by a ONE_USE
 * closer. Styles whose START was detached but whose STOP was not are tracked
 * as active, so every detached slice re-opens and closes them itself.
 */
class Chain
{
    std::deque<Chainable> elements;
    std::vector<SequenceSGR> activeStyles;
    size_t dataLength = 0;
    size_t lastDetachedDataLength = 0;
    std::shared_ptr<spdlog::logger> log;

public:
    Chain();

    void attach(Segment segment);
    void attach(std::vector<Segment> segments);

    /**
     * @brief Detaches exactly `numBytes` bytes of content
     * @throws Suspended if fewer bytes are buffered and `force` is not set
     * @throws Exhausted if no segments are left
     */
    Slice detachBytes(size_t numBytes, bool force);

    /**
     * @brief Detaches content up to and including the first newline segment
     * @throws Suspended if there is no newline yet and `force` is not set
     * @throws Exhausted if no segments are left
     */
    Slice detachLine(bool force);

    size_t dataLen() const { return dataLength; }
    size_t lastDetachedDataLen() const { return lastDetachedDataLength; }
    const std::deque<Chainable>& getElements() const { return elements; }
    const std::vector<SequenceSGR>& getActiveStyles() const { return activeStyles; }

private:
    Slice detach(size_t numBytes, bool drain);
    bool hasSegments() const;
    void closeActiveStyle(const SequenceSGR& style);
};

// Renders a slice: segments through the printer, START and ONE_USE markers as SGR
std::string render(const Slice& slice, const SegmentPrinter& printer);

// Total content bytes of a slice
size_t dataLen(const Slice& slice);

} // namespace escview
