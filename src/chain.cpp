#include "chain.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace escview {

Chain::Chain() : log(logging::component("chainbuf")) {}

void Chain::attach(Segment segment) {
    dataLength += segment.dataLen();

    const SequenceSGR opening = segment.getOpeningSeq();
    if (opening.isNoop()) {
        elements.emplace_back(std::move(segment));
        return;
    }
    elements.emplace_back(StyleMarker{MarkerKind::START, opening});
    elements.emplace_back(std::move(segment));
    elements.emplace_back(StyleMarker{MarkerKind::STOP, opening});
    elements.emplace_back(StyleMarker{MarkerKind::ONE_USE, opening.closing()});
}

void Chain::attach(std::vector<Segment> segments) {
    for (auto& segment : segments)
        attach(std::move(segment));
}

Slice Chain::detachBytes(size_t numBytes, bool force) {
    if (!hasSegments())
        throw Exhausted();
    if (dataLength < numBytes && !force) {
        log->trace("Requested {} bytes, {} buffered", numBytes, dataLength);
        throw Suspended();
    }

    const size_t available = std::min(numBytes, dataLength);
    return detach(available, force && available == dataLength);
}

Slice Chain::detachLine(bool force) {
    if (!hasSegments())
        throw Exhausted();

    size_t available = 0;
    bool newlineFound = false;
    for (const auto& element : elements) {
        available += escview::dataLen(element);
        if (escview::isNewline(element)) {
            newlineFound = true;
            break;
        }
    }

    if (!newlineFound && !force) {
        log->trace("No newline among {} buffered bytes", dataLength);
        throw Suspended();
    }
    return detach(available, force && available == dataLength);
}

Slice Chain::detach(size_t numBytes, bool drain) {
    log->trace("Detaching {} bytes of {}{}", numBytes, dataLength, drain ? " (draining)" : "");

    Slice result;
    for (const auto& style : activeStyles)
        result.emplace_back(StyleMarker{MarkerKind::ONE_USE, style});

    size_t left = numBytes;
    while (!elements.empty()) {
        Chainable& front = elements.front();
        // Zero-length elements at a slice boundary belong to the next slice, unless nothing follows
        const bool atBoundary = left == 0 && !drain;

        if (auto* segment = std::get_if<Segment>(&front)) {
            if (atBoundary)
                break;
            if (segment->dataLen() <= left) {
                left -= segment->dataLen();
                result.emplace_back(std::move(*segment));
                elements.pop_front();
            } else {
                result.emplace_back(segment->split(left));
                left = 0;
            }
            continue;
        }

        auto& marker = std::get<StyleMarker>(front);
        if (marker.kind == MarkerKind::START && atBoundary)
            break;

        switch (marker.kind) {
            case MarkerKind::START:
                activeStyles.push_back(marker.ref);
                result.emplace_back(std::move(marker));
                break;
            case MarkerKind::STOP:
                closeActiveStyle(marker.ref);
                break;
            case MarkerKind::ONE_USE:
                result.emplace_back(std::move(marker));
                break;
        }
        elements.pop_front();
    }

    for (const auto& style : activeStyles)
        result.emplace_back(StyleMarker{MarkerKind::ONE_USE, style.closing()});

    lastDetachedDataLength = numBytes - left;
    dataLength -= lastDetachedDataLength;
    return result;
}

bool Chain::hasSegments() const {
    return std::any_of(elements.begin(), elements.end(),
                       [](const Chainable& element) { return std::holds_alternative<Segment>(element); });
}

void Chain::closeActiveStyle(const SequenceSGR& style) {
    auto it = std::find(activeStyles.begin(), activeStyles.end(), style);
    if (it != activeStyles.end())
        activeStyles.erase(it);
}

std::string render(const Slice& slice, const SegmentPrinter& printer) {
    std::string result;
    size_t position = 0;
    for (const auto& element : slice) {
        if (const auto* segment = std::get_if<Segment>(&element)) {
            result += printer.print(*segment, position);
            position += segment->dataLen();
            continue;
        }
        const auto& marker = std::get<StyleMarker>(element);
        if (marker.kind != MarkerKind::STOP)
            result += printer.printSgr(marker.ref);
    }
    return result;
}

size_t dataLen(const Slice& slice) {
    size_t total = 0;
    for (const auto& element : slice)
        total += escview::dataLen(element);
    return total;
}

} // namespace escview
