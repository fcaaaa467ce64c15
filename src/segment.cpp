#include "segment.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace escview {

namespace {
constexpr bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}
} // namespace

size_t utf8Length(std::string_view s) {
    size_t count = 0;
    for (char c : s) {
        if (!isContinuation(c)) count++;
    }
    return count;
}

size_t utf8Offset(std::string_view s, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (isContinuation(s[i])) continue;
        if (seen == count) return i;
        seen++;
    }
    return s.size();
}

Segment::Segment(SequenceSGR openingSeq, std::string_view typeLabel, std::string_view raw, std::string_view processed)
    : openingSeq(std::move(openingSeq)), typeLabel(typeLabel), raw(raw), processed(processed) {}

Segment Segment::split(size_t numBytes) {
    if (!isConsistent()) {
        throw SegmentSplitError(
            "Cannot split inconsistent segment " + to_string() + ": processed text is not aligned "
            "with raw bytes, which is only allowed in text mode");
    }
    if (numBytes > raw.size()) {
        throw SegmentSplitError("Split point " + std::to_string(numBytes) + " is beyond segment " + to_string());
    }

    const size_t processedCut = utf8Offset(processed, numBytes);
    Segment left(openingSeq, typeLabel, std::string_view(raw).substr(0, numBytes),
                 std::string_view(processed).substr(0, processedCut));

    raw.erase(0, numBytes);
    processed.erase(0, processedCut);
    return left;
}

bool Segment::operator==(const Segment& other) const {
    return openingSeq == other.openingSeq
        && typeLabel == other.typeLabel
        && raw == other.raw
        && processed == other.processed;
}

std::string Segment::to_string() const {
    return "Segment<" + typeLabel + ">[" + logging::hexBytes(raw) + "]->[" + processed + "]";
}

} // namespace escview
