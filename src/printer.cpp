#include "printer.hpp"
#include <fmt/format.h>

namespace escview {

std::string SegmentPrinter::printSgr(const SequenceSGR& seq) const {
    if (!applySgr)
        return "";
    if (encodeSgr)
        return escapeSgr(seq.assemble());
    return seq.assemble();
}

std::string SegmentPrinter::rawToHex(const Segment& segment, size_t position) {
    std::string result;
    result.reserve(segment.dataLen() * 3);
    for (unsigned char b : segment.getRaw()) {
        if (position > 0 && position % BYTE_CHUNK_LEN == 0)
            result += ' ';
        result += fmt::format(" {:02x}", b);
        position++;
    }
    return result;
}

std::string SegmentPrinter::rawToSafe(const Segment& segment, size_t) {
    std::string result;
    for (unsigned char b : segment.getRaw()) {
        if ((b >= 0x09 && b <= 0x0d) || b == 0x20)
            result += "\xC2\xB7"; // ·
        else if (b < 0x21 || b > 0x7e)
            result += "\xE2\x96\xAF"; // ▯
        else
            result += static_cast<char>(b);
    }
    return result;
}

std::string SegmentPrinter::processedNoop(const Segment& segment, size_t) {
    return segment.getProcessed();
}

} // namespace escview
