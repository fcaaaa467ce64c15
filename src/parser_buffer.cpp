#include "parser_buffer.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace escview {

ParserBuffer::ParserBuffer() : log(logging::component("parsbuf")) {}

void ParserBuffer::append(std::string_view bytes, bool finish) {
    rawBuffer.append(bytes);
    isClosed = finish;

    log->trace("Appending {} bytes", bytes.size());
    log->trace("Buffer state: {}", logging::preview(rawBuffer));
    if (finish)
        log->debug("Closing buffer for input");
}

void ParserBuffer::retainSuffix(std::string_view remainder) {
    if (remainder.empty()) {
        rawBuffer.clear();
        log->trace("Purging");
        return;
    }

    const bool isSuffix = remainder.size() <= rawBuffer.size() &&
        std::string_view(rawBuffer).substr(rawBuffer.size() - remainder.size()) == remainder;
    if (!isSuffix)
        throw ParserInconsistency("Retained bytes are not a suffix of the parser buffer: " + logging::preview(remainder, 32));

    // `remainder` may point into rawBuffer, so copy before erasing
    rawBuffer = std::string(remainder);
    log->trace("Cropping, buffer state: {}", logging::preview(rawBuffer));
}

} // namespace escview
