#include "formatter.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace escview {

AbstractFormatter::AbstractFormatter(ParserBuffer& parserBuffer, Chain& chain, OutputWriter& output, const std::string& name)
    : parserBuffer(parserBuffer), chain(chain), output(output), log(logging::component(name)) {}

// --- Binary ---

BinaryFormatter::BinaryFormatter(ParserBuffer& parserBuffer, Chain& chain, OutputWriter& output, size_t columns)
    : AbstractFormatter(parserBuffer, chain, output, "binfmt"), columns(columns) {}

size_t BinaryFormatter::computeColumns(int width, size_t prefixWidth) {
    // Every group takes 3 chars per byte, 3 for the processed column and 2 for the gap
    constexpr int chunkWidth = 3 * BYTE_CHUNK_LEN + (BYTE_CHUNK_LEN - 1) + 2;
    const int available = width - static_cast<int>(prefixWidth) - 1;
    const int chunks = std::max(1, available / chunkWidth);
    return static_cast<size_t>(chunks) * BYTE_CHUNK_LEN;
}

size_t BinaryFormatter::hexWidth(size_t numBytes) {
    if (numBytes == 0)
        return 0;
    return 3 * numBytes + (numBytes - 1) / BYTE_CHUNK_LEN;
}

void BinaryFormatter::format() {
    size_t cols = columns;
    if (cols == 0) {
        cols = computeColumns(terminalWidth(), output.offsetPrefixWidth());
        log->trace("Columns amount set to: {}", cols);
    }

    const bool force = parserBuffer.closed();
    const std::string separator = output.getOptions().printOffsets ? output.separator() : " ";

    while (true) {
        log->debug("Requested {} byte(s)", cols);
        Slice slice;
        try {
            slice = chain.detachBytes(cols, force);
        } catch (const Suspended&) {
            break;
        } catch (const Exhausted&) {
            break;
        }

        const size_t dataLen = chain.lastDetachedDataLen();
        const std::string padding(hexWidth(cols) - hexWidth(dataLen), ' ');

        if (log->should_log(spdlog::level::trace))
            log->trace("{} {}", output.offsetLabel(offset), render(slice, debugSgrPrinter));
        if (log->should_log(spdlog::level::debug)) {
            log->debug("{} {}{} |{}", output.offsetLabel(offset), render(slice, debugRawPrinter), padding,
                       render(slice, debugSafePrinter));
        }

        output.writeWithOffset(render(slice, hexPrinter) + padding + " " + separator +
                               render(slice, processedPrinter) + "\n", offset);
        offset += dataLen;
    }

    if (force && output.getOptions().printOffsets)
        output.write(output.formatOffset(offset, seqs::HI_GREEN) + "\n");
}

// --- Text ---

TextFormatter::TextFormatter(ParserBuffer& parserBuffer, Chain& chain, OutputWriter& output)
    : AbstractFormatter(parserBuffer, chain, output, "txtfmt") {}

void TextFormatter::format() {
    const bool force = parserBuffer.closed();

    while (true) {
        log->debug("Requested line");
        Slice slice;
        try {
            slice = chain.detachLine(force);
        } catch (const Suspended&) {
            break;
        } catch (const Exhausted&) {
            break;
        }

        if (log->should_log(spdlog::level::trace)) {
            log->trace("{} {}", output.offsetLabel(offset), render(slice, debugSgrPrinter));
            log->trace("{} {}", output.offsetLabel(offset), render(slice, debugRawPrinter));
        }
        if (log->should_log(spdlog::level::debug))
            log->debug("{} {}", output.offsetLabel(offset), render(slice, debugSafePrinter));

        const std::string line = render(slice, processedPrinter);
        output.writeWithLineNumber(line, lineNumber);

        const std::string plain = stripSgr(line);
        if (plain.empty() || plain.back() != '\n')
            output.write("\n");

        offset += chain.lastDetachedDataLen();
        lineNumber++;
    }

    if (force)
        log->debug("EOF");
}

// --- Factory ---

std::unique_ptr<AbstractFormatter> FormatterFactory::create(ReadMode readMode, ParserBuffer& parserBuffer, Chain& chain,
                                                            OutputWriter& output, size_t columns) {
    switch (readMode) {
        case ReadMode::TEXT:
            return std::make_unique<TextFormatter>(parserBuffer, chain, output);
        case ReadMode::BINARY:
            return std::make_unique<BinaryFormatter>(parserBuffer, chain, output, columns);
    }
    throw std::runtime_error("Invalid read mode");
}

} // namespace escview
