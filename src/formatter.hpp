#pragma once
#include "chain.hpp"
#include "modes.hpp"
#include "output.hpp"
#include "parser_buffer.hpp"
#include "printer.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace escview {

/**
 * @brief Drives detach and print cycles over the chain
 *
 * format() is called after every parse pass. It writes everything the chain can
 * give without more input, and drains the rest once the parser buffer is closed.
 */
class AbstractFormatter
{
protected:
    ParserBuffer& parserBuffer;
    Chain& chain;
    OutputWriter& output;
    std::shared_ptr<spdlog::logger> log;
    size_t offset = 0;

    const SegmentPrinter hexPrinter = SegmentPrinter::hex();
    const SegmentPrinter processedPrinter = SegmentPrinter::processed();
    const SegmentPrinter debugRawPrinter = SegmentPrinter::debugRaw();
    const SegmentPrinter debugSafePrinter = SegmentPrinter::debugSafe();
    const SegmentPrinter debugSgrPrinter = SegmentPrinter::debugSgr();

public:
    AbstractFormatter(ParserBuffer& parserBuffer, Chain& chain, OutputWriter& output, const std::string& name);
    virtual ~AbstractFormatter() = default;

    virtual void format() = 0;

    size_t getOffset() const { return offset; }
};

// Annotated hex dump: offset, hex bytes in groups of four, processed column
class BinaryFormatter : public AbstractFormatter
{
    size_t columns; // 0 = fit to the terminal

public:
    BinaryFormatter(ParserBuffer& parserBuffer, Chain& chain, OutputWriter& output, size_t columns = 0);

    void format() override;

    static size_t computeColumns(int width, size_t prefixWidth);
    // Width of the hex column for `numBytes` bytes
    static size_t hexWidth(size_t numBytes);
};

// Processed text, line by line, optionally numbered
class TextFormatter : public AbstractFormatter
{
    size_t lineNumber = 1;

public:
    TextFormatter(ParserBuffer& parserBuffer, Chain& chain, OutputWriter& output);

    void format() override;
};

class FormatterFactory
{
public:
    static std::unique_ptr<AbstractFormatter> create(ReadMode readMode, ParserBuffer& parserBuffer, Chain& chain,
                                                     OutputWriter& output, size_t columns = 0);
};

} // namespace escview
