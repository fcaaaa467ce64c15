#pragma once
#include "sgr.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace escview {

struct OutputOptions
{
    bool printOffsets = true;
    bool decimalOffsets = false;
    bool lineNumbers = true;
    bool debug = false;
};

// Terminal width from the tty, then $COLUMNS, then 80; two columns are kept free unless `exact`
int terminalWidth(bool exact = false);

/**
 * @brief Writes formatted rows to the output stream
 *
 * Knows how to render the offset and line number prefixes that precede rows.
 */
class OutputWriter
{
    std::ostream& out;
    OutputOptions options;

public:
    static constexpr size_t PREFIX_LEN = 8;

    OutputWriter(std::ostream& out, OutputOptions options = {});

    void write(std::string_view s);
    void writeWithOffset(std::string_view s, size_t offset);
    void writeWithLineNumber(std::string_view s, size_t lineNumber);

    // Cyan "│", gray when debugging
    std::string separator() const;
    // Label right-aligned and cut to PREFIX_LEN, followed by the separator
    std::string formatPrefix(std::string_view label, const SequenceSGR& style) const;
    std::string formatOffset(size_t offset, const SequenceSGR& style = seqs::GREEN) const;
    // "0x" + hex padded to an even number of digits, or plain decimal
    std::string offsetLabel(size_t offset) const;

    // Visible width of the offset prefix, 0 when offsets are off
    size_t offsetPrefixWidth() const;

    const OutputOptions& getOptions() const { return options; }
};

} // namespace escview
