#include "output.hpp"
#include <cstdlib>
#include <fmt/format.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace escview {

namespace {

std::string styled(std::string_view s, const SequenceSGR& style) {
    return style.assemble() + std::string(s) + style.closing().assemble();
}

} // namespace

int terminalWidth(bool exact) {
    int width = 80;

    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        width = ws.ws_col;
    } else if (const char* columns = std::getenv("COLUMNS")) {
        const int parsed = std::atoi(columns);
        if (parsed > 0)
            width = parsed;
    }
    return exact ? width : width - 2;
}

OutputWriter::OutputWriter(std::ostream& out, OutputOptions options) : out(out), options(options) {}

void OutputWriter::write(std::string_view s) {
    out << s;
    out.flush();
}

void OutputWriter::writeWithOffset(std::string_view s, size_t offset) {
    if (options.printOffsets)
        out << formatOffset(offset);
    write(s);
}

void OutputWriter::writeWithLineNumber(std::string_view s, size_t lineNumber) {
    if (options.debug) {
        out << formatPrefix(std::to_string(lineNumber), seqs::GREEN);
    } else if (options.lineNumbers) {
        out << styled(fmt::format("{:2}", lineNumber), seqs::GREEN) << separator();
    }
    write(s);
}

std::string OutputWriter::separator() const {
    return styled("\xE2\x94\x82", options.debug ? seqs::GRAY : seqs::CYAN); // │
}

std::string OutputWriter::formatPrefix(std::string_view label, const SequenceSGR& style) const {
    std::string text(label.substr(0, PREFIX_LEN));
    text.insert(0, PREFIX_LEN - text.size(), ' ');
    return styled(text, style) + separator();
}

std::string OutputWriter::formatOffset(size_t offset, const SequenceSGR& style) const {
    return formatPrefix(offsetLabel(offset), style);
}

std::string OutputWriter::offsetLabel(size_t offset) const {
    const std::string decimal = std::to_string(offset);
    if (options.decimalOffsets)
        return decimal;

    const size_t digits = (decimal.size() + 1) / 2 * 2;
    return fmt::format("0x{:0{}x}", offset, digits);
}

size_t OutputWriter::offsetPrefixWidth() const {
    return options.printOffsets ? PREFIX_LEN + 1 : 0;
}

} // namespace escview
