#pragma once
#include "modes.hpp"
#include "output.hpp"
#include "reader.hpp"
#include "template.hpp"
#include <array>
#include <cstddef>
#include <string>

namespace escview {

// Flat run configuration as given on the command line
struct Settings
{
    std::string filename;
    bool text = false;   // explicit --text; text is also the default read mode
    bool binary = false;
    std::array<bool, CHAR_CLASS_COUNT> focus{};
    std::array<bool, CHAR_CLASS_COUNT> ignore{};
    long maxLines = 0;
    long maxBytes = 0;
    long buffer = 0;     // 0 = default chunk size
    int debug = 0;
    bool noColorMarkers = false;
    int marker = 1;
    bool noSeparators = false;
    bool noLineNumbers = false;
    long columns = 0;    // 0 = fit to the terminal
    bool decode = false;
    bool decimalOffsets = false;
    bool noOffsets = false;

    // Throws ArgumentError on an invalid combination
    void validate() const;

    // --- Derived values ---
    ReadMode readMode() const;
    DisplayMode displayMode(CharClass charClass) const;
    MarkerDetails effectiveMarkerDetails() const;
    bool effectivePrintOffsets() const;
    size_t chunkSize() const;

    TemplateConfig templateConfig() const;
    ReaderOptions readerOptions() const;
    OutputOptions outputOptions() const;
};

} // namespace escview
