#include "settings.hpp"
#include "errors.hpp"

namespace escview {

void Settings::validate() const {
    if (text && binary)
        throw ArgumentError("Options --text and --binary are mutually exclusive");
    if (decimalOffsets && noOffsets)
        throw ArgumentError("Options --decimal-offsets and --no-offsets are mutually exclusive");

    for (CharClass charClass : ALL_CHAR_CLASSES) {
        const auto idx = static_cast<size_t>(charClass);
        if (focus[idx] && ignore[idx]) {
            const std::string name(charClassName(charClass));
            throw ArgumentError("Options --focus-" + name + " and --ignore-" + name + " are mutually exclusive");
        }
    }

    if (maxLines < 0)
        throw ArgumentError("--max-lines cannot be negative");
    if (maxBytes < 0)
        throw ArgumentError("--max-bytes cannot be negative");
    if (buffer < 0)
        throw ArgumentError("--buffer cannot be negative");
    if (columns < 0)
        throw ArgumentError("--columns cannot be negative");
}

ReadMode Settings::readMode() const {
    return binary ? ReadMode::BINARY : ReadMode::TEXT;
}

DisplayMode Settings::displayMode(CharClass charClass) const {
    const auto idx = static_cast<size_t>(charClass);
    if (ignore[idx])
        return DisplayMode::IGNORED;
    if (focus[idx])
        return DisplayMode::FOCUSED;
    return DisplayMode::DEFAULT;
}

MarkerDetails Settings::effectiveMarkerDetails() const {
    if (binary)
        return MarkerDetails::BINARY_STRICT;
    if (marker <= 0)
        return MarkerDetails::NO_DETAILS;
    if (marker == 1)
        return MarkerDetails::BRIEF_DETAILS;
    return MarkerDetails::FULL_DETAILS;
}

bool Settings::effectivePrintOffsets() const {
    return debug > 0 || !noOffsets;
}

size_t Settings::chunkSize() const {
    if (buffer > 0)
        return static_cast<size_t>(buffer);
    return debug > 0 ? Reader::READ_CHUNK_SIZE_DEBUG : Reader::READ_CHUNK_SIZE;
}

TemplateConfig Settings::templateConfig() const {
    TemplateConfig config;
    config.readMode = readMode();
    config.markerDetails = effectiveMarkerDetails();
    config.decode = decode;
    config.noSeparators = noSeparators;
    config.noColorMarkers = noColorMarkers;
    for (CharClass charClass : ALL_CHAR_CLASSES)
        config.displayModes[static_cast<size_t>(charClass)] = displayMode(charClass);
    return config;
}

ReaderOptions Settings::readerOptions() const {
    return {filename, chunkSize(), static_cast<size_t>(maxBytes), static_cast<size_t>(maxLines)};
}

OutputOptions Settings::outputOptions() const {
    OutputOptions options;
    options.printOffsets = effectivePrintOffsets();
    options.decimalOffsets = decimalOffsets;
    options.lineNumbers = !noLineNumbers;
    options.debug = debug > 0;
    return options;
}

} // namespace escview
