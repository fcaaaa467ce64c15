#pragma once
#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace escview {

enum class ReadMode
{
    TEXT,
    BINARY,
};

enum class DisplayMode
{
    DEFAULT,
    FOCUSED,
    IGNORED,
};

enum class CharClass
{
    CONTROL_CHAR,
    ESCAPE_SEQ,
    WHITESPACE,
    UTF_8_SEQ,
    BINARY_DATA,
    PRINTABLE_CHAR,
};

constexpr size_t CHAR_CLASS_COUNT = 6;

enum class MarkerDetails
{
    NO_DETAILS = 0,
    BRIEF_DETAILS = 1,
    FULL_DETAILS = 2,
    BINARY_STRICT = 3, // len(raw) must equal len(processed)
};

constexpr std::string_view TYPE_LABEL_DETAILS = "*";

constexpr std::string_view typeLabel(CharClass charClass) {
    switch (charClass) {
        case CharClass::CONTROL_CHAR  : return "C";
        case CharClass::ESCAPE_SEQ    : return "E";
        case CharClass::WHITESPACE    : return "S";
        case CharClass::UTF_8_SEQ     : return "U";
        case CharClass::BINARY_DATA   : return "B";
        case CharClass::PRINTABLE_CHAR: return "P";
    }
    return "?";
}

// Name used by the --focus-* / --ignore-* options
constexpr std::string_view charClassName(CharClass charClass) {
    switch (charClass) {
        case CharClass::CONTROL_CHAR  : return "control";
        case CharClass::ESCAPE_SEQ    : return "esc";
        case CharClass::WHITESPACE    : return "space";
        case CharClass::UTF_8_SEQ     : return "utf8";
        case CharClass::BINARY_DATA   : return "binary";
        case CharClass::PRINTABLE_CHAR: return "printable";
    }
    return "?";
}

constexpr std::array<CharClass, CHAR_CLASS_COUNT> ALL_CHAR_CLASSES = {
    CharClass::CONTROL_CHAR, CharClass::ESCAPE_SEQ, CharClass::WHITESPACE,
    CharClass::UTF_8_SEQ, CharClass::BINARY_DATA, CharClass::PRINTABLE_CHAR,
};

/**
 * @brief Value which is almost always equal to a default, with sparse overrides
 *
 * Overrides can be keyed by display mode or by read mode. Lookup checks the
 * display mode first, then the read mode, then falls back to the default.
 */
template <typename V>
class PartialOverride
{
    V defaultValue;
    std::map<DisplayMode, V> byDisplayMode;
    std::map<ReadMode, V> byReadMode;

public:
    PartialOverride(V value) : defaultValue(std::move(value)) {}
    PartialOverride(V value, std::map<DisplayMode, V> displayOverrides, std::map<ReadMode, V> readOverrides = {})
        : defaultValue(std::move(value)), byDisplayMode(std::move(displayOverrides)), byReadMode(std::move(readOverrides)) {}
    PartialOverride(V value, std::map<ReadMode, V> readOverrides)
        : defaultValue(std::move(value)), byReadMode(std::move(readOverrides)) {}

    const V& get() const { return defaultValue; }

    const V& get(DisplayMode displayMode, ReadMode readMode) const {
        if (auto it = byDisplayMode.find(displayMode); it != byDisplayMode.end())
            return it->second;
        if (auto it = byReadMode.find(readMode); it != byReadMode.end())
            return it->second;
        return defaultValue;
    }

    void set(DisplayMode key, V value) { byDisplayMode[key] = std::move(value); }
    void set(ReadMode key, V value) { byReadMode[key] = std::move(value); }

    bool hasKey(DisplayMode key) const { return byDisplayMode.count(key) > 0; }
    bool hasKey(ReadMode key) const { return byReadMode.count(key) > 0; }
};

} // namespace escview
