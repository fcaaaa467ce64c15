#pragma once
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace escview {

namespace sgr {

// SGR (Select Graphic Rendition) parameter codes
enum Code : int {
    RESET              = 0,
    BOLD               = 1,
    DIM                = 2,
    ITALIC             = 3,
    UNDERLINED         = 4,
    BLINK_SLOW         = 5,
    BLINK_FAST         = 6,
    INVERSED           = 7,
    HIDDEN             = 8,
    CROSSLINED         = 9,
    DOUBLE_UNDERLINED  = 21,
    BOLD_DIM_OFF       = 22,
    ITALIC_OFF         = 23,
    UNDERLINED_OFF     = 24,
    BLINK_OFF          = 25,
    INVERSED_OFF       = 27,
    HIDDEN_OFF         = 28,
    CROSSLINED_OFF     = 29,
    BLACK              = 30,
    RED                = 31,
    GREEN              = 32,
    YELLOW             = 33,
    BLUE               = 34,
    MAGENTA            = 35,
    CYAN               = 36,
    WHITE              = 37,
    COLOR_EXTENDED     = 38,
    COLOR_OFF          = 39,
    BG_BLACK           = 40,
    BG_RED             = 41,
    BG_GREEN           = 42,
    BG_YELLOW          = 43,
    BG_BLUE            = 44,
    BG_MAGENTA         = 45,
    BG_CYAN            = 46,
    BG_WHITE           = 47,
    BG_COLOR_EXTENDED  = 48,
    BG_COLOR_OFF       = 49,
    OVERLINED          = 53,
    OVERLINED_OFF      = 55,
    GRAY               = 90,
    HI_RED             = 91,
    HI_GREEN           = 92,
    HI_YELLOW          = 93,
    HI_BLUE            = 94,
    HI_MAGENTA         = 95,
    HI_CYAN            = 96,
    HI_WHITE           = 97,
    BG_GRAY            = 100,
    BG_HI_WHITE        = 107,
};

// Second parameter of 38/48
constexpr int EXTENDED_MODE_256 = 5;
constexpr int EXTENDED_MODE_RGB = 2;

constexpr char ESC        = '\x1b';
constexpr char INTRODUCER = '[';
constexpr char TERMINATOR = 'm';
constexpr char SEPARATOR  = ';';

constexpr bool isColor(int code) {
    return (code >= BLACK && code <= WHITE) || (code >= GRAY && code <= HI_WHITE);
}

constexpr bool isBgColor(int code) {
    return (code >= BG_BLACK && code <= BG_WHITE) || (code >= BG_GRAY && code <= BG_HI_WHITE);
}

} // namespace sgr

// Ordered list of SGR parameters. An empty list is a no-op and assembles to nothing.
class SequenceSGR
{
    std::vector<int> params;

public:
    SequenceSGR() = default;
    SequenceSGR(std::initializer_list<int> codes);
    explicit SequenceSGR(std::vector<int> codes);

    static SequenceSGR color256(int index, bool bg = false);

    const std::vector<int>& getParams() const { return params; }

    std::string assemble() const;
    SequenceSGR closing() const;

    // No params, or only resets: nothing to bracket
    bool isNoop() const;

    SequenceSGR operator+(const SequenceSGR& other) const;
    bool operator==(const SequenceSGR& other) const { return params == other.params; }
    bool operator!=(const SequenceSGR& other) const { return params != other.params; }

    std::string to_string() const;
};

// Replaces every assembled SGR in `s` with its escaped form "[ǝ<params>]"
std::string escapeSgr(std::string_view s);

// Removes every assembled SGR from `s`
std::string stripSgr(std::string_view s);

// Splits "1;31;;4" into {1, 31, 4}; pieces that are not plain numbers are skipped
std::vector<int> parseSgrParams(std::string_view params);

// Common styles
namespace seqs {
inline const SequenceSGR RESET{sgr::RESET};
inline const SequenceSGR BOLD{sgr::BOLD};
inline const SequenceSGR DIM{sgr::DIM};
inline const SequenceSGR INVERSED{sgr::INVERSED};
inline const SequenceSGR UNDERLINED{sgr::UNDERLINED};
inline const SequenceSGR BLACK{sgr::BLACK};
inline const SequenceSGR RED{sgr::RED};
inline const SequenceSGR GREEN{sgr::GREEN};
inline const SequenceSGR YELLOW{sgr::YELLOW};
inline const SequenceSGR MAGENTA{sgr::MAGENTA};
inline const SequenceSGR CYAN{sgr::CYAN};
inline const SequenceSGR GRAY{sgr::GRAY};
inline const SequenceSGR HI_RED{sgr::HI_RED};
inline const SequenceSGR HI_GREEN{sgr::HI_GREEN};
inline const SequenceSGR HI_YELLOW{sgr::HI_YELLOW};
inline const SequenceSGR HI_BLUE{sgr::HI_BLUE};
inline const SequenceSGR HI_CYAN{sgr::HI_CYAN};
inline const SequenceSGR BG_BLACK{sgr::BG_BLACK};
inline const SequenceSGR BG_CYAN{sgr::BG_CYAN};
inline const SequenceSGR BG_WHITE{sgr::BG_WHITE};
} // namespace seqs

} // namespace escview

namespace std {
template <>
struct hash<escview::SequenceSGR> {
    size_t operator()(const escview::SequenceSGR& seq) const noexcept {
        return hash<string>{}(seq.assemble());
    }
};
} // namespace std
