#include "sgr.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace escview {

namespace {

// Resetter for a single (non-extended) parameter, or -1 if there is none
int resetterFor(int code) {
    switch (code) {
        case sgr::BOLD:
        case sgr::DIM:               return sgr::BOLD_DIM_OFF;
        case sgr::ITALIC:            return sgr::ITALIC_OFF;
        case sgr::UNDERLINED:
        case sgr::DOUBLE_UNDERLINED: return sgr::UNDERLINED_OFF;
        case sgr::BLINK_SLOW:
        case sgr::BLINK_FAST:        return sgr::BLINK_OFF;
        case sgr::INVERSED:          return sgr::INVERSED_OFF;
        case sgr::HIDDEN:            return sgr::HIDDEN_OFF;
        case sgr::CROSSLINED:        return sgr::CROSSLINED_OFF;
        case sgr::OVERLINED:         return sgr::OVERLINED_OFF;
        default: break;
    }
    if (sgr::isColor(code)) return sgr::COLOR_OFF;
    if (sgr::isBgColor(code)) return sgr::BG_COLOR_OFF;
    return -1;
}

// Number of params taken by an extended color starting at `pos` (0 if it is not one)
size_t extendedColorLength(const std::vector<int>& params, size_t pos) {
    if (params[pos] != sgr::COLOR_EXTENDED && params[pos] != sgr::BG_COLOR_EXTENDED)
        return 0;
    const size_t left = params.size() - pos - 1;
    if (left >= 2 && params[pos + 1] == sgr::EXTENDED_MODE_256)
        return 3;
    if (left >= 4 && params[pos + 1] == sgr::EXTENDED_MODE_RGB)
        return 5;
    return 0;
}

// Length of an assembled SGR starting at `pos`, or 0
size_t sgrLengthAt(std::string_view s, size_t pos) {
    if (pos + 2 >= s.size() || s[pos] != sgr::ESC || s[pos + 1] != sgr::INTRODUCER)
        return 0;
    size_t end = pos + 2;
    while (end < s.size() && (std::isdigit(static_cast<unsigned char>(s[end])) || s[end] == sgr::SEPARATOR))
        end++;
    if (end >= s.size() || s[end] != sgr::TERMINATOR)
        return 0;
    return end - pos + 1;
}

} // namespace

SequenceSGR::SequenceSGR(std::initializer_list<int> codes) : params(codes) {
    for (auto& p : params) p = std::max(0, p);
}

SequenceSGR::SequenceSGR(std::vector<int> codes) : params(std::move(codes)) {
    for (auto& p : params) p = std::max(0, p);
}

SequenceSGR SequenceSGR::color256(int index, bool bg) {
    return SequenceSGR{bg ? sgr::BG_COLOR_EXTENDED : sgr::COLOR_EXTENDED, sgr::EXTENDED_MODE_256, index};
}

std::string SequenceSGR::assemble() const {
    if (params.empty())
        return "";

    std::string result{sgr::ESC, sgr::INTRODUCER};
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) result += sgr::SEPARATOR;
        result += std::to_string(params[i]);
    }
    result += sgr::TERMINATOR;
    return result;
}

SequenceSGR SequenceSGR::closing() const {
    std::vector<int> closingParams;
    size_t pos = 0;
    while (pos < params.size()) {
        if (size_t extLen = extendedColorLength(params, pos)) {
            closingParams.push_back(params[pos] == sgr::COLOR_EXTENDED ? sgr::COLOR_OFF : sgr::BG_COLOR_OFF);
            pos += extLen;
            continue;
        }
        int resetter = resetterFor(params[pos]);
        if (resetter >= 0)
            closingParams.push_back(resetter);
        pos++;
    }
    return SequenceSGR(std::move(closingParams));
}

bool SequenceSGR::isNoop() const {
    return std::all_of(params.begin(), params.end(), [](int p) { return p == sgr::RESET; });
}

SequenceSGR SequenceSGR::operator+(const SequenceSGR& other) const {
    std::vector<int> merged = params;
    merged.insert(merged.end(), other.params.begin(), other.params.end());
    return SequenceSGR(std::move(merged));
}

std::string SequenceSGR::to_string() const {
    std::string result = "SGR[";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) result += ',';
        result += std::to_string(params[i]);
    }
    return result + "]";
}

std::string escapeSgr(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        if (size_t len = sgrLengthAt(s, pos)) {
            result += "[\xC7\x9D"; // ǝ
            result += s.substr(pos + 2, len - 3);
            result += ']';
            pos += len;
            continue;
        }
        result += s[pos++];
    }
    return result;
}

std::string stripSgr(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        if (size_t len = sgrLengthAt(s, pos)) {
            pos += len;
            continue;
        }
        result += s[pos++];
    }
    return result;
}

std::vector<int> parseSgrParams(std::string_view params) {
    std::vector<int> codes;
    size_t start = 0;
    while (start <= params.size()) {
        size_t end = params.find(sgr::SEPARATOR, start);
        if (end == std::string_view::npos) end = params.size();

        std::string_view piece = params.substr(start, end - start);
        int value = 0;
        auto [ptr, ec] = std::from_chars(piece.data(), piece.data() + piece.size(), value);
        if (!piece.empty() && ec == std::errc() && ptr == piece.data() + piece.size())
            codes.push_back(value);

        start = end + 1;
    }
    return codes;
}

} // namespace escview
