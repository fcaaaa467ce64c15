#include "template.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace escview {

namespace {

constexpr std::array<std::string_view, 8> COLOR_NAMES = {"blk", "red", "grn", "yel", "blu", "mag", "cyn", "wht"};

std::string hexByte(unsigned char b) {
    return fmt::format("{:02x}", b);
}

std::string abbreviate(int code) {
    switch (code) {
        case sgr::RESET            : return "0";
        case sgr::BOLD             : return "b";
        case sgr::DIM              : return "d";
        case sgr::ITALIC           : return "i";
        case sgr::UNDERLINED       : return "u";
        case sgr::DOUBLE_UNDERLINED: return "uu";
        case sgr::BLINK_SLOW       :
        case sgr::BLINK_FAST       : return "bl";
        case sgr::INVERSED         : return "inv";
        case sgr::HIDDEN           : return "hid";
        case sgr::CROSSLINED       : return "x";
        case sgr::OVERLINED        : return "ov";
        case sgr::BOLD_DIM_OFF     : return "-b";
        case sgr::ITALIC_OFF       : return "-i";
        case sgr::UNDERLINED_OFF   : return "-u";
        case sgr::BLINK_OFF        : return "-bl";
        case sgr::INVERSED_OFF     : return "-inv";
        case sgr::HIDDEN_OFF       : return "-hid";
        case sgr::CROSSLINED_OFF   : return "-x";
        case sgr::OVERLINED_OFF    : return "-ov";
        case sgr::COLOR_OFF        : return "fg";
        case sgr::BG_COLOR_OFF     : return "@bg";
        default: break;
    }
    if (code >= sgr::BLACK && code <= sgr::WHITE)
        return std::string(COLOR_NAMES[code - sgr::BLACK]);
    if (code >= sgr::GRAY && code <= sgr::HI_WHITE)
        return "hi" + std::string(COLOR_NAMES[code - sgr::GRAY]);
    if (code >= sgr::BG_BLACK && code <= sgr::BG_WHITE)
        return "@" + std::string(COLOR_NAMES[code - sgr::BG_BLACK]);
    if (code >= sgr::BG_GRAY && code <= sgr::BG_HI_WHITE)
        return "@hi" + std::string(COLOR_NAMES[code - sgr::BG_GRAY]);
    return std::to_string(code);
}

bool isExtendedColor(int code) {
    return code == sgr::COLOR_EXTENDED || code == sgr::BG_COLOR_EXTENDED;
}

// Length of a complete extended color starting at params[i] (3 or 5), 0 if incomplete
size_t extendedColorAt(const std::vector<int>& params, size_t i) {
    if (!isExtendedColor(params[i]))
        return 0;
    if (i + 2 < params.size() && params[i + 1] == sgr::EXTENDED_MODE_256)
        return 3;
    if (i + 4 < params.size() && params[i + 1] == sgr::EXTENDED_MODE_RGB)
        return 5;
    return 0;
}

} // namespace

Template::Template(TemplateKind kind, CharClass charClass, OpeningSeqPOV openingSeqs, LabelPOV labels)
    : kind(kind), charClass(charClass), openingSeqs(std::move(openingSeqs)), labels(std::move(labels)) {
    if (!this->openingSeqs.hasKey(DisplayMode::FOCUSED))
        this->openingSeqs.set(DisplayMode::FOCUSED, this->openingSeqs.get() + seqs::INVERSED);
    if (!this->openingSeqs.hasKey(DisplayMode::IGNORED))
        this->openingSeqs.set(DisplayMode::IGNORED, ignoredOpeningSeq());
    if (!this->labels.hasKey(DisplayMode::IGNORED))
        this->labels.set(DisplayMode::IGNORED, std::string(IGNORED_LABEL));
}

void Template::configure(const TemplateConfig& config) {
    displayMode = config.displayMode(charClass);
    readMode = config.readMode;
    markerDetails = config.markerDetails;
    decode = config.decode;
    noSeparators = config.noSeparators;
    noColorMarkers = config.noColorMarkers;
}

std::vector<Segment> Template::substitute(std::string_view raw, std::string_view sgrParams) {
    switch (kind) {
        case TemplateKind::CONTROL_CHAR:
            return substituteControl(raw);
        case TemplateKind::ESCAPE_SEQ:
        case TemplateKind::ESCAPE_SEQ_SGR:
            return substituteEscape(raw, sgrParams);
        default:
            return substituteGeneric(raw);
    }
}

std::vector<Segment> Template::substituteGeneric(std::string_view raw) const {
    return {Segment(openingSeq(), typeLabel(), raw, process(raw))};
}

std::vector<Segment> Template::substituteControl(std::string_view raw) const {
    if (markerDetails == MarkerDetails::BINARY_STRICT || markerDetails == MarkerDetails::NO_DETAILS)
        return substituteGeneric(raw);

    std::vector<Segment> result;
    const SequenceSGR detailsStyle = openingSeqs.get() + detailsOpeningSeq();

    for (size_t i = 0; i < raw.size(); ++i) {
        const auto b = static_cast<unsigned char>(raw[i]);
        result.emplace_back(openingSeq(), typeLabel(), raw.substr(i, 1), processByte(b));
        if (isIgnored())
            continue;

        // Caret notation letter (0x01 -> A, 0x1c -> \) or the hex value
        std::string details = (markerDetails == MarkerDetails::BRIEF_DETAILS)
            ? std::string(1, static_cast<char>(b + 0x40))
            : hexByte(b);
        result.push_back(createDetails(detailsStyle, "", details));
    }
    return result;
}

std::vector<Segment> Template::substituteEscape(std::string_view raw, std::string_view sgrParams) {
    if (isIgnored())
        return substituteGeneric(raw);

    const SequenceSGR labelStyle = openingSeq() + seqs::BOLD;

    if (markerDetails == MarkerDetails::NO_DETAILS)
        return {Segment(labelStyle, typeLabel(), raw, label())};

    std::vector<Segment> result;
    result.emplace_back(labelStyle, typeLabel(), raw.substr(0, 1), label());

    const std::string_view paramsRaw = raw.substr(1);
    std::string details(paramsRaw);
    SequenceSGR detailsStyle = openingSeqs.get() + detailsOpeningSeq();

    if (kind == TemplateKind::ESCAPE_SEQ_SGR) {
        const SgrDetails& sgrDetails = resolveSgrDetails(sgrParams);
        if (markerDetails == MarkerDetails::BRIEF_DETAILS)
            details = sgrDetails.brief;
        detailsStyle = noColorMarkers ? detailsOpeningSeq() : detailsOpeningSeq() + sgrDetails.markerStyle;
    } else if (markerDetails == MarkerDetails::BRIEF_DETAILS) {
        details.clear();
    }
    result.push_back(createDetails(detailsStyle, paramsRaw, details));

    const bool wrap = readMode != ReadMode::BINARY && !noSeparators &&
        (markerDetails == MarkerDetails::BRIEF_DETAILS || markerDetails == MarkerDetails::FULL_DETAILS);
    if (wrap) {
        result.insert(result.begin(), Segment(separatorOpeningSeq(), "", "", SEPARATOR_LEFT));
        result.emplace_back(separatorOpeningSeq(), "", "", SEPARATOR_RIGHT);
    }
    return result;
}

std::string Template::processByte(unsigned char b) const {
    if (kind == TemplateKind::PRINTABLE_CHAR && !isIgnored())
        return std::string(1, static_cast<char>(b));

    if (kind == TemplateKind::NEWLINE && readMode == ReadMode::TEXT) {
        // Line breaks are kept even for an ignored class; the reset keeps backgrounds from bleeding into the next line
        if (isIgnored())
            return label() + "\n";
        return label() + seqs::RESET.assemble() + "\n";
    }
    return label();
}

std::string Template::process(std::string_view raw) const {
    if (kind == TemplateKind::UTF_8_SEQ && !isIgnored() && (readMode == ReadMode::TEXT || decode))
        return processUtf8(raw);

    std::string result;
    for (unsigned char b : raw)
        result += processByte(b);
    return result;
}

std::string Template::processUtf8(std::string_view raw) const {
    std::string decoded(raw);
    if (readMode != ReadMode::BINARY)
        return decoded;

    // Keep one code point per raw byte for the hex dump alignment
    const size_t length = utf8Length(decoded);
    if (length < raw.size())
        decoded.insert(0, raw.size() - length, '_');
    else if (length > raw.size())
        decoded.resize(utf8Offset(decoded, raw.size()));
    return decoded;
}

Segment Template::createDetails(const SequenceSGR& style, std::string_view raw, std::string_view processed) const {
    return Segment(style, TYPE_LABEL_DETAILS, raw, processed);
}

const Template::SgrDetails& Template::resolveSgrDetails(std::string_view sgrParams) {
    const std::string key(sgrParams);
    if (auto it = sgrDetailsCache.find(key); it != sgrDetailsCache.end())
        return it->second;

    const std::vector<int> params = parseSgrParams(sgrParams);
    auto [it, inserted] = sgrDetailsCache.emplace(key, SgrDetails{sgrBriefDetails(params), sgrMarkerStyle(params)});
    return it->second;
}

std::string Template::sgrBriefDetails(const std::vector<int>& params) {
    std::string result;
    for (size_t i = 0; i < params.size(); ++i) {
        std::string part;
        const size_t extended = extendedColorAt(params, i);
        const std::string prefix = (params[i] == sgr::BG_COLOR_EXTENDED) ? "@" : "";

        if (extended == 3) {
            part = prefix + "x" + std::to_string(params[i + 2]);
        } else if (extended == 5) {
            part = prefix + "#";
            for (size_t c = 2; c < 5; ++c)
                part += hexByte(static_cast<unsigned char>(std::min(params[i + c], 255)));
        } else {
            part = abbreviate(params[i]);
        }

        if (!result.empty())
            result += ',';
        result += part;
        if (extended > 0)
            i += extended - 1;
    }
    return result;
}

SequenceSGR Template::sgrMarkerStyle(const std::vector<int>& params) {
    // Bold, inverse and overline are reserved for the markers themselves
    std::vector<int> allowed;
    for (size_t i = 0; i < params.size(); ++i) {
        const int code = params[i];
        if (const size_t extended = extendedColorAt(params, i); extended > 0) {
            allowed.insert(allowed.end(), params.begin() + i, params.begin() + i + extended);
            i += extended - 1;
            continue;
        }
        if (code == sgr::DIM || code == sgr::ITALIC || code == sgr::UNDERLINED || code == sgr::CROSSLINED ||
            sgr::isColor(code) || sgr::isBgColor(code))
            allowed.push_back(code);
    }
    return SequenceSGR(std::move(allowed));
}

} // namespace escview
