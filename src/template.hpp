#pragma once
#include "modes.hpp"
#include "segment.hpp"
#include "sgr.hpp"
#include <array>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace escview {

using OpeningSeqPOV = PartialOverride<SequenceSGR>;
using LabelPOV = PartialOverride<std::string>;

// Substitution strategy of a template
enum class TemplateKind
{
    GENERIC,        // one label per byte
    CONTROL_CHAR,   // one segment per byte plus a detail segment
    ESCAPE_SEQ,     // introducer label plus parameter details
    ESCAPE_SEQ_SGR, // same, with details styled and abbreviated from the SGR params
    NEWLINE,        // label followed by a real line break in text mode
    PRINTABLE_CHAR, // the byte itself
    UTF_8_SEQ,      // the decoded character
};

// Everything a template needs to know about the current run
struct TemplateConfig
{
    ReadMode readMode = ReadMode::TEXT;
    MarkerDetails markerDetails = MarkerDetails::BRIEF_DETAILS;
    bool decode = false;
    bool noSeparators = false;
    bool noColorMarkers = false;
    std::array<DisplayMode, CHAR_CLASS_COUNT> displayModes{};

    DisplayMode displayMode(CharClass charClass) const { return displayModes[static_cast<size_t>(charClass)]; }
};

/**
 * @brief Rendering rule for one kind of byte run
 *
 * Opening style and label are resolved through partial overrides keyed by the
 * display mode of the template's character class and by the read mode.
 */
class Template
{
public:
    static constexpr std::string_view SEPARATOR_LEFT = "\xE2\xA2\xB8";  // ⢸
    static constexpr std::string_view SEPARATOR_RIGHT = "\xE2\xA1\x87"; // ⡇
    static constexpr std::string_view IGNORED_LABEL = "\xC3\x97";       // ×

    static SequenceSGR ignoredOpeningSeq() { return seqs::GRAY + seqs::DIM; }
    static SequenceSGR detailsOpeningSeq() { return seqs::BG_BLACK + seqs::UNDERLINED; }
    static SequenceSGR separatorOpeningSeq() { return SequenceSGR::color256(255); }

    Template(TemplateKind kind, CharClass charClass, OpeningSeqPOV openingSeqs, LabelPOV labels = std::string());

    void configure(const TemplateConfig& config);

    // `sgrParams` carries the parameter bytes of an SGR sequence for ESCAPE_SEQ_SGR templates
    std::vector<Segment> substitute(std::string_view raw, std::string_view sgrParams = {});

    TemplateKind getKind() const { return kind; }
    CharClass getCharClass() const { return charClass; }
    const OpeningSeqPOV& getOpeningSeqs() const { return openingSeqs; }
    const LabelPOV& getLabels() const { return labels; }

    // Condensed description of SGR parameters, e.g. "b,red,@x236"
    static std::string sgrBriefDetails(const std::vector<int>& params);
    // Parameters of an SGR that are safe to reuse for styling its own detail marker
    static SequenceSGR sgrMarkerStyle(const std::vector<int>& params);

private:
    TemplateKind kind;
    CharClass charClass;
    OpeningSeqPOV openingSeqs;
    LabelPOV labels;

    DisplayMode displayMode = DisplayMode::DEFAULT;
    ReadMode readMode = ReadMode::TEXT;
    MarkerDetails markerDetails = MarkerDetails::NO_DETAILS;
    bool decode = false;
    bool noSeparators = false;
    bool noColorMarkers = false;

    struct SgrDetails
    {
        std::string brief;
        SequenceSGR markerStyle;
    };
    std::unordered_map<std::string, SgrDetails> sgrDetailsCache;

    bool isIgnored() const { return displayMode == DisplayMode::IGNORED; }
    const SequenceSGR& openingSeq() const { return openingSeqs.get(displayMode, readMode); }
    const std::string& label() const { return labels.get(displayMode, readMode); }
    std::string_view typeLabel() const { return escview::typeLabel(charClass); }

    // --- Strategies ---
    std::vector<Segment> substituteGeneric(std::string_view raw) const;
    std::vector<Segment> substituteControl(std::string_view raw) const;
    std::vector<Segment> substituteEscape(std::string_view raw, std::string_view sgrParams);

    std::string processByte(unsigned char b) const;
    std::string process(std::string_view raw) const;
    std::string processUtf8(std::string_view raw) const;

    Segment createDetails(const SequenceSGR& style, std::string_view raw, std::string_view processed) const;
    const SgrDetails& resolveSgrDetails(std::string_view sgrParams);
};

} // namespace escview
