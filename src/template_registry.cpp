#include "template_registry.hpp"
#include "errors.hpp"

namespace escview {

namespace {

LabelPOV label(const char* text) { return LabelPOV(std::string(text)); }

} // namespace

TemplateRegistry::TemplateRegistry(const TemplateConfig& config) {
    using K = TemplateKind;
    templates.reserve(TEMPLATE_COUNT);

    const CharClass cc = CharClass::CONTROL_CHAR;
    templates.emplace_back(K::CONTROL_CHAR, cc, seqs::RED, label("\xE2\xB1\xAF"));    // Ɐ
    templates.emplace_back(K::GENERIC, cc, seqs::HI_RED, label("\xC3\x98"));          // Ø
    templates.emplace_back(K::GENERIC, cc, seqs::RED, label("\xE2\x86\x90"));         // ←
    templates.emplace_back(K::GENERIC, cc, seqs::RED, label("\xE2\x86\x92"));         // →
    templates.emplace_back(K::GENERIC, cc, seqs::HI_YELLOW, label("\xE2\x88\x8C"));   // ∌

    const CharClass ws = CharClass::WHITESPACE;
    const OpeningSeqPOV wsSeqs(seqs::HI_CYAN, {{DisplayMode::FOCUSED, seqs::BG_CYAN + seqs::BLACK}});
    templates.emplace_back(K::GENERIC, ws, wsSeqs,
                           LabelPOV(std::string("\xE2\x87\xA5"), {{ReadMode::TEXT, std::string("\xE2\x87\xA5\t")}}));   // ⇥
    templates.emplace_back(K::NEWLINE, ws, wsSeqs, label("\xE2\x86\xB5"));            // ↵
    templates.emplace_back(K::GENERIC, ws, wsSeqs, label("\xE2\xA4\x93"));            // ⤓
    templates.emplace_back(K::GENERIC, ws, wsSeqs, label("\xE2\x86\xA1"));            // ↡
    templates.emplace_back(K::GENERIC, ws, wsSeqs, label("\xE2\x87\xA4"));            // ⇤
    templates.emplace_back(K::GENERIC, ws, wsSeqs,
                           LabelPOV(std::string("\xE2\x90\xA3"), {{DisplayMode::FOCUSED, std::string("\xC2\xB7")}}));   // ␣ ·

    const CharClass es = CharClass::ESCAPE_SEQ;
    templates.emplace_back(K::ESCAPE_SEQ, es, SequenceSGR::color256(255) + SequenceSGR::color256(16, true),
                           label("\xCE\xB8"));                                        // θ
    templates.emplace_back(K::ESCAPE_SEQ_SGR, es, SequenceSGR::color256(210) + SequenceSGR::color256(16, true),
                           label("\xC7\x9D"));                                        // ǝ
    templates.emplace_back(K::ESCAPE_SEQ, es, seqs::HI_GREEN, label("\xCD\xBD"));     // Ͻ
    templates.emplace_back(K::ESCAPE_SEQ, es, seqs::GREEN, label("\xEA\x9F\xBB"));    // ꟻ
    templates.emplace_back(K::ESCAPE_SEQ, es, seqs::YELLOW, label("\xEA\x9F\xBC"));   // ꟼ
    templates.emplace_back(K::ESCAPE_SEQ, es, seqs::YELLOW, label("\xC6\x8E"));       // Ǝ
    templates.emplace_back(K::ESCAPE_SEQ, es, seqs::YELLOW, label("\xEA\x99\x84"));   // Ꙅ

    templates.emplace_back(K::UTF_8_SEQ, CharClass::UTF_8_SEQ, seqs::HI_BLUE,
                           LabelPOV(std::string(), {{ReadMode::BINARY, std::string("\xE2\x96\xAF")}}));              // ▯
    templates.emplace_back(K::GENERIC, CharClass::BINARY_DATA, seqs::MAGENTA,
                           LabelPOV(std::string("\xE1\xB8\x86"), {{ReadMode::BINARY, std::string("\xE2\x96\xAF")}})); // Ḇ ▯
    templates.emplace_back(K::PRINTABLE_CHAR, CharClass::PRINTABLE_CHAR,
                           OpeningSeqPOV(SequenceSGR::color256(102), {{DisplayMode::FOCUSED, seqs::BG_WHITE + seqs::BLACK}}),
                           label(""));

    configure(config);
}

void TemplateRegistry::configure(const TemplateConfig& config) {
    for (auto& tpl : templates)
        tpl.configure(config);
}

Template& TemplateRegistry::lookup(const ByteRun& run) {
    return get(resolve(run));
}

TemplateId TemplateRegistry::resolve(const ByteRun& run) {
    switch (run.type) {
        case RunType::UTF_8_SEQ             : return TemplateId::UTF_8_SEQ;
        case RunType::BINARY_DATA           : return TemplateId::BINARY_DATA;
        case RunType::ESCAPE_SEQ_CSI:
            if (run.terminator != sgr::TERMINATOR)
                return TemplateId::ESCAPE_SEQ_CSI;
            if (run.params.empty() || run.params == "0")
                return TemplateId::ESCAPE_SEQ_SGR_0;
            return TemplateId::ESCAPE_SEQ_SGR;
        case RunType::ESCAPE_SEQ_NF         : return TemplateId::ESCAPE_SEQ_NF;
        case RunType::ESCAPE_SEQ_FP         : return TemplateId::ESCAPE_SEQ_FP;
        case RunType::ESCAPE_SEQ_FE         : return TemplateId::ESCAPE_SEQ_FE;
        case RunType::ESCAPE_SEQ_FS         : return TemplateId::ESCAPE_SEQ_FS;
        case RunType::CONTROL_CHAR          : return TemplateId::CONTROL_CHAR;
        case RunType::CONTROL_CHAR_NULL     : return TemplateId::CONTROL_CHAR_NULL;
        case RunType::CONTROL_CHAR_BACKSPACE: return TemplateId::CONTROL_CHAR_BACKSPACE;
        case RunType::CONTROL_CHAR_ESCAPE   : return TemplateId::CONTROL_CHAR_ESCAPE;
        case RunType::CONTROL_CHAR_DELETE   : return TemplateId::CONTROL_CHAR_DELETE;
        case RunType::WHITESPACE_TAB        : return TemplateId::WHITESPACE_TAB;
        case RunType::WHITESPACE_NEWLINE    : return TemplateId::WHITESPACE_NEWLINE;
        case RunType::WHITESPACE_VERT_TAB   : return TemplateId::WHITESPACE_VERT_TAB;
        case RunType::WHITESPACE_FORM_FEED  : return TemplateId::WHITESPACE_FORM_FEED;
        case RunType::WHITESPACE_CARR_RETURN: return TemplateId::WHITESPACE_CARR_RETURN;
        case RunType::WHITESPACE_SPACE      : return TemplateId::WHITESPACE_SPACE;
        case RunType::PRINTABLE_CHAR        : return TemplateId::PRINTABLE_CHAR;
        case RunType::UNKNOWN               : break;
    }
    throw UnknownClassification("No template defined for run " + run.to_string());
}

} // namespace escview
