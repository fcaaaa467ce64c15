#pragma once
#include "lexer.hpp"
#include "template.hpp"
#include <cstddef>
#include <vector>

namespace escview {

// Run alternatives that get a template of their own; CSI runs are split further into SGR variants
enum class TemplateId
{
    CONTROL_CHAR,
    CONTROL_CHAR_NULL,
    CONTROL_CHAR_BACKSPACE,
    CONTROL_CHAR_DELETE,
    CONTROL_CHAR_ESCAPE,
    WHITESPACE_TAB,
    WHITESPACE_NEWLINE,
    WHITESPACE_VERT_TAB,
    WHITESPACE_FORM_FEED,
    WHITESPACE_CARR_RETURN,
    WHITESPACE_SPACE,
    ESCAPE_SEQ_SGR_0,       // ESC [ m, ESC [ 0 m
    ESCAPE_SEQ_SGR,         // any other ESC [ ... m
    ESCAPE_SEQ_CSI,
    ESCAPE_SEQ_NF,
    ESCAPE_SEQ_FP,
    ESCAPE_SEQ_FE,
    ESCAPE_SEQ_FS,
    UTF_8_SEQ,
    BINARY_DATA,
    PRINTABLE_CHAR,
};

constexpr size_t TEMPLATE_COUNT = 21;

/**
 * @brief Holds one template per run alternative
 *
 * Built once at startup. configure() pushes the run configuration into every
 * template and has to be called again whenever that configuration changes.
 */
class TemplateRegistry
{
    std::vector<Template> templates; // indexed by TemplateId

public:
    explicit TemplateRegistry(const TemplateConfig& config = {});

    void configure(const TemplateConfig& config);

    Template& get(TemplateId id) { return templates[static_cast<size_t>(id)]; }

    // Template for a lexed run; CSI runs with the "m" terminator resolve to the SGR templates
    Template& lookup(const ByteRun& run);

    // Template id for a run, throws UnknownClassification if there is none
    static TemplateId resolve(const ByteRun& run);
};

} // namespace escview
