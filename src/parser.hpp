#pragma once
#include "chain.hpp"
#include "lexer.hpp"
#include "parser_buffer.hpp"
#include "template_registry.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace spdlog { class logger; }

namespace escview {

/**
 * @brief Classifies the parser buffer and feeds the resulting segments into the chain
 *
 * Bytes the lexer could not classify yet (a sequence cut by a chunk boundary)
 * stay in the parser buffer and are parsed again together with the next chunk.
 */
class Parser
{
    ParserBuffer& parserBuffer;
    Chain& chain;
    TemplateRegistry& registry;
    std::shared_ptr<spdlog::logger> log;

public:
    Parser(ParserBuffer& parserBuffer, Chain& chain, TemplateRegistry& registry);

    // `offset` is the stream position of the start of the parser buffer, for diagnostics
    void parse(size_t offset);

private:
    void handle(const ByteRun& run, size_t offset);
    void logMatch(const ByteRun& run, const std::vector<Segment>& segments, size_t offset) const;
};

} // namespace escview
