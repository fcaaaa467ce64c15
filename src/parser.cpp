#include "parser.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace escview {

Parser::Parser(ParserBuffer& parserBuffer, Chain& chain, TemplateRegistry& registry)
    : parserBuffer(parserBuffer), chain(chain), registry(registry), log(logging::component("parser")) {}

void Parser::parse(size_t offset) {
    const std::string& raw = parserBuffer.raw();
    log->debug("Parsing at 0x{:x}: {}", offset, logging::preview(raw));

    Lexer lexer(raw);
    const std::vector<ByteRun> runs = lexer.tokenize(parserBuffer.closed());
    for (const auto& run : runs)
        handle(run, offset);

    const std::string_view remainder = lexer.remainder();
    if (!remainder.empty()) {
        if (parserBuffer.closed()) {
            throw ParserInconsistency("Parsing inconsistency at 0x" + fmt::format("{:x}/{:d}", offset, offset) +
                                      ", bytes left unprocessed: " + logging::preview(remainder));
        }
        log->debug("Deferring {} bytes to the next chunk", remainder.size());
    }
    parserBuffer.retainSuffix(remainder);
}

void Parser::handle(const ByteRun& run, size_t offset) {
    Template& tpl = registry.lookup(run);
    std::vector<Segment> segments = tpl.substitute(run.value, run.params);

    if (log->should_log(spdlog::level::trace))
        logMatch(run, segments, offset);
    chain.attach(std::move(segments));
}

void Parser::logMatch(const ByteRun& run, const std::vector<Segment>& segments, size_t offset) const {
    std::string message = fmt::format("Match {}: ", runTypeName(run.type));
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0)
            message += "; ";
        message += "<" + segments[i].getTypeLabel() + "> " + logging::preview(segments[i].getRaw());
    }
    log->trace("0x{:08x} {}", offset + run.offset, message);
}

} // namespace escview
