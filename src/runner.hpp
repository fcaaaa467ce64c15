#pragma once
#include "chain.hpp"
#include "formatter.hpp"
#include "output.hpp"
#include "parser.hpp"
#include "parser_buffer.hpp"
#include "reader.hpp"
#include "settings.hpp"
#include "template_registry.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <string_view>

namespace spdlog { class logger; }

namespace escview {

/**
 * @brief Wires the pipeline together and runs it over the whole input
 *
 * Every chunk goes through append, parse and format, in that order.
 */
class ByteIoRunner
{
    Settings settings;
    ParserBuffer parserBuffer;
    Chain chain;
    TemplateRegistry registry;
    Parser parser;
    OutputWriter output;
    std::unique_ptr<AbstractFormatter> formatter;
    std::unique_ptr<Reader> reader;
    std::shared_ptr<spdlog::logger> log;

public:
    // Reads the file or stdin named in the settings
    ByteIoRunner(const Settings& settings, std::ostream& out);
    // Reads from the given stream
    ByteIoRunner(const Settings& settings, std::ostream& out, std::istream& in);

    void run();

private:
    ByteIoRunner(const Settings& settings, std::ostream& out, std::unique_ptr<Reader> input);

    void processChunk(std::string_view bytes, size_t offset, bool final);
};

} // namespace escview
