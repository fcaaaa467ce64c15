#include "errors.hpp"
#include "logging.hpp"
#include "runner.hpp"
#include "settings.hpp"
#include <argparse/argparse.hpp>
#include <iostream>
#include <string>

namespace {

void printError(const std::string& message) {
    using namespace escview;
    std::cerr << (seqs::HI_RED + seqs::BOLD).assemble() << "ERROR: "
              << SequenceSGR{sgr::BOLD_DIM_OFF}.assemble() << message
              << seqs::HI_RED.closing().assemble() << std::endl;
}

void addClassFlags(argparse::ArgumentParser& program, escview::CharClass charClass,
                   const char* focusShort, const char* ignoreShort, const std::string& what) {
    const std::string name(escview::charClassName(charClass));
    program.add_argument(focusShort, "--focus-" + name)
        .help("highlight " + what)
        .default_value(false)
        .implicit_value(true);
    program.add_argument(ignoreShort, "--ignore-" + name)
        .help("dim " + what)
        .default_value(false)
        .implicit_value(true);
}

} // namespace

int main(int argc, char* argv[]) {
    using escview::CharClass;

    argparse::ArgumentParser program("escview", "1.0.0", argparse::default_arguments::all);
    program.add_description("Shows control characters, escape sequences, whitespace, UTF-8 and binary data "
                            "as labeled markers, inline or in an annotated hex dump.");

    program.add_argument("file")
        .help("input file; reads stdin when empty or '-'")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string(""));

    program.add_argument("-t", "--text")
        .help("text mode (default)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-b", "--binary")
        .help("binary mode")
        .default_value(false)
        .implicit_value(true);

    addClassFlags(program, CharClass::WHITESPACE, "-s", "-S", "whitespace");
    addClassFlags(program, CharClass::CONTROL_CHAR, "-c", "-C", "control characters");
    addClassFlags(program, CharClass::PRINTABLE_CHAR, "-p", "-P", "printable characters");
    addClassFlags(program, CharClass::ESCAPE_SEQ, "-e", "-E", "escape sequences");
    addClassFlags(program, CharClass::UTF_8_SEQ, "-u", "-U", "UTF-8 sequences");
    addClassFlags(program, CharClass::BINARY_DATA, "-i", "-I", "binary data");

    program.add_argument("-L", "--max-lines")
        .help("stop after reading <n> lines (0 = no limit)")
        .scan<'i', long>()
        .default_value(0L);
    program.add_argument("-B", "--max-bytes")
        .help("stop after reading <n> bytes (0 = no limit)")
        .scan<'i', long>()
        .default_value(0L);
    program.add_argument("-f", "--buffer")
        .help("read buffer size in bytes (default 4096, 128 with --debug)")
        .scan<'i', long>()
        .default_value(0L);

    int verbosity = 0;
    program.add_argument("-d", "--debug")
        .help("print diagnostics to stderr, repeat for more")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    program.add_argument("--no-color-markers")
        .help("do not color SGR markers with the style they set")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-m", "--marker")
        .help("text mode: marker details, 0 = none, 1 = brief, 2 = full")
        .scan<'i', int>()
        .default_value(1);
    program.add_argument("--no-separators")
        .help("text mode: no separators around escape sequences")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-line-numbers")
        .help("text mode: no line numbers")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-w", "--columns")
        .help("binary mode: bytes per row (0 = fit to the terminal)")
        .scan<'i', long>()
        .default_value(0L);
    program.add_argument("-D", "--decode")
        .help("binary mode: decode UTF-8 sequences")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--decimal-offsets")
        .help("binary mode: decimal offsets")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-offsets")
        .help("binary mode: no offsets")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        printError(err.what());
        std::cerr << program;
        return 1;
    }

    escview::Settings settings;
    settings.filename = program.get<std::string>("file");
    settings.text = program.get<bool>("--text");
    settings.binary = program.get<bool>("--binary");
    for (CharClass charClass : escview::ALL_CHAR_CLASSES) {
        const std::string name(escview::charClassName(charClass));
        settings.focus[static_cast<size_t>(charClass)] = program.get<bool>("--focus-" + name);
        settings.ignore[static_cast<size_t>(charClass)] = program.get<bool>("--ignore-" + name);
    }
    settings.maxLines = program.get<long>("--max-lines");
    settings.maxBytes = program.get<long>("--max-bytes");
    settings.buffer = program.get<long>("--buffer");
    settings.debug = verbosity;
    settings.noColorMarkers = program.get<bool>("--no-color-markers");
    settings.marker = program.get<int>("--marker");
    settings.noSeparators = program.get<bool>("--no-separators");
    settings.noLineNumbers = program.get<bool>("--no-line-numbers");
    settings.columns = program.get<long>("--columns");
    settings.decode = program.get<bool>("--decode");
    settings.decimalOffsets = program.get<bool>("--decimal-offsets");
    settings.noOffsets = program.get<bool>("--no-offsets");

    try {
        settings.validate();
    }
    catch (const escview::ArgumentError& err) {
        printError(err.what());
        std::cerr << program;
        return 1;
    }

    escview::logging::setup(settings.debug);

    try {
        escview::ByteIoRunner runner(settings, std::cout);
        runner.run();
    }
    catch (const std::exception& e) {
        std::cout.flush();
        if (settings.debug > 0)
            escview::logging::component("app")->error("Run aborted: {}", e.what());
        printError(e.what());
        if (settings.debug == 0)
            std::cerr << "Run the app with '--debug' argument to see the details" << std::endl;
        return 1;
    }

    return 0;
}
