#include "runner.hpp"
#include "logging.hpp"
#include <utility>

namespace escview {

ByteIoRunner::ByteIoRunner(const Settings& settings, std::ostream& out)
    : ByteIoRunner(settings, out, std::make_unique<Reader>(settings.readerOptions())) {}

ByteIoRunner::ByteIoRunner(const Settings& settings, std::ostream& out, std::istream& in)
    : ByteIoRunner(settings, out, std::make_unique<Reader>(in, settings.readerOptions())) {}

ByteIoRunner::ByteIoRunner(const Settings& settings, std::ostream& out, std::unique_ptr<Reader> input)
    : settings(settings),
      registry(settings.templateConfig()),
      parser(parserBuffer, chain, registry),
      output(out, settings.outputOptions()),
      formatter(FormatterFactory::create(settings.readMode(), parserBuffer, chain, output,
                                         static_cast<size_t>(settings.columns))),
      reader(std::move(input)),
      log(logging::component("runner")) {}

void ByteIoRunner::run() {
    log->debug("Running in {} mode", settings.readMode() == ReadMode::BINARY ? "binary" : "text");
    reader->read([this](std::string_view bytes, size_t offset, bool final) {
        processChunk(bytes, offset, final);
    });
}

void ByteIoRunner::processChunk(std::string_view bytes, size_t offset, bool final) {
    // The parser buffer may still hold bytes deferred from the previous chunk
    const size_t bufferOffset = offset - parserBuffer.raw().size();

    parserBuffer.append(bytes, final);
    parser.parse(bufferOffset);
    formatter->format();
}

} // namespace escview
