#include "reader.hpp"
#include "logging.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace escview {

Reader::Reader(ReaderOptions options) : options(std::move(options)), in(nullptr), log(logging::component("reader")) {
    if (this->options.chunkSize == 0)
        this->options.chunkSize = READ_CHUNK_SIZE;

    if (readingStdin()) {
        in = &std::cin;
        log->debug("Reading from stdin");
        return;
    }

    file = std::make_unique<std::ifstream>(this->options.filename, std::ios::binary);
    if (!file->is_open())
        throw std::runtime_error("Could not open file: " + this->options.filename);
    in = file.get();
    log->debug("Opened file: {}", this->options.filename);
}

Reader::Reader(std::istream& in, ReaderOptions options)
    : options(std::move(options)), in(&in), log(logging::component("reader")) {
    if (this->options.chunkSize == 0)
        this->options.chunkSize = READ_CHUNK_SIZE;
}

void Reader::read(const ReadCallback& callback) {
    log->trace("Read buffer: size {}", options.chunkSize);

    std::vector<char> chunk(options.chunkSize);
    std::string input;
    size_t offset = 0;
    size_t lines = 0;
    size_t chunks = 0;

    while (true) {
        in->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<size_t>(in->gcount());
        if (got == 0)
            break;

        input.assign(chunk.data(), got);
        log->debug("0x{:08x} Read chunk #{}: {}", offset, chunks++, logging::preview(input, 5));

        if (options.maxLines > 0) {
            for (size_t pos = input.find('\n'); pos != std::string::npos; pos = input.find('\n', pos + 1)) {
                if (++lines >= options.maxLines) {
                    input.resize(pos);
                    log->trace("Line limit exceeded: {}", options.maxLines);
                    break;
                }
            }
        }

        if (options.maxBytes > 0 && offset + input.size() > options.maxBytes) {
            // The cut part goes out with the final callback
            input.resize(options.maxBytes - offset);
            log->trace("Byte limit exceeded: {}", options.maxBytes);
            break;
        }

        callback(input, offset, false);
        offset += input.size();
        input.clear();

        if ((options.maxBytes > 0 && offset >= options.maxBytes) ||
            (options.maxLines > 0 && lines >= options.maxLines))
            break;
    }

    log->debug("0x{:08x} Encountered EOF", offset);
    callback(input, offset, true);
}

} // namespace escview
