#pragma once
#include <cstddef>
#include <fstream>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog { class logger; }

namespace escview {

struct ReaderOptions
{
    std::string filename;   // empty or "-" for stdin
    size_t chunkSize = 4096;
    size_t maxBytes = 0;    // 0 = no limit
    size_t maxLines = 0;    // 0 = no limit
};

// Receives every chunk with its stream offset; `final` is set exactly once, on the last call
using ReadCallback = std::function<void(std::string_view bytes, size_t offset, bool final)>;

/**
 * @brief Delivers the input in chunks, honoring the byte and line limits
 *
 * The line limit cuts the input right before the n-th line break.
 */
class Reader
{
    ReaderOptions options;
    std::unique_ptr<std::ifstream> file;
    std::istream* in;
    std::shared_ptr<spdlog::logger> log;

public:
    static constexpr size_t READ_CHUNK_SIZE = 4096;
    static constexpr size_t READ_CHUNK_SIZE_DEBUG = 128;

    // Opens the file named in the options, or stdin
    explicit Reader(ReaderOptions options);
    Reader(std::istream& in, ReaderOptions options);

    void read(const ReadCallback& callback);

    bool readingStdin() const { return options.filename.empty() || options.filename == "-"; }
};

} // namespace escview
