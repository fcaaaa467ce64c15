#pragma once
#include <memory>
#include <string>
#include <string_view>

namespace spdlog { class logger; }

namespace escview {

// Accumulates raw input between parse passes
class ParserBuffer
{
    std::string rawBuffer;
    bool isClosed = false;
    std::shared_ptr<spdlog::logger> log;

public:
    ParserBuffer();

    void append(std::string_view bytes, bool finish = false);

    // Keeps only `remainder`, which has to be a suffix of the current contents
    void retainSuffix(std::string_view remainder);

    const std::string& raw() const { return rawBuffer; }
    bool closed() const { return isClosed; }
};

} // namespace escview
