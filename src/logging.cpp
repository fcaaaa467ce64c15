#include "logging.hpp"
#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace escview::logging {

namespace {

spdlog::level::level_enum currentLevel = spdlog::level::warn;

spdlog::sink_ptr sharedSink() {
    static spdlog::sink_ptr sink = [] {
        auto s = std::make_shared<spdlog::sinks::stderr_color_sink_st>();
        s->set_pattern("%^[%n]%$ %v");
        return s;
    }();
    return sink;
}

} // namespace

void setup(int verbosity) {
    if (verbosity <= 0)
        currentLevel = spdlog::level::warn;
    else if (verbosity == 1)
        currentLevel = spdlog::level::debug;
    else
        currentLevel = spdlog::level::trace;

    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(currentLevel);
    });
}

std::shared_ptr<spdlog::logger> component(const std::string& name) {
    if (auto existing = spdlog::get(name))
        return existing;

    auto logger = std::make_shared<spdlog::logger>(name, sharedSink());
    logger->set_level(currentLevel);
    spdlog::register_logger(logger);
    return logger;
}

std::string preview(std::string_view bytes, size_t maxBytes) {
    std::string result = "len " + std::to_string(bytes.size());
    if (bytes.empty())
        return result + " []";

    const auto shown = bytes.substr(0, maxBytes);
    result += fmt::format(" [{:n}{}]", spdlog::to_hex(shown.begin(), shown.end()),
                          bytes.size() > maxBytes ? " .." : "");
    return result;
}

std::string hexBytes(std::string_view bytes) {
    std::string hex;
    for (unsigned char b : bytes) {
        if (!hex.empty())
            hex += ' ';
        hex += fmt::format("{:02x}", b);
    }
    return hex;
}

} // namespace escview::logging
