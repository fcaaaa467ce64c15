#pragma once
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace escview::logging {

// Configures every component logger: 0 = warnings only, 1 = debug, 2+ = trace
void setup(int verbosity);

// Named logger for a pipeline component, created on first use and sharing one stderr sink
std::shared_ptr<spdlog::logger> component(const std::string& name);

// "len N [1b 5b 33 ..]" style preview of a byte buffer
std::string preview(std::string_view bytes, size_t maxBytes = 8);

// All bytes as space-separated lowercase hex pairs: "1b 5b 33"
std::string hexBytes(std::string_view bytes);

} // namespace escview::logging
