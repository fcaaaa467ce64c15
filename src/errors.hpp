#pragma once
#include <stdexcept>
#include <string>

namespace escview {

// Not enough data buffered yet; the formatting pass should stop and resume on the next chunk
class Suspended : public std::runtime_error {
public:
    Suspended() : std::runtime_error("Waiting for more input") {}
};

// Nothing left to detach
class Exhausted : public std::runtime_error {
public:
    Exhausted() : std::runtime_error("No data available") {}
};

// Anything deriving from this aborts the run
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ParserInconsistency : public FatalError {
public:
    using FatalError::FatalError;
};

class SegmentSplitError : public FatalError {
public:
    using FatalError::FatalError;
};

class UnknownClassification : public FatalError {
public:
    using FatalError::FatalError;
};

// Invalid command line or option combination
class ArgumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace escview
