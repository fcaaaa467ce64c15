#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace escview {

// Alternatives of the byte-run classification, in matching order
enum class RunType
{
    UTF_8_SEQ,
    BINARY_DATA,
    ESCAPE_SEQ_CSI,         // ESC [ (0x30-3f)* (0x20-2f)* (0x40-7e)
    ESCAPE_SEQ_NF,          // ESC (0x20-2f)+ (0x30-7e)
    ESCAPE_SEQ_FP,          // ESC (0x30-3f)
    ESCAPE_SEQ_FE,          // ESC (0x40-5f)
    ESCAPE_SEQ_FS,          // ESC (0x60-7e)
    CONTROL_CHAR,           // (0x01-07, 0x0e-1a, 0x1c-1f)+
    CONTROL_CHAR_NULL,      // 0x00+
    CONTROL_CHAR_BACKSPACE, // 0x08+
    CONTROL_CHAR_ESCAPE,    // 0x1b outside of a sequence
    CONTROL_CHAR_DELETE,    // 0x7f+
    WHITESPACE_TAB,         // 0x09+
    WHITESPACE_NEWLINE,     // 0x0a, one at a time
    WHITESPACE_VERT_TAB,    // 0x0b+
    WHITESPACE_FORM_FEED,   // 0x0c+
    WHITESPACE_CARR_RETURN, // 0x0d+
    WHITESPACE_SPACE,       // 0x20+
    PRINTABLE_CHAR,         // 0x21-0x7e+
    UNKNOWN = -2,           // should never happen
};

constexpr size_t RUN_TYPE_COUNT = 19;

struct ByteRun
{
    RunType type;
    std::string_view value;
    size_t offset = 0;            // position within the lexed buffer
    std::string_view params = {}; // CSI parameter bytes
    char terminator = '\0';       // CSI final byte
    std::string to_string() const;
};

std::string_view runTypeName(RunType type);

/**
 * @brief Splits a byte buffer into classified runs
 *
 * Every byte value is covered by exactly one alternative. When the buffer ends in
 * the middle of an escape or UTF-8 sequence, or inside a binary run that the next
 * bytes could still extend, and the input is not final, lexing stops there and the
 * rest is left as the remainder. A tail longer than the limits below is classified
 * as if the input were final.
 */
class Lexer
{
    std::string_view source;
    size_t cursor = 0;

public:
    static constexpr size_t MAX_DEFERRED_SEQUENCE_LEN = 256;
    static constexpr size_t MAX_DEFERRED_BINARY_LEN = 4096;

    explicit Lexer(std::string_view src) : source(src) {}
    std::vector<ByteRun> tokenize(bool final);

    // Bytes left unconsumed by the last tokenize() call
    std::string_view remainder() const { return source.substr(cursor); }

private:
    enum class Match { NO_MATCH, MATCHED, NEED_MORE };

    Match matchUtf8(size_t& end) const;
    Match matchCsi(size_t& end, std::string_view& params, char& terminator) const;
    Match matchNf(size_t& end) const;
    Match matchEscapeFinal(unsigned char lo, unsigned char hi, size_t& end) const;

    size_t runWhile(size_t from, bool (*pred)(unsigned char)) const;

    constexpr bool is_eof(size_t pos) const { return pos >= source.length(); }
    constexpr unsigned char at(size_t pos) const { return static_cast<unsigned char>(source[pos]); }
};

} // namespace escview
