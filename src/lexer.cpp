#include "lexer.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <fmt/format.h>

namespace escview {

namespace {

constexpr unsigned char ESC = 0x1b;

constexpr bool isGenericControl(unsigned char b) {
    return (b >= 0x01 && b <= 0x07) || (b >= 0x0e && b <= 0x1a) || (b >= 0x1c && b <= 0x1f);
}
constexpr bool isHigh(unsigned char b) { return b >= 0x80; }
constexpr bool isPrintable(unsigned char b) { return b >= 0x21 && b <= 0x7e; }
constexpr bool isIntermediate(unsigned char b) { return b >= 0x20 && b <= 0x2f; }
constexpr bool isParameter(unsigned char b) { return b >= 0x30 && b <= 0x3f; }
constexpr bool isCsiFinal(unsigned char b) { return b >= 0x40 && b <= 0x7e; }

} // namespace

std::string_view runTypeName(RunType type) {
    switch (type) {
        case RunType::UTF_8_SEQ             : return "utf8";
        case RunType::BINARY_DATA           : return "binary";
        case RunType::ESCAPE_SEQ_CSI        : return "esc/csi";
        case RunType::ESCAPE_SEQ_NF         : return "esc/nf";
        case RunType::ESCAPE_SEQ_FP         : return "esc/fp";
        case RunType::ESCAPE_SEQ_FE         : return "esc/fe";
        case RunType::ESCAPE_SEQ_FS         : return "esc/fs";
        case RunType::CONTROL_CHAR          : return "control";
        case RunType::CONTROL_CHAR_NULL     : return "control/null";
        case RunType::CONTROL_CHAR_BACKSPACE: return "control/backspace";
        case RunType::CONTROL_CHAR_ESCAPE   : return "control/escape";
        case RunType::CONTROL_CHAR_DELETE   : return "control/delete";
        case RunType::WHITESPACE_TAB        : return "space/tab";
        case RunType::WHITESPACE_NEWLINE    : return "space/newline";
        case RunType::WHITESPACE_VERT_TAB   : return "space/vtab";
        case RunType::WHITESPACE_FORM_FEED  : return "space/formfeed";
        case RunType::WHITESPACE_CARR_RETURN: return "space/cr";
        case RunType::WHITESPACE_SPACE      : return "space/space";
        case RunType::PRINTABLE_CHAR        : return "printable";
        case RunType::UNKNOWN               : return "unknown";
    }
    return "unknown";
}

std::string ByteRun::to_string() const {
    return fmt::format("ByteRun({} @{}: {})", runTypeName(type), offset, logging::hexBytes(value));
}

size_t Lexer::runWhile(size_t from, bool (*pred)(unsigned char)) const {
    size_t pos = from;
    while (!is_eof(pos) && pred(at(pos))) pos++;
    return pos;
}

Lexer::Match Lexer::matchUtf8(size_t& end) const {
    const unsigned char lead = at(cursor);
    size_t length = 0;
    unsigned char lo = 0x80, hi = 0xbf; // allowed range of the second byte

    if (lead >= 0xc2 && lead <= 0xdf) {
        length = 2;
    } else if (lead == 0xe0) {                        // excluding overlongs
        length = 3; lo = 0xa0;
    } else if ((lead >= 0xe1 && lead <= 0xec) || lead == 0xee || lead == 0xef) {
        length = 3;
    } else if (lead == 0xed) {                        // excluding surrogates
        length = 3; hi = 0x9f;
    } else if (lead == 0xf0) {                        // planes 1-3
        length = 4; lo = 0x90;
    } else if (lead >= 0xf1 && lead <= 0xf3) {        // planes 4-15
        length = 4;
    } else if (lead == 0xf4) {                        // plane 16
        length = 4; hi = 0x8f;
    } else {
        return Match::NO_MATCH;
    }

    for (size_t i = 1; i < length; ++i) {
        if (is_eof(cursor + i)) return Match::NEED_MORE;
        const unsigned char c = at(cursor + i);
        const unsigned char min = (i == 1) ? lo : 0x80;
        const unsigned char max = (i == 1) ? hi : 0xbf;
        if (c < min || c > max) return Match::NO_MATCH;
    }
    end = cursor + length;
    return Match::MATCHED;
}

Lexer::Match Lexer::matchCsi(size_t& end, std::string_view& params, char& terminator) const {
    size_t pos = cursor + 1;
    if (is_eof(pos)) return Match::NEED_MORE;
    if (at(pos) != '[') return Match::NO_MATCH;
    pos++;

    const size_t paramsStart = pos;
    pos = runWhile(pos, isParameter);
    const size_t paramsEnd = pos;
    pos = runWhile(pos, isIntermediate);

    if (is_eof(pos)) return Match::NEED_MORE;
    if (!isCsiFinal(at(pos))) return Match::NO_MATCH;

    params = source.substr(paramsStart, paramsEnd - paramsStart);
    terminator = source[pos];
    end = pos + 1;
    return Match::MATCHED;
}

Lexer::Match Lexer::matchNf(size_t& end) const {
    size_t pos = cursor + 1;
    if (is_eof(pos)) return Match::NEED_MORE;
    if (!isIntermediate(at(pos))) return Match::NO_MATCH;
    pos = runWhile(pos + 1, isIntermediate);

    if (is_eof(pos)) return Match::NEED_MORE;
    if (at(pos) < 0x30 || at(pos) > 0x7e) return Match::NO_MATCH;
    end = pos + 1;
    return Match::MATCHED;
}

Lexer::Match Lexer::matchEscapeFinal(unsigned char lo, unsigned char hi, size_t& end) const {
    const size_t pos = cursor + 1;
    if (is_eof(pos)) return Match::NEED_MORE;
    if (at(pos) < lo || at(pos) > hi) return Match::NO_MATCH;
    end = pos + 1;
    return Match::MATCHED;
}

std::vector<ByteRun> Lexer::tokenize(bool final) {
    std::vector<ByteRun> runs;

    // An alternative that could still match once more bytes arrive wins over the ones after it,
    // unless the tail kept back would grow past limit
    auto deferred = [this, final](Match m, size_t limit) {
        return m == Match::NEED_MORE && !final && source.length() - cursor <= limit;
    };

    while (!is_eof(cursor)) {
        const size_t start = cursor;
        const unsigned char b = at(cursor);
        size_t end = start;

        auto push = [&](RunType type) {
            runs.push_back({type, source.substr(start, end - start), start});
            cursor = end;
        };

        if (isHigh(b)) {
            Match m = matchUtf8(end);
            if (m == Match::MATCHED) { push(RunType::UTF_8_SEQ); continue; }
            if (deferred(m, MAX_DEFERRED_SEQUENCE_LEN)) break;

            // The next chunk may continue the run, which would swallow a UTF-8 sequence after it
            end = runWhile(start, isHigh);
            if (is_eof(end) && deferred(Match::NEED_MORE, MAX_DEFERRED_BINARY_LEN)) break;
            push(RunType::BINARY_DATA);
            continue;
        }

        if (b == ESC) {
            std::string_view params;
            char terminator = '\0';
            Match m = matchCsi(end, params, terminator);
            if (m == Match::MATCHED) {
                push(RunType::ESCAPE_SEQ_CSI);
                runs.back().params = params;
                runs.back().terminator = terminator;
                continue;
            }
            if (deferred(m, MAX_DEFERRED_SEQUENCE_LEN)) break;

            m = matchNf(end);
            if (m == Match::MATCHED) { push(RunType::ESCAPE_SEQ_NF); continue; }
            if (deferred(m, MAX_DEFERRED_SEQUENCE_LEN)) break;

            m = matchEscapeFinal(0x30, 0x3f, end);
            if (m == Match::MATCHED) { push(RunType::ESCAPE_SEQ_FP); continue; }
            if (deferred(m, MAX_DEFERRED_SEQUENCE_LEN)) break;

            m = matchEscapeFinal(0x40, 0x5f, end);
            if (m == Match::MATCHED) { push(RunType::ESCAPE_SEQ_FE); continue; }
            if (deferred(m, MAX_DEFERRED_SEQUENCE_LEN)) break;

            m = matchEscapeFinal(0x60, 0x7e, end);
            if (m == Match::MATCHED) { push(RunType::ESCAPE_SEQ_FS); continue; }
            if (deferred(m, MAX_DEFERRED_SEQUENCE_LEN)) break;

            end = start + 1;
            push(RunType::CONTROL_CHAR_ESCAPE);
            continue;
        }

        if (isGenericControl(b)) {
            end = runWhile(start, isGenericControl);
            push(RunType::CONTROL_CHAR);
            continue;
        }

        if (isPrintable(b)) {
            end = runWhile(start, isPrintable);
            push(RunType::PRINTABLE_CHAR);
            continue;
        }

        RunType symType = RunType::UNKNOWN;
        switch (b) {
            case 0x00: symType = RunType::CONTROL_CHAR_NULL; break;
            case 0x08: symType = RunType::CONTROL_CHAR_BACKSPACE; break;
            case 0x7f: symType = RunType::CONTROL_CHAR_DELETE; break;
            case 0x09: symType = RunType::WHITESPACE_TAB; break;
            case 0x0a: symType = RunType::WHITESPACE_NEWLINE; break;
            case 0x0b: symType = RunType::WHITESPACE_VERT_TAB; break;
            case 0x0c: symType = RunType::WHITESPACE_FORM_FEED; break;
            case 0x0d: symType = RunType::WHITESPACE_CARR_RETURN; break;
            case 0x20: symType = RunType::WHITESPACE_SPACE; break;
            default: break;
        }
        if (symType == RunType::UNKNOWN) {
            throw ParserInconsistency(fmt::format("No alternative covers byte 0x{:02x} at offset {}", b, start));
        }

        if (symType == RunType::WHITESPACE_NEWLINE) {
            end = start + 1;
        } else {
            end = start;
            while (!is_eof(end) && at(end) == b) end++;
        }
        push(symType);
    }

    return runs;
}

} // namespace escview
