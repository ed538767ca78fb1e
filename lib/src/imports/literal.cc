//
// Go string literal decoding
//

#include <gopdeps/literal.hh>
#include <gopdeps/file_set.hh>
#include <gopdeps/parser_error.hh>

#include <algorithm>
#include <cstdint>
#include <utility>

namespace gopdeps {
    namespace {
        int hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        // Consumes `count` hex digits from the front of `in`
        bool take_hex(std::string_view& in, std::size_t count, std::uint32_t& value) {
            if (in.size() < count) {
                return false;
            }
            value = 0;
            for (std::size_t i = 0; i < count; ++i) {
                int digit = hex_digit(in[i]);
                if (digit < 0) {
                    return false;
                }
                value = value * 16 + static_cast<std::uint32_t>(digit);
            }
            in.remove_prefix(count);
            return true;
        }

        void append_utf8(std::string& out, std::uint32_t cp) {
            if (cp < 0x80) {
                out += static_cast<char>(cp);
            } else if (cp < 0x800) {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x10000) {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        bool is_valid_code_point(std::uint32_t cp) {
            return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
        }

        // Length of the UTF-8 sequence introduced by `lead`; stray bytes count as one
        std::size_t sequence_length(unsigned char lead) {
            if (lead >= 0xF0 && lead <= 0xF7) return 4;
            if (lead >= 0xE0) return lead <= 0xEF ? 3 : 1;
            if (lead >= 0xC0) return 2;
            return 1;
        }

        // Decodes the escape sequence after a backslash
        bool decode_escape(std::string_view& in, char quote, std::string& out) {
            if (in.empty()) {
                return false;
            }
            char c = in.front();
            in.remove_prefix(1);

            switch (c) {
                case 'a': out += '\a'; return true;
                case 'b': out += '\b'; return true;
                case 'f': out += '\f'; return true;
                case 'n': out += '\n'; return true;
                case 'r': out += '\r'; return true;
                case 't': out += '\t'; return true;
                case 'v': out += '\v'; return true;
                case '\\': out += '\\'; return true;
                case '\'':
                case '"':
                    // Only the enclosing quote may be escaped
                    if (c != quote) {
                        return false;
                    }
                    out += c;
                    return true;
                case 'x': {
                    std::uint32_t value;
                    if (!take_hex(in, 2, value)) {
                        return false;
                    }
                    out += static_cast<char>(value);
                    return true;
                }
                case 'u':
                case 'U': {
                    std::uint32_t value;
                    if (!take_hex(in, c == 'u' ? 4 : 8, value) || !is_valid_code_point(value)) {
                        return false;
                    }
                    append_utf8(out, value);
                    return true;
                }
                default:
                    break;
            }

            if (c >= '0' && c <= '7') {
                std::uint32_t value = static_cast<std::uint32_t>(c - '0');
                for (int i = 0; i < 2; ++i) {
                    if (in.empty() || in.front() < '0' || in.front() > '7') {
                        return false;
                    }
                    value = value * 8 + static_cast<std::uint32_t>(in.front() - '0');
                    in.remove_prefix(1);
                }
                if (value > 255) {
                    return false;
                }
                out += static_cast<char>(value);
                return true;
            }
            return false;
        }
    } // anonymous namespace

    std::optional<std::string> unquote(std::string_view literal) {
        if (literal.size() < 2) {
            return std::nullopt;
        }
        const char quote = literal.front();
        if (literal.back() != quote) {
            return std::nullopt;
        }
        std::string_view body = literal.substr(1, literal.size() - 2);

        if (quote == '`') {
            if (body.find('`') != std::string_view::npos) {
                return std::nullopt;
            }
            // Carriage returns are dropped from raw strings
            std::string result;
            result.reserve(body.size());
            for (char c : body) {
                if (c != '\r') {
                    result += c;
                }
            }
            return result;
        }

        if (quote != '"' && quote != '\'') {
            return std::nullopt;
        }
        if (body.find('\n') != std::string_view::npos) {
            return std::nullopt;
        }

        std::string result;
        result.reserve(body.size());
        std::size_t characters = 0;

        while (!body.empty()) {
            const char c = body.front();
            if (c == quote) {
                return std::nullopt;
            }
            if (c == '\\') {
                body.remove_prefix(1);
                if (!decode_escape(body, quote, result)) {
                    return std::nullopt;
                }
            } else {
                std::size_t length = std::min(sequence_length(static_cast<unsigned char>(c)), body.size());
                result.append(body.substr(0, length));
                body.remove_prefix(length);
            }
            ++characters;
        }

        if (quote == '\'' && characters != 1) {
            return std::nullopt;
        }
        return result;
    }

    std::string decode_string_literal(const ast::basic_lit& lit) {
        if (lit.kind != ast::lit_kind::string) {
            throw grammar_invariant_error(
                file_set::position(lit.pos) + ": import path is not a string literal: " + lit.value);
        }

        std::optional<std::string> value = unquote(lit.value);
        if (!value) {
            throw grammar_invariant_error(
                file_set::position(lit.pos) + ": malformed string literal: " + lit.value);
        }
        return std::move(*value);
    }
}
