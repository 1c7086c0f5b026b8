#include "stanza/reader.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <set>
#include <sstream>


namespace Stanza {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ReaderQuotas& quotas);
    } // namespace detail

    ParseResult parse(std::string_view input, const ReaderQuotas& quotas) {
        return detail::parse_impl(input, quotas);
    }

    ParseResult parse(std::istream& is, const ReaderQuotas& quotas) {
        std::ostringstream oss;
        oss << is.rdbuf();
        static constexpr std::array supported{ TextEncoding::utf8, TextEncoding::utf16le };
        auto text = decode_text(oss.view(), supported);
        if (!text) return std::unexpected(std::move(text.error()));
        return detail::parse_impl(*text, quotas);
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        struct Scanner {
            std::string_view text;
            const ReaderQuotas& quotas;
            size_t idx = 0;
            size_t line = 1;
            size_t column = 1;
            size_t depth = 0;
            size_t name_chars = 0;
            std::set<std::string, std::less<>> names;
            std::pmr::memory_resource* mem_res;

            Scanner(std::string_view t, const ReaderQuotas& q, std::pmr::memory_resource* r)
                : text{ t }, quotas{ q }, mem_res{ r } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            [[nodiscard]] bool starts_with(std::string_view s) const noexcept { return text.substr(idx).starts_with(s); }

            char get() {
                if (eof()) return '\0';
                char c = text[idx++];
                if (c == '\n') {
                    line++;
                    column = 1;
                } else column++;
                return c;
            }

            void advance(size_t n) {
                for (size_t i = 0; i < n && !eof(); i++) get();
            }

            bool consume(char c) {
                if (peek() == c) {
                    get();
                    return true;
                }
                return false;
            }

            ParseError make_error(ParseError::code code, std::string_view msg) const {
                return ParseError::make(code, idx, line, column, msg);
            }
        };

        struct DepthGuard {
            Scanner& s;
            bool active = false;

            DepthGuard(Scanner& sc) : s(sc) {
                if (s.depth + 1 <= static_cast<size_t>(s.quotas.max_depth)) {
                    s.depth++;
                    active = true;
                }
            }

            ~DepthGuard() {
                if (active) s.depth--;
            }

            bool ok() const {
                return active;
            }
        };

        expected_t<node> parse_element(Scanner& s);
        expected_t<std::string_view> parse_name(Scanner& s);
        expected_void parse_reference(Scanner& s, string& out);
        expected_void skip_comment(Scanner& s);
        expected_void skip_processing_instruction(Scanner& s);
        expected_void skip_misc(Scanner& s);

        bool is_valid_utf8(std::string_view s, size_t& error_idx) {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
            size_t i = 0;
            size_t n = s.size();

            auto fail = [&](size_t idx) { error_idx = idx; return false; };

            while (i < n) {
                unsigned char c = data[i];

                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                if (c >= 0xC2 && c <= 0xDF) {
                    if (i + 1 >= n) return fail(i);
                    if ((data[i + 1] & 0xC0) != 0x80) return fail(i);
                    i += 2;
                    continue;
                }

                if (c >= 0xE0 && c <= 0xEF) {
                    if (i + 2 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    unsigned char c2 = data[i + 2];
                    if (c == 0xE0 && (c1 < 0xA0 || c1 > 0xBF)) return fail(i);
                    if (c == 0xED && (c1 < 0x80 || c1 > 0x9F)) return fail(i);
                    if ((c1 & 0xC0) != 0x80) return fail(i);
                    if ((c2 & 0xC0) != 0x80) return fail(i);
                    i += 3;
                    continue;
                }

                if (c >= 0xF0 && c <= 0xF4) {
                    if (i + 3 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    unsigned char c2 = data[i + 2];
                    unsigned char c3 = data[i + 3];
                    if (c == 0xF0 && (c1 < 0x90 || c1 > 0xBF)) return fail(i);
                    if (c == 0xF4 && (c1 < 0x80 || c1 > 0x8F)) return fail(i);
                    if ((c1 & 0xC0) != 0x80) return fail(i);
                    if ((c2 & 0xC0) != 0x80) return fail(i);
                    if ((c3 & 0xC0) != 0x80) return fail(i);
                    i += 4;
                    continue;
                }

                return fail(i);
            }
            return true;
        }

        inline bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

        inline bool is_name_start(char c) noexcept {
            auto u = static_cast<unsigned char>(c);
            return std::isalpha(u) || c == '_' || c == ':' || u >= 0x80;
        }

        inline bool is_name_char(char c) noexcept {
            return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '.';
        }

        void skip_ws(Scanner& s) {
            while (is_ws(s.peek())) s.get();
        }

        expected_t<std::string_view> parse_name(Scanner& s) {
            size_t start = s.idx;
            if (!is_name_start(s.peek())) return std::unexpected(s.make_error(ParseError::code::invalid_name, "Expected a name"));
            while (is_name_char(s.peek())) s.get();
            std::string_view name = s.text.substr(start, s.idx - start);

            if (!s.names.contains(name)) {
                s.name_chars += name.size();
                if (s.name_chars > static_cast<size_t>(s.quotas.max_name_table_char_count))
                    return std::unexpected(s.make_error(ParseError::code::name_table_exceeded, "Name table character count quota exceeded"));
                s.names.emplace(name);
            }
            return name;
        }

        expected_void parse_reference(Scanner& s, string& out) {
            if (!s.consume('&')) return std::unexpected(s.make_error(ParseError::code::invalid_entity, "Expected '&'"));

            if (s.consume('#')) {
                int base = 10;
                if (s.consume('x')) base = 16;
                size_t start = s.idx;
                while (!s.eof() && s.peek() != ';' && s.idx - start < 8) s.get();
                if (!s.consume(';')) return std::unexpected(s.make_error(ParseError::code::invalid_character_reference, "Unterminated character reference"));
                auto digits = s.text.substr(start, s.idx - start - 1);
                uint32_t cp = 0;
                auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
                if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size())
                    return std::unexpected(s.make_error(ParseError::code::invalid_character_reference, "Malformed character reference"));
                bool legal = cp == 0x9 || cp == 0xA || cp == 0xD
                    || (cp >= 0x20 && cp <= 0xD7FF)
                    || (cp >= 0xE000 && cp <= 0xFFFD)
                    || (cp >= 0x10000 && cp <= 0x10FFFF);
                if (!legal) return std::unexpected(s.make_error(ParseError::code::invalid_character_reference, "Character reference to an illegal code point"));
                append_utf8(cp, out);
                return {};
            }

            static constexpr std::pair<std::string_view, char> predefined[] = {
                { "lt;", '<' }, { "gt;", '>' }, { "amp;", '&' }, { "quot;", '"' }, { "apos;", '\'' },
            };
            for (const auto& [name, ch] : predefined) {
                if (s.starts_with(name)) {
                    s.advance(name.size());
                    out.push_back(ch);
                    return {};
                }
            }
            return std::unexpected(s.make_error(ParseError::code::invalid_entity, "Unknown entity reference"));
        }

        expected_void skip_comment(Scanner& s) {
            s.advance(4); // <!--
            while (!s.eof()) {
                if (s.starts_with("--")) {
                    if (!s.starts_with("-->")) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "'--' is not allowed inside a comment"));
                    s.advance(3);
                    return {};
                }
                s.get();
            }
            return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated comment"));
        }

        expected_void skip_processing_instruction(Scanner& s) {
            s.advance(2); // <?
            auto target = parse_name(s);
            if (!target) return std::unexpected(target.error());
            std::string_view t = *target;
            if (t.size() == 3 && std::tolower(static_cast<unsigned char>(t[0])) == 'x'
                && std::tolower(static_cast<unsigned char>(t[1])) == 'm'
                && std::tolower(static_cast<unsigned char>(t[2])) == 'l')
                return std::unexpected(s.make_error(ParseError::code::unexpected_character, "XML declaration is only allowed at the start of the document"));
            while (!s.eof()) {
                if (s.starts_with("?>")) {
                    s.advance(2);
                    return {};
                }
                s.get();
            }
            return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated processing instruction"));
        }

        expected_void skip_misc(Scanner& s) {
            while (true) {
                skip_ws(s);
                if (s.starts_with("<!--")) {
                    if (auto r = skip_comment(s); !r) return r;
                } else if (s.starts_with("<!DOCTYPE") || s.starts_with("<!doctype")) {
                    return std::unexpected(s.make_error(ParseError::code::dtd_prohibited, "Document type declarations are prohibited"));
                } else if (s.starts_with("<?")) {
                    if (auto r = skip_processing_instruction(s); !r) return r;
                } else {
                    return {};
                }
            }
        }

        expected_void parse_xml_declaration(Scanner& s) {
            if (!s.starts_with("<?xml") || !(s.text.size() > 5 && is_ws(s.text[5]))) return {};
            s.advance(5);
            while (!s.eof()) {
                if (s.starts_with("?>")) {
                    s.advance(2);
                    return {};
                }
                s.get();
            }
            return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated XML declaration"));
        }

        expected_void check_text_length(Scanner& s, const string& text) {
            if (text.size() > static_cast<size_t>(s.quotas.max_string_content_length))
                return std::unexpected(s.make_error(ParseError::code::string_length_exceeded, "String content length quota exceeded"));
            return {};
        }

        expected_void parse_attribute(Scanner& s, node& n) {
            auto name = parse_name(s);
            if (!name) return std::unexpected(name.error());
            skip_ws(s);
            if (!s.consume('=')) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected '=' after attribute name"));
            skip_ws(s);

            char quote = s.peek();
            if (quote != '"' && quote != '\'') return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected quoted attribute value"));
            s.get();

            string value{ allocator_type(s.mem_res) };
            while (true) {
                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated attribute value"));
                char c = s.peek();
                if (c == quote) { s.get(); break; }
                if (c == '<') return std::unexpected(s.make_error(ParseError::code::unexpected_character, "'<' is not allowed in attribute values"));
                if (c == '&') {
                    if (auto r = parse_reference(s, value); !r) return r;
                } else {
                    value.push_back(s.get());
                }
                if (auto r = check_text_length(s, value); !r) return r;
            }

            if (!n.set_attribute(*name, value))
                return std::unexpected(s.make_error(ParseError::code::duplicate_attribute, "Duplicate attribute"));
            return {};
        }

        expected_void parse_end_tag(Scanner& s, const node& n) {
            s.advance(2); // </
            auto name = parse_name(s);
            if (!name) return std::unexpected(name.error());
            if (*name != std::string_view{ n.name() }) return std::unexpected(s.make_error(ParseError::code::mismatched_end_tag, "End tag does not match start tag"));
            skip_ws(s);
            if (!s.consume('>')) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected '>' to close end tag"));
            return {};
        }

        expected_void parse_content(Scanner& s, node& n) {
            string run{ allocator_type(s.mem_res) };

            auto flush = [&]() -> expected_void {
                if (run.empty()) return {};
                n.append_text(run);
                run.clear();
                return check_text_length(s, n.text());
            };

            while (true) {
                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated element, expected end tag"));

                char c = s.peek();
                if (c == '&') {
                    if (auto r = parse_reference(s, run); !r) return r;
                    continue;
                }
                if (c != '<') {
                    if (c == '>' && s.idx >= 2 && s.text.substr(s.idx - 2, 2) == "]]")
                        return std::unexpected(s.make_error(ParseError::code::unexpected_character, "']]>' is not allowed in character data"));
                    run.push_back(s.get());
                    if (run.size() > static_cast<size_t>(s.quotas.max_string_content_length))
                        return std::unexpected(s.make_error(ParseError::code::string_length_exceeded, "String content length quota exceeded"));
                    continue;
                }

                if (auto r = flush(); !r) return r;

                if (s.starts_with("</")) return parse_end_tag(s, n);

                if (s.starts_with("<!--")) {
                    if (auto r = skip_comment(s); !r) return r;
                    continue;
                }

                if (s.starts_with("<![CDATA[")) {
                    s.advance(9);
                    size_t end = s.text.find("]]>", s.idx);
                    if (end == std::string_view::npos) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated CDATA section"));
                    n.append_text(s.text.substr(s.idx, end - s.idx));
                    s.advance(end - s.idx + 3);
                    if (auto r = check_text_length(s, n.text()); !r) return r;
                    continue;
                }

                if (s.starts_with("<?")) {
                    if (auto r = skip_processing_instruction(s); !r) return r;
                    continue;
                }

                if (s.starts_with("<!")) return std::unexpected(s.make_error(ParseError::code::dtd_prohibited, "Markup declarations are prohibited"));

                if (n.size() + 1 > static_cast<size_t>(s.quotas.max_array_length))
                    return std::unexpected(s.make_error(ParseError::code::array_length_exceeded, "Array length quota exceeded"));

                auto child = parse_element(s);
                if (!child) return std::unexpected(std::move(child.error()));
                n.append_child(std::move(*child));
            }
        }

        expected_t<node> parse_element(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return std::unexpected(s.make_error(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded"));

            size_t tag_start = s.idx;
            if (!s.consume('<')) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected '<' to start element"));

            auto name = parse_name(s);
            if (!name) return std::unexpected(name.error());
            node n{ *name, s.mem_res };

            auto check_tag_size = [&]() -> expected_void {
                if (s.idx - tag_start > static_cast<size_t>(s.quotas.max_bytes_per_read))
                    return std::unexpected(s.make_error(ParseError::code::bytes_per_read_exceeded, "Start tag exceeds bytes per read quota"));
                return {};
            };

            while (true) {
                bool had_ws = is_ws(s.peek());
                skip_ws(s);
                if (auto r = check_tag_size(); !r) return std::unexpected(r.error());

                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated start tag"));
                if (s.starts_with("/>")) {
                    s.advance(2);
                    return n;
                }
                if (s.consume('>')) break;
                if (!had_ws) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected whitespace before attribute"));
                if (auto r = parse_attribute(s, n); !r) return std::unexpected(r.error());
            }

            if (auto r = parse_content(s, n); !r) return std::unexpected(r.error());
            return n;
        }

        ParseResult parse_impl(std::string_view text, const ReaderQuotas& quotas) {
            std::pmr::memory_resource* res = std::pmr::get_default_resource();
            Scanner s{ text, quotas, res };

            size_t bad_idx = 0;
            if (!is_valid_utf8(text, bad_idx)) {
                s.advance(bad_idx);
                return std::unexpected(s.make_error(ParseError::code::invalid_utf8, "Invalid UTF-8 sequence"));
            }

            if (auto r = parse_xml_declaration(s); !r) return std::unexpected(r.error());
            if (auto r = skip_misc(s); !r) return std::unexpected(r.error());
            if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Root element is missing"));
            if (s.peek() != '<') return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Data at the root level is invalid"));

            auto root = parse_element(s);
            if (!root) return std::unexpected(root.error());
            if (auto r = skip_misc(s); !r) return std::unexpected(r.error());
            if (!s.eof()) return std::unexpected(s.make_error(ParseError::code::trailing_content, "Trailing content after the root element"));
            return *std::move(root);
        }

    } // namespace detail
#pragma endregion
#pragma region Decoding

    std::optional<TextEncoding> encoding_from_charset(std::string_view charset) noexcept {
        std::string lower;
        for (char c : charset) {
            if (c == '"' || c == '\'') continue;
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (lower == "utf-8" || lower == "utf8") return TextEncoding::utf8;
        if (lower == "utf-16" || lower == "utf-16le" || lower == "utf16" || lower == "unicode") return TextEncoding::utf16le;
        return std::nullopt;
    }

    namespace detail {

        expected_t<std::string> utf16le_to_utf8(std::string_view bytes) {
            auto make_error = [&](size_t at, std::string_view msg) {
                return ParseError::make(ParseError::code::invalid_utf8, at, 1, at + 1, msg);
            };
            if (bytes.size() % 2 != 0) return std::unexpected(make_error(bytes.size(), "Truncated UTF-16 code unit"));

            std::string out;
            out.reserve(bytes.size() / 2);
            auto unit = [&](size_t i) -> uint16_t {
                return static_cast<uint16_t>(static_cast<unsigned char>(bytes[i]) | (static_cast<unsigned char>(bytes[i + 1]) << 8));
            };

            for (size_t i = 0; i < bytes.size(); i += 2) {
                uint16_t first = unit(i);
                uint32_t codepoint = first;
                if (first >= 0xD800 && first <= 0xDBFF) {
                    if (i + 2 >= bytes.size()) return std::unexpected(make_error(i, "Unpaired high surrogate"));
                    uint16_t second = unit(i + 2);
                    if (!(second >= 0xDC00 && second <= 0xDFFF)) return std::unexpected(make_error(i, "Invalid low surrogate"));
                    codepoint = 0x10000u + ((static_cast<uint32_t>(first - 0xD800) << 10) | static_cast<uint32_t>(second - 0xDC00));
                    i += 2;
                } else if (first >= 0xDC00 && first <= 0xDFFF) {
                    return std::unexpected(make_error(i, "Unpaired low surrogate"));
                }
                append_utf8(codepoint, out);
            }
            return out;
        }

    } // namespace detail

    std::expected<std::string, ParseError> decode_text(std::string_view bytes,
                                                       std::span<const TextEncoding> supported,
                                                       std::string_view charset) {
        auto unsupported = [](std::string_view what) {
            std::string msg{ "Unsupported encoding: " };
            msg.append(what);
            return std::unexpected(ParseError::make(ParseError::code::unsupported_encoding, 0, 1, 1, msg));
        };

        std::optional<TextEncoding> detected;
        size_t bom = 0;
        if (bytes.starts_with("\xEF\xBB\xBF")) {
            detected = TextEncoding::utf8;
            bom = 3;
        } else if (bytes.starts_with("\xFF\xFE")) {
            detected = TextEncoding::utf16le;
            bom = 2;
        } else if (bytes.starts_with("\xFE\xFF") || (bytes.size() >= 2 && bytes[0] == '\0' && bytes[1] == '<')) {
            return unsupported("utf-16be");
        } else if (bytes.size() >= 2 && bytes[0] == '<' && bytes[1] == '\0') {
            detected = TextEncoding::utf16le;
        } else if (!bytes.empty() && bytes[0] == '<') {
            // `<` or `<?` in single bytes: the charset hint is not consulted
            detected = TextEncoding::utf8;
        } else if (!charset.empty()) {
            detected = encoding_from_charset(charset);
            if (!detected) return unsupported(charset);
        } else {
            detected = TextEncoding::utf8;
        }

        if (std::ranges::find(supported, *detected) == supported.end()) return unsupported(encoding_name(*detected));

        bytes.remove_prefix(bom);
        if (*detected == TextEncoding::utf16le) return detail::utf16le_to_utf8(bytes);
        return std::string{ bytes };
    }

#pragma endregion
#pragma region Reader

    XmlReader::XmlReader(std::unique_ptr<body_stream> stream,
                         const ReaderQuotas& quotas,
                         std::vector<TextEncoding> encodings,
                         std::string charset)
        : m_Stream{ std::move(stream) }, m_Quotas{ quotas }, m_Encodings{ std::move(encodings) }, m_Charset{ std::move(charset) } {}

    XmlReader::~XmlReader() {
        close();
    }

    void XmlReader::close() noexcept {
        m_Stream.reset();
    }

    ParseResult XmlReader::read_document() {
        if (!m_Stream) return std::unexpected(ParseError::make(ParseError::code::io_error, 0, 1, 1, "Reader is closed"));

        static constexpr size_t max_chunk = 4096;
        std::vector<char> chunk(std::min(max_chunk, static_cast<size_t>(std::max(m_Quotas.max_bytes_per_read, 1))));
        std::string bytes;
        while (size_t n = m_Stream->read(chunk)) {
            bytes.append(chunk.data(), n);
        }
        close();

        auto text = decode_text(bytes, m_Encodings, m_Charset);
        if (!text) return std::unexpected(std::move(text.error()));
        return detail::parse_impl(*text, m_Quotas);
    }

#pragma endregion

} // namespace Stanza
