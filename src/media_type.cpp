#include "stanza/media_type.hpp"

#include <algorithm>
#include <cctype>


namespace Stanza {

    namespace {
        bool is_tchar(char c) noexcept {
            if (std::isalnum(static_cast<unsigned char>(c))) return true;
            constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
            return extra.find(c) != std::string_view::npos;
        }

        bool iequals(std::string_view a, std::string_view b) noexcept {
            return std::ranges::equal(a, b, [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
            });
        }

        std::string to_lower(std::string_view s) {
            std::string out{ s };
            for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return out;
        }

        struct Cursor {
            std::string_view text;
            std::size_t idx = 0;

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }

            void skip_ows() {
                while (!eof() && (text[idx] == ' ' || text[idx] == '\t')) idx++;
            }

            bool consume(char c) {
                if (peek() != c) return false;
                idx++;
                return true;
            }

            std::string_view token() {
                const std::size_t start = idx;
                while (!eof() && is_tchar(text[idx])) idx++;
                return text.substr(start, idx - start);
            }

            std::optional<std::string> quoted_string() {
                if (!consume('"')) return std::nullopt;
                std::string out;
                while (!eof()) {
                    char c = text[idx++];
                    if (c == '"') return out;
                    if (c == '\\') {
                        if (eof()) return std::nullopt;
                        c = text[idx++];
                    }
                    out.push_back(c);
                }
                return std::nullopt;
            }
        };
    } // namespace

    std::optional<MediaType> MediaType::parse(std::string_view text) {
        Cursor cur{ text };
        MediaType mt;

        cur.skip_ows();
        std::string_view type = cur.token();
        if (type.empty() || !cur.consume('/')) return std::nullopt;
        std::string_view subtype = cur.token();
        if (subtype.empty()) return std::nullopt;
        mt.m_Type = to_lower(type);
        mt.m_Subtype = to_lower(subtype);

        cur.skip_ows();
        while (!cur.eof()) {
            if (!cur.consume(';')) return std::nullopt;
            cur.skip_ows();
            if (cur.eof()) break;

            std::string_view name = cur.token();
            if (name.empty() || !cur.consume('=')) return std::nullopt;

            std::string value;
            if (cur.peek() == '"') {
                auto quoted = cur.quoted_string();
                if (!quoted) return std::nullopt;
                value = std::move(*quoted);
            } else {
                std::string_view tok = cur.token();
                if (tok.empty()) return std::nullopt;
                value.assign(tok);
            }
            mt.m_Parameters.emplace_back(to_lower(name), std::move(value));
            cur.skip_ows();
        }
        return mt;
    }

    std::string_view MediaType::suffix() const noexcept {
        const auto plus = m_Subtype.rfind('+');
        if (plus == std::string::npos) return {};
        return std::string_view{ m_Subtype }.substr(plus + 1);
    }

    std::optional<std::string_view> MediaType::parameter_value(std::string_view name) const {
        for (const auto& [key, value] : m_Parameters) {
            if (iequals(key, name)) return std::string_view{ value };
        }
        return std::nullopt;
    }

    bool MediaType::is_subset_of(const MediaType& other) const {
        if (other.m_Type != "*" && other.m_Type != m_Type) return false;
        if (other.m_Subtype != "*" && other.m_Subtype != m_Subtype && other.m_Subtype != suffix()) return false;

        for (const auto& [key, value] : other.m_Parameters) {
            auto mine = parameter_value(key);
            if (!mine) return false;
            if (key == "charset" ? !iequals(*mine, value) : *mine != value) return false;
        }
        return true;
    }

    std::string MediaType::to_string() const {
        std::string out = m_Type + "/" + m_Subtype;
        for (const auto& [key, value] : m_Parameters) {
            out += "; ";
            out += key;
            out += "=";
            out += value;
        }
        return out;
    }

} // namespace Stanza
