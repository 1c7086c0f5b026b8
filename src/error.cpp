#include "stanza/error.hpp"

#include <format>

namespace Stanza {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    ConvertError ConvertError::make(code c, std::string_view path, std::string_view m) {
        ConvertError e;
        e.errc = c;
        e.path.assign(path.begin(), path.end());
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    ReadError ReadError::unsupported_media_type(std::string_view content_type) {
        ReadError e;
        e.errc = code::unsupported_media_type;
        e.msg = std::format("Unsupported content type '{}'", content_type);
        return e;
    }

    ReadError ReadError::from(ParseError p) {
        ReadError e;
        e.errc = p.is_quota() ? code::quota_exceeded : code::malformed_document;
        e.msg = std::format("{} (line {}, column {})", p.msg, p.line, p.column);
        e.parse = std::move(p);
        return e;
    }

    ReadError ReadError::from(ConvertError c) {
        ReadError e;
        e.errc = code::malformed_document;
        e.msg = std::format("{} at {}", c.msg, c.path);
        e.convert = std::move(c);
        return e;
    }

} // namespace Stanza
