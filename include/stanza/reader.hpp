#pragma once


/*
    ----------------------------------------------
    Stanza reader - quota-bounded XML document input
    ----------------------------------------------
    - Parsing:
        * `std::expected<node, ParseError> parse(std::string_view, const ReaderQuotas& = {})`
        * `std::expected<node, ParseError> parse(std::istream&, const ReaderQuotas& = {})`
        * The parser accepts an XML declaration, comments, processing
          instructions, CDATA sections, the five predefined entities and
          character references. Document type declarations are rejected.
    - Decoding:
        * `decode_text(bytes, encodings, charset)` detects UTF-8 or UTF-16LE
          from a byte-order mark or the leading `<` byte pattern, falls back
          to the `charset` hint, and transcodes to UTF-8
    - Reading:
        * `XmlReader` owns a request `body_stream`, pulls it in chunks of at
          most `max_bytes_per_read` bytes, decodes and parses it, and
          releases the stream exactly once: on `close()` or destruction
*/

#include <expected>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/error.hpp"
#include "stanza/node.hpp"
#include "stanza/options.hpp"
#include "stanza/stream.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Alias for the result type returned by XML parsing functions
    using ParseResult = std::expected<node, ParseError>;

    /// @ingroup StanzaAPI
    /// @brief Parses an XML document from UTF-8 text
    ///
    /// @details
    /// On success, the root element is returned. On failure, a `ParseError`
    /// describing the location and reason is returned instead. Quota
    /// violations are reported with the `*_exceeded` codes.
    ///
    /// Example:
    /// @code
    /// auto doc = Stanza::parse("<ArrayOfInt><int>1</int></ArrayOfInt>");
    /// if (doc) std::println("{}", doc->children().size());
    /// @endcode
    ///
    /// @param input UTF-8 encoded XML text
    /// @param quotas Resource limits applied while parsing
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ReaderQuotas& quotas = default_reader_quotas());

    /// @ingroup StanzaAPI
    /// @brief Parses an XML document from an input stream
    ///
    /// @details
    /// Reads the entire contents of @p is, decodes it as UTF-8 or UTF-16LE
    /// and parses it with @p quotas.
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, const ReaderQuotas& quotas = default_reader_quotas());

    /// @ingroup StanzaAPI
    /// @brief Maps a `charset` parameter value to an encoding.
    /// @return The encoding, or `std::nullopt` for charsets Stanza cannot decode
    [[nodiscard]] STANZA_API std::optional<TextEncoding> encoding_from_charset(std::string_view charset) noexcept;

    /// @ingroup StanzaAPI
    /// @brief Detects the encoding of @p bytes and transcodes them to UTF-8.
    ///
    /// @param bytes Raw body bytes
    /// @param supported Encodings the caller accepts
    /// @param charset Optional `charset` hint from the request content type
    /// @return UTF-8 text without byte-order mark, or `unsupported_encoding` /
    ///         `invalid_utf8` errors
    [[nodiscard]] STANZA_API std::expected<std::string, ParseError> decode_text(std::string_view bytes,
                                                                     std::span<const TextEncoding> supported,
                                                                     std::string_view charset = {});

    /// @ingroup StanzaAPI
    /// @brief Scoped, quota-bounded reader over a request body.
    ///
    /// @details
    /// The reader takes ownership of the body stream. The stream is destroyed
    /// exactly once, either by `close()` or by the destructor, whichever comes
    /// first, and on every exit path of the caller including exceptions.
    class XmlReader {
    public:
        STANZA_API XmlReader(std::unique_ptr<body_stream> stream,
                             const ReaderQuotas& quotas,
                             std::vector<TextEncoding> encodings = { TextEncoding::utf8, TextEncoding::utf16le },
                             std::string charset = {});
        STANZA_API virtual ~XmlReader();

        XmlReader(const XmlReader&) = delete;
        XmlReader& operator=(const XmlReader&) = delete;

        /// @brief Reads the whole body and parses it into a document.
        ///
        /// @details
        /// May be called once; afterwards the reader is closed.
        /// @throws stream_error if the body stream fails or is cancelled
        [[nodiscard]] STANZA_API ParseResult read_document();

        /// @brief Releases the body stream. Idempotent.
        STANZA_API void close() noexcept;

        [[nodiscard]] bool is_open() const noexcept { return m_Stream != nullptr; }
        [[nodiscard]] const ReaderQuotas& quotas() const noexcept { return m_Quotas; }

    private:
        std::unique_ptr<body_stream> m_Stream;
        ReaderQuotas m_Quotas;
        std::vector<TextEncoding> m_Encodings;
        std::string m_Charset;
    };

} // namespace Stanza
