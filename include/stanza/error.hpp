#pragma once


/*
    --------------------------------------------------
    Stanza errors - Structured parse and read failures
    --------------------------------------------------
    Stanza reports failures in three layers:

    - `Stanza::ParseError`:
        * Produced by the XML parser when the document text is malformed
          or when one of the configured `ReaderQuotas` is exceeded
        * Carries a code, byte offset, 1-based line/column and a message
    - `Stanza::ConvertError`:
        * Produced when a well-formed document does not fit the runtime type
          it is deserialized into (unexpected root, bad scalar text, ...)
        * Carries the element path at which conversion failed
    - `Stanza::ReadError`:
        * Returned by the input read pipeline; it classifies the failure as
          an unsupported media type, a malformed document or an exceeded
          quota, and keeps the underlying parse or convert error

    Configuration faults (a null factory, a surrogate without constructor)
    and shape faults (wrapping a type that is not a sequence interface) are
    programmer errors. They are thrown as `configuration_error` and
    `invalid_shape_error` as soon as they are detected.

    -----
    Usage
    -----
    - Parsing functions such as `Stanza::parse(...)` return
      `std::expected<node, ParseError>`
    - The read pipeline returns `std::expected<std::any, ReadError>`
    - `ReadError::is_quota()` lets a host map quota failures to a
      "payload too large" response
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced while parsing and reading
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced during XML parsing.
    ///
    /// @details
    /// A `ParseError` is returned whenever `Stanza::parse(...)` fails to
    /// interpret the input as a well-formed XML document, or when the
    /// document exceeds one of the reader quotas. Each error contains:
    ///
    /// - **errc** - a classification of the error
    /// - **offset** - byte offset from the start of input where the error occurred
    /// - **line** - 1-based line number of the error position
    /// - **column** - 1-based column number (UTF-8 byte offset within the line)
    /// - **msg** - human-readable explanation of the error
    struct ParseError {
        /// @ingroup StanzaError
        /// @brief Enumeration of possible error categories detected by the parser.
        ///
        /// @details
        /// The first group describes syntax violations of XML 1.0. The second
        /// group describes quota violations; `is_quota()` tells them apart.
        enum class code : uint8_t {
            unexpected_character,       ///< Invalid or unexpected character.
            unexpected_end_of_input,    ///< Input ended prematurely.
            invalid_name,               ///< Malformed element or attribute name.
            mismatched_end_tag,         ///< End tag does not close the open element.
            duplicate_attribute,        ///< Attribute repeated on one element.
            invalid_entity,             ///< Unknown or unterminated entity reference.
            invalid_character_reference,///< Malformed or out-of-range `&#...;`.
            invalid_utf8,               ///< Text is not valid UTF-8 after decoding.
            trailing_content,           ///< Content after the root element.
            dtd_prohibited,             ///< Document type declarations are not processed.
            unsupported_encoding,       ///< Body encoding is not a supported encoding.
            io_error,                   ///< The body stream could not be read.

            depth_limit_exceeded,       ///< Element nesting deeper than `max_depth`.
            string_length_exceeded,     ///< Text or attribute longer than `max_string_content_length`.
            array_length_exceeded,      ///< More children than `max_array_length`.
            bytes_per_read_exceeded,    ///< Start tag larger than `max_bytes_per_read`.
            name_table_exceeded,        ///< Distinct names exceed `max_name_table_char_count`.
        };

        code errc{};          ///< The classification of the parsing error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @brief True when the error was caused by a reader quota rather than by syntax.
        [[nodiscard]] bool is_quota() const noexcept { return errc >= code::depth_limit_exceeded; }

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `ParseError` instance.
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Byte offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        /// @return A fully constructed `ParseError`.
        STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Failure to convert a parsed element into a runtime type.
    struct ConvertError {
        enum class code : uint8_t {
            unexpected_element, ///< Element name does not match the expected type.
            invalid_value,      ///< Scalar text could not be converted.
            not_constructible,  ///< The target type cannot be built by the serializer.
        };

        code errc{};
        std::string path{}; ///< Element path, e.g. `/ArrayOfInt/int[2]`.
        std::string msg{};

        STANZA_API static ConvertError make(code c, std::string_view path, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Failure reported by the input read pipeline.
    ///
    /// @details
    /// Exactly one of `parse` / `convert` is set for `malformed_document`;
    /// `parse` is set for `quota_exceeded`; neither is set for
    /// `unsupported_media_type`.
    struct ReadError {
        enum class code : uint8_t {
            unsupported_media_type, ///< Negotiation failed; the formatter declines.
            malformed_document,     ///< Syntax or conversion failure.
            quota_exceeded,         ///< A reader quota was exceeded.
        };

        code errc{};
        std::string msg{};
        std::optional<ParseError> parse{};
        std::optional<ConvertError> convert{};

        [[nodiscard]] bool is_quota() const noexcept { return errc == code::quota_exceeded; }

        STANZA_API static ReadError unsupported_media_type(std::string_view content_type);
        STANZA_API static ReadError from(ParseError e);
        STANZA_API static ReadError from(ConvertError e);
    };

    /// @ingroup StanzaError
    /// @brief Thrown when a wrapper provider is asked to wrap a type of the wrong shape.
    class invalid_shape_error : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// @ingroup StanzaError
    /// @brief Thrown for setup faults: null factories, missing surrogate constructors,
    ///        types the serializer cannot construct, out-of-range quotas.
    class configuration_error : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

} // namespace Stanza
