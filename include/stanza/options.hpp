#pragma once


/*
    --------------------------------
    Stanza reader quotas and options
    --------------------------------
    This header defines the configuration structures that bound the
    resources an XML document may consume while it is being read.

    --------------------------------------
    Reader quotas - Stanza::ReaderQuotas
    --------------------------------------
    - `int max_depth`:
        * Maximum element nesting depth; the root element is depth 1
        * Exceeding it fails with `depth_limit_exceeded`
    - `int max_string_content_length`:
        * Maximum length, in bytes of UTF-8, of one text run or one
          attribute value
    - `int max_array_length`:
        * Maximum number of child elements below any single element
    - `int max_bytes_per_read`:
        * Size of each chunk pulled from the body stream, and the maximum
          size of a single start tag (name plus attributes)
    - `int max_name_table_char_count`:
        * Maximum total number of characters of distinct element and
          attribute names seen in one document

    Every limit must be positive. Defaults come from
    `Stanza::default_reader_quotas()`: a depth of 32 and `INT32_MAX` for
    everything else.

    -----
    Usage
    -----
        Stanza::ReaderQuotas quotas = Stanza::default_reader_quotas();
        quotas.max_depth = 8;
        auto doc = Stanza::parse(text, quotas);
*/


#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

/// @defgroup StanzaOptions Reader Options
/// @ingroup Stanza
/// @brief Configuration objects controlling document reading

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Default maximum element nesting depth.
    inline constexpr int default_max_depth = 32;

    /// @ingroup StanzaOptions
    /// @brief Upper bounds on the resources a document may consume while it is read.
    ///
    /// @details
    /// A plain aggregate; every field can be overridden independently.
    ///
    /// Example:
    /// @code
    /// ReaderQuotas q = default_reader_quotas();
    /// q.max_string_content_length = 4096;
    /// @endcode
    struct ReaderQuotas {
        int max_depth = default_max_depth;                                      ///< Maximum element nesting depth.
        int max_string_content_length = std::numeric_limits<int32_t>::max();    ///< Maximum text/attribute length.
        int max_array_length = std::numeric_limits<int32_t>::max();             ///< Maximum child elements per element.
        int max_bytes_per_read = std::numeric_limits<int32_t>::max();           ///< Stream chunk and start tag size.
        int max_name_table_char_count = std::numeric_limits<int32_t>::max();    ///< Total characters of distinct names.
    };

    /// @ingroup StanzaOptions
    /// @brief Returns the shared default quotas.
    [[nodiscard]] constexpr ReaderQuotas default_reader_quotas() noexcept { return ReaderQuotas{}; }

    /// @ingroup StanzaOptions
    /// @brief Text encodings the reader can decode.
    enum class TextEncoding : uint8_t {
        utf8,    ///< UTF-8; a byte-order mark is accepted and stripped.
        utf16le, ///< UTF-16 little endian, with or without byte-order mark.
    };

    /// @ingroup StanzaOptions
    /// @brief Canonical name of an encoding (`utf-8`, `utf-16le`).
    [[nodiscard]] constexpr std::string_view encoding_name(TextEncoding e) noexcept {
        switch (e) {
        case TextEncoding::utf8: return "utf-8";
        case TextEncoding::utf16le: return "utf-16le";
        }
        return "unknown";
    }

} // namespace Stanza
