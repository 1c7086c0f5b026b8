#pragma once


/*
    ---------------------------------
    Stanza media types - negotiation
    ---------------------------------
    `MediaType::parse` reads a `Content-Type` value:

        type "/" subtype *( ";" name "=" ( token / quoted-string ) )

    Type, subtype and parameter names are case-insensitive and stored in
    lower case. A subtype of the form `name+suffix` exposes `suffix()`.

    `a.is_subset_of(b)` holds when every request described by `a` is also
    described by `b`:
        - `b`'s type and subtype are equal to `a`'s or `*`, or `b`'s subtype
          equals `a`'s structured-syntax suffix (`problem+xml` within `xml`)
        - every parameter of `b` is present in `a` with an equal value
          (`charset` values compare case-insensitively)
*/

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stanza/config.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Parsed media type with parameters.
    class MediaType {
    public:
        using parameter = std::pair<std::string, std::string>;

        /// @return The media type, or `std::nullopt` if @p text is not a valid media type
        [[nodiscard]] STANZA_API static std::optional<MediaType> parse(std::string_view text);

        [[nodiscard]] const std::string& type() const noexcept { return m_Type; }
        [[nodiscard]] const std::string& subtype() const noexcept { return m_Subtype; }

        /// @brief Structured-syntax suffix (`xml` for `application/problem+xml`); empty if none.
        [[nodiscard]] STANZA_API std::string_view suffix() const noexcept;

        [[nodiscard]] const std::vector<parameter>& parameters() const noexcept { return m_Parameters; }

        /// @brief Value of the parameter named @p name (case-insensitive).
        [[nodiscard]] STANZA_API std::optional<std::string_view> parameter_value(std::string_view name) const;

        [[nodiscard]] std::optional<std::string_view> charset() const { return parameter_value("charset"); }

        [[nodiscard]] STANZA_API bool is_subset_of(const MediaType& other) const;

        /// @brief Canonical text form: `type/subtype; name=value`.
        [[nodiscard]] STANZA_API std::string to_string() const;

    private:
        std::string m_Type;
        std::string m_Subtype;
        std::vector<parameter> m_Parameters;
    };

} // namespace Stanza
