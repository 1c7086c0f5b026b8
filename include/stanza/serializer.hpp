#pragma once


/*
    ----------------------------------------------
    Stanza serializer - documents into runtime types
    ----------------------------------------------
    `XmlSerializer` reads one document into one runtime type. It only
    handles types it can construct (types whose descriptor has `read`);
    sequence interfaces and error dictionaries must first be replaced by a
    surrogate, which is what the wrapper providers are for.

    The root element must carry the type's `xml_name`:
        - `int`              -> <int>5</int>
        - `seq_ptr<int>`     -> (surrogate) <ArrayOfInt><int>1</int></ArrayOfInt>
        - `serializable_error` -> (surrogate) <Error><Name>...</Name></Error>
*/

#include <any>
#include <expected>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/node.hpp"
#include "stanza/reader.hpp"
#include "stanza/types.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Deserializes documents into instances of one runtime type.
    class XmlSerializer {
    public:
        /// @throws configuration_error if @p type is null or cannot be constructed
        STANZA_API explicit XmlSerializer(type_ref type);
        virtual ~XmlSerializer() = default;

        [[nodiscard]] type_ref type() const noexcept { return m_Type; }

        /// @brief Reads the whole document from @p reader and converts it.
        ///
        /// @details
        /// Parse failures and quota violations map to `ReadError::from(ParseError)`;
        /// shape mismatches to `ReadError::from(ConvertError)`.
        ///
        /// @throws stream_error if the body stream of @p reader fails
        [[nodiscard]] STANZA_API virtual std::expected<std::any, ReadError> deserialize(XmlReader& reader) const;

        /// @brief Converts an already parsed document.
        [[nodiscard]] STANZA_API ConvertResult deserialize(const node& root) const;

    private:
        type_ref m_Type;
    };

} // namespace Stanza
