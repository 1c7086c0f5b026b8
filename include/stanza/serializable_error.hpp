#pragma once


/*
    ---------------------------------------------------
    Stanza serializable errors - keyed error collections
    ---------------------------------------------------
    `serializable_error` maps field keys to error messages. It has no stable
    element shape of its own, so it is read through the surrogate
    `serializable_error_wrapper`, whose element form is:

        <Error>
            <Name>The Name field is required.</Name>
            <MVC-Empty>The request is invalid.</MVC-Empty>
        </Error>

    - Each child element is one entry; its text is the message
    - The empty key is written as `MVC-Empty`
    - Keys that are not valid XML names use `_xHHHH_` escapes, which are
      decoded on read (`Order_x0020_Id` reads as `Order Id`)

    `SerializableErrorWrapperProviderFactory` claims the declared
    `serializable_error` type; it is part of the default registry, so
    `seq_ptr<serializable_error>` reads `<ArrayOfError>` documents.
*/

#include <any>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "stanza/config.hpp"
#include "stanza/types.hpp"
#include "stanza/wrapper.hpp"

/// @defgroup StanzaErrorModel Serializable Errors
/// @ingroup Stanza
/// @brief Keyed error collections and their surrogate

namespace Stanza {

    /// @ingroup StanzaErrorModel
    /// @brief Key of the entry that describes the request as a whole.
    inline constexpr std::string_view empty_error_key = "MVC-Empty";

    /// @ingroup StanzaErrorModel
    /// @brief Collection of error messages keyed by field name.
    class serializable_error {
    public:
        using map_type = std::map<std::string, std::string, std::less<>>;
        using const_iterator = map_type::const_iterator;

        serializable_error() = default;
        serializable_error(std::initializer_list<map_type::value_type> entries) : m_Entries{ entries } {}

        /// @brief Sets the message for @p key, replacing an existing one.
        void set(std::string_view key, std::string_view message) {
            m_Entries.insert_or_assign(std::string(key), std::string(message));
        }

        /// @return Pointer to the message for @p key, or nullptr if absent
        [[nodiscard]] const std::string* find(std::string_view key) const {
            auto it = m_Entries.find(key);
            return it == m_Entries.end() ? nullptr : &it->second;
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_Entries.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Entries.empty(); }
        [[nodiscard]] const_iterator begin() const noexcept { return m_Entries.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return m_Entries.end(); }

        friend bool operator==(const serializable_error&, const serializable_error&) = default;

    private:
        map_type m_Entries;
    };

    /// @ingroup StanzaErrorModel
    /// @brief Surrogate read in place of a `serializable_error`.
    class serializable_error_wrapper {
    public:
        static constexpr std::string_view xml_name = "Error";

        serializable_error_wrapper() = default;
        explicit serializable_error_wrapper(serializable_error error) : m_Error{ std::move(error) } {}

        [[nodiscard]] const serializable_error& error() const noexcept { return m_Error; }

    private:
        serializable_error m_Error;
    };

    /// @ingroup StanzaErrorModel
    /// @brief Decodes `_xHHHH_` and `_xHHHHHHHH_` escapes in an XML name to UTF-8.
    ///
    /// @details
    /// Malformed or out-of-range escapes are kept verbatim.
    [[nodiscard]] STANZA_API std::string decode_xml_name(std::string_view name);

    /// @ingroup StanzaErrorModel
    /// @brief Descriptor of `serializable_error`: a dictionary the serializer cannot read.
    [[nodiscard]] STANZA_API std::unique_ptr<type_descriptor> describe_type(std::type_identity<serializable_error>);

    /// @ingroup StanzaErrorModel
    /// @brief Descriptor of the `Error` surrogate; reads entries and unwraps to `serializable_error`.
    [[nodiscard]] STANZA_API std::unique_ptr<type_descriptor> describe_type(std::type_identity<serializable_error_wrapper>);

    /// @ingroup StanzaErrorModel
    /// @brief Wraps a `serializable_error` in its surrogate.
    class SerializableErrorWrapperProvider final : public WrapperProvider {
    public:
        [[nodiscard]] STANZA_API type_ref wrapping_type() const noexcept override;
        [[nodiscard]] STANZA_API std::any wrap(const std::any& original) const override;
    };

    /// @ingroup StanzaErrorModel
    /// @brief Claims the declared `serializable_error` type in either direction.
    class SerializableErrorWrapperProviderFactory final : public WrapperProviderFactory {
    public:
        [[nodiscard]] STANZA_API std::shared_ptr<const WrapperProvider> get_provider(const WrapperContext& context) const override;
    };

} // namespace Stanza
