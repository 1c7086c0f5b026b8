#pragma once


/*
    -------------------------------------------
    Stanza runtime types - descriptors and boxing
    -------------------------------------------
    The read pipeline decides at run time which type a document is read
    into: the declared type, or a surrogate composed for it. Types are
    therefore described by `type_descriptor` objects, referenced through
    `type_ref` (a pointer with static lifetime; equal types have equal
    pointers).

    - Descriptors for C++ types come from `type_of<T>()` (see convert.hpp)
    - Descriptors for composed surrogate sequences come from
      `delegating_sequence_type(wrapped, declared)`, which builds them once
      per `(wrapped, declared)` pair and interns them

    A descriptor carries the closures the serializer and the wrapper
    providers need:
        * `make_default` - zero value, or none for reference-shaped types
        * `read`         - builds a value from an element; absent when the
                           serializer cannot construct the type
        * `unwrap`       - turns a surrogate back into its declared type;
                           absent when the type is not a surrogate
        * `construct`    - composed sequences: builds the surrogate from
                           `(original, inner provider)`
        * `make_delegating_sequence` - builds the composed sequence
                           descriptor whose declared element is this type

    ------
    Values
    ------
    Values travel as `std::any`. An empty `std::any` is *none*.
    `box` turns null smart pointers into none; `unbox<T>` turns none into
    `T{}`.
*/

#include <any>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/node.hpp"

/// @defgroup StanzaTypes Runtime Types
/// @ingroup Stanza
/// @brief Runtime descriptors of serializable and surrogate types

namespace Stanza {

    class WrapperProvider;

    struct type_descriptor;

    /// @ingroup StanzaTypes
    /// @brief Reference to an interned type descriptor
    using type_ref = const type_descriptor*;

    /// @ingroup StanzaTypes
    /// @brief Result of converting an element into a runtime value
    using ConvertResult = std::expected<std::any, ConvertError>;

    /// @ingroup StanzaTypes
    /// @brief Shape of a described type
    enum class type_kind : uint8_t {
        scalar,              ///< Text-valued type: numbers, booleans, strings.
        record,              ///< User type read through `from_xml`.
        sequence_interface,  ///< `sequence<T>` interface; not constructible.
        delegating_sequence, ///< Composed surrogate for a sequence interface.
        surrogate,           ///< Hand-written surrogate type (e.g. error wrapper).
        dictionary,          ///< Keyed collection the serializer cannot read directly.
    };

    /// @ingroup StanzaTypes
    /// @brief Runtime description of a type.
    struct type_descriptor {
        using default_fn = std::function<std::any()>;
        using read_fn = std::function<ConvertResult(const node&, std::string_view path)>;
        using unwrap_fn = std::function<std::any(const std::any& surrogate, type_ref declared)>;
        using construct_fn = std::function<std::any(const std::any& original, std::shared_ptr<const WrapperProvider> inner)>;
        using compose_fn = std::function<std::unique_ptr<type_descriptor>(type_ref wrapped_element)>;

        std::string name;            ///< Diagnostic name, e.g. `sequence<int>`.
        std::string xml_name;        ///< Element name used in documents, e.g. `ArrayOfInt`.
        type_kind kind = type_kind::scalar;
        bool is_value_type = true;   ///< False for reference-shaped (nullable) types.
        type_ref element = nullptr;  ///< Declared element type of sequence shapes.
        type_ref wrapped_element = nullptr; ///< Surrogate element type of composed sequences.

        default_fn make_default;
        read_fn read;
        unwrap_fn unwrap;
        construct_fn construct;
        compose_fn make_delegating_sequence;

        /// @brief True when the serializer can build this type from an element.
        [[nodiscard]] bool is_constructible() const noexcept { return static_cast<bool>(read); }

        /// @brief True when values of this type can be unwrapped to a declared type.
        [[nodiscard]] bool is_unwrappable() const noexcept { return static_cast<bool>(unwrap); }
    };

    /// @ingroup StanzaTypes
    /// @brief Descriptor of a C++ type; defined in convert.hpp.
    template<typename T>
    type_ref type_of();

    /// @ingroup StanzaTypes
    /// @brief Returns the interned descriptor of the surrogate sequence that
    ///        stores @p declared elements and exposes @p wrapped elements.
    ///
    /// @details
    /// Built once per pair from `declared->make_delegating_sequence` and kept
    /// for the lifetime of the process; later calls return the same pointer.
    ///
    /// @throws configuration_error if @p declared cannot compose a sequence,
    ///         or if @p wrapped cannot be read by the serializer
    [[nodiscard]] STANZA_API type_ref delegating_sequence_type(type_ref wrapped, type_ref declared);

    /// @ingroup StanzaTypes
    /// @brief `ArrayOf` + element name with its first letter upper-cased.
    [[nodiscard]] STANZA_API std::string array_xml_name(std::string_view element_xml_name);

    namespace detail {
        template<typename T>
        struct is_shared_ptr : std::false_type {};

        template<typename T>
        struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};
    } // namespace detail

    /// @ingroup StanzaTypes
    /// @brief True for `std::shared_ptr<T>`: the reference-shaped types.
    template<typename T>
    inline constexpr bool is_reference_shaped_v = detail::is_shared_ptr<std::remove_cvref_t<T>>::value;

    /// @ingroup StanzaTypes
    /// @brief Stores @p v in a `std::any`; null smart pointers become none.
    template<typename T>
    [[nodiscard]] std::any box(T v) {
        if constexpr (is_reference_shaped_v<T>) {
            if (!v) return {};
        }
        return std::any{ std::move(v) };
    }

    /// @ingroup StanzaTypes
    /// @brief Extracts a `T` from @p a; none becomes `T{}`.
    /// @throws std::bad_any_cast if @p a holds a different type
    template<typename T>
    [[nodiscard]] T unbox(const std::any& a) {
        if (!a.has_value()) return T{};
        return std::any_cast<T>(a);
    }

} // namespace Stanza
