#pragma once


/*
    ------------------------------------------------
    Stanza type conversion utilities - type_of/from_xml
    ------------------------------------------------
    This header defines `type_of<T>()`, which describes a C++ type to the
    serializer, and the customization points used to read user-defined
    types from XML elements.

    ----------
    Core Ideas
    ----------
    - Builtin descriptors exist for:
        * `bool`, the fixed-width integers, `float`, `double`, `std::string`
          (XmlSerializer names: `boolean`, `int`, `long`, `double`, ...)
        * `seq_ptr<T>` for any described `T`; a sequence interface the
          serializer cannot construct (element name `ArrayOf` + element)
        * `std::shared_ptr<R>` for any record `R`; a nullable record
    - For a user-defined record `R`, provide:

        struct R {
            static constexpr std::string_view xml_name = "Point";
            ...
        };

        std::expected<void, Stanza::ConvertError> from_xml(const Stanza::node& n, R& out);

      in the namespace of `R` (found by ADL). `read_member` reads one
      child element into a member and reports errors with its path.
    - Types with an unusual shape (surrogates, dictionaries) can describe
      themselves entirely by providing, in their namespace:

        std::unique_ptr<Stanza::type_descriptor> describe_type(std::type_identity<T>);

    Every descriptor built here also carries `make_delegating_sequence`,
    which composes the surrogate descriptor for `sequence<T>`.

    ----------------
    Conceptual Usage
    ----------------
        struct point {
            static constexpr std::string_view xml_name = "Point";
            int x = 0;
            int y = 0;
        };

        Stanza::ConvertStatus from_xml(const Stanza::node& n, point& p) {
            if (auto r = Stanza::read_member(n, "X", p.x); !r) return r;
            return Stanza::read_member(n, "Y", p.y);
        }

        Stanza::type_ref t = Stanza::type_of<Stanza::seq_ptr<point>>();
        // t->xml_name == "ArrayOfPoint"
*/


#include <any>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/node.hpp"
#include "stanza/sequence.hpp"
#include "stanza/types.hpp"

/// @defgroup StanzaConvert Type Conversion
/// @ingroup Stanza
/// @brief Describing C++ types and reading them from XML elements

namespace Stanza {

    /// @ingroup StanzaConvert
    /// @brief Result of a `from_xml` customization point
    using ConvertStatus = std::expected<void, ConvertError>;

    /// @ingroup StanzaConvert
    /// @brief Concept for builtin scalar types read from element text.
    template<typename T>
    concept XmlScalar = std::same_as<T, bool>
        || std::same_as<T, std::string>
        || std::same_as<T, float>
        || std::same_as<T, double>
        || (std::integral<T> && !std::same_as<T, char> && !std::same_as<T, wchar_t>
            && !std::same_as<T, char8_t> && !std::same_as<T, char16_t> && !std::same_as<T, char32_t>);

    /// @ingroup StanzaConvert
    /// @brief Concept representing records that can be read from an element.
    ///
    /// @details
    /// A type `T` satisfies `XmlDeserializable` if it names its element via
    /// a static `xml_name` and an overload of:
    ///
    ///     Stanza::ConvertStatus from_xml(const Stanza::node& src, T& out);
    ///
    /// is available through ADL. `out` is value-initialized before the call.
    template<typename T>
    concept XmlDeserializable = std::default_initializable<T> && requires(const node& n, T& t) {
        { T::xml_name } -> std::convertible_to<std::string_view>;
        { from_xml(n, t) } -> std::same_as<ConvertStatus>;
    };

    /// @ingroup StanzaConvert
    /// @brief Concept for types that build their own descriptor through ADL `describe_type`.
    template<typename T>
    concept SelfDescribing = requires {
        { describe_type(std::type_identity<T>{}) } -> std::same_as<std::unique_ptr<type_descriptor>>;
    };

    namespace detail {

        template<typename>
        inline constexpr bool always_false_v = false;

        template<typename T>
        struct sequence_traits : std::false_type {};

        template<typename E>
        struct sequence_traits<seq_ptr<E>> : std::true_type {
            using element_type = E;
        };

        template<typename T>
        struct shared_record_traits : std::false_type {};

        template<XmlDeserializable R>
        struct shared_record_traits<std::shared_ptr<R>> : std::true_type {
            using record_type = R;
        };

        constexpr std::string_view trim_xml_space(std::string_view s) noexcept {
            constexpr std::string_view ws = " \t\r\n";
            const auto first = s.find_first_not_of(ws);
            if (first == std::string_view::npos) return {};
            const auto last = s.find_last_not_of(ws);
            return s.substr(first, last - first + 1);
        }

        template<typename T>
        constexpr std::string_view scalar_xml_name() noexcept {
            if constexpr (std::same_as<T, bool>) return "boolean";
            else if constexpr (std::same_as<T, std::string>) return "string";
            else if constexpr (std::same_as<T, float>) return "float";
            else if constexpr (std::same_as<T, double>) return "double";
            else if constexpr (std::is_signed_v<T>) {
                if constexpr (sizeof(T) == 1) return "byte";
                else if constexpr (sizeof(T) == 2) return "short";
                else if constexpr (sizeof(T) == 4) return "int";
                else return "long";
            }
            else {
                if constexpr (sizeof(T) == 1) return "unsignedByte";
                else if constexpr (sizeof(T) == 2) return "unsignedShort";
                else if constexpr (sizeof(T) == 4) return "unsignedInt";
                else return "unsignedLong";
            }
        }

        template<typename T>
        ConvertResult invalid_scalar(std::string_view text, std::string_view path) {
            return std::unexpected(ConvertError::make(ConvertError::code::invalid_value, path,
                std::format("'{}' is not a valid {}", text, scalar_xml_name<T>())));
        }

        template<XmlScalar T>
        ConvertResult read_scalar(const node& n, std::string_view path) {
            if constexpr (std::same_as<T, std::string>) {
                return std::any{ std::string(n.text()) };
            }
            else {
                const std::string_view text = trim_xml_space(n.text());

                if constexpr (std::same_as<T, bool>) {
                    if (text == "true" || text == "1") return std::any{ true };
                    if (text == "false" || text == "0") return std::any{ false };
                    return invalid_scalar<T>(text, path);
                }
                else if constexpr (std::floating_point<T>) {
                    if (text == "INF") return std::any{ std::numeric_limits<T>::infinity() };
                    if (text == "-INF") return std::any{ -std::numeric_limits<T>::infinity() };
                    if (text == "NaN") return std::any{ std::numeric_limits<T>::quiet_NaN() };

                    T v{};
                    const char* first = text.data();
                    const char* last = text.data() + text.size();
                    if (first != last && *first == '+') ++first;
                    auto [p, ec] = std::from_chars(first, last, v, std::chars_format::general);
                    if (text.empty() || ec != std::errc{} || p != last) return invalid_scalar<T>(text, path);
                    return std::any{ v };
                }
                else {
                    T v{};
                    const char* first = text.data();
                    const char* last = text.data() + text.size();
                    if (first != last && *first == '+') ++first;
                    auto [p, ec] = std::from_chars(first, last, v);
                    if (text.empty() || ec != std::errc{} || p != last) return invalid_scalar<T>(text, path);
                    return std::any{ v };
                }
            }
        }

        template<typename T>
        std::unique_ptr<type_descriptor> describe_delegating(type_ref wrapped);

        template<typename T>
        std::unique_ptr<type_descriptor> describe() {
            std::unique_ptr<type_descriptor> d;

            if constexpr (SelfDescribing<T>) {
                d = describe_type(std::type_identity<T>{});
            }
            else if constexpr (XmlScalar<T>) {
                d = std::make_unique<type_descriptor>();
                d->name = scalar_xml_name<T>();
                d->xml_name = d->name;
                d->kind = type_kind::scalar;
                d->make_default = [] { return std::any{ T{} }; };
                d->read = [](const node& n, std::string_view path) -> ConvertResult {
                    if (n.is_nil()) return std::any{ T{} };
                    return read_scalar<T>(n, path);
                };
            }
            else if constexpr (sequence_traits<T>::value) {
                using E = typename sequence_traits<T>::element_type;
                type_ref element = type_of<E>();

                d = std::make_unique<type_descriptor>();
                d->name = std::format("sequence<{}>", element->name);
                d->xml_name = array_xml_name(element->xml_name);
                d->kind = type_kind::sequence_interface;
                d->is_value_type = false;
                d->element = element;
                d->make_default = [] { return std::any{}; };
            }
            else if constexpr (shared_record_traits<T>::value) {
                using R = typename shared_record_traits<T>::record_type;

                d = std::make_unique<type_descriptor>();
                d->name = std::format("shared_ptr<{}>", R::xml_name);
                d->xml_name = R::xml_name;
                d->kind = type_kind::record;
                d->is_value_type = false;
                d->make_default = [] { return std::any{}; };
                d->read = [](const node& n, std::string_view path) -> ConvertResult {
                    if (n.is_nil()) return std::any{};
                    auto v = type_of<R>()->read(n, path);
                    if (!v) return std::unexpected(std::move(v.error()));
                    return std::any{ std::make_shared<R>(unbox<R>(*v)) };
                };
            }
            else if constexpr (XmlDeserializable<T>) {
                d = std::make_unique<type_descriptor>();
                d->name = T::xml_name;
                d->xml_name = T::xml_name;
                d->kind = type_kind::record;
                d->make_default = [] { return std::any{ T{} }; };
                d->read = [](const node& n, std::string_view path) -> ConvertResult {
                    T out{};
                    if (n.is_nil()) return std::any{ std::move(out) };
                    if (auto r = from_xml(n, out); !r) {
                        ConvertError e = std::move(r.error());
                        e.path.insert(0, path);
                        return std::unexpected(std::move(e));
                    }
                    return std::any{ std::move(out) };
                };
            }
            else {
                static_assert(always_false_v<T>, "Stanza cannot describe this type; provide from_xml or describe_type");
            }

            if (!d->make_delegating_sequence) {
                d->make_delegating_sequence = [](type_ref wrapped) { return describe_delegating<T>(wrapped); };
            }
            return d;
        }

        /// Descriptor of `delegating_sequence<T>` exposing @p wrapped elements.
        template<typename T>
        std::unique_ptr<type_descriptor> describe_delegating(type_ref wrapped) {
            type_ref declared = type_of<T>();

            auto d = std::make_unique<type_descriptor>();
            d->name = std::format("delegating_sequence<{}, {}>", wrapped->name, declared->name);
            d->xml_name = array_xml_name(wrapped->xml_name);
            d->kind = type_kind::delegating_sequence;
            d->is_value_type = false;
            d->element = declared;
            d->wrapped_element = wrapped;
            d->make_default = [] { return std::any{}; };

            d->read = [wrapped](const node& n, std::string_view path) -> ConvertResult {
                if (n.is_nil()) return std::any{};

                auto seq = std::make_shared<delegating_sequence<T>>(wrapped);
                std::size_t index = 0;
                for (const node& child : n.children()) {
                    // Unknown elements are skipped
                    if (child.local_name() != wrapped->xml_name) continue;
                    const std::string child_path = std::format("{}/{}[{}]", path, child.local_name(), ++index);
                    auto item = wrapped->read(child, child_path);
                    if (!item) return std::unexpected(std::move(item.error()));
                    seq->add(*item);
                }
                return std::any{ std::move(seq) };
            };

            d->unwrap = [declared](const std::any& surrogate, type_ref target) -> std::any {
                if (!surrogate.has_value()) return {};
                if (!target || target->kind != type_kind::sequence_interface || target->element != declared) {
                    throw configuration_error{ std::format("Cannot unwrap a sequence of '{}' into '{}'",
                        declared->name, target ? target->name : std::string("<null>")) };
                }
                return box(std::any_cast<const std::shared_ptr<delegating_sequence<T>>&>(surrogate)->unwrap());
            };

            d->construct = [](const std::any& original, std::shared_ptr<const WrapperProvider> inner) -> std::any {
                if (!original.has_value()) return {};
                auto source = std::any_cast<seq_ptr<T>>(original);
                if (!source) return {};
                return std::any{ std::make_shared<delegating_sequence<T>>(std::move(source), std::move(inner)) };
            };

            return d;
        }

    } // namespace detail

    /// @ingroup StanzaConvert
    /// @brief Descriptor of `T`, built on first use and kept for the lifetime of the process.
    template<typename T>
    type_ref type_of() {
        if constexpr (!std::is_same_v<T, std::remove_cvref_t<T>>) {
            return type_of<std::remove_cvref_t<T>>();
        } else {
            static const std::unique_ptr<type_descriptor> d = detail::describe<T>();
            return d.get();
        }
    }

    /// @ingroup StanzaConvert
    /// @brief Reads the first child element named @p name into @p out.
    ///
    /// @details
    /// A missing child leaves @p out untouched. Errors carry the path of the
    /// child relative to @p parent.
    ///
    /// @tparam T A type described by `type_of<T>()`
    template<typename T>
    ConvertStatus read_member(const node& parent, std::string_view name, T& out) {
        const node* child = parent.find_child(name);
        if (!child) return {};

        type_ref t = type_of<T>();
        const std::string path = std::format("/{}", name);
        if (!t->is_constructible()) {
            return std::unexpected(ConvertError::make(ConvertError::code::not_constructible, path,
                std::format("Type '{}' cannot be read by the serializer", t->name)));
        }

        auto v = t->read(*child, path);
        if (!v) return std::unexpected(std::move(v.error()));
        out = unbox<T>(*v);
        return {};
    }

} // namespace Stanza
