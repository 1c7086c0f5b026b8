#pragma once


/*
    -----------------------------------------------
    Stanza sequence wrapper - surrogates for sequence<T>
    -----------------------------------------------
    A declared `seq_ptr<E>` cannot be built by the serializer: `sequence<E>`
    is abstract. `SequenceWrapperProvider` substitutes the composed
    `delegating_sequence<E', E>` surrogate, where `E'` is the wrapping type
    of the element provider, or `E` when elements need no wrapping.

    Resolution is recursive. For `seq_ptr<seq_ptr<int>>` the factory first
    resolves `seq_ptr<int>` (surrogate `delegating_sequence<int, int>`) and
    then composes `delegating_sequence<delegating_sequence<int, int>, seq_ptr<int>>`.

    -----
    Usage
    -----
        auto factories = Stanza::default_wrapper_provider_factories();
        auto provider = Stanza::get_wrapper_provider(factories,
            { .declared_type = Stanza::type_of<Stanza::seq_ptr<int>>() });
        // provider->wrapping_type()->xml_name == "ArrayOfInt"
*/

#include <any>
#include <memory>

#include "stanza/config.hpp"
#include "stanza/types.hpp"
#include "stanza/wrapper.hpp"

namespace Stanza {

    /// @ingroup StanzaWrapper
    /// @brief Wraps a declared sequence interface in its composed surrogate.
    class SequenceWrapperProvider final : public WrapperProvider {
    public:
        /// @brief Composes the surrogate for @p declared.
        ///
        /// @param declared    A sequence interface type (`type_of<seq_ptr<E>>()`)
        /// @param inner       Provider for `E`, or nullptr when elements are not wrapped
        ///
        /// @throws invalid_shape_error if @p declared is not a sequence interface
        ///         with one element type
        /// @throws configuration_error if the surrogate cannot be composed or constructed
        STANZA_API SequenceWrapperProvider(type_ref declared, std::shared_ptr<const WrapperProvider> inner);

        [[nodiscard]] type_ref wrapping_type() const noexcept override { return m_Wrapping; }

        /// @brief Surrogate over @p original; elements are wrapped lazily on enumeration.
        [[nodiscard]] STANZA_API std::any wrap(const std::any& original) const override;

        [[nodiscard]] type_ref declared_type() const noexcept { return m_Declared; }
        [[nodiscard]] const std::shared_ptr<const WrapperProvider>& inner() const noexcept { return m_Inner; }

    private:
        type_ref m_Declared;
        std::shared_ptr<const WrapperProvider> m_Inner;
        type_ref m_Wrapping;
    };

    /// @ingroup StanzaWrapper
    /// @brief Claims every sequence interface and resolves its element provider
    ///        through the registry of the context.
    class SequenceWrapperProviderFactory final : public WrapperProviderFactory {
    public:
        /// @return A `SequenceWrapperProvider`, or nullptr for types that are not sequence interfaces
        /// @throws invalid_shape_error if a sequence interface has no element type
        [[nodiscard]] STANZA_API std::shared_ptr<const WrapperProvider> get_provider(const WrapperContext& context) const override;
    };

} // namespace Stanza
