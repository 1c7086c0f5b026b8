#pragma once


/*
    ------------------------------------------------
    Stanza wrapper providers - surrogate type plumbing
    ------------------------------------------------
    Some declared types cannot be handled by the serializer directly: a
    sequence interface has no constructor, an error dictionary has no stable
    element shape. A `WrapperProvider` names a surrogate type to read or write
    instead, and converts values into it.

    - `WrapperContext` describes one resolution: the declared type and the
      direction (serializing or deserializing)
    - `WrapperProviderFactory` inspects a context and either returns a
      provider or declines with nullptr
    - `get_wrapper_provider` consults an ordered list of factories; the first
      factory that returns a provider wins

    Surrogates are turned back into the declared type through the
    `unwrap` closure of their descriptor (see types.hpp); the read pipeline
    only calls it when the surrogate differs from the declared type.
*/

#include <any>
#include <memory>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/types.hpp"

/// @defgroup StanzaWrapper Wrapper Providers
/// @ingroup Stanza
/// @brief Surrogate type resolution for types the serializer cannot handle

namespace Stanza {

    class WrapperProviderFactory;

    /// @ingroup StanzaWrapper
    /// @brief Ordered list of wrapper provider factories
    using WrapperProviderFactories = std::vector<std::shared_ptr<const WrapperProviderFactory>>;

    /// @ingroup StanzaWrapper
    /// @brief Describes a type that may need a surrogate, and the direction of the operation.
    struct WrapperContext {
        type_ref declared_type = nullptr;
        bool is_serialization = false;

        /// Registry consulted for nested element types. Set by `get_wrapper_provider`;
        /// a factory called directly with a null registry resolves no nested providers.
        const WrapperProviderFactories* factories = nullptr;
    };

    /// @ingroup StanzaWrapper
    /// @brief Names a surrogate type and converts declared values into it.
    class WrapperProvider {
    public:
        virtual ~WrapperProvider() = default;

        /// @brief The surrogate type to use instead of the declared type.
        [[nodiscard]] virtual type_ref wrapping_type() const noexcept = 0;

        /// @brief Converts a declared value (or none) into a surrogate value.
        ///
        /// @details
        /// `wrap(none)` returns none. Any other result holds a value of
        /// `wrapping_type()`.
        [[nodiscard]] virtual std::any wrap(const std::any& original) const = 0;
    };

    /// @ingroup StanzaWrapper
    /// @brief Creates wrapper providers for the types it recognizes.
    class WrapperProviderFactory {
    public:
        virtual ~WrapperProviderFactory() = default;

        /// @brief Gets the provider for @p context.
        /// @return A provider if the factory decides to wrap the type, else nullptr
        [[nodiscard]] virtual std::shared_ptr<const WrapperProvider> get_provider(const WrapperContext& context) const = 0;
    };

    /// @ingroup StanzaWrapper
    /// @brief Returns the provider of the first factory in @p factories that claims @p context.
    ///
    /// @details
    /// Factories are consulted in order and the first non-null result wins.
    /// The context handed to each factory refers to @p factories so that
    /// recursive factories resolve element types against the same registry.
    ///
    /// @throws configuration_error if a factory entry is null
    [[nodiscard]] STANZA_API std::shared_ptr<const WrapperProvider> get_wrapper_provider(const WrapperProviderFactories& factories,
                                                                                       const WrapperContext& context);

    /// @ingroup StanzaWrapper
    /// @brief The registry a formatter starts with: the sequence factory followed by
    ///        the serializable error factory.
    [[nodiscard]] STANZA_API WrapperProviderFactories default_wrapper_provider_factories();

} // namespace Stanza
