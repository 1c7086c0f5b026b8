#include "stanza/wrapper.hpp"

#include <memory>

#include "stanza/error.hpp"
#include "stanza/sequence_wrapper.hpp"
#include "stanza/serializable_error.hpp"


namespace Stanza {

    std::shared_ptr<const WrapperProvider> get_wrapper_provider(const WrapperProviderFactories& factories,
                                                                const WrapperContext& context) {
        WrapperContext scoped = context;
        scoped.factories = &factories;

        for (const auto& factory : factories) {
            if (!factory) throw configuration_error{ "Wrapper provider factory list contains a null entry" };
            if (auto provider = factory->get_provider(scoped)) return provider;
        }
        return nullptr;
    }

    WrapperProviderFactories default_wrapper_provider_factories() {
        return {
            std::make_shared<const SequenceWrapperProviderFactory>(),
            std::make_shared<const SerializableErrorWrapperProviderFactory>(),
        };
    }

} // namespace Stanza
