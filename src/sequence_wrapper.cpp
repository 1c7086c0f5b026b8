#include "stanza/sequence_wrapper.hpp"

#include <format>
#include <utility>

#include "stanza/error.hpp"


namespace Stanza {

    namespace {
        type_ref checked_element(type_ref declared) {
            if (!declared)
                throw invalid_shape_error{ "Declared type is null" };
            if (declared->kind != type_kind::sequence_interface)
                throw invalid_shape_error{ std::format("Type '{}' is not a sequence interface", declared->name) };
            if (!declared->element)
                throw invalid_shape_error{ std::format("Sequence interface '{}' has no element type", declared->name) };
            return declared->element;
        }
    } // namespace

    SequenceWrapperProvider::SequenceWrapperProvider(type_ref declared, std::shared_ptr<const WrapperProvider> inner)
        : m_Declared{ declared }, m_Inner{ std::move(inner) } {
        type_ref element = checked_element(declared);
        type_ref wrapped = m_Inner ? m_Inner->wrapping_type() : element;
        if (!wrapped) wrapped = element;

        m_Wrapping = delegating_sequence_type(wrapped, element);
        if (!m_Wrapping->construct)
            throw configuration_error{ std::format("Surrogate '{}' has no constructor", m_Wrapping->name) };
    }

    std::any SequenceWrapperProvider::wrap(const std::any& original) const {
        if (!original.has_value()) return {};
        return m_Wrapping->construct(original, m_Inner);
    }

    std::shared_ptr<const WrapperProvider> SequenceWrapperProviderFactory::get_provider(const WrapperContext& context) const {
        type_ref declared = context.declared_type;
        if (!declared || declared->kind != type_kind::sequence_interface) return nullptr;

        type_ref element = checked_element(declared);

        std::shared_ptr<const WrapperProvider> inner;
        if (context.factories) {
            inner = get_wrapper_provider(*context.factories,
                                         WrapperContext{ element, context.is_serialization, context.factories });
        }
        return std::make_shared<const SequenceWrapperProvider>(declared, std::move(inner));
    }

} // namespace Stanza
