#include "stanza/input_formatter.hpp"

#include <algorithm>
#include <format>
#include <utility>


namespace Stanza {

    namespace {
        void validate_quotas(const ReaderQuotas& q) {
            auto check = [](int value, std::string_view name) {
                if (value <= 0) throw configuration_error{ std::format("Reader quota '{}' must be positive, got {}", name, value) };
            };
            check(q.max_depth, "max_depth");
            check(q.max_string_content_length, "max_string_content_length");
            check(q.max_array_length, "max_array_length");
            check(q.max_bytes_per_read, "max_bytes_per_read");
            check(q.max_name_table_char_count, "max_name_table_char_count");
        }
    } // namespace

    XmlInputFormatter::XmlInputFormatter()
        : XmlInputFormatter(XmlInputFormatterOptions{}) {}

    XmlInputFormatter::XmlInputFormatter(XmlInputFormatterOptions options)
        : m_Options{ std::move(options) } {
        if (m_Options.supported_media_types.empty())
            throw configuration_error{ "At least one supported media type is required" };
        if (m_Options.supported_encodings.empty())
            throw configuration_error{ "At least one supported encoding is required" };
        validate_quotas(m_Options.quotas);

        for (const auto& text : m_Options.supported_media_types) {
            auto mt = MediaType::parse(text);
            if (!mt) throw configuration_error{ std::format("Invalid supported media type '{}'", text) };
            m_MediaTypes.push_back(std::move(*mt));
        }

        const auto& factories = m_Options.wrapper_provider_factories;
        if (std::ranges::any_of(factories, [](const auto& f) { return f == nullptr; }))
            throw configuration_error{ "Wrapper provider factory list contains a null entry" };
    }

    bool XmlInputFormatter::can_read(const InputFormatterContext& context) const {
        return negotiate(context.request.content_type).has_value();
    }

    ReadResult XmlInputFormatter::read(InputFormatterContext& context) const {
        if (!context.model_type) throw configuration_error{ "Input formatter context has no model type" };

        InputRequest& request = context.request;
        auto content_type = negotiate(request.content_type);
        if (!content_type) {
            trace(std::format("declined content type '{}'", request.content_type));
            return std::unexpected(ReadError::unsupported_media_type(request.content_type));
        }

        if (request.content_length == 0) {
            trace(std::format("empty body, returning default of '{}'", context.model_type->name));
            return context.model_type->make_default();
        }

        std::unique_ptr<body_stream> body = std::move(request.body);
        if (!body) body = std::make_unique<string_body>(std::string{});

        auto reader = create_reader(std::move(body), content_type->charset().value_or(std::string_view{}));
        type_ref type = get_serializable_type(context.model_type);
        if (type != context.model_type)
            trace(std::format("reading '{}' through surrogate '{}'", context.model_type->name, type->name));

        auto serializer = create_serializer(type);
        auto value = serializer->deserialize(*reader);
        reader.reset();

        if (!value) {
            trace(std::format("read of '{}' failed: {}", type->name, value.error().msg));
            return std::unexpected(std::move(value.error()));
        }

        if (type != context.model_type && type->is_unwrappable())
            return type->unwrap(*value, context.model_type);
        return std::move(*value);
    }

    type_ref XmlInputFormatter::get_serializable_type(type_ref declared) const {
        auto provider = get_wrapper_provider(m_Options.wrapper_provider_factories,
                                             WrapperContext{ declared, false, nullptr });
        if (provider && provider->wrapping_type()) return provider->wrapping_type();
        return declared;
    }

    std::unique_ptr<XmlReader> XmlInputFormatter::create_reader(std::unique_ptr<body_stream> body,
                                                                std::string_view charset) const {
        return std::make_unique<XmlReader>(std::move(body), m_Options.quotas, m_Options.supported_encodings, std::string{ charset });
    }

    std::unique_ptr<XmlSerializer> XmlInputFormatter::create_serializer(type_ref type) const {
        return std::make_unique<XmlSerializer>(type);
    }

    std::optional<MediaType> XmlInputFormatter::negotiate(std::string_view content_type) const {
        auto requested = MediaType::parse(content_type);
        if (!requested) return std::nullopt;
        for (const auto& supported : m_MediaTypes) {
            if (requested->is_subset_of(supported)) return requested;
        }
        return std::nullopt;
    }

    void XmlInputFormatter::trace(std::string_view message) const {
        if (m_Options.trace) m_Options.trace(message);
    }

} // namespace Stanza
