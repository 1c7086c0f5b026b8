#include "stanza/serializer.hpp"

#include <format>


namespace Stanza {

    XmlSerializer::XmlSerializer(type_ref type)
        : m_Type{ type } {
        if (!m_Type)
            throw configuration_error{ "Serializer requires a type" };
        if (!m_Type->is_constructible())
            throw configuration_error{ std::format("Type '{}' cannot be constructed by the serializer", m_Type->name) };
    }

    std::expected<std::any, ReadError> XmlSerializer::deserialize(XmlReader& reader) const {
        auto doc = reader.read_document();
        if (!doc) return std::unexpected(ReadError::from(std::move(doc.error())));

        auto value = deserialize(*doc);
        if (!value) return std::unexpected(ReadError::from(std::move(value.error())));
        return std::move(*value);
    }

    ConvertResult XmlSerializer::deserialize(const node& root) const {
        const std::string path = std::format("/{}", root.local_name());
        if (root.local_name() != m_Type->xml_name) {
            return std::unexpected(ConvertError::make(ConvertError::code::unexpected_element, path,
                std::format("Expected root element '{}' but found '{}'", m_Type->xml_name, root.name())));
        }
        return m_Type->read(root, path);
    }

} // namespace Stanza
