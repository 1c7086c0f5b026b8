#include "stanza/types.hpp"

#include <cctype>
#include <format>
#include <map>
#include <mutex>
#include <utility>


namespace Stanza {

    namespace {
        struct composed_registry {
            std::mutex mutex;
            std::map<std::pair<type_ref, type_ref>, std::unique_ptr<type_descriptor>> types;
        };

        composed_registry& registry() {
            static composed_registry r;
            return r;
        }
    } // namespace

    type_ref delegating_sequence_type(type_ref wrapped, type_ref declared) {
        if (!wrapped || !declared)
            throw configuration_error{ "Composed sequence requires both element types" };
        if (!declared->make_delegating_sequence)
            throw configuration_error{ std::format("Type '{}' cannot compose a sequence surrogate", declared->name) };
        if (!wrapped->is_constructible())
            throw configuration_error{ std::format("Surrogate element type '{}' cannot be read by the serializer", wrapped->name) };

        auto& r = registry();
        std::scoped_lock lock{ r.mutex };

        auto key = std::make_pair(wrapped, declared);
        if (auto it = r.types.find(key); it != r.types.end()) return it->second.get();

        auto composed = declared->make_delegating_sequence(wrapped);
        if (!composed)
            throw configuration_error{ std::format("Type '{}' returned no sequence surrogate", declared->name) };
        type_ref result = composed.get();
        r.types.emplace(key, std::move(composed));
        return result;
    }

    std::string array_xml_name(std::string_view element_xml_name) {
        std::string out = "ArrayOf";
        out.append(element_xml_name);
        if (out.size() > 7) out[7] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[7])));
        return out;
    }

} // namespace Stanza
