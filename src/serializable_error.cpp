#include "stanza/serializable_error.hpp"

#include <charconv>
#include <format>

#include "stanza/convert.hpp"
#include "utf8.hpp"


namespace Stanza {

    namespace {
        // Parses the escape at the start of `s` (`_xHHHH_` or `_xHHHHHHHH_`).
        // Returns the number of bytes consumed, 0 when `s` does not start with one.
        std::size_t parse_name_escape(std::string_view s, char32_t& cp) {
            for (std::size_t digits : { std::size_t{ 8 }, std::size_t{ 4 } }) {
                const std::size_t len = digits + 3;
                if (s.size() < len || !s.starts_with("_x") || s[len - 1] != '_') continue;

                std::uint32_t v = 0;
                const char* first = s.data() + 2;
                const char* last = first + digits;
                auto [p, ec] = std::from_chars(first, last, v, 16);
                if (ec != std::errc{} || p != last) continue;
                if (v > 0x10FFFF || (v >= 0xD800 && v <= 0xDFFF)) continue;
                cp = static_cast<char32_t>(v);
                return len;
            }
            return 0;
        }

        const serializable_error& unwrap_error(const std::any& surrogate) {
            return std::any_cast<const serializable_error_wrapper&>(surrogate).error();
        }
    } // namespace

    std::string decode_xml_name(std::string_view name) {
        std::string out;
        out.reserve(name.size());
        std::size_t i = 0;
        while (i < name.size()) {
            char32_t cp = 0;
            if (name[i] == '_') {
                if (std::size_t n = parse_name_escape(name.substr(i), cp)) {
                    detail::append_utf8(static_cast<std::uint32_t>(cp), out);
                    i += n;
                    continue;
                }
            }
            out.push_back(name[i++]);
        }
        return out;
    }

    std::unique_ptr<type_descriptor> describe_type(std::type_identity<serializable_error>) {
        auto d = std::make_unique<type_descriptor>();
        d->name = "serializable_error";
        d->xml_name = "Error";
        d->kind = type_kind::dictionary;
        d->make_default = [] { return std::any{ serializable_error{} }; };
        return d;
    }

    std::unique_ptr<type_descriptor> describe_type(std::type_identity<serializable_error_wrapper>) {
        auto d = std::make_unique<type_descriptor>();
        d->name = "serializable_error_wrapper";
        d->xml_name = serializable_error_wrapper::xml_name;
        d->kind = type_kind::surrogate;
        d->make_default = [] { return std::any{ serializable_error_wrapper{} }; };

        d->read = [](const node& n, std::string_view) -> ConvertResult {
            if (n.is_nil()) return std::any{};

            serializable_error error;
            for (const node& child : n.children()) {
                std::string key = decode_xml_name(child.local_name());
                if (key == empty_error_key) key.clear();
                error.set(key, child.text());
            }
            return std::any{ serializable_error_wrapper{ std::move(error) } };
        };

        d->unwrap = [](const std::any& surrogate, type_ref declared) -> std::any {
            if (!surrogate.has_value()) return {};
            if (declared != type_of<serializable_error>())
                throw configuration_error{ std::format("Cannot unwrap an error collection into '{}'",
                                                       declared ? declared->name : std::string("<null>")) };
            return std::any{ unwrap_error(surrogate) };
        };
        return d;
    }

    type_ref SerializableErrorWrapperProvider::wrapping_type() const noexcept {
        return type_of<serializable_error_wrapper>();
    }

    std::any SerializableErrorWrapperProvider::wrap(const std::any& original) const {
        if (!original.has_value()) return {};
        return std::any{ serializable_error_wrapper{ std::any_cast<const serializable_error&>(original) } };
    }

    std::shared_ptr<const WrapperProvider> SerializableErrorWrapperProviderFactory::get_provider(const WrapperContext& context) const {
        if (context.declared_type != type_of<serializable_error>()) return nullptr;
        return std::make_shared<const SerializableErrorWrapperProvider>();
    }

} // namespace Stanza
