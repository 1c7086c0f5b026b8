#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"
#include "models.hpp"

#include <cmath>
#include <vector>

namespace {

    using Stanza::seq_ptr;
    using Stanza::type_of;

    // Claims every type and substitutes `std::string`.
    class string_provider final : public Stanza::WrapperProvider {
    public:
        Stanza::type_ref wrapping_type() const noexcept override { return type_of<std::string>(); }
        std::any wrap(const std::any& original) const override {
            if (!original.has_value()) return {};
            return std::any{ std::string("wrapped") };
        }
    };

    class greedy_factory final : public Stanza::WrapperProviderFactory {
    public:
        std::shared_ptr<const Stanza::WrapperProvider> get_provider(const Stanza::WrapperContext&) const override {
            return std::make_shared<const string_provider>();
        }
    };

    class declining_factory final : public Stanza::WrapperProviderFactory {
    public:
        mutable int calls = 0;
        std::shared_ptr<const Stanza::WrapperProvider> get_provider(const Stanza::WrapperContext&) const override {
            calls++;
            return nullptr;
        }
    };

    std::shared_ptr<const Stanza::WrapperProvider> resolve(Stanza::type_ref declared) {
        static const auto factories = Stanza::default_wrapper_provider_factories();
        return Stanza::get_wrapper_provider(factories, { .declared_type = declared });
    }

    template<typename T>
    std::vector<T> values_of(const std::any& a) {
        auto seq = Stanza::unbox<seq_ptr<T>>(a);
        REQUIRE(seq != nullptr);
        return Stanza::to_vector(*seq);
    }

    Stanza::node parse_doc(std::string_view s) {
        auto r = Stanza::parse(s);
        REQUIRE(r);
        return std::move(*r);
    }
}


TEST_CASE("Builtin Type Descriptors") {
    REQUIRE(type_of<int>()->xml_name == "int");
    REQUIRE(type_of<long long>()->xml_name == "long");
    REQUIRE(type_of<bool>()->xml_name == "boolean");
    REQUIRE(type_of<double>()->xml_name == "double");
    REQUIRE(type_of<std::string>()->xml_name == "string");
    REQUIRE(type_of<unsigned char>()->xml_name == "unsignedByte");

    REQUIRE(type_of<int>() == type_of<int>());
    REQUIRE(type_of<const int>() == type_of<int>());
    REQUIRE(type_of<int>()->is_value_type);
    REQUIRE(type_of<int>()->is_constructible());
    REQUIRE(std::any_cast<int>(type_of<int>()->make_default()) == 0);
}

TEST_CASE("Sequence Interface Descriptors") {
    auto ints = type_of<seq_ptr<int>>();
    REQUIRE(ints->kind == Stanza::type_kind::sequence_interface);
    REQUIRE(ints->xml_name == "ArrayOfInt");
    REQUIRE(ints->element == type_of<int>());
    REQUIRE_FALSE(ints->is_value_type);
    REQUIRE_FALSE(ints->is_constructible());
    REQUIRE_FALSE(ints->make_default().has_value());

    REQUIRE(type_of<seq_ptr<seq_ptr<int>>>()->xml_name == "ArrayOfArrayOfInt");
    REQUIRE(type_of<seq_ptr<models::person>>()->xml_name == "ArrayOfPerson");
    REQUIRE(type_of<seq_ptr<std::string>>()->xml_name == "ArrayOfString");
}

TEST_CASE("Registry Returns Null for Types Needing No Surrogate") {
    REQUIRE(resolve(type_of<int>()) == nullptr);
    REQUIRE(resolve(type_of<models::person>()) == nullptr);
    REQUIRE(resolve(type_of<std::shared_ptr<models::person>>()) == nullptr);

    Stanza::WrapperProviderFactories empty;
    REQUIRE(Stanza::get_wrapper_provider(empty, { .declared_type = type_of<seq_ptr<int>>() }) == nullptr);
}

TEST_CASE("Registry Consults Factories in Order") {
    auto declining = std::make_shared<declining_factory>();

    Stanza::WrapperProviderFactories factories{ declining, std::make_shared<greedy_factory>() };
    for (const auto& f : Stanza::default_wrapper_provider_factories()) factories.push_back(f);

    auto provider = Stanza::get_wrapper_provider(factories, { .declared_type = type_of<seq_ptr<int>>() });
    REQUIRE(provider);
    REQUIRE(provider->wrapping_type() == type_of<std::string>());
    REQUIRE(declining->calls == 1);
}

TEST_CASE("Null Factory Is a Configuration Error") {
    Stanza::WrapperProviderFactories factories{ std::make_shared<declining_factory>(), nullptr };
    REQUIRE_THROWS_AS(Stanza::get_wrapper_provider(factories, { .declared_type = type_of<int>() }),
                      Stanza::configuration_error);
}

TEST_CASE("Sequence of Scalars Resolves to Composed Surrogate") {
    auto provider = resolve(type_of<seq_ptr<int>>());
    REQUIRE(provider);

    auto wrapping = provider->wrapping_type();
    REQUIRE(wrapping->kind == Stanza::type_kind::delegating_sequence);
    REQUIRE(wrapping->xml_name == "ArrayOfInt");
    REQUIRE(wrapping->element == type_of<int>());
    REQUIRE(wrapping->wrapped_element == type_of<int>());
    REQUIRE(wrapping->is_constructible());
    REQUIRE(wrapping->is_unwrappable());
}

TEST_CASE("Composed Surrogates Are Interned") {
    auto a = resolve(type_of<seq_ptr<int>>());
    auto b = resolve(type_of<seq_ptr<int>>());
    REQUIRE(a != b);
    REQUIRE(a->wrapping_type() == b->wrapping_type());
    REQUIRE(Stanza::delegating_sequence_type(type_of<int>(), type_of<int>()) == a->wrapping_type());
}

TEST_CASE("Nested Sequences Resolve Recursively") {
    auto provider = resolve(type_of<seq_ptr<seq_ptr<int>>>());
    REQUIRE(provider);

    auto inner = resolve(type_of<seq_ptr<int>>())->wrapping_type();
    auto outer = provider->wrapping_type();
    REQUIRE(outer->xml_name == "ArrayOfArrayOfInt");
    REQUIRE(outer->element == type_of<seq_ptr<int>>());
    REQUIRE(outer->wrapped_element == inner);

    auto seq_provider = std::dynamic_pointer_cast<const Stanza::SequenceWrapperProvider>(provider);
    REQUIRE(seq_provider);
    REQUIRE(seq_provider->inner() != nullptr);
    REQUIRE(seq_provider->inner()->wrapping_type() == inner);
}

TEST_CASE("Wrapping a Non-Sequence Is an Invalid Shape") {
    REQUIRE_THROWS_AS(Stanza::SequenceWrapperProvider(type_of<int>(), nullptr), Stanza::invalid_shape_error);
    REQUIRE_THROWS_AS(Stanza::SequenceWrapperProvider(nullptr, nullptr), Stanza::invalid_shape_error);

    Stanza::type_descriptor broken;
    broken.name = "sequence<?>";
    broken.kind = Stanza::type_kind::sequence_interface;

    Stanza::SequenceWrapperProviderFactory factory;
    REQUIRE_THROWS_AS((void)factory.get_provider({ .declared_type = &broken }), Stanza::invalid_shape_error);
    REQUIRE(factory.get_provider({ .declared_type = type_of<int>() }) == nullptr);
}

TEST_CASE("Wrap and Unwrap Preserve Elements and Order") {
    auto provider = resolve(type_of<seq_ptr<int>>());
    auto original = Stanza::make_sequence({ 3, 1, 2 });

    std::any wrapped = provider->wrap(Stanza::box(original));
    REQUIRE(wrapped.has_value());

    auto& surrogate = *std::any_cast<const std::shared_ptr<Stanza::delegating_sequence<int>>&>(wrapped);
    REQUIRE(surrogate.size() == 3);
    REQUIRE(std::any_cast<int>(surrogate.at(0)) == 3);
    REQUIRE(std::any_cast<int>(surrogate.at(2)) == 2);

    std::any back = provider->wrapping_type()->unwrap(wrapped, type_of<seq_ptr<int>>());
    REQUIRE(Stanza::unbox<seq_ptr<int>>(back) == original);
    REQUIRE(values_of<int>(back) == std::vector{ 3, 1, 2 });
}

TEST_CASE("None Wraps and Unwraps to None") {
    auto provider = resolve(type_of<seq_ptr<int>>());
    REQUIRE_FALSE(provider->wrap(std::any{}).has_value());
    REQUIRE_FALSE(provider->wrap(Stanza::box(seq_ptr<int>{})).has_value());
    REQUIRE_FALSE(provider->wrapping_type()->unwrap(std::any{}, type_of<seq_ptr<int>>()).has_value());
}

TEST_CASE("Error Provider Maps None to None") {
    auto provider = resolve(type_of<Stanza::serializable_error>());
    REQUIRE_FALSE(provider->wrap(std::any{}).has_value());
    REQUIRE_FALSE(provider->wrapping_type()->unwrap(std::any{}, type_of<Stanza::serializable_error>()).has_value());
}

TEST_CASE("Empty Integer Sequence Wraps, Reads and Unwraps Empty") {
    auto provider = resolve(type_of<seq_ptr<int>>());
    REQUIRE(provider);
    auto wrapping = provider->wrapping_type();
    REQUIRE(wrapping->xml_name == "ArrayOfInt");

    std::any wrapped = provider->wrap(Stanza::box(Stanza::make_sequence(std::vector<int>{})));
    REQUIRE(wrapped.has_value());
    REQUIRE(std::any_cast<const std::shared_ptr<Stanza::delegating_sequence<int>>&>(wrapped)->empty());

    Stanza::XmlSerializer serializer{ wrapping };
    auto v = serializer.deserialize(parse_doc("<ArrayOfInt/>"));
    REQUIRE(v);

    auto back = wrapping->unwrap(*v, type_of<seq_ptr<int>>());
    REQUIRE(values_of<int>(back).empty());
}

TEST_CASE("Empty Sequence Wraps to Empty Surrogate") {
    auto provider = resolve(type_of<seq_ptr<std::string>>());
    std::any wrapped = provider->wrap(Stanza::box(Stanza::make_sequence(std::vector<std::string>{})));
    REQUIRE(wrapped.has_value());

    auto back = provider->wrapping_type()->unwrap(wrapped, type_of<seq_ptr<std::string>>());
    REQUIRE(values_of<std::string>(back).empty());
}

TEST_CASE("Unwrapping Into the Wrong Type Is a Configuration Error") {
    auto provider = resolve(type_of<seq_ptr<int>>());
    std::any wrapped = provider->wrap(Stanza::box(Stanza::make_sequence({ 1 })));
    REQUIRE_THROWS_AS(provider->wrapping_type()->unwrap(wrapped, type_of<seq_ptr<double>>()), Stanza::configuration_error);
}

TEST_CASE("Nested Sequences Survive Wrap, Populate and Unwrap") {
    auto provider = resolve(type_of<seq_ptr<seq_ptr<int>>>());
    auto inner_type = provider->wrapping_type()->wrapped_element;

    auto original = Stanza::make_sequence(std::vector<seq_ptr<int>>{
        Stanza::make_sequence({ 1, 2 }),
        nullptr,
        Stanza::make_sequence(std::vector<int>{}),
    });

    std::any wrapped = provider->wrap(Stanza::box(original));
    auto& outer = *std::any_cast<const std::shared_ptr<Stanza::delegating_sequence<seq_ptr<int>>>&>(wrapped);
    REQUIRE(outer.size() == 3);
    REQUIRE(outer.at(0).type() == typeid(std::shared_ptr<Stanza::delegating_sequence<int>>));
    REQUIRE_FALSE(outer.at(1).has_value());

    // Feed the surrogate elements into a fresh surrogate, as the serializer does.
    Stanza::delegating_sequence<seq_ptr<int>> rebuilt{ inner_type };
    for (std::any item : outer) rebuilt.add(item);

    auto result = Stanza::to_vector(*rebuilt.unwrap());
    REQUIRE(result.size() == 3);
    REQUIRE(Stanza::to_vector(*result[0]) == std::vector{ 1, 2 });
    REQUIRE(result[1] == nullptr);
    REQUIRE(result[2] != nullptr);
    REQUIRE(result[2]->empty());
}

TEST_CASE("Serializable Error Resolves to Error Surrogate") {
    auto provider = resolve(type_of<Stanza::serializable_error>());
    REQUIRE(provider);
    REQUIRE(provider->wrapping_type() == type_of<Stanza::serializable_error_wrapper>());
    REQUIRE(provider->wrapping_type()->xml_name == "Error");

    Stanza::serializable_error error{ { "Name", "Required" } };
    std::any wrapped = provider->wrap(std::any{ error });
    std::any back = provider->wrapping_type()->unwrap(wrapped, type_of<Stanza::serializable_error>());
    REQUIRE(std::any_cast<const Stanza::serializable_error&>(back) == error);
}

TEST_CASE("Sequence of Serializable Errors Composes Both Factories") {
    auto provider = resolve(type_of<seq_ptr<Stanza::serializable_error>>());
    REQUIRE(provider);
    REQUIRE(provider->wrapping_type()->xml_name == "ArrayOfError");
    REQUIRE(provider->wrapping_type()->wrapped_element == type_of<Stanza::serializable_error_wrapper>());
}

TEST_CASE("Error Keys Decode XML Name Escapes") {
    REQUIRE(Stanza::decode_xml_name("Order_x0020_Id") == "Order Id");
    REQUIRE(Stanza::decode_xml_name("caf_x00E9_") == "caf\xC3\xA9");
    REQUIRE(Stanza::decode_xml_name("_x0001F600_") == "\xF0\x9F\x98\x80");
    REQUIRE(Stanza::decode_xml_name("bad_x12_") == "bad_x12_");
    REQUIRE(Stanza::decode_xml_name("plain") == "plain");
}

TEST_CASE("Serializer Requires a Constructible Type") {
    REQUIRE_THROWS_AS(Stanza::XmlSerializer{ type_of<seq_ptr<int>>() }, Stanza::configuration_error);
    REQUIRE_THROWS_AS(Stanza::XmlSerializer{ type_of<Stanza::serializable_error>() }, Stanza::configuration_error);
    REQUIRE_NOTHROW(Stanza::XmlSerializer{ type_of<int>() });
}

TEST_CASE("Serializer Reads Scalars") {
    Stanza::XmlSerializer ints{ type_of<int>() };

    auto v = ints.deserialize(parse_doc("<int> 42 </int>"));
    REQUIRE(v);
    REQUIRE(std::any_cast<int>(*v) == 42);

    auto bad = ints.deserialize(parse_doc("<int>4x2</int>"));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == Stanza::ConvertError::code::invalid_value);
    REQUIRE(bad.error().path == "/int");

    auto overflow = ints.deserialize(parse_doc("<int>99999999999</int>"));
    REQUIRE_FALSE(overflow);

    auto wrong_root = ints.deserialize(parse_doc("<long>1</long>"));
    REQUIRE_FALSE(wrong_root);
    REQUIRE(wrong_root.error().errc == Stanza::ConvertError::code::unexpected_element);

    Stanza::XmlSerializer bools{ type_of<bool>() };
    REQUIRE(std::any_cast<bool>(*bools.deserialize(parse_doc("<boolean>true</boolean>"))));
    REQUIRE_FALSE(std::any_cast<bool>(*bools.deserialize(parse_doc("<boolean>0</boolean>"))));

    Stanza::XmlSerializer doubles{ type_of<double>() };
    REQUIRE(std::any_cast<double>(*doubles.deserialize(parse_doc("<double>1.5e2</double>"))) == Catch::Approx(150.0));
    REQUIRE(std::isinf(std::any_cast<double>(*doubles.deserialize(parse_doc("<double>-INF</double>")))));
}

TEST_CASE("Serializer Reads Records") {
    Stanza::XmlSerializer people{ type_of<models::person>() };

    auto v = people.deserialize(parse_doc("<Person><Id>5</Id><Name>Ann</Name></Person>"));
    REQUIRE(v);
    REQUIRE(std::any_cast<models::person>(*v) == models::person{ 5, "Ann" });

    auto partial = people.deserialize(parse_doc("<Person><Name>Bo</Name></Person>"));
    REQUIRE(partial);
    REQUIRE(std::any_cast<models::person>(*partial).id == 0);

    auto bad = people.deserialize(parse_doc("<Person><Id>five</Id></Person>"));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().path == "/Person/Id");
}

TEST_CASE("Serializer Reads Composed Sequences") {
    auto wrapping = resolve(type_of<seq_ptr<models::person>>())->wrapping_type();
    Stanza::XmlSerializer serializer{ wrapping };

    auto v = serializer.deserialize(parse_doc(
        "<ArrayOfPerson>"
        "  <Person><Id>1</Id><Name>A</Name></Person>"
        "  <Person><Id>2</Id><Name>B</Name></Person>"
        "</ArrayOfPerson>"));
    REQUIRE(v);

    auto back = wrapping->unwrap(*v, type_of<seq_ptr<models::person>>());
    auto people = values_of<models::person>(back);
    REQUIRE(people.size() == 2);
    REQUIRE(people[1] == models::person{ 2, "B" });

    auto mixed = serializer.deserialize(parse_doc(
        "<ArrayOfPerson><Animal/><Person><Id>7</Id></Person><Animal><Id>x</Id></Animal></ArrayOfPerson>"));
    REQUIRE(mixed);
    auto kept = values_of<models::person>(wrapping->unwrap(*mixed, type_of<seq_ptr<models::person>>()));
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0].id == 7);

    auto bad = serializer.deserialize(parse_doc(
        "<ArrayOfPerson><Animal/><Person/><Person><Id>x</Id></Person></ArrayOfPerson>"));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().path == "/ArrayOfPerson/Person[2]/Id");
}

TEST_CASE("Read Surrogates Enumerate Surrogate Elements") {
    auto nested = resolve(type_of<seq_ptr<seq_ptr<int>>>())->wrapping_type();
    auto v = nested->read(parse_doc(
        "<ArrayOfArrayOfInt><ArrayOfInt><int>1</int></ArrayOfInt><ArrayOfInt xmlns:i=\"http://www.w3.org/2001/XMLSchema-instance\" i:nil=\"true\"/></ArrayOfArrayOfInt>"),
        "/ArrayOfArrayOfInt");
    REQUIRE(v);

    auto& outer = *std::any_cast<const std::shared_ptr<Stanza::delegating_sequence<seq_ptr<int>>>&>(*v);
    REQUIRE(outer.size() == 2);
    REQUIRE(outer.at(0).type() == typeid(std::shared_ptr<Stanza::delegating_sequence<int>>));
    REQUIRE_FALSE(outer.at(1).has_value());

    auto errors = resolve(type_of<seq_ptr<Stanza::serializable_error>>())->wrapping_type();
    auto e = errors->read(parse_doc("<ArrayOfError><Error><Name>Required</Name></Error></ArrayOfError>"), "/ArrayOfError");
    REQUIRE(e);
    auto& error_seq = *std::any_cast<const std::shared_ptr<Stanza::delegating_sequence<Stanza::serializable_error>>&>(*e);
    REQUIRE(error_seq.at(0).type() == typeid(Stanza::serializable_error_wrapper));
}

TEST_CASE("Adding to a Wrapped Surrogate Keeps Surrogate Elements") {
    auto provider = resolve(type_of<seq_ptr<seq_ptr<int>>>());
    std::any wrapped = provider->wrap(Stanza::box(Stanza::make_sequence(std::vector<seq_ptr<int>>{ Stanza::make_sequence({ 1 }) })));
    auto& outer = *std::any_cast<const std::shared_ptr<Stanza::delegating_sequence<seq_ptr<int>>>&>(wrapped);

    outer.add(outer.at(0));
    REQUIRE(outer.size() == 2);
    REQUIRE(outer.at(0).type() == typeid(std::shared_ptr<Stanza::delegating_sequence<int>>));
    REQUIRE(outer.at(1).type() == typeid(std::shared_ptr<Stanza::delegating_sequence<int>>));

    auto result = Stanza::to_vector(*outer.unwrap());
    REQUIRE(result.size() == 2);
    REQUIRE(Stanza::to_vector(*result[1]) == std::vector{ 1 });
}
