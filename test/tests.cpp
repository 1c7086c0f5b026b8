#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"
#include "models.hpp"

#include <array>
#include <sstream>

using namespace Catch;

namespace {

    Stanza::ParseResult parse_str(std::string_view s, const Stanza::ReaderQuotas& quotas = Stanza::default_reader_quotas()) {
        return Stanza::parse(s, quotas);
    }

    void expect_ok(std::string_view s, const Stanza::ReaderQuotas& quotas = Stanza::default_reader_quotas()) {
        auto r = parse_str(s, quotas);
        REQUIRE(r);
    }

    void expect_fail(std::string_view s, Stanza::ParseError::code code, const Stanza::ReaderQuotas& quotas = Stanza::default_reader_quotas()) {
        auto r = parse_str(s, quotas);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
    }

    constexpr std::array both_encodings{ Stanza::TextEncoding::utf8, Stanza::TextEncoding::utf16le };
    constexpr std::array utf8_only{ Stanza::TextEncoding::utf8 };
}


TEST_CASE("Parse Element Tree") {
    auto r = Stanza::parse("<ArrayOfInt><int>1</int><int>2</int></ArrayOfInt>");
    REQUIRE(r);
    REQUIRE(r->name() == "ArrayOfInt");
    REQUIRE(r->size() == 2);
    REQUIRE(r->children()[0].name() == "int");
    REQUIRE(r->children()[0].text() == "1");
    REQUIRE(r->children()[1].text() == "2");
}

TEST_CASE("Declaration, Comments and Processing Instructions Are Skipped") {
    std::string s = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                    "<!-- leading -->\n"
                    "<?app some data?>\n"
                    "<root a=\"1\" b='x &amp; y'><!-- inner --><![CDATA[<raw>]]></root>\n"
                    "<!-- trailing -->";
    auto r = Stanza::parse(s);
    REQUIRE(r);
    REQUIRE(r->name() == "root");
    REQUIRE(*r->attribute("a") == "1");
    REQUIRE(*r->attribute("b") == "x & y");
    REQUIRE(r->text() == "<raw>");
}

TEST_CASE("Entity and Character References") {
    auto r = Stanza::parse("<t>&lt;&#65;&#x42;&gt;&quot;&apos;</t>");
    REQUIRE(r);
    REQUIRE(r->text() == "<AB>\"'");

    auto euro = Stanza::parse("<t>&#x20AC;</t>");
    REQUIRE(euro);
    REQUIRE(euro->text() == "\xE2\x82\xAC");
}

TEST_CASE("Reject Malformed Documents") {
    using code = Stanza::ParseError::code;

    expect_fail("", code::unexpected_end_of_input);
    expect_fail("   ", code::unexpected_end_of_input);
    expect_fail("text", code::unexpected_character);
    expect_fail("<a></b>", code::mismatched_end_tag);
    expect_fail("<a/><b/>", code::trailing_content);
    expect_fail("<a x=\"1\" x=\"2\"/>", code::duplicate_attribute);
    expect_fail("<a>&nbsp;</a>", code::invalid_entity);
    expect_fail("<a>&#0;</a>", code::invalid_character_reference);
    expect_fail("<a>&#xZZ;</a>", code::invalid_character_reference);
    expect_fail("<a>", code::unexpected_end_of_input);
    expect_fail("<a><!-- open", code::unexpected_end_of_input);
    expect_fail("<a><?xml version=\"1.0\"?></a>", code::unexpected_character);
    expect_fail("<1a/>", code::invalid_name);
}

TEST_CASE("Document Type Declarations Are Prohibited") {
    expect_fail("<!DOCTYPE root [<!ENTITY x \"boom\">]><root>&x;</root>", Stanza::ParseError::code::dtd_prohibited);
    expect_fail("<root><!ENTITY x \"boom\"></root>", Stanza::ParseError::code::dtd_prohibited);
}

TEST_CASE("Error Position in Range") {
    std::string s = "<a>\n  <b>\n</a>";
    auto r = Stanza::parse(s);
    REQUIRE_FALSE(r);

    const auto& e = r.error();
    REQUIRE(e.errc == Stanza::ParseError::code::mismatched_end_tag);
    REQUIRE(e.offset <= s.size());
    REQUIRE(e.line == 3);
    REQUIRE(e.column >= 1);
    REQUIRE_FALSE(e.msg.empty());
    REQUIRE_FALSE(e.is_quota());
}

TEST_CASE("Invalid UTF-8 Rejected") {
    expect_fail("<a>\xC3\x28</a>", Stanza::ParseError::code::invalid_utf8);
}

TEST_CASE("Names, Prefixes and Namespaces") {
    auto r = Stanza::parse("<p:item xmlns:p=\"urn:example\"><p:child/></p:item>");
    REQUIRE(r);
    REQUIRE(r->local_name() == "item");
    REQUIRE(r->prefix() == "p");
    REQUIRE(r->namespace_for("p") != nullptr);
    REQUIRE(*r->namespace_for("p") == "urn:example");
    REQUIRE(r->find_child("child") != nullptr);
    REQUIRE(r->find_child("missing") == nullptr);
}

TEST_CASE("Nil Elements") {
    auto r = Stanza::parse("<a xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">"
                           "<b xsi:nil=\"true\"/><c/><d xsi:nil=\"false\"/></a>");
    REQUIRE(r);
    REQUIRE(r->children()[0].is_nil());
    REQUIRE_FALSE(r->children()[1].is_nil());
    REQUIRE_FALSE(r->children()[2].is_nil());
}

TEST_CASE("Node Equality is Structural") {
    auto a = Stanza::parse("<a x=\"1\"><b>t</b></a>");
    auto b = Stanza::parse("<a  x='1' ><b>t</b></a>");
    auto c = Stanza::parse("<a x=\"2\"><b>t</b></a>");
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(c);
    REQUIRE(*a == *b);
    REQUIRE_FALSE(*a == *c);
}

struct CountingResource : std::pmr::memory_resource {
    size_t allocs = 0;

    void* do_allocate(size_t bytes, size_t alignment) override {
        allocs++;
        return std::pmr::get_default_resource()->allocate(bytes, alignment);
    }

    void do_deallocate(void* p, size_t bytes, size_t alignment) override {
        return std::pmr::get_default_resource()->deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }
};

TEST_CASE("Node Uses Provided memory_resource") {
    CountingResource res;
    Stanza::node n{ "a-rather-long-element-name-that-does-not-fit-inline", &res };
    n.set_attribute("attribute-with-a-long-name-as-well", "value");
    n.append_child(Stanza::node{ "child", &res });

    REQUIRE(res.allocs > 0);
    REQUIRE(n.resource() == &res);
}

TEST_CASE("Depth Quota") {
    Stanza::ReaderQuotas q;
    q.max_depth = 2;

    expect_ok("<a><b/></a>", q);
    expect_fail("<a><b><c/></b></a>", Stanza::ParseError::code::depth_limit_exceeded, q);

    auto r = parse_str("<a><b><c/></b></a>", q);
    REQUIRE(r.error().is_quota());
}

TEST_CASE("Default Depth Quota Is 32") {
    std::string ok, deep;
    for (int i = 0; i < 32; i++) ok += "<e>";
    for (int i = 0; i < 32; i++) ok += "</e>";
    for (int i = 0; i < 33; i++) deep += "<e>";
    for (int i = 0; i < 33; i++) deep += "</e>";

    REQUIRE(Stanza::default_reader_quotas().max_depth == 32);
    expect_ok(ok);
    expect_fail(deep, Stanza::ParseError::code::depth_limit_exceeded);
}

TEST_CASE("String Content Quota") {
    Stanza::ReaderQuotas q;
    q.max_string_content_length = 4;

    expect_ok("<a>hell</a>", q);
    expect_fail("<a>hello</a>", Stanza::ParseError::code::string_length_exceeded, q);
    expect_fail("<a v=\"hello\"/>", Stanza::ParseError::code::string_length_exceeded, q);
    expect_fail("<a><![CDATA[hello]]></a>", Stanza::ParseError::code::string_length_exceeded, q);
}

TEST_CASE("Array Length Quota") {
    Stanza::ReaderQuotas q;
    q.max_array_length = 2;

    expect_ok("<a><b/><b/></a>", q);
    expect_fail("<a><b/><b/><b/></a>", Stanza::ParseError::code::array_length_exceeded, q);
}

TEST_CASE("Bytes Per Read Quota Bounds Start Tags") {
    Stanza::ReaderQuotas q;
    q.max_bytes_per_read = 16;

    expect_ok("<a><b>some longer text content</b></a>", q);
    expect_fail("<a attribute=\"0123456789\"/>", Stanza::ParseError::code::bytes_per_read_exceeded, q);
}

TEST_CASE("Name Table Quota") {
    Stanza::ReaderQuotas q;
    q.max_name_table_char_count = 3;

    expect_ok("<ab><ab/><ab/></ab>", q);
    expect_fail("<abcd/>", Stanza::ParseError::code::name_table_exceeded, q);
    expect_fail("<ab><cd/></ab>", Stanza::ParseError::code::name_table_exceeded, q);
}

TEST_CASE("Decode UTF-8 With and Without BOM") {
    auto plain = Stanza::decode_text("<a>x</a>", both_encodings);
    REQUIRE(plain);
    REQUIRE(*plain == "<a>x</a>");

    auto bom = Stanza::decode_text("\xEF\xBB\xBF<a>x</a>", both_encodings);
    REQUIRE(bom);
    REQUIRE(*bom == "<a>x</a>");
}

TEST_CASE("Decode UTF-16LE With and Without BOM") {
    auto plain = Stanza::decode_text(models::utf16le("<a>x</a>"), both_encodings);
    REQUIRE(plain);
    REQUIRE(*plain == "<a>x</a>");

    auto bom = Stanza::decode_text(models::utf16le("<a>x</a>", true), both_encodings);
    REQUIRE(bom);
    REQUIRE(*bom == "<a>x</a>");
}

TEST_CASE("Unsupported Encodings Rejected") {
    std::string be;
    for (char c : std::string_view{ "<a/>" }) {
        be.push_back('\0');
        be.push_back(c);
    }
    auto r = Stanza::decode_text(be, both_encodings);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::ParseError::code::unsupported_encoding);

    auto not_configured = Stanza::decode_text(models::utf16le("<a/>"), utf8_only);
    REQUIRE_FALSE(not_configured);
    REQUIRE(not_configured.error().errc == Stanza::ParseError::code::unsupported_encoding);

    auto latin1 = Stanza::decode_text(" <a/>", both_encodings, "iso-8859-1");
    REQUIRE_FALSE(latin1);
    REQUIRE(latin1.error().errc == Stanza::ParseError::code::unsupported_encoding);
}

TEST_CASE("Leading Angle Bracket Overrides Charset Hint") {
    auto labelled_utf16 = Stanza::decode_text("<a>x</a>", both_encodings, "utf-16");
    REQUIRE(labelled_utf16);
    REQUIRE(*labelled_utf16 == "<a>x</a>");

    auto declared = Stanza::decode_text("<?xml version=\"1.0\"?><a/>", both_encodings, "iso-8859-1");
    REQUIRE(declared);

    auto hinted = Stanza::decode_text(models::utf16le(" <a/>"), both_encodings, "utf-16");
    REQUIRE(hinted);
    REQUIRE(*hinted == " <a/>");
}

TEST_CASE("Charset Names") {
    REQUIRE(Stanza::encoding_from_charset("UTF-8") == Stanza::TextEncoding::utf8);
    REQUIRE(Stanza::encoding_from_charset("\"utf-16\"") == Stanza::TextEncoding::utf16le);
    REQUIRE_FALSE(Stanza::encoding_from_charset("shift_jis"));
}

TEST_CASE("Parse From Stream") {
    std::istringstream iss{ models::utf16le("<a>x</a>", true) };
    auto r = Stanza::parse(iss);
    REQUIRE(r);
    REQUIRE(r->text() == "x");
}

TEST_CASE("XmlReader Reads in Chunks and Releases Its Stream") {
    int released = 0;
    Stanza::ReaderQuotas q;
    q.max_bytes_per_read = 4;

    Stanza::XmlReader reader{ std::make_unique<models::counting_body>("<a><b>1</b><b>2</b></a>", released), q };
    REQUIRE(reader.is_open());

    auto doc = reader.read_document();
    REQUIRE(doc);
    REQUIRE(doc->size() == 2);
    REQUIRE_FALSE(reader.is_open());
    REQUIRE(released == 1);

    reader.close();
    REQUIRE(released == 1);

    auto again = reader.read_document();
    REQUIRE_FALSE(again);
    REQUIRE(again.error().errc == Stanza::ParseError::code::io_error);
}

TEST_CASE("XmlReader Releases Its Stream on Destruction") {
    int released = 0;
    {
        Stanza::XmlReader reader{ std::make_unique<models::counting_body>("<a/>", released), Stanza::default_reader_quotas() };
    }
    REQUIRE(released == 1);
}

TEST_CASE("XmlReader Propagates Stream Failures") {
    int released = 0;
    {
        Stanza::XmlReader reader{ std::make_unique<models::aborted_body>(released), Stanza::default_reader_quotas() };
        REQUIRE_THROWS_AS((void)reader.read_document(), Stanza::stream_error);
    }
    REQUIRE(released == 1);
}
