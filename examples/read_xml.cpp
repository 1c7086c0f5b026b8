#include <print>
#include <fstream>

#include "stanza/stanza.hpp"

int main(int argc, char** argv) {

    Stanza::XmlInputFormatterOptions opts;
    opts.quotas.max_depth = 16;
    opts.trace = [](std::string_view m) { std::println(stderr, "stanza: {}", m); };
    Stanza::XmlInputFormatter formatter{ std::move(opts) };

    Stanza::InputRequest request{
        .content_type = "application/xml; charset=utf-8",
        .content_length = std::nullopt,
        .body = std::make_unique<Stanza::string_body>(
            "<ArrayOfArrayOfInt xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">"
            "<ArrayOfInt><int>1</int><int>2</int></ArrayOfInt>"
            "<ArrayOfInt xsi:nil=\"true\"/>"
            "<ArrayOfInt><int>3</int></ArrayOfInt>"
            "</ArrayOfArrayOfInt>"),
    };
    Stanza::InputFormatterContext ctx{ request, Stanza::type_of<Stanza::seq_ptr<Stanza::seq_ptr<int>>>() };

    auto r = formatter.read(ctx);
    if (!r) {
        std::println("Read error! -> {}", r.error().msg);
        return 1;
    }

    auto rows = Stanza::unbox<Stanza::seq_ptr<Stanza::seq_ptr<int>>>(*r);
    for (const auto& row : *rows) {
        if (!row) {
            std::println("null");
            continue;
        }
        for (int v : *row) std::print("{} ", v);
        std::println("");
    }

    if (argc < 2) return 0;

    // Reads a list of errors from the given file.
    std::ifstream ifs(argv[1], std::ios::binary);
    if (!ifs) {
        std::println("Failed to open file");
        return -1;
    }

    Stanza::InputRequest file_request{ "text/xml", std::nullopt, std::make_unique<Stanza::istream_body>(ifs) };
    Stanza::InputFormatterContext file_ctx{ file_request, Stanza::type_of<Stanza::seq_ptr<Stanza::serializable_error>>() };

    auto errors = formatter.read(file_ctx);
    if (!errors) {
        std::println("Read error! -> {}", errors.error().msg);
        return errors.error().is_quota() ? 2 : 1;
    }

    for (const auto& error : *Stanza::unbox<Stanza::seq_ptr<Stanza::serializable_error>>(*errors)) {
        for (const auto& [key, message] : error)
            std::println("{}: {}", key.empty() ? "(request)" : key, message);
    }

    return 0;
}
