#pragma once


/*
    ------------------------------------------------------------------
    Stanza - XML input adaptation for types a serializer cannot build
    ------------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The XML element DOM:           `Stanza::node`
        - Error reporting types:         `Stanza::ParseError`,
                                         `Stanza::ConvertError`,
                                         `Stanza::ReadError`
        - Parsing functions:             `Stanza::parse(...)`,
                                         `Stanza::XmlReader`
        - Runtime types:                 `Stanza::type_of<T>()`,
                                         `from_xml` support
        - Wrapper providers:             `Stanza::SequenceWrapperProvider`,
                                         `Stanza::SerializableErrorWrapperProvider`
        - The read pipeline:             `Stanza::XmlInputFormatter`

    -------------------
    High-Level Overview
    -------------------
    - DOM:
        * `Stanza::node` holds one element with its attributes, text and
          children, using `std::pmr` allocators
    - Parsing:
        * `std::expected<node, ParseError> parse(std::string_view, const ReaderQuotas& = ...)`
        * `std::expected<node, ParseError> parse(std::istream&, const ReaderQuotas& = ...)`
        * Every `ReaderQuotas` limit is enforced while the text is scanned
    - Wrapping:
        * A declared `seq_ptr<T>` is read through a composed
          `delegating_sequence` surrogate, recursively for nested sequences
        * A declared `serializable_error` is read through its `Error` surrogate
        * More surrogates plug in through `WrapperProviderFactory`
    - Reading:
        * `XmlInputFormatter::read` negotiates the content type, resolves
          the surrogate, reads the body under quotas and unwraps the result

    ------------
    Design Goals
    ------------
    - Modern C++:
        * `std::expected` for data errors, exceptions for setup faults
    - Safety:
        * Untrusted bodies are bounded by reader quotas; document type
          declarations are never processed
    - Composability:
        * No global mutable configuration; factories and quotas are
          injected through `XmlInputFormatterOptions`

    -----
    Usage
    -----
        #include "stanza/stanza.hpp"

        Stanza::XmlInputFormatter formatter;
        Stanza::InputRequest request{ "text/xml", std::nullopt,
            std::make_unique<Stanza::string_body>("<ArrayOfInt><int>1</int><int>2</int></ArrayOfInt>") };
        Stanza::InputFormatterContext ctx{ request, Stanza::type_of<Stanza::seq_ptr<int>>() };

        if (auto r = formatter.read(ctx)) {
            for (int v : *Stanza::unbox<Stanza::seq_ptr<int>>(*r))
                std::println("{}", v);
        }
*/

/// @defgroup StanzaAPI Public API
/// @ingroup Stanza
/// @brief Parsing, serializing and reading entry points

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/node.hpp"
#include "stanza/stream.hpp"
#include "stanza/reader.hpp"
#include "stanza/types.hpp"
#include "stanza/wrapper.hpp"
#include "stanza/sequence.hpp"
#include "stanza/convert.hpp"
#include "stanza/sequence_wrapper.hpp"
#include "stanza/serializable_error.hpp"
#include "stanza/serializer.hpp"
#include "stanza/media_type.hpp"
#include "stanza/input_formatter.hpp"
