#pragma once


/*
    --------------------------------------------------
    Stanza input formatter - the XML request read path
    --------------------------------------------------
    `XmlInputFormatter::read(context)` runs four stages:

    1. Negotiate   - the request content type must be a subset of one of
                     the supported media types; otherwise the formatter
                     declines with `unsupported_media_type`
    2. Empty body  - a declared content length of 0 returns the default of
                     the model type (a zero value, or none for
                     reference-shaped types) without touching the body
    3. Read        - the serializable type is resolved through the wrapper
                     provider factories; the body is read by an `XmlReader`
                     under the configured quotas and deserialized into it
    4. Unwrap      - when a surrogate was read, it is unwrapped to the
                     model type

    The formatter is immutable once constructed and `read` may be called
    from several threads at once. Options are validated by the constructor.

    -----
    Usage
    -----
        Stanza::XmlInputFormatter formatter;

        Stanza::InputRequest request{
            .content_type = "application/xml",
            .content_length = std::nullopt,
            .body = std::make_unique<Stanza::string_body>("<ArrayOfInt><int>1</int></ArrayOfInt>"),
        };
        Stanza::InputFormatterContext ctx{ request, Stanza::type_of<Stanza::seq_ptr<int>>() };

        auto result = formatter.read(ctx);
        if (result) auto seq = Stanza::unbox<Stanza::seq_ptr<int>>(*result);
*/

#include <any>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/media_type.hpp"
#include "stanza/options.hpp"
#include "stanza/reader.hpp"
#include "stanza/serializer.hpp"
#include "stanza/stream.hpp"
#include "stanza/types.hpp"
#include "stanza/wrapper.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Inbound request as supplied by the host.
    struct InputRequest {
        std::string content_type;
        std::optional<std::uint64_t> content_length;
        std::unique_ptr<body_stream> body;
    };

    /// @ingroup StanzaAPI
    /// @brief One read: the request and the type the caller wants back.
    struct InputFormatterContext {
        InputRequest& request;
        type_ref model_type = nullptr;
    };

    /// @ingroup StanzaAPI
    /// @brief Receives diagnostic messages from the formatter.
    using TraceCallback = std::function<void(std::string_view)>;

    /// @ingroup StanzaOptions
    /// @brief Configuration of an `XmlInputFormatter`.
    ///
    /// @details
    /// Every field may be overridden before the formatter is constructed:
    /// @code
    /// Stanza::XmlInputFormatterOptions opts;
    /// opts.quotas.max_depth = 8;
    /// opts.wrapper_provider_factories.push_back(std::make_shared<MyFactory>());
    /// Stanza::XmlInputFormatter formatter{ std::move(opts) };
    /// @endcode
    struct XmlInputFormatterOptions {
        std::vector<std::string> supported_media_types{ "application/xml", "text/xml" };
        std::vector<TextEncoding> supported_encodings{ TextEncoding::utf8, TextEncoding::utf16le };
        ReaderQuotas quotas = default_reader_quotas();
        WrapperProviderFactories wrapper_provider_factories = default_wrapper_provider_factories();

        /// Optional; called with one message per notable pipeline event.
        TraceCallback trace;
    };

    /// @ingroup StanzaAPI
    /// @brief Result of reading a request body
    using ReadResult = std::expected<std::any, ReadError>;

    /// @ingroup StanzaAPI
    /// @brief Reads XML request bodies into declared types.
    class XmlInputFormatter {
    public:
        STANZA_API XmlInputFormatter();

        /// @throws configuration_error if a media type is unparsable, a list is
        ///         empty, a quota is not positive or a factory entry is null
        STANZA_API explicit XmlInputFormatter(XmlInputFormatterOptions options);

        virtual ~XmlInputFormatter() = default;

        /// @brief True when the request content type matches a supported media type.
        [[nodiscard]] STANZA_API bool can_read(const InputFormatterContext& context) const;

        /// @brief Reads the request body into `context.model_type`.
        ///
        /// @details
        /// The request body is moved out of the request and released before
        /// `read` returns, on success, on error and on exceptions.
        ///
        /// @throws stream_error if the body stream fails or is cancelled
        /// @throws configuration_error / invalid_shape_error for setup faults
        [[nodiscard]] STANZA_API ReadResult read(InputFormatterContext& context) const;

        /// @brief The type documents are read into for @p declared: the wrapping
        ///        type of the first provider that claims it, or @p declared itself.
        [[nodiscard]] STANZA_API virtual type_ref get_serializable_type(type_ref declared) const;

        [[nodiscard]] const std::vector<MediaType>& supported_media_types() const noexcept { return m_MediaTypes; }
        [[nodiscard]] const std::vector<TextEncoding>& supported_encodings() const noexcept { return m_Options.supported_encodings; }
        [[nodiscard]] const ReaderQuotas& quotas() const noexcept { return m_Options.quotas; }
        [[nodiscard]] int max_depth() const noexcept { return m_Options.quotas.max_depth; }
        [[nodiscard]] const WrapperProviderFactories& wrapper_provider_factories() const noexcept { return m_Options.wrapper_provider_factories; }

    protected:
        /// @brief Creates the reader that owns @p body for one read.
        [[nodiscard]] STANZA_API virtual std::unique_ptr<XmlReader> create_reader(std::unique_ptr<body_stream> body,
                                                                                std::string_view charset) const;

        /// @brief Creates the serializer for @p type.
        [[nodiscard]] STANZA_API virtual std::unique_ptr<XmlSerializer> create_serializer(type_ref type) const;

    private:
        [[nodiscard]] std::optional<MediaType> negotiate(std::string_view content_type) const;
        void trace(std::string_view message) const;

        XmlInputFormatterOptions m_Options;
        std::vector<MediaType> m_MediaTypes;
    };

} // namespace Stanza
