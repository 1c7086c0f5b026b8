#pragma once


/*
    -------------------------------------
    Stanza body streams - request payloads
    -------------------------------------
    A `body_stream` is the readable byte source of an inbound request. The
    host supplies one per request; the read pipeline moves it into an
    `XmlReader`, which releases it exactly once when reading ends.

    - `istream_body` adapts a host-owned `std::istream`. Releasing it never
      closes the host stream.
    - `string_body` owns its bytes; handy for tests and buffered payloads.

    A host that cancels or aborts a request makes `read` throw
    `stream_error`; the pipeline propagates it instead of returning a
    partial object.
*/

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

#include "stanza/config.hpp"

namespace Stanza {

    /// @brief Thrown by a `body_stream` when the underlying read fails or is cancelled.
    class stream_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief Readable byte source of a request body.
    class body_stream {
    public:
        virtual ~body_stream() = default;

        /// @brief Reads up to `buffer.size()` bytes.
        /// @return Number of bytes read; 0 at end of stream
        /// @throws stream_error on failure or cancellation
        virtual std::size_t read(std::span<char> buffer) = 0;
    };

    /// @brief Non-owning adapter over a host `std::istream`.
    class istream_body final : public body_stream {
    public:
        STANZA_API explicit istream_body(std::istream& is) noexcept;
        STANZA_API std::size_t read(std::span<char> buffer) override;

    private:
        std::istream* m_Stream;
    };

    /// @brief Body stream over an owned byte string.
    class string_body final : public body_stream {
    public:
        STANZA_API explicit string_body(std::string bytes) noexcept;
        STANZA_API std::size_t read(std::span<char> buffer) override;

    private:
        std::string m_Bytes;
        std::size_t m_Pos = 0;
    };

} // namespace Stanza
