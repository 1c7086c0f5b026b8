#include "stanza/stream.hpp"

#include <algorithm>
#include <cstring>
#include <istream>


namespace Stanza {

    istream_body::istream_body(std::istream& is) noexcept
        : m_Stream{ &is } {}

    std::size_t istream_body::read(std::span<char> buffer) {
        if (buffer.empty() || m_Stream->eof()) return 0;
        m_Stream->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (m_Stream->bad()) throw stream_error{ "Failed to read request body" };
        return static_cast<std::size_t>(m_Stream->gcount());
    }

    string_body::string_body(std::string bytes) noexcept
        : m_Bytes{ std::move(bytes) } {}

    std::size_t string_body::read(std::span<char> buffer) {
        std::size_t n = std::min(buffer.size(), m_Bytes.size() - m_Pos);
        if (n != 0) std::memcpy(buffer.data(), m_Bytes.data() + m_Pos, n);
        m_Pos += n;
        return n;
    }

} // namespace Stanza
