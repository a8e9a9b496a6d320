#pragma once

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/VectorView.hpp>

#include "Chunk.hpp"


namespace chunkio
{
/**
 * Reads a chunk sequentially. The index is an absolute offset in the resource, so one cursor can be used
 * with any chunk that contains the bytes it points to.
 */
class Cursor
{
public:
    explicit
    Cursor( size_t index = 0 ) noexcept :
        m_index( index )
    {}

    [[nodiscard]] size_t
    index() const noexcept
    {
        return m_index;
    }

    [[nodiscard]] Cursor
    copy() const noexcept
    {
        return Cursor( m_index );
    }

    void
    skip( size_t nBytes ) noexcept
    {
        m_index += nBytes;
    }

    void
    moveTo( size_t index ) noexcept
    {
        m_index = index;
    }

    /**
     * @return The next @p nBytes bytes of @p chunk and advances past them.
     * @throws InvariantViolation if the bytes are not inside @p chunk.
     */
    [[nodiscard]] VectorView<std::byte>
    bytes( const Chunk& chunk,
           size_t       nBytes )
    {
        const auto stop = saturatingAddition( m_index, nBytes );
        if ( ( stop - m_index != nBytes ) || !chunk.contains( m_index, stop ) ) {
            std::stringstream message;
            message << "Cannot read " << nBytes << " B at cursor index " << m_index << " from chunk "
                    << chunk.range() << "!";
            throw InvariantViolation( std::move( message ).str() );
        }

        const auto result = chunk.get( m_index, stop );
        m_index = stop;
        return result;
    }

    /**
     * Reads one big-endian number.
     */
    template<typename T>
    [[nodiscard]] T
    field( const Chunk& chunk )
    {
        static_assert( std::is_arithmetic_v<T>, "Only numbers can be read as fields!" );
        return loadBigEndian<T>( bytes( chunk, sizeof( T ) ).data() );
    }

    /**
     * Reads a string prefixed by its length: one byte, or 255 followed by a 4-byte big-endian length.
     */
    [[nodiscard]] std::string
    string( const Chunk& chunk )
    {
        size_t length = field<uint8_t>( chunk );
        if ( length == 255 ) {
            length = field<uint32_t>( chunk );
        }
        return std::string( bytes( chunk, length ).toStringView() );
    }

private:
    size_t m_index;
};
}  // namespace chunkio
