#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <core/Error.hpp>
#include <core/VectorView.hpp>


namespace chunkio
{
/**
 * Half-open byte range [start, stop) inside a resource.
 */
struct ByteRange
{
    size_t start{ 0 };
    size_t stop{ 0 };

    [[nodiscard]] constexpr size_t
    size() const noexcept
    {
        return stop - start;
    }

    [[nodiscard]] constexpr bool
    operator==( const ByteRange& other ) const noexcept
    {
        return ( start == other.start ) && ( stop == other.stop );
    }

    [[nodiscard]] constexpr bool
    operator!=( const ByteRange& other ) const noexcept
    {
        return !( *this == other );
    }
};


inline std::ostream&
operator<<( std::ostream&    out,
            const ByteRange& range )
{
    out << "[" << range.start << ", " << range.stop << ")";
    return out;
}


[[nodiscard]] inline std::string
toString( const ByteRange& range )
{
    std::stringstream result;
    result << range;
    return std::move( result ).str();
}


/**
 * Immutable buffer holding exactly the bytes of one requested range. Copies are cheap because all copies share
 * the same underlying memory, which is either an owned buffer or a view into a memory map that the chunk keeps
 * alive.
 */
class Chunk
{
public:
    Chunk( size_t                 start,
           size_t                 stop,
           std::vector<std::byte> data ) :
        Chunk( start, stop, std::make_shared<const std::vector<std::byte> >( std::move( data ) ) )
    {}

    /**
     * Zero-copy constructor for data that lives in memory owned by someone else, e.g., a memory map.
     * @param owner Keeps @p data alive for as long as this chunk or any copy of it exists.
     */
    [[nodiscard]] static Chunk
    view( size_t                      start,
          size_t                      stop,
          std::shared_ptr<const void> owner,
          const std::byte*            data,
          size_t                      size )
    {
        return Chunk( start, stop, std::move( owner ), data, size );
    }

    [[nodiscard]] size_t
    start() const noexcept
    {
        return m_start;
    }

    [[nodiscard]] size_t
    stop() const noexcept
    {
        return m_stop;
    }

    [[nodiscard]] ByteRange
    range() const noexcept
    {
        return { m_start, m_stop };
    }

    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_stop - m_start;
    }

    [[nodiscard]] const std::byte*
    data() const noexcept
    {
        return m_data;
    }

    [[nodiscard]] VectorView<std::byte>
    rawData() const noexcept
    {
        return { m_data, size() };
    }

    [[nodiscard]] bool
    contains( size_t start,
              size_t stop ) const noexcept
    {
        return ( m_start <= start ) && ( start <= stop ) && ( stop <= m_stop );
    }

    /**
     * @param start Absolute offset in the resource, not relative to the chunk!
     * @param stop Absolute offset in the resource, not relative to the chunk!
     */
    [[nodiscard]] VectorView<std::byte>
    get( size_t start,
         size_t stop ) const
    {
        if ( !contains( start, stop ) ) {
            std::stringstream message;
            message << "Requested range " << ByteRange{ start, stop } << " is not inside the chunk "
                    << range() << "!";
            throw InvariantViolation( std::move( message ).str() );
        }
        return { m_data + ( start - m_start ), stop - start };
    }

    [[nodiscard]] VectorView<std::byte>
    remainder( size_t start ) const
    {
        return get( start, m_stop );
    }

    /**
     * Same as @ref get but returns a chunk sharing the memory with this chunk.
     */
    [[nodiscard]] Chunk
    slice( size_t start,
           size_t stop ) const
    {
        const auto data = get( start, stop );
        return Chunk( start, stop, m_owner, data.data(), data.size() );
    }

private:
    Chunk( size_t                                         start,
           size_t                                         stop,
           std::shared_ptr<const std::vector<std::byte> > buffer ) :
        Chunk( start, stop, buffer, buffer->data(), buffer->size() )
    {}

    Chunk( size_t                      start,
           size_t                      stop,
           std::shared_ptr<const void> owner,
           const std::byte*            data,
           size_t                      size ) :
        m_start( start ),
        m_stop( stop ),
        m_owner( std::move( owner ) ),
        m_data( data )
    {
        if ( start > stop ) {
            std::stringstream message;
            message << "Chunk start " << start << " must not lie after its stop " << stop << "!";
            throw InvariantViolation( std::move( message ).str() );
        }

        if ( size != stop - start ) {
            std::stringstream message;
            message << "Chunk " << ByteRange{ start, stop } << " requires " << stop - start
                    << " B but the buffer holds " << size << " B!";
            throw InvariantViolation( std::move( message ).str() );
        }

        if ( ( data == nullptr ) && ( size > 0 ) ) {
            throw InvariantViolation( "Chunk data must not be null!" );
        }
    }

private:
    size_t m_start;
    size_t m_stop;
    std::shared_ptr<const void> m_owner;
    const std::byte* m_data;
};
}  // namespace chunkio
