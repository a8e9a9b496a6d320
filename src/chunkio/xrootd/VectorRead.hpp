#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <core/Error.hpp>
#include <chunkio/Chunk.hpp>


namespace chunkio
{
/**
 * One element of a vector read request: a piece of the requested range with index @ref rangeIndex.
 */
struct VectorReadElement
{
    size_t rangeIndex{ 0 };
    ByteRange range;

    [[nodiscard]] bool
    operator==( const VectorReadElement& other ) const noexcept
    {
        return ( rangeIndex == other.rangeIndex ) && ( range == other.range );
    }

    [[nodiscard]] bool
    operator!=( const VectorReadElement& other ) const noexcept
    {
        return !( *this == other );
    }
};


using VectorReadBatch = std::vector<VectorReadElement>;


/**
 * Splits ranges into batches for vector read requests. Ranges longer than @p maxElementSize are split into
 * consecutive elements, and each batch holds at most @p maxNumElements elements. Empty ranges produce no
 * elements. Concatenating all batches yields the elements in the order of the requested ranges.
 */
[[nodiscard]] inline std::vector<VectorReadBatch>
planVectorReads( const std::vector<ByteRange>& ranges,
                 std::optional<size_t>         maxNumElements,
                 std::optional<size_t>         maxElementSize )
{
    if ( maxNumElements && ( *maxNumElements == 0 ) ) {
        throw std::invalid_argument( "The maximum number of vector read elements must be positive!" );
    }
    if ( maxElementSize && ( *maxElementSize == 0 ) ) {
        throw std::invalid_argument( "The maximum vector read element size must be positive!" );
    }

    std::vector<VectorReadBatch> batches;
    const auto append =
        [&] ( VectorReadElement element ) {
            if ( batches.empty() || ( maxNumElements && ( batches.back().size() >= *maxNumElements ) ) ) {
                batches.emplace_back();
            }
            batches.back().emplace_back( element );
        };

    for ( size_t i = 0; i < ranges.size(); ++i ) {
        const auto& range = ranges[i];
        if ( range.start > range.stop ) {
            std::stringstream message;
            message << "Invalid range " << range << "!";
            throw std::invalid_argument( std::move( message ).str() );
        }

        for ( auto start = range.start; start < range.stop; ) {
            const auto stop = maxElementSize ? std::min( range.stop, start + *maxElementSize ) : range.stop;
            append( VectorReadElement{ i, { start, stop } } );
            start = stop;
        }
    }

    return batches;
}


/**
 * Collects the elements of vector reads into one buffer per requested range and resolves the promise of a
 * range when all of its elements have arrived. The first failed element fails the whole range but no other
 * range. Thread-safe, so that batches may be read concurrently.
 *
 * Destroying the assembler before all elements arrived breaks the promises of the incomplete ranges.
 */
class VectorReadAssembler
{
public:
    explicit
    VectorReadAssembler( const std::vector<ByteRange>& ranges )
    {
        for ( const auto& range : ranges ) {
            m_ranges.emplace_back( range );
        }
    }

    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_ranges.size();
    }

    /**
     * Must only be called once per range.
     */
    [[nodiscard]] std::future<Chunk>
    future( size_t rangeIndex )
    {
        return m_ranges.at( rangeIndex ).promise.get_future();
    }

    /**
     * Registers @p element as part of the requests. Must be called for all elements before any
     * of them is completed. Ranges without elements are resolved by @ref finishPlanning.
     */
    void
    expect( const VectorReadElement& element )
    {
        auto& range = m_ranges.at( element.rangeIndex );
        if ( ( element.range.start < range.range.start ) || ( element.range.stop > range.range.stop ) ) {
            std::stringstream message;
            message << "Vector read element " << element.range << " lies outside of its range "
                    << range.range << "!";
            throw InvariantViolation( std::move( message ).str() );
        }
        ++range.remainingElements;
    }

    /**
     * Resolves all ranges that do not expect any element, i.e., empty ones.
     */
    void
    finishPlanning()
    {
        for ( auto& range : m_ranges ) {
            const std::lock_guard lock( range.mutex );
            if ( range.remainingElements == 0 ) {
                resolve( range );
            }
        }
    }

    /**
     * @return The destination memory for the element. Valid until the element is completed or failed.
     */
    [[nodiscard]] std::byte*
    buffer( const VectorReadElement& element )
    {
        auto& range = m_ranges.at( element.rangeIndex );
        return range.buffer.data() + ( element.range.start - range.range.start );
    }

    void
    complete( const VectorReadElement& element )
    {
        auto& range = m_ranges.at( element.rangeIndex );
        const std::lock_guard lock( range.mutex );
        finishElement( range );
    }

    void
    fail( const VectorReadElement& element,
          std::exception_ptr       error )
    {
        auto& range = m_ranges.at( element.rangeIndex );
        const std::lock_guard lock( range.mutex );
        if ( !range.error ) {
            range.error = std::move( error );
        }
        finishElement( range );
    }

private:
    struct PendingRange
    {
        explicit
        PendingRange( const ByteRange& requested ) :
            range( requested ),
            buffer( requested.size() )
        {}

        ByteRange range;
        std::vector<std::byte> buffer;
        size_t remainingElements{ 0 };
        std::exception_ptr error;
        std::promise<Chunk> promise;
        std::mutex mutex;
    };

    static void
    finishElement( PendingRange& range )
    {
        if ( range.remainingElements == 0 ) {
            throw InvariantViolation( "More vector read elements finished than were expected!" );
        }
        if ( --range.remainingElements == 0 ) {
            resolve( range );
        }
    }

    static void
    resolve( PendingRange& range )
    {
        if ( range.error ) {
            range.promise.set_exception( range.error );
        } else {
            range.promise.set_value( Chunk( range.range.start, range.range.stop, std::move( range.buffer ) ) );
        }
    }

private:
    /* Not a vector because PendingRange is neither copyable nor movable. */
    std::deque<PendingRange> m_ranges;
};
}  // namespace chunkio
