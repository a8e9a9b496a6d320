#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/Statistics.hpp>

#include "Chunk.hpp"
#include "ChunkFuture.hpp"


namespace chunkio
{
enum class FileHandler
{
    MEMMAP,
    FILE,
};


enum class HttpHandler
{
    MULTIPART,
    MULTITHREADED,
};


enum class XRootDHandler
{
    VECTOR_READ,
    MULTITHREADED,
};


struct SourceOptions
{
    using Seconds = std::chrono::duration<double>;

    /** 0 fetches inline on the calling thread. */
    size_t numWorkers{ 1 };
    /** Workers for secondary work, e.g., after falling back from a failed memory map or multipart request. */
    size_t numFallbackWorkers{ 0 };
    /** Maximum wait per network operation and per ChunkFuture::resolve. Unset waits forever. */
    std::optional<Seconds> timeout{ Seconds( 30 ) };
    /** Maximum number of ranges per vector read request. */
    std::optional<size_t> maxNumElements;
    /** Maximum number of bytes per vector read element. Longer ranges are split. */
    std::optional<size_t> maxElementSize;

    FileHandler fileHandler{ FileHandler::MEMMAP };
    HttpHandler httpHandler{ HttpHandler::MULTIPART };
    XRootDHandler xrootdHandler{ XRootDHandler::VECTOR_READ };

    bool verbose{ false };
};


struct SourceStatistics
{
    uint64_t numRequests{ 0 };
    uint64_t numRequestedChunks{ 0 };
    uint64_t numRequestedBytes{ 0 };
};


enum class SourceState
{
    OPEN,
    CLOSED,
};


[[nodiscard]] inline const char*
toString( SourceState state ) noexcept
{
    switch ( state )
    {
    case SourceState::OPEN:
        return "open";
    case SourceState::CLOSED:
        return "closed";
    }
    return "unknown";
}


/**
 * Serves arbitrary [start, stop) byte ranges of one resource.
 *
 * The constructor of a derived class opens the resource and throws ResourceUnavailable if that is not
 * possible. @ref close releases everything and is also called by the destructors of the derived classes.
 * Derived classes implement @ref release, which is called exactly once, and call @ref recordRequest for
 * every request they issue.
 */
class Source
{
public:
    Source( std::string   identity,
            SourceOptions options ) :
        m_identity( std::move( identity ) ),
        m_options( std::move( options ) )
    {}

    virtual
    ~Source() = default;

    Source( const Source& ) = delete;
    Source( Source&& ) = delete;
    Source& operator=( const Source& ) = delete;
    Source& operator=( Source&& ) = delete;

    /**
     * Requests the bytes [start, stop). Errors while fetching are stored in the returned future.
     * @throws std::invalid_argument if start > stop.
     * @throws StateError if the source was closed.
     */
    [[nodiscard]] virtual ChunkFuture
    chunk( size_t start,
           size_t stop ) = 0;

    /**
     * @return One future per range, in the order of @p ranges.
     */
    [[nodiscard]] virtual std::vector<ChunkFuture>
    chunks( const std::vector<ByteRange>& ranges )
    {
        ensureOpen( "chunks" );
        checkRanges( ranges );

        std::vector<ChunkFuture> result;
        result.reserve( ranges.size() );
        for ( const auto& range : ranges ) {
            result.emplace_back( chunk( range.start, range.stop ) );
        }
        return result;
    }

    /**
     * Total size of the resource in bytes if known.
     */
    [[nodiscard]] virtual std::optional<size_t>
    numBytes() const = 0;

    void
    close()
    {
        if ( m_closed.exchange( true ) ) {
            return;
        }

        release();

        if ( m_showProfileOnDestruction ) {
            printProfile();
        }
    }

    [[nodiscard]] bool
    closed() const noexcept
    {
        return m_closed;
    }

    [[nodiscard]] SourceState
    state() const noexcept
    {
        return m_closed ? SourceState::CLOSED : SourceState::OPEN;
    }

    [[nodiscard]] const std::string&
    identity() const noexcept
    {
        return m_identity;
    }

    [[nodiscard]] const SourceOptions&
    options() const noexcept
    {
        return m_options;
    }

    [[nodiscard]] SourceStatistics
    statistics() const noexcept
    {
        SourceStatistics result;
        result.numRequests = m_numRequests;
        result.numRequestedChunks = m_numRequestedChunks;
        result.numRequestedBytes = m_numRequestedBytes;
        return result;
    }

    void
    setShowProfileOnDestruction( bool showProfileOnDestruction ) noexcept
    {
        m_showProfileOnDestruction = showProfileOnDestruction;
    }

protected:
    /**
     * Releases all backend resources. Must stop the worker pool before closing the handles used by its tasks.
     */
    virtual void
    release() = 0;

    /**
     * Prefix for log messages, e.g., "[FileSource]".
     */
    [[nodiscard]] virtual const char*
    name() const noexcept = 0;

    void
    ensureOpen( const char* operation ) const
    {
        if ( m_closed ) {
            std::stringstream message;
            message << "Cannot call " << operation << " on closed source " << m_identity << "!";
            throw StateError( std::move( message ).str() );
        }
    }

    static void
    checkRange( size_t start,
                size_t stop )
    {
        if ( start > stop ) {
            std::stringstream message;
            message << "Range start " << start << " must not be larger than its stop " << stop << "!";
            throw std::invalid_argument( std::move( message ).str() );
        }
    }

    static void
    checkRanges( const std::vector<ByteRange>& ranges )
    {
        for ( const auto& range : ranges ) {
            checkRange( range.start, range.stop );
        }
    }

    /**
     * Thread-safe. Counts one issued request covering @p nChunks ranges with @p nBytes in total.
     */
    void
    recordRequest( size_t nChunks,
                   size_t nBytes )
    {
        ++m_numRequests;
        m_numRequestedChunks += nChunks;
        m_numRequestedBytes += nBytes;

        if ( m_showProfileOnDestruction ) {
            const std::lock_guard lock( m_profileMutex );
            m_requestSizes.merge( nBytes );
        }
    }

    /**
     * Thread-safe. Adds the wall time of one finished request.
     */
    void
    recordFetchTime( double seconds )
    {
        if ( m_showProfileOnDestruction ) {
            const std::lock_guard lock( m_profileMutex );
            m_fetchTimes.merge( seconds );
        }
    }

    /**
     * Wraps a future with the identity and the timeout of this source.
     */
    [[nodiscard]] ChunkFuture
    makeFuture( std::future<Chunk> future,
                ByteRange          range ) const
    {
        return ChunkFuture( std::move( future ), range, m_identity, m_options.timeout );
    }

    [[nodiscard]] ChunkFuture
    makeFuture( std::shared_future<Chunk> future,
                ByteRange                 range ) const
    {
        return ChunkFuture( std::move( future ), range, m_identity, m_options.timeout );
    }

    template<typename... Args>
    void
    log( const Args&... args ) const
    {
        if ( m_options.verbose ) {
            ThreadSafeOutput output;
            output << "[" + std::string( name() ) + "]";
            ( output << ... << args );
            std::cerr << output;
        }
    }

private:
    void
    printProfile() const
    {
        const std::lock_guard lock( m_profileMutex );
        std::cerr << ( ThreadSafeOutput()
            << "[" + std::string( name() ) + "::close]" << m_identity << "\n"
            << "   requests         :" << m_numRequests.load() << "\n"
            << "   requested chunks :" << m_numRequestedChunks.load() << "\n"
            << "   requested bytes  :" << formatBytes( m_numRequestedBytes.load() ) << "\n"
            << "   request sizes    : (" << m_requestSizes.formatAverageWithUncertainty( true ) << ") B\n"
            << "   fetch times      : (" << m_fetchTimes.formatAverageWithUncertainty( true ) << ") s\n"
        );
    }

private:
    const std::string m_identity;
    const SourceOptions m_options;

    std::atomic<bool> m_closed{ false };
    std::atomic<bool> m_showProfileOnDestruction{ false };

    std::atomic<uint64_t> m_numRequests{ 0 };
    std::atomic<uint64_t> m_numRequestedChunks{ 0 };
    std::atomic<uint64_t> m_numRequestedBytes{ 0 };

    mutable std::mutex m_profileMutex;
    Statistics<uint64_t> m_requestSizes;
    Statistics<double> m_fetchTimes;
};
}  // namespace chunkio
