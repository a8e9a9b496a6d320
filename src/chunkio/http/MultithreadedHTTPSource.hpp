#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/ThreadPool.hpp>
#include <chunkio/Chunk.hpp>
#include <chunkio/ChunkFuture.hpp>
#include <chunkio/Source.hpp>

#include "Curl.hpp"
#include "Multipart.hpp"


namespace chunkio
{
/**
 * Fetches each range with its own GET request carrying a single Range header. The requests are distributed
 * over numWorkers threads, each of which uses its own curl handle.
 */
class MultithreadedHTTPSource final :
    public Source
{
public:
    /**
     * @throws ResourceUnavailable if the HEAD request to @p url fails.
     */
    explicit
    MultithreadedHTTPSource( const std::string& url,
                             SourceOptions      options = {} ) :
        Source( url, std::move( options ) ),
        m_threadPool( this->options().numWorkers )
    {
        {
            const auto handle = m_handles.acquire();
            m_numBytes = http::checkResource( **handle, url, this->options().timeout );
        }
        log( "Opened", url, "with", m_threadPool.capacity(), "workers, size:",
             m_numBytes ? formatBytes( *m_numBytes ) : std::string( "unknown" ) );
    }

    ~MultithreadedHTTPSource() override
    {
        close();
    }

    [[nodiscard]] ChunkFuture
    chunk( size_t start,
           size_t stop ) override
    {
        ensureOpen( "chunk" );
        checkRange( start, stop );

        if ( start == stop ) {
            return ChunkFuture::ready( Chunk( start, stop, std::vector<std::byte>() ), identity() );
        }

        recordRequest( 1, stop - start );
        return makeFuture( m_threadPool.submit( [this, start, stop] () { return fetch( start, stop ); } ),
                           { start, stop } );
    }

    [[nodiscard]] std::optional<size_t>
    numBytes() const override
    {
        return m_numBytes;
    }

protected:
    void
    release() override
    {
        m_threadPool.stop();
        m_handles.clear();
        log( "Closed", identity() );
    }

    [[nodiscard]] const char*
    name() const noexcept override
    {
        return "MultithreadedHTTPSource";
    }

private:
    [[nodiscard]] Chunk
    fetch( size_t start,
           size_t stop )
    {
        const ByteRange range{ start, stop };
        const auto t0 = now();

        http::HttpRequest request;
        request.url = identity();
        request.range = http::formatRangeHeader( { range } );
        request.timeout = options().timeout;

        log( "GET", identity(), "bytes=" + request.range );

        auto response = [&] () {
            const auto handle = m_handles.acquire();
            return ( *handle )->perform( request );
        }();

        http::throwOnTransferError( response, identity(), toString( range ) );

        if ( ( response.status != 206 ) && ( response.status != 200 ) ) {
            std::stringstream message;
            message << "Fetching " << range << " from " << identity() << " failed with HTTP status "
                    << response.status << "!";
            throw FetchError( std::move( message ).str() );
        }

        if ( response.body.size() != range.size() ) {
            std::stringstream message;
            message << "Fetching " << range << " from " << identity() << " returned " << response.body.size()
                    << " B with HTTP status " << response.status << " instead of " << range.size() << " B!";
            throw FetchError( std::move( message ).str(), Error::LENGTH_MISMATCH );
        }

        if ( const auto contentRange = response.header( "Content-Range" );
             contentRange && ( http::parseContentRange( *contentRange ).range() != range ) ) {
            std::stringstream message;
            message << "Fetching " << range << " from " << identity() << " returned the range "
                    << http::parseContentRange( *contentRange ).range() << "!";
            throw FetchError( std::move( message ).str() );
        }

        recordFetchTime( duration( t0 ) );
        return Chunk( start, stop, std::move( response.body ) );
    }

private:
    std::optional<size_t> m_numBytes;
    http::CurlHandlePool m_handles;
    ThreadPool m_threadPool;
};
}  // namespace chunkio
