#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <chunkio/Chunk.hpp>
#include <chunkio/ChunkFuture.hpp>
#include <chunkio/Source.hpp>

#include "Curl.hpp"
#include "Multipart.hpp"
#include "MultithreadedHTTPSource.hpp"


namespace chunkio
{
/**
 * Fetches all ranges of one @ref chunks call with a single multipart GET request on the calling thread.
 * The returned futures are already resolved.
 *
 * If the server shows that it does not support multiple ranges, e.g., by answering with the whole file,
 * this and all later requests are served by a MultithreadedHTTPSource with numFallbackWorkers workers.
 */
class HTTPSource final :
    public Source
{
public:
    /**
     * @throws ResourceUnavailable if the HEAD request to @p url fails.
     */
    explicit
    HTTPSource( const std::string& url,
                SourceOptions      options = {} ) :
        Source( url, std::move( options ) ),
        m_handle( std::make_unique<http::CurlHandle>() )
    {
        m_numBytes = http::checkResource( *m_handle, url, this->options().timeout );
        log( "Opened", url, "size:", m_numBytes ? formatBytes( *m_numBytes ) : std::string( "unknown" ) );
    }

    ~HTTPSource() override
    {
        close();
    }

    [[nodiscard]] ChunkFuture
    chunk( size_t start,
           size_t stop ) override
    {
        auto result = chunks( { ByteRange{ start, stop } } );
        return std::move( result.front() );
    }

    [[nodiscard]] std::vector<ChunkFuture>
    chunks( const std::vector<ByteRange>& ranges ) override
    {
        checkRanges( ranges );

        const std::lock_guard lock( m_mutex );
        ensureOpen( "chunks" );

        if ( m_fallback ) {
            return m_fallback->chunks( ranges );
        }

        std::vector<ByteRange> nonEmptyRanges;
        size_t nBytes{ 0 };
        for ( const auto& range : ranges ) {
            if ( range.size() > 0 ) {
                nonEmptyRanges.emplace_back( range );
                nBytes += range.size();
            }
        }

        std::vector<std::optional<ChunkFuture> > fetched( nonEmptyRanges.size() );
        if ( !nonEmptyRanges.empty() ) {
            recordRequest( nonEmptyRanges.size(), nBytes );
            try {
                auto futures = fetchMultipart( nonEmptyRanges );
                std::move( futures.begin(), futures.end(), fetched.begin() );
            } catch ( const ProtocolError& exception ) {
                if ( exception.error() != Error::MULTIPART_UNSUPPORTED ) {
                    throw;
                }
                switchToFallback( exception );
                return m_fallback->chunks( ranges );
            }
        }

        std::vector<ChunkFuture> result;
        result.reserve( ranges.size() );
        size_t iFetched{ 0 };
        for ( const auto& range : ranges ) {
            if ( range.size() == 0 ) {
                result.emplace_back( ChunkFuture::ready( Chunk( range.start, range.stop, std::vector<std::byte>() ),
                                                         identity() ) );
            } else {
                result.emplace_back( std::move( *fetched[iFetched++] ) );
            }
        }
        return result;
    }

    [[nodiscard]] std::optional<size_t>
    numBytes() const override
    {
        return m_numBytes;
    }

    /**
     * True after the server was found to not support multipart ranges.
     */
    [[nodiscard]] bool
    usesFallback() const
    {
        const std::lock_guard lock( m_mutex );
        return static_cast<bool>( m_fallback );
    }

protected:
    void
    release() override
    {
        const std::lock_guard lock( m_mutex );
        if ( m_fallback ) {
            m_fallback->close();
        }
        m_handle.reset();
        log( "Closed", identity() );
    }

    [[nodiscard]] const char*
    name() const noexcept override
    {
        return "HTTPSource";
    }

private:
    /**
     * Errors concerning the whole request are stored in all returned futures.
     * @throws ProtocolError with Error::MULTIPART_UNSUPPORTED if the server ignored the ranges.
     */
    [[nodiscard]] std::vector<ChunkFuture>
    fetchMultipart( const std::vector<ByteRange>& ranges )
    {
        const auto t0 = now();

        http::HttpRequest request;
        request.url = identity();
        request.range = http::formatRangeHeader( ranges );
        request.timeout = options().timeout;

        log( "GET", identity(), "with", ranges.size(), "ranges" );

        std::vector<std::optional<Chunk> > parts;
        try {
            auto response = m_handle->perform( request );
            http::throwOnTransferError( response, identity(), std::to_string( ranges.size() ) + " ranges" );
            parts = demultiplex( ranges, std::move( response ) );
        } catch ( const ProtocolError& exception ) {
            if ( exception.error() == Error::MULTIPART_UNSUPPORTED ) {
                throw;
            }
            return failAll( ranges, std::current_exception() );
        } catch ( const SourceError& ) {
            return failAll( ranges, std::current_exception() );
        }

        recordFetchTime( duration( t0 ) );

        std::vector<ChunkFuture> result;
        result.reserve( ranges.size() );
        for ( size_t i = 0; i < ranges.size(); ++i ) {
            if ( parts[i] ) {
                result.emplace_back( ChunkFuture::ready( std::move( *parts[i] ), identity() ) );
                continue;
            }

            std::stringstream message;
            message << "The multipart response from " << identity() << " is missing the requested range "
                    << ranges[i] << "!";
            result.emplace_back( ChunkFuture::failed(
                std::make_exception_ptr( FetchError( std::move( message ).str() ) ), ranges[i], identity() ) );
        }
        return result;
    }

    [[nodiscard]] std::vector<std::optional<Chunk> >
    demultiplex( const std::vector<ByteRange>& ranges,
                 http::HttpResponse            response ) const
    {
        if ( response.status == 200 ) {
            std::stringstream message;
            message << "The server for " << identity() << " ignored the Range header with "
                    << ranges.size() << " ranges and returned the whole resource!";
            throw ProtocolError( std::move( message ).str(), Error::MULTIPART_UNSUPPORTED );
        }

        if ( response.status != 206 ) {
            std::stringstream message;
            message << "Fetching " << ranges.size() << " ranges from " << identity()
                    << " failed with HTTP status " << response.status << "!";
            throw FetchError( std::move( message ).str() );
        }

        const auto contentType = response.header( "Content-Type" );
        const auto boundary = contentType ? http::parseMultipartBoundary( *contentType ) : std::nullopt;
        const auto body = std::make_shared<const std::vector<std::byte> >( std::move( response.body ) );

        if ( boundary ) {
            return http::distributeParts( ranges, http::parseMultipartByteRanges( body, *boundary ) );
        }

        /* A single range, either because only one was requested or because the server coalesced all of them. */
        const auto contentRange = response.header( "Content-Range" );
        if ( !contentRange ) {
            if ( ranges.size() > 1 ) {
                std::stringstream message;
                message << "The server for " << identity() << " answered a request for " << ranges.size()
                        << " ranges with neither a multipart body nor a Content-Range!";
                throw ProtocolError( std::move( message ).str(), Error::MULTIPART_UNSUPPORTED );
            }
            if ( body->size() != ranges.front().size() ) {
                std::stringstream message;
                message << "Fetching " << ranges.front() << " from " << identity() << " returned "
                        << body->size() << " B!";
                throw FetchError( std::move( message ).str(), Error::LENGTH_MISMATCH );
            }
            return { Chunk::view( ranges.front().start, ranges.front().stop, body, body->data(), body->size() ) };
        }

        const auto range = http::parseContentRange( *contentRange ).range();
        if ( body->size() != range.size() ) {
            std::stringstream message;
            message << "The body for the returned range " << range << " from " << identity() << " has "
                    << body->size() << " B!";
            throw ProtocolError( std::move( message ).str() );
        }
        return http::distributeParts( ranges, { Chunk::view( range.start, range.stop, body, body->data(),
                                                             body->size() ) } );
    }

    [[nodiscard]] std::vector<ChunkFuture>
    failAll( const std::vector<ByteRange>& ranges,
             const std::exception_ptr&     exception ) const
    {
        std::vector<ChunkFuture> result;
        result.reserve( ranges.size() );
        for ( const auto& range : ranges ) {
            result.emplace_back( ChunkFuture::failed( exception, range, identity() ) );
        }
        return result;
    }

    /**
     * Must be called with locked mutex.
     */
    void
    switchToFallback( const ProtocolError& reason )
    {
        log( reason.what(), "Falling back to one request per range with", options().numFallbackWorkers,
             "workers." );

        auto fallbackOptions = options();
        fallbackOptions.numWorkers = fallbackOptions.numFallbackWorkers;
        m_fallback = std::make_unique<MultithreadedHTTPSource>( identity(), std::move( fallbackOptions ) );
    }

private:
    std::optional<size_t> m_numBytes;

    mutable std::mutex m_mutex;
    std::unique_ptr<http::CurlHandle> m_handle;
    std::unique_ptr<MultithreadedHTTPSource> m_fallback;
};
}  // namespace chunkio
