#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/ThreadPool.hpp>
#include <chunkio/Chunk.hpp>
#include <chunkio/ChunkFuture.hpp>
#include <chunkio/Source.hpp>

#include "XRootDFile.hpp"


namespace chunkio
{
/**
 * Issues one XRootD read per range on a single file handle, up to numWorkers of them concurrently.
 */
class MultithreadedXRootDSource final :
    public Source
{
public:
    /**
     * @throws ResourceUnavailable if the file cannot be opened.
     */
    explicit
    MultithreadedXRootDSource( const std::string& url,
                               SourceOptions      options = {} ) :
        Source( url, std::move( options ) ),
        m_file( url, this->options().timeout ),
        m_threadPool( this->options().numWorkers )
    {
        log( "Opened", url, "with", m_threadPool.capacity(), "workers" );
    }

    ~MultithreadedXRootDSource() override
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
        return makeFuture( m_threadPool.submit( [this, start, stop] () {
                               const auto t0 = now();
                               auto result = m_file.read( start, stop );
                               recordFetchTime( duration( t0 ) );
                               return result;
                           } ),
                           { start, stop } );
    }

    [[nodiscard]] std::optional<size_t>
    numBytes() const override
    {
        return m_file.size();
    }

protected:
    void
    release() override
    {
        m_threadPool.stop();
        m_file.close();
        log( "Closed", identity() );
    }

    [[nodiscard]] const char*
    name() const noexcept override
    {
        return "MultithreadedXRootDSource";
    }

private:
    xrootd::File m_file;
    ThreadPool m_threadPool;
};
}  // namespace chunkio
