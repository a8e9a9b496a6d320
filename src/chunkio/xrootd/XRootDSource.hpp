#pragma once

#include <algorithm>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
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

#include "VectorRead.hpp"
#include "XRootDFile.hpp"


namespace chunkio
{
/**
 * Serves all ranges of one @ref chunks call with as few XRootD vector reads as the server limits allow.
 * The batches are read one after another on the calling thread, or concurrently on numFallbackWorkers
 * threads if that is non-zero. Each range fails or succeeds on its own.
 */
class XRootDSource final :
    public Source
{
public:
    /**
     * Limits not given in @p options are queried from the server.
     * @throws ResourceUnavailable if the file cannot be opened.
     */
    explicit
    XRootDSource( const std::string& url,
                  SourceOptions      options = {} ) :
        Source( url, std::move( options ) ),
        m_file( url, this->options().timeout ),
        m_maxNumElements( this->options().maxNumElements ),
        m_maxElementSize( this->options().maxElementSize )
    {
        if ( !m_maxNumElements || !m_maxElementSize ) {
            const auto limits = queryServerLimits();
            if ( !m_maxNumElements ) {
                m_maxNumElements = limits.maxNumElements;
            }
            if ( !m_maxElementSize ) {
                m_maxElementSize = limits.maxElementSize;
            }
        }

        /* Element lengths are 32-bit in the protocol. */
        m_maxElementSize = std::min<size_t>( m_maxElementSize.value_or( std::numeric_limits<uint32_t>::max() ),
                                             std::numeric_limits<uint32_t>::max() );

        if ( this->options().numFallbackWorkers > 0 ) {
            m_batchPool = std::make_unique<ThreadPool>( this->options().numFallbackWorkers );
        }

        log( "Opened", url, "with at most",
             m_maxNumElements ? std::to_string( *m_maxNumElements ) : std::string( "unlimited" ),
             "elements of at most", formatBytes( *m_maxElementSize ), "per vector read" );
    }

    ~XRootDSource() override
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
        ensureOpen( "chunks" );
        checkRanges( ranges );

        const auto batches = planVectorReads( ranges, m_maxNumElements, m_maxElementSize );
        const auto assembler = std::make_shared<VectorReadAssembler>( ranges );

        std::vector<ChunkFuture> result;
        result.reserve( ranges.size() );
        for ( size_t i = 0; i < ranges.size(); ++i ) {
            result.emplace_back( makeFuture( assembler->future( i ), ranges[i] ) );
        }

        for ( const auto& batch : batches ) {
            for ( const auto& element : batch ) {
                assembler->expect( element );
            }
        }
        assembler->finishPlanning();

        for ( const auto& batch : batches ) {
            size_t nBytes{ 0 };
            for ( const auto& element : batch ) {
                nBytes += element.range.size();
            }
            recordRequest( batch.size(), nBytes );

            if ( m_batchPool ) {
                /* Results are delivered through the assembler. */
                (void)m_batchPool->submit( [this, assembler, batch] () { readBatch( *assembler, batch ); } );
            } else {
                readBatch( *assembler, batch );
            }
        }

        return result;
    }

    [[nodiscard]] std::optional<size_t>
    numBytes() const override
    {
        return m_file.size();
    }

    [[nodiscard]] xrootd::ServerLimits
    queryServerLimits() const
    {
        return xrootd::queryServerLimits( identity(), options().timeout );
    }

    [[nodiscard]] std::optional<size_t>
    maxNumElements() const noexcept
    {
        return m_maxNumElements;
    }

    [[nodiscard]] std::optional<size_t>
    maxElementSize() const noexcept
    {
        return m_maxElementSize;
    }

protected:
    void
    release() override
    {
        if ( m_batchPool ) {
            m_batchPool->stop();
        }
        m_file.close();
        log( "Closed", identity() );
    }

    [[nodiscard]] const char*
    name() const noexcept override
    {
        return "XRootDSource";
    }

private:
    void
    readBatch( VectorReadAssembler&   assembler,
               const VectorReadBatch& batch )
    {
        const auto t0 = now();

        XrdCl::ChunkList elements;
        elements.reserve( batch.size() );
        for ( const auto& element : batch ) {
            elements.emplace_back( element.range.start, static_cast<uint32_t>( element.range.size() ),
                                   assembler.buffer( element ) );
        }

        log( "Vector read with", elements.size(), "elements from", identity() );

        std::vector<size_t> sizes;
        try {
            sizes = m_file.vectorRead( elements );
        } catch ( const SourceError& ) {
            const auto error = std::current_exception();
            for ( const auto& element : batch ) {
                assembler.fail( element, error );
            }
            return;
        }

        for ( size_t i = 0; i < batch.size(); ++i ) {
            const auto& element = batch[i];
            if ( sizes[i] == element.range.size() ) {
                assembler.complete( element );
                continue;
            }

            std::stringstream message;
            message << "Vector read element " << element.range << " from " << identity() << " returned "
                    << sizes[i] << " B instead of " << element.range.size() << " B!";
            assembler.fail( element, std::make_exception_ptr(
                FetchError( std::move( message ).str(), Error::LENGTH_MISMATCH ) ) );
        }

        recordFetchTime( duration( t0 ) );
    }

private:
    xrootd::File m_file;
    std::optional<size_t> m_maxNumElements;
    std::optional<size_t> m_maxElementSize;
    std::unique_ptr<ThreadPool> m_batchPool;
};
}  // namespace chunkio
