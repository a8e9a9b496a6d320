#pragma once

#include <cstring>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/FileUtils.hpp>
#include <core/ThreadPool.hpp>
#include <chunkio/Chunk.hpp>
#include <chunkio/ChunkFuture.hpp>
#include <chunkio/Source.hpp>

#include "FileSource.hpp"


namespace chunkio
{
/**
 * Maps the whole file once and returns chunks that are views into the mapping. The mapping is shared with all
 * returned chunks, so they stay valid after the source has been closed.
 *
 * If the file cannot be mapped, e.g., because it is empty or the file system does not support mmap,
 * all requests are forwarded to a FileSource with numFallbackWorkers workers.
 * If the file is mapped and numFallbackWorkers > 0, @ref chunks copies the ranges into owned buffers
 * on a pool of that size.
 */
class MemmapSource final :
    public Source
{
public:
    explicit
    MemmapSource( const std::string& path,
                  SourceOptions      options = {} ) :
        Source( path, std::move( options ) )
    {
        const auto file = throwingOpen( path );
        m_fileSize = fileSize( *file );

        try {
            m_mapping = std::make_shared<const unique_memory_map>( *file, m_fileSize );
        } catch ( const std::runtime_error& exception ) {
            log( "Could not map", path, "because:", exception.what(), "Falling back to pread." );

            auto fallbackOptions = this->options();
            fallbackOptions.numWorkers = fallbackOptions.numFallbackWorkers;
            m_fallback = std::make_unique<FileSource>( path, std::move( fallbackOptions ) );
        }

        if ( m_mapping ) {
            if ( this->options().numFallbackWorkers > 0 ) {
                m_copyPool = std::make_unique<ThreadPool>( this->options().numFallbackWorkers );
            }
            log( "Mapped", formatBytes( m_fileSize ), "of", path );
        }
    }

    ~MemmapSource() override
    {
        close();
    }

    [[nodiscard]] ChunkFuture
    chunk( size_t start,
           size_t stop ) override
    {
        ensureOpen( "chunk" );
        checkRange( start, stop );
        recordRequest( 1, stop - start );

        if ( m_fallback ) {
            return m_fallback->chunk( start, stop );
        }

        try {
            return ChunkFuture::ready( view( start, stop ), identity() );
        } catch ( const FetchError& ) {
            return ChunkFuture::failed( std::current_exception(), { start, stop }, identity() );
        }
    }

    [[nodiscard]] std::vector<ChunkFuture>
    chunks( const std::vector<ByteRange>& ranges ) override
    {
        if ( !m_copyPool && !m_fallback ) {
            return Source::chunks( ranges );
        }

        ensureOpen( "chunks" );
        checkRanges( ranges );

        if ( m_fallback ) {
            for ( const auto& range : ranges ) {
                recordRequest( 1, range.size() );
            }
            return m_fallback->chunks( ranges );
        }

        std::vector<ChunkFuture> result;
        result.reserve( ranges.size() );
        for ( const auto& range : ranges ) {
            recordRequest( 1, range.size() );
            result.emplace_back( makeFuture(
                m_copyPool->submit( [this, range] () { return copy( range.start, range.stop ); } ), range ) );
        }
        return result;
    }

    [[nodiscard]] std::optional<size_t>
    numBytes() const override
    {
        return m_fileSize;
    }

    [[nodiscard]] bool
    isMemoryMapped() const noexcept
    {
        return !m_fallback;
    }

protected:
    void
    release() override
    {
        if ( m_copyPool ) {
            m_copyPool->stop();
        }
        if ( m_fallback ) {
            m_fallback->close();
        }
        /* Chunks still referencing the mapping keep it alive. */
        m_mapping.reset();
        log( "Closed", identity() );
    }

    [[nodiscard]] const char*
    name() const noexcept override
    {
        return "MemmapSource";
    }

private:
    [[nodiscard]] Chunk
    view( size_t start,
          size_t stop ) const
    {
        if ( stop > m_fileSize ) {
            std::stringstream message;
            message << "Range " << ByteRange{ start, stop } << " exceeds the " << m_fileSize
                    << " B of the memory-mapped file " << identity() << "!";
            throw FetchError( std::move( message ).str(), Error::LENGTH_MISMATCH );
        }
        return Chunk::view( start, stop, m_mapping, m_mapping->data() + start, stop - start );
    }

    [[nodiscard]] Chunk
    copy( size_t start,
          size_t stop ) const
    {
        const auto mapped = view( start, stop );
        std::vector<std::byte> buffer( mapped.size() );
        if ( !buffer.empty() ) {
            std::memcpy( buffer.data(), mapped.data(), buffer.size() );
        }
        return Chunk( start, stop, std::move( buffer ) );
    }

private:
    size_t m_fileSize{ 0 };
    std::shared_ptr<const unique_memory_map> m_mapping;
    std::unique_ptr<FileSource> m_fallback;
    std::unique_ptr<ThreadPool> m_copyPool;
};
}  // namespace chunkio
