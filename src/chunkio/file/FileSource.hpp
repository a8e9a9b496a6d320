#pragma once

#include <cstddef>
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


namespace chunkio
{
/**
 * Reads ranges with pread on one file descriptor shared by all workers. Because pread does not use the
 * file position, the workers need no locking.
 */
class FileSource final :
    public Source
{
public:
    explicit
    FileSource( const std::string& path,
                SourceOptions      options = {} ) :
        Source( path, std::move( options ) ),
        m_file( throwingOpen( path ) ),
        m_fileSize( fileSize( *m_file ) ),
        m_threadPool( this->options().numWorkers )
    {
        log( "Opened", path, "with", formatBytes( m_fileSize ), "and", m_threadPool.capacity(), "workers" );
    }

    ~FileSource() override
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

        return makeFuture( m_threadPool.submit( [this, start, stop] () { return read( start, stop ); } ),
                           { start, stop } );
    }

    [[nodiscard]] std::optional<size_t>
    numBytes() const override
    {
        return m_fileSize;
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
        return "FileSource";
    }

private:
    [[nodiscard]] Chunk
    read( size_t start,
          size_t stop )
    {
        const auto t0 = now();

        std::vector<std::byte> buffer( stop - start );
        size_t nBytesRead{ 0 };
        try {
            nBytesRead = preadAll( *m_file, buffer.data(), buffer.size(), start );
        } catch ( const std::runtime_error& exception ) {
            std::stringstream message;
            message << "Reading " << ByteRange{ start, stop } << " from " << identity() << " failed: "
                    << exception.what();
            throw FetchError( std::move( message ).str() );
        }

        if ( nBytesRead != buffer.size() ) {
            std::stringstream message;
            message << "Reading " << ByteRange{ start, stop } << " from " << identity() << " returned only "
                    << nBytesRead << " B because the file has only " << m_fileSize << " B!";
            throw FetchError( std::move( message ).str(), Error::LENGTH_MISMATCH );
        }

        recordFetchTime( duration( t0 ) );
        return Chunk( start, stop, std::move( buffer ) );
    }

private:
    unique_file_descriptor m_file;
    const size_t m_fileSize;
    ThreadPool m_threadPool;
};
}  // namespace chunkio
