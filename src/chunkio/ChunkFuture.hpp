#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <core/Error.hpp>

#include "Chunk.hpp"


namespace chunkio
{
enum class ChunkState
{
    PENDING,
    READY,
    FAILED,
};


[[nodiscard]] inline const char*
toString( ChunkState state ) noexcept
{
    switch ( state )
    {
    case ChunkState::PENDING:
        return "pending";
    case ChunkState::READY:
        return "ready";
    case ChunkState::FAILED:
        return "failed";
    }
    return "unknown";
}


/**
 * Result handle for a requested chunk. Fetch errors are stored inside and only thrown by @ref resolve, so
 * that one failed range does not invalidate the other ranges of a batch unless the failed one is accessed.
 * Copies share the same result.
 */
class ChunkFuture
{
public:
    using Seconds = std::chrono::duration<double>;

public:
    ChunkFuture( std::shared_future<Chunk> future,
                 ByteRange                 range,
                 std::string               identity,
                 std::optional<Seconds>    timeout = {} ) :
        m_future( std::move( future ) ),
        m_range( range ),
        m_identity( std::move( identity ) ),
        m_timeout( timeout )
    {
        if ( !m_future.valid() ) {
            throw InvariantViolation( "Chunk future must refer to a shared state!" );
        }
    }

    ChunkFuture( std::future<Chunk>     future,
                 ByteRange              range,
                 std::string            identity,
                 std::optional<Seconds> timeout = {} ) :
        ChunkFuture( future.valid() ? future.share() : std::shared_future<Chunk>(), range, std::move( identity ), timeout )
    {}

    [[nodiscard]] static ChunkFuture
    ready( Chunk       chunk,
           std::string identity )
    {
        const auto range = chunk.range();
        std::promise<Chunk> promise;
        promise.set_value( std::move( chunk ) );
        return ChunkFuture( promise.get_future(), range, std::move( identity ) );
    }

    [[nodiscard]] static ChunkFuture
    failed( std::exception_ptr error,
            ByteRange          range,
            std::string        identity )
    {
        std::promise<Chunk> promise;
        promise.set_exception( std::move( error ) );
        return ChunkFuture( promise.get_future(), range, std::move( identity ) );
    }

    /**
     * Checks the state without blocking.
     */
    [[nodiscard]] ChunkState
    state() const
    {
        if ( m_future.wait_for( std::chrono::seconds( 0 ) ) != std::future_status::ready ) {
            return ChunkState::PENDING;
        }

        try {
            (void)m_future.get();
            return ChunkState::READY;
        } catch ( const std::exception& ) {
            return ChunkState::FAILED;
        }
    }

    /**
     * Blocks until the chunk is ready or failed, or until the timeout elapsed.
     * @return true if the result is available.
     */
    bool
    wait() const
    {
        if ( !m_timeout ) {
            m_future.wait();
            return true;
        }
        return m_future.wait_for( *m_timeout ) == std::future_status::ready;
    }

    /**
     * Blocks until the chunk is available and returns it or rethrows the error that occurred while fetching it.
     * @throws Timeout if the configured timeout elapsed before the fetch finished.
     * @throws Cancelled if the task was abandoned without result because its source was closed.
     */
    [[nodiscard]] const Chunk&
    resolve() const
    {
        if ( !wait() ) {
            std::stringstream message;
            message << "Waiting for " << m_range << " from " << m_identity << " exceeded the timeout of "
                    << m_timeout->count() << " s!";
            throw Timeout( std::move( message ).str() );
        }

        try {
            return m_future.get();
        } catch ( const std::future_error& exception ) {
            if ( exception.code() == std::future_errc::broken_promise ) {
                std::stringstream message;
                message << "Fetching " << m_range << " from " << m_identity << " was abandoned!";
                throw Cancelled( std::move( message ).str() );
            }
            throw;
        }
    }

    [[nodiscard]] const ByteRange&
    range() const noexcept
    {
        return m_range;
    }

    [[nodiscard]] const std::string&
    identity() const noexcept
    {
        return m_identity;
    }

private:
    std::shared_future<Chunk> m_future;
    ByteRange m_range;
    std::string m_identity;
    std::optional<Seconds> m_timeout;
};
}  // namespace chunkio
