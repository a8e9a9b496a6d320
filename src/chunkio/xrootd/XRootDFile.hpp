#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <XrdCl/XrdClBuffer.hh>
#include <XrdCl/XrdClFile.hh>
#include <XrdCl/XrdClFileSystem.hh>
#include <XrdCl/XrdClStatus.hh>
#include <XrdCl/XrdClURL.hh>
#include <XrdCl/XrdClXRootDResponses.hh>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <chunkio/Chunk.hpp>


namespace chunkio::xrootd
{
/**
 * XrdCl takes timeouts in whole seconds, where 0 means the client default.
 */
[[nodiscard]] inline uint16_t
toTimeoutSeconds( const std::optional<std::chrono::duration<double> >& timeout )
{
    if ( !timeout ) {
        return 0;
    }
    const auto seconds = std::ceil( timeout->count() );
    return static_cast<uint16_t>( std::clamp( seconds, 1.0,
                                              static_cast<double>( std::numeric_limits<uint16_t>::max() ) ) );
}


/**
 * @throws Timeout if the status reports an expired operation.
 * @throws FetchError for all other error states.
 */
inline void
throwOnError( const XrdCl::XRootDStatus& status,
              const std::string&         what )
{
    if ( status.IsOK() ) {
        return;
    }

    const auto message = what + " failed: " + status.ToString();
    if ( status.code == XrdCl::errOperationExpired ) {
        throw Timeout( message );
    }
    throw FetchError( message );
}


struct ServerLimits
{
    /** Maximum number of elements in one vector read, readv_iov_max. */
    std::optional<size_t> maxNumElements;
    /** Maximum size of one vector read element, readv_ior_max. */
    std::optional<size_t> maxElementSize;
};


/**
 * Asks the server of @p url for its vector read limits. Returns empty limits if the server does not answer.
 */
[[nodiscard]] inline ServerLimits
queryServerLimits( const std::string&                                   url,
                   const std::optional<std::chrono::duration<double> >& timeout )
{
    const XrdCl::URL parsedUrl( url );
    XrdCl::FileSystem fileSystem( parsedUrl );

    XrdCl::Buffer argument;
    argument.FromString( "readv_iov_max readv_ior_max" );
    XrdCl::Buffer* rawResponse{ nullptr };
    const auto status = fileSystem.Query( XrdCl::QueryCode::Config, argument, rawResponse,
                                          toTimeoutSeconds( timeout ) );
    const std::unique_ptr<XrdCl::Buffer> response( rawResponse );

    ServerLimits limits;
    if ( !status.IsOK() || !response ) {
        return limits;
    }

    /* The answer has one line per queried value. Unknown values are echoed back as their name. */
    const auto text = response->ToString();
    const auto lines = split( text, '\n' );
    const auto parse =
        [] ( std::string_view line ) -> std::optional<size_t> {
            try {
                const std::string value( trim( line ) );
                size_t nParsed{ 0 };
                const auto result = std::stoull( value, &nParsed );
                if ( ( nParsed == value.size() ) && ( result > 0 ) ) {
                    return static_cast<size_t>( result );
                }
            } catch ( const std::logic_error& ) {
                /* Not a number. */
            }
            return std::nullopt;
        };

    if ( lines.size() > 0 ) {
        limits.maxNumElements = parse( lines[0] );
    }
    if ( lines.size() > 1 ) {
        limits.maxElementSize = parse( lines[1] );
    }
    return limits;
}


/**
 * Owns an XrdCl::File opened for reading. The synchronous XrdCl::File methods may be called from several
 * threads at once.
 */
class File
{
public:
    /**
     * @throws ResourceUnavailable if the file cannot be opened.
     */
    File( const std::string&                                   url,
          const std::optional<std::chrono::duration<double> >& timeout ) :
        m_url( url ),
        m_timeout( toTimeoutSeconds( timeout ) )
    {
        const auto status = m_file.Open( url, XrdCl::OpenFlags::Read, XrdCl::Access::None, m_timeout );
        if ( !status.IsOK() ) {
            throw ResourceUnavailable( "Opening " + url + " failed: " + status.ToString() );
        }

        XrdCl::StatInfo* rawInfo{ nullptr };
        const auto statStatus = m_file.Stat( false, rawInfo, m_timeout );
        const std::unique_ptr<XrdCl::StatInfo> info( rawInfo );
        if ( statStatus.IsOK() && info ) {
            m_size = static_cast<size_t>( info->GetSize() );
        }
    }

    ~File()
    {
        close();
    }

    File( const File& ) = delete;
    File( File&& ) = delete;
    File& operator=( const File& ) = delete;
    File& operator=( File&& ) = delete;

    void
    close()
    {
        if ( m_file.IsOpen() ) {
            /* Errors on closing a read-only file are ignored. */
            (void)m_file.Close( m_timeout );
        }
    }

    [[nodiscard]] std::optional<size_t>
    size() const noexcept
    {
        return m_size;
    }

    /**
     * @throws FetchError on error status or if fewer bytes than requested were returned.
     */
    [[nodiscard]] Chunk
    read( size_t start,
          size_t stop )
    {
        const ByteRange range{ start, stop };
        if ( range.size() > std::numeric_limits<uint32_t>::max() ) {
            std::stringstream message;
            message << "Range " << range << " is too large for a single XRootD read!";
            throw std::invalid_argument( std::move( message ).str() );
        }

        std::vector<std::byte> buffer( range.size() );
        uint32_t nBytesRead{ 0 };
        const auto status = m_file.Read( start, static_cast<uint32_t>( buffer.size() ), buffer.data(),
                                         nBytesRead, m_timeout );
        throwOnError( status, "Reading " + toString( range ) + " from " + m_url );

        if ( nBytesRead != buffer.size() ) {
            std::stringstream message;
            message << "Reading " << range << " from " << m_url << " returned " << nBytesRead << " B!";
            throw FetchError( std::move( message ).str(), Error::LENGTH_MISMATCH );
        }
        return Chunk( start, stop, std::move( buffer ) );
    }

    /**
     * Reads all elements into the buffers given by each ChunkInfo.
     * @return The number of bytes returned for each element, in request order.
     * @throws FetchError or Timeout if the whole request failed.
     */
    [[nodiscard]] std::vector<size_t>
    vectorRead( const XrdCl::ChunkList& elements )
    {
        XrdCl::VectorReadInfo* rawInfo{ nullptr };
        const auto status = m_file.VectorRead( elements, nullptr, rawInfo, m_timeout );
        const std::unique_ptr<XrdCl::VectorReadInfo> info( rawInfo );

        std::stringstream what;
        what << "Vector read of " << elements.size() << " elements from " << m_url;
        throwOnError( status, what.str() );
        if ( !info ) {
            throw FetchError( what.str() + " returned no response!" );
        }

        const auto& returned = info->GetChunks();
        std::vector<size_t> sizes( elements.size(), 0 );
        for ( size_t i = 0; i < std::min( sizes.size(), returned.size() ); ++i ) {
            sizes[i] = returned[i].offset == elements[i].offset ? returned[i].length : 0;
        }
        return sizes;
    }

private:
    const std::string m_url;
    const uint16_t m_timeout;
    XrdCl::File m_file;
    std::optional<size_t> m_size;
};
}  // namespace chunkio::xrootd
