#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <new>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <curl/curl.h>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <chunkio/Chunk.hpp>


namespace chunkio::http
{
/**
 * curl_global_init is not thread-safe and must be called once before any other curl function.
 */
class CurlGlobal
{
public:
    static void
    ensureInitialized()
    {
        static const CurlGlobal instance;
    }

private:
    CurlGlobal()
    {
        const auto result = curl_global_init( CURL_GLOBAL_ALL );
        if ( result != CURLE_OK ) {
            throw std::runtime_error( std::string( "Failed to initialize libcurl: " )
                                      + curl_easy_strerror( result ) );
        }
    }

    ~CurlGlobal()
    {
        curl_global_cleanup();
    }
};


struct HttpResponse
{
    /** CURLE_OK if the transfer itself succeeded, which says nothing about the HTTP status. */
    CURLcode transferResult{ CURLE_OK };
    std::string transferError;
    long status{ 0 };
    /** Headers of the last response, i.e., after following redirects. */
    std::vector<std::pair<std::string, std::string> > headers;
    std::vector<std::byte> body;

    [[nodiscard]] bool
    transferSucceeded() const noexcept
    {
        return transferResult == CURLE_OK;
    }

    [[nodiscard]] bool
    timedOut() const noexcept
    {
        return transferResult == CURLE_OPERATION_TIMEDOUT;
    }

    /**
     * Case-insensitive header lookup. Returns the last occurrence.
     */
    [[nodiscard]] std::optional<std::string>
    header( std::string_view name ) const
    {
        const auto lowerName = toLower( name );
        for ( auto it = headers.rbegin(); it != headers.rend(); ++it ) {
            if ( toLower( it->first ) == lowerName ) {
                return it->second;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<size_t>
    contentLength() const
    {
        const auto value = header( "Content-Length" );
        if ( !value ) {
            return std::nullopt;
        }
        try {
            size_t parsedLength{ 0 };
            const auto result = std::stoull( *value, &parsedLength );
            if ( parsedLength != trim( *value ).size() ) {
                return std::nullopt;
            }
            return static_cast<size_t>( result );
        } catch ( const std::logic_error& ) {
            return std::nullopt;
        }
    }
};


struct HttpRequest
{
    std::string url;
    /** Without body. */
    bool head{ false };
    /** Value for the Range header without the "bytes=" prefix, e.g., "0-99,200-299". */
    std::string range;
    std::optional<std::chrono::duration<double> > timeout;
};


/**
 * Owns one curl easy handle. An easy handle keeps its connections alive between transfers, so reusing
 * one handle for many requests to the same host avoids reconnecting. A handle must not be used by two
 * threads at once.
 */
class CurlHandle
{
public:
    CurlHandle()
    {
        CurlGlobal::ensureInitialized();
        m_handle = curl_easy_init();
        if ( m_handle == nullptr ) {
            throw std::runtime_error( "Failed to create a curl easy handle!" );
        }
    }

    ~CurlHandle()
    {
        curl_easy_cleanup( m_handle );
    }

    CurlHandle( const CurlHandle& ) = delete;
    CurlHandle( CurlHandle&& ) = delete;
    CurlHandle& operator=( const CurlHandle& ) = delete;
    CurlHandle& operator=( CurlHandle&& ) = delete;

    /**
     * Transfer errors are returned inside the response instead of being thrown because the meaning
     * depends on the caller, e.g., open time versus fetch time.
     */
    [[nodiscard]] HttpResponse
    perform( const HttpRequest& request )
    {
        /* Resets the options but keeps the connection cache. */
        curl_easy_reset( m_handle );

        HttpResponse response;
        std::array<char, CURL_ERROR_SIZE> errorBuffer{};

        curl_easy_setopt( m_handle, CURLOPT_URL, request.url.c_str() );
        curl_easy_setopt( m_handle, CURLOPT_FOLLOWLOCATION, 1L );
        curl_easy_setopt( m_handle, CURLOPT_MAXREDIRS, 10L );
        /* Signals are not thread-safe and timeouts work without them when using the threaded resolver. */
        curl_easy_setopt( m_handle, CURLOPT_NOSIGNAL, 1L );
        curl_easy_setopt( m_handle, CURLOPT_USERAGENT, "chunkio/1.0" );
        curl_easy_setopt( m_handle, CURLOPT_ERRORBUFFER, errorBuffer.data() );
        curl_easy_setopt( m_handle, CURLOPT_WRITEFUNCTION, &CurlHandle::writeCallback );
        curl_easy_setopt( m_handle, CURLOPT_WRITEDATA, &response.body );
        curl_easy_setopt( m_handle, CURLOPT_HEADERFUNCTION, &CurlHandle::headerCallback );
        curl_easy_setopt( m_handle, CURLOPT_HEADERDATA, &response.headers );

        if ( request.timeout ) {
            /* 0 would mean no timeout for curl. */
            const auto milliseconds = std::max<long>(
                1L, static_cast<long>( std::chrono::duration_cast<std::chrono::milliseconds>(
                                           *request.timeout ).count() ) );
            curl_easy_setopt( m_handle, CURLOPT_TIMEOUT_MS, milliseconds );
            curl_easy_setopt( m_handle, CURLOPT_CONNECTTIMEOUT_MS, milliseconds );
        }

        if ( request.head ) {
            curl_easy_setopt( m_handle, CURLOPT_NOBODY, 1L );
        } else {
            curl_easy_setopt( m_handle, CURLOPT_HTTPGET, 1L );
        }

        if ( !request.range.empty() ) {
            curl_easy_setopt( m_handle, CURLOPT_RANGE, request.range.c_str() );
        }

        response.transferResult = curl_easy_perform( m_handle );
        if ( response.transferResult != CURLE_OK ) {
            response.transferError = errorBuffer[0] != '\0'
                                     ? std::string( errorBuffer.data() )
                                     : std::string( curl_easy_strerror( response.transferResult ) );
        }
        curl_easy_getinfo( m_handle, CURLINFO_RESPONSE_CODE, &response.status );

        /* The error buffer is a local variable. */
        curl_easy_setopt( m_handle, CURLOPT_ERRORBUFFER, nullptr );
        return response;
    }

private:
    static size_t
    writeCallback( char*  data,
                   size_t size,
                   size_t count,
                   void*  userData )
    {
        auto* const body = static_cast<std::vector<std::byte>*>( userData );
        const auto nBytes = size * count;
        const auto* const bytes = reinterpret_cast<const std::byte*>( data );
        try {
            body->insert( body->end(), bytes, bytes + nBytes );
        } catch ( const std::bad_alloc& ) {
            /* Exceptions must not pass through libcurl. Returning less than given aborts the transfer. */
            return 0;
        }
        return nBytes;
    }

    static size_t
    headerCallback( char*  data,
                    size_t size,
                    size_t count,
                    void*  userData )
    {
        auto* const headers = static_cast<std::vector<std::pair<std::string, std::string> >*>( userData );
        const auto nBytes = size * count;
        const auto line = trim( std::string_view( data, nBytes ) );

        /* Each response in a redirect chain starts with a status line. Only keep the last response's headers. */
        if ( startsWith( line, std::string_view( "HTTP/" ) ) ) {
            headers->clear();
        } else if ( const auto colon = line.find( ':' ); colon != std::string_view::npos ) {
            headers->emplace_back( std::string( trim( line.substr( 0, colon ) ) ),
                                   std::string( trim( line.substr( colon + 1 ) ) ) );
        }
        return nBytes;
    }

private:
    CURL* m_handle{ nullptr };
};


/**
 * Hands out curl handles to workers so that each concurrently running request has its own handle while
 * finished handles, and their open connections, get reused.
 */
class CurlHandlePool
{
public:
    class Lease
    {
    public:
        Lease( CurlHandlePool&             pool,
               std::unique_ptr<CurlHandle> handle ) :
            m_pool( pool ),
            m_handle( std::move( handle ) )
        {}

        ~Lease()
        {
            m_pool.giveBack( std::move( m_handle ) );
        }

        Lease( const Lease& ) = delete;
        Lease( Lease&& ) = delete;
        Lease& operator=( const Lease& ) = delete;
        Lease& operator=( Lease&& ) = delete;

        [[nodiscard]] CurlHandle&
        operator*() const noexcept
        {
            return *m_handle;
        }

        [[nodiscard]] CurlHandle*
        operator->() const noexcept
        {
            return m_handle.get();
        }

    private:
        CurlHandlePool& m_pool;
        std::unique_ptr<CurlHandle> m_handle;
    };

public:
    [[nodiscard]] std::unique_ptr<Lease>
    acquire()
    {
        {
            const std::lock_guard lock( m_mutex );
            if ( !m_idleHandles.empty() ) {
                auto handle = std::move( m_idleHandles.back() );
                m_idleHandles.pop_back();
                return std::make_unique<Lease>( *this, std::move( handle ) );
            }
        }
        return std::make_unique<Lease>( *this, std::make_unique<CurlHandle>() );
    }

    void
    clear()
    {
        const std::lock_guard lock( m_mutex );
        m_idleHandles.clear();
    }

private:
    void
    giveBack( std::unique_ptr<CurlHandle> handle )
    {
        const std::lock_guard lock( m_mutex );
        m_idleHandles.emplace_back( std::move( handle ) );
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<CurlHandle> > m_idleHandles;
};


[[nodiscard]] inline bool
isSuccessStatus( long status ) noexcept
{
    return ( status >= 200 ) && ( status < 300 );
}


/**
 * Checks that the resource exists with a HEAD request.
 * @return The Content-Length if the server reported one.
 * @throws ResourceUnavailable if the host is unreachable or the status is not 2xx.
 */
[[nodiscard]] inline std::optional<size_t>
checkResource( CurlHandle&                                          handle,
               const std::string&                                   url,
               const std::optional<std::chrono::duration<double> >& timeout )
{
    HttpRequest request;
    request.url = url;
    request.head = true;
    request.timeout = timeout;

    const auto response = handle.perform( request );
    if ( !response.transferSucceeded() ) {
        throw ResourceUnavailable( "Could not reach " + url + ": " + response.transferError );
    }
    if ( !isSuccessStatus( response.status ) ) {
        std::stringstream message;
        message << "Server refused " << url << " with HTTP status " << response.status << "!";
        throw ResourceUnavailable( std::move( message ).str() );
    }
    return response.contentLength();
}


/**
 * @throws Timeout or FetchError if the transfer did not complete.
 */
inline void
throwOnTransferError( const HttpResponse& response,
                      const std::string&  url,
                      const std::string&  what )
{
    if ( response.transferSucceeded() ) {
        return;
    }

    std::stringstream message;
    message << "Fetching " << what << " from " << url << " failed: " << response.transferError;
    if ( response.timedOut() ) {
        throw Timeout( std::move( message ).str() );
    }
    throw FetchError( std::move( message ).str() );
}


/**
 * Formats ranges as a Range header value without the "bytes=" prefix. The HTTP ranges are inclusive.
 */
[[nodiscard]] inline std::string
formatRangeHeader( const std::vector<ByteRange>& ranges )
{
    std::stringstream result;
    for ( size_t i = 0; i < ranges.size(); ++i ) {
        if ( ranges[i].size() == 0 ) {
            throw std::invalid_argument( "Empty ranges cannot be expressed in a Range header!" );
        }
        if ( i > 0 ) {
            result << ",";
        }
        result << ranges[i].start << "-" << ranges[i].stop - 1;
    }
    return std::move( result ).str();
}
}  // namespace chunkio::http
