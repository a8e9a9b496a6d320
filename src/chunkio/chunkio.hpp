#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <core/common.hpp>
#include <core/Error.hpp>

#include "Chunk.hpp"
#include "ChunkFuture.hpp"
#include "Cursor.hpp"
#include "Source.hpp"
#include "file/FileSource.hpp"
#include "file/MemmapSource.hpp"
#include "http/HTTPSource.hpp"
#include "http/MultithreadedHTTPSource.hpp"
#include "xrootd/VectorRead.hpp"

#ifdef CHUNKIO_WITH_XROOTD
    #include "xrootd/MultithreadedXRootDSource.hpp"
    #include "xrootd/XRootDSource.hpp"
#endif


namespace chunkio
{
/**
 * @return The lower-case URL scheme, e.g., "http", or an empty string for plain paths.
 */
[[nodiscard]] inline std::string
urlScheme( std::string_view identity )
{
    const auto separator = identity.find( "://" );
    if ( separator == std::string_view::npos ) {
        return {};
    }
    return toLower( identity.substr( 0, separator ) );
}


[[nodiscard]] inline bool
supportsXRootD() noexcept
{
#ifdef CHUNKIO_WITH_XROOTD
    return true;
#else
    return false;
#endif
}


/**
 * Opens the backend matching the URL scheme of @p identity. Paths without scheme are local files.
 * The handler options choose between the variants of each backend.
 *
 * @throws std::invalid_argument for unknown schemes.
 * @throws ResourceUnavailable if the resource cannot be opened or XRootD support was not compiled in.
 */
[[nodiscard]] inline std::unique_ptr<Source>
openSource( const std::string& identity,
            SourceOptions      options = {} )
{
    const auto scheme = urlScheme( identity );

    if ( scheme.empty() || ( scheme == "file" ) ) {
        const auto path = scheme.empty() ? identity : identity.substr( std::string_view( "file://" ).size() );
        if ( options.fileHandler == FileHandler::FILE ) {
            return std::make_unique<FileSource>( path, std::move( options ) );
        }
        return std::make_unique<MemmapSource>( path, std::move( options ) );
    }

    if ( ( scheme == "http" ) || ( scheme == "https" ) ) {
        if ( options.httpHandler == HttpHandler::MULTITHREADED ) {
            return std::make_unique<MultithreadedHTTPSource>( identity, std::move( options ) );
        }
        return std::make_unique<HTTPSource>( identity, std::move( options ) );
    }

    if ( scheme == "root" ) {
    #ifdef CHUNKIO_WITH_XROOTD
        if ( options.xrootdHandler == XRootDHandler::MULTITHREADED ) {
            return std::make_unique<MultithreadedXRootDSource>( identity, std::move( options ) );
        }
        return std::make_unique<XRootDSource>( identity, std::move( options ) );
    #else
        throw ResourceUnavailable( "Cannot open " + identity + " because chunkio was built without XRootD!" );
    #endif
    }

    throw std::invalid_argument( "Unsupported URL scheme '" + scheme + "' in: " + identity );
}
}  // namespace chunkio
