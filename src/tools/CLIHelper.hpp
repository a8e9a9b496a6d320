#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <cxxopts.hpp>

#include <core/common.hpp>
#include <chunkio/Chunk.hpp>
#include <chunkio/Source.hpp>


template<typename T>
[[nodiscard]] std::optional<T>
getOptional( cxxopts::ParseResult const& parsedArgs,
             std::string          const& argument )
{
    if ( parsedArgs.count( argument ) > 0 ) {
        return parsedArgs[argument].as<T>();
    }
    return std::nullopt;
}


/**
 * Parses "start:stop" with decimal, non-negative offsets.
 */
[[nodiscard]] inline chunkio::ByteRange
parseByteRange( std::string_view text )
{
    const auto parseOffset =
        [text] ( std::string_view number ) {
            if ( number.empty() || ( number.find_first_not_of( "0123456789" ) != std::string_view::npos ) ) {
                throw std::invalid_argument( "Invalid offset '" + std::string( number ) + "' in range: "
                                             + std::string( text ) );
            }
            try {
                return static_cast<size_t>( std::stoull( std::string( number ) ) );
            } catch ( const std::out_of_range& ) {
                throw std::invalid_argument( "Offset is too large in range: " + std::string( text ) );
            }
        };

    const auto separator = text.find( ':' );
    if ( separator == std::string_view::npos ) {
        throw std::invalid_argument( "Expected a range in the form start:stop but got: " + std::string( text ) );
    }

    const chunkio::ByteRange range{ parseOffset( chunkio::trim( text.substr( 0, separator ) ) ),
                                    parseOffset( chunkio::trim( text.substr( separator + 1 ) ) ) };
    if ( range.start > range.stop ) {
        throw std::invalid_argument( "Range start is larger than its stop: " + std::string( text ) );
    }
    return range;
}


/**
 * Sets the handler for the backend family named by @p name, e.g., "vector" selects the XRootD vector read.
 */
inline void
applyHandler( std::string_view          name,
              chunkio::SourceOptions& options )
{
    using namespace chunkio;

    const auto lowered = toLower( name );
    if ( lowered == "file" ) {
        options.fileHandler = FileHandler::FILE;
    } else if ( lowered == "memmap" ) {
        options.fileHandler = FileHandler::MEMMAP;
    } else if ( lowered == "http" ) {
        options.httpHandler = HttpHandler::MULTITHREADED;
    } else if ( lowered == "multipart" ) {
        options.httpHandler = HttpHandler::MULTIPART;
    } else if ( lowered == "xrootd" ) {
        options.xrootdHandler = XRootDHandler::MULTITHREADED;
    } else if ( lowered == "vector" ) {
        options.xrootdHandler = XRootDHandler::VECTOR_READ;
    } else {
        throw std::invalid_argument( "Unknown handler: " + std::string( name )
                                     + "! Possible values: file, memmap, http, multipart, xrootd, vector" );
    }
}
