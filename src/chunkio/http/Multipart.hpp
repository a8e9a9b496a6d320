#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <chunkio/Chunk.hpp>


namespace chunkio::http
{
/**
 * Value of a Content-Range header, e.g., "bytes 0-99/1270". @ref last is inclusive like in HTTP.
 */
struct ContentRange
{
    size_t first{ 0 };
    size_t last{ 0 };
    std::optional<size_t> total;

    [[nodiscard]] ByteRange
    range() const noexcept
    {
        return { first, last + 1 };
    }
};


namespace detail
{
/**
 * Parses a decimal number at the start of @p text and removes it from @p text.
 */
[[nodiscard]] inline std::optional<size_t>
consumeNumber( std::string_view& text )
{
    size_t result{ 0 };
    size_t nDigits{ 0 };
    for ( ; ( nDigits < text.size() ) && ( text[nDigits] >= '0' ) && ( text[nDigits] <= '9' ); ++nDigits ) {
        const auto digit = static_cast<size_t>( text[nDigits] - '0' );
        if ( result > ( std::numeric_limits<size_t>::max() - digit ) / 10 ) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }

    if ( nDigits == 0 ) {
        return std::nullopt;
    }
    text.remove_prefix( nDigits );
    return result;
}


[[nodiscard]] inline bool
consumeCharacter( std::string_view& text,
                  char              character )
{
    if ( text.empty() || ( text.front() != character ) ) {
        return false;
    }
    text.remove_prefix( 1 );
    return true;
}
}  // namespace detail


/**
 * @throws ProtocolError if @p value is not of the form "bytes first-last/total" or "bytes first-last/\*".
 */
[[nodiscard]] inline ContentRange
parseContentRange( std::string_view value )
{
    const auto throwMalformed =
        [value] () {
            throw ProtocolError( "Malformed Content-Range header: '" + std::string( value ) + "'!" );
        };

    auto text = trim( value );
    if ( !startsWith( text, std::string_view( "bytes" ), /* case-sensitive */ false ) ) {
        throwMalformed();
    }
    text.remove_prefix( 5 );
    text = trim( text );

    ContentRange result;
    const auto first = detail::consumeNumber( text );
    if ( !first || !detail::consumeCharacter( text, '-' ) ) {
        throwMalformed();
    }
    const auto last = detail::consumeNumber( text );
    if ( !last || !detail::consumeCharacter( text, '/' ) ) {
        throwMalformed();
    }

    if ( !detail::consumeCharacter( text, '*' ) ) {
        result.total = detail::consumeNumber( text );
        if ( !result.total ) {
            throwMalformed();
        }
    }

    if ( !text.empty() || ( *last < *first ) ) {
        throwMalformed();
    }

    result.first = *first;
    result.last = *last;
    return result;
}


/**
 * @return The boundary parameter of a "multipart/byteranges" Content-Type, or nothing for other content types.
 */
[[nodiscard]] inline std::optional<std::string>
parseMultipartBoundary( std::string_view contentType )
{
    const auto parameters = split( contentType, ';' );
    if ( parameters.empty() || ( toLower( trim( parameters.front() ) ) != "multipart/byteranges" ) ) {
        return std::nullopt;
    }

    for ( size_t i = 1; i < parameters.size(); ++i ) {
        const auto parameter = trim( parameters[i] );
        const auto equalSign = parameter.find( '=' );
        if ( ( equalSign == std::string_view::npos )
             || ( toLower( trim( parameter.substr( 0, equalSign ) ) ) != "boundary" ) ) {
            continue;
        }

        auto boundary = trim( parameter.substr( equalSign + 1 ) );
        if ( ( boundary.size() >= 2 ) && ( boundary.front() == '"' ) && ( boundary.back() == '"' ) ) {
            boundary = boundary.substr( 1, boundary.size() - 2 );
        }
        if ( boundary.empty() ) {
            break;
        }
        return std::string( boundary );
    }

    throw ProtocolError( "Multipart Content-Type without boundary: '" + std::string( contentType ) + "'!" );
}


/**
 * Splits a multipart/byteranges body into one chunk per part. The chunks are views into @p body.
 * The part data is taken by the length declared in its Content-Range header and must be followed
 * directly by the next delimiter.
 *
 * @throws ProtocolError for malformed bodies, parts without Content-Range, or parts whose data length
 *         differs from their declared range.
 */
[[nodiscard]] inline std::vector<Chunk>
parseMultipartByteRanges( const std::shared_ptr<const std::vector<std::byte> >& body,
                          std::string_view                                      boundary )
{
    if ( !body ) {
        throw std::invalid_argument( "Multipart body must not be null!" );
    }

    const std::string_view text( reinterpret_cast<const char*>( body->data() ), body->size() );
    const auto delimiter = "--" + std::string( boundary );

    auto position = text.find( delimiter );
    if ( position == std::string_view::npos ) {
        throw ProtocolError( "Multipart body does not contain the boundary '" + std::string( boundary ) + "'!" );
    }

    const auto findLineEnd =
        [&text] ( size_t from ) {
            const auto lineEnd = text.find( '\n', from );
            if ( lineEnd == std::string_view::npos ) {
                throw ProtocolError( "Multipart body is truncated inside the part headers!" );
            }
            return lineEnd;
        };

    std::vector<Chunk> parts;
    while ( true ) {
        position += delimiter.size();
        if ( text.substr( position, 2 ) == "--" ) {
            break;
        }

        /* Skip possible transport padding after the delimiter. */
        position = findLineEnd( position ) + 1;

        std::optional<ContentRange> contentRange;
        while ( true ) {
            const auto lineEnd = findLineEnd( position );
            const auto line = trim( text.substr( position, lineEnd - position ) );
            position = lineEnd + 1;
            if ( line.empty() ) {
                break;
            }

            const auto colon = line.find( ':' );
            if ( ( colon != std::string_view::npos )
                 && ( toLower( trim( line.substr( 0, colon ) ) ) == "content-range" ) ) {
                contentRange = parseContentRange( line.substr( colon + 1 ) );
            }
        }

        if ( !contentRange ) {
            std::stringstream message;
            message << "Part " << parts.size() << " of the multipart body has no Content-Range header!";
            throw ProtocolError( std::move( message ).str() );
        }

        const auto range = contentRange->range();
        if ( range.size() > text.size() - position ) {
            std::stringstream message;
            message << "Multipart part " << range << " declares " << range.size() << " B but only "
                    << text.size() - position << " B are left in the body!";
            throw ProtocolError( std::move( message ).str() );
        }

        parts.emplace_back( Chunk::view( range.start, range.stop, body, body->data() + position, range.size() ) );
        position += range.size();

        if ( text.substr( position, 2 ) == "\r\n" ) {
            position += 2;
        } else if ( text.substr( position, 1 ) == "\n" ) {
            position += 1;
        }

        if ( text.substr( position, delimiter.size() ) != delimiter ) {
            std::stringstream message;
            message << "Data of multipart part " << range << " is longer than its declared range!";
            throw ProtocolError( std::move( message ).str() );
        }
    }

    return parts;
}


[[nodiscard]] inline std::vector<Chunk>
parseMultipartByteRanges( std::string_view body,
                          std::string_view boundary )
{
    const auto* const data = reinterpret_cast<const std::byte*>( body.data() );
    return parseMultipartByteRanges(
        std::make_shared<const std::vector<std::byte> >( data, data + body.size() ), boundary );
}


/**
 * Assigns received parts to requested ranges. A requested range is served by the part with exactly the same
 * range or else by any part containing it, which happens when the server coalesces ranges.
 *
 * @return One entry per requested range, empty if no part covers it.
 * @throws ProtocolError if a part covers none of the requested ranges.
 */
[[nodiscard]] inline std::vector<std::optional<Chunk> >
distributeParts( const std::vector<ByteRange>& requested,
                 const std::vector<Chunk>&     parts )
{
    for ( const auto& part : parts ) {
        const auto isRequested =
            std::any_of( requested.begin(), requested.end(),
                         [&part] ( const auto& range ) { return part.contains( range.start, range.stop ); } );
        if ( !isRequested ) {
            std::stringstream message;
            message << "The server returned the part " << part.range() << ", which was not requested!";
            throw ProtocolError( std::move( message ).str() );
        }
    }

    std::vector<std::optional<Chunk> > result( requested.size() );
    for ( size_t i = 0; i < requested.size(); ++i ) {
        const auto& range = requested[i];
        const Chunk* containing{ nullptr };
        for ( const auto& part : parts ) {
            if ( part.range() == range ) {
                containing = &part;
                break;
            }
            if ( ( containing == nullptr ) && part.contains( range.start, range.stop ) ) {
                containing = &part;
            }
        }

        if ( containing != nullptr ) {
            result[i] = containing->slice( range.start, range.stop );
        }
    }
    return result;
}
}  // namespace chunkio::http
