#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <chunkio/http/Curl.hpp>
#include <chunkio/http/Multipart.hpp>


using namespace chunkio;
using namespace chunkio::http;


void
testParseContentRange()
{
    auto range = parseContentRange( "bytes 0-99/1270" );
    REQUIRE_EQUAL( range.first, 0U );
    REQUIRE_EQUAL( range.last, 99U );
    REQUIRE( range.total.has_value() );
    REQUIRE_EQUAL( range.total.value_or( 0 ), 1270U );
    REQUIRE_EQUAL( range.range(), ByteRange( { 0, 100 } ) );

    range = parseContentRange( "  Bytes 50-54/*\r\n" );
    REQUIRE_EQUAL( range.range(), ByteRange( { 50, 55 } ) );
    REQUIRE( !range.total.has_value() );

    range = parseContentRange( "bytes 7-7/8" );
    REQUIRE_EQUAL( range.range().size(), 1U );

    REQUIRE_THROWS_AS( parseContentRange( "" ), ProtocolError );
    REQUIRE_THROWS_AS( parseContentRange( "items 0-1/2" ), ProtocolError );
    REQUIRE_THROWS_AS( parseContentRange( "bytes 0-/2" ), ProtocolError );
    REQUIRE_THROWS_AS( parseContentRange( "bytes -5/2" ), ProtocolError );
    REQUIRE_THROWS_AS( parseContentRange( "bytes 5-4/10" ), ProtocolError );
    REQUIRE_THROWS_AS( parseContentRange( "bytes 0-4/" ), ProtocolError );
    REQUIRE_THROWS_AS( parseContentRange( "bytes 0-4/10 trailing" ), ProtocolError );
    REQUIRE_THROWS_AS( parseContentRange( "bytes 99999999999999999999999-1/2" ), ProtocolError );
}


void
testParseBoundary()
{
    REQUIRE( !parseMultipartBoundary( "application/octet-stream" ).has_value() );
    REQUIRE( !parseMultipartBoundary( "" ).has_value() );
    REQUIRE_EQUAL( parseMultipartBoundary( "multipart/byteranges; boundary=3d6b6a416f9b5" ).value_or( "" ),
                   std::string( "3d6b6a416f9b5" ) );
    REQUIRE_EQUAL( parseMultipartBoundary( "Multipart/ByteRanges;Boundary=\"quoted one\"" ).value_or( "" ),
                   std::string( "quoted one" ) );
    REQUIRE_EQUAL( parseMultipartBoundary( "multipart/byteranges; charset=x; boundary=B" ).value_or( "" ),
                   std::string( "B" ) );

    REQUIRE_THROWS_AS( parseMultipartBoundary( "multipart/byteranges" ), ProtocolError );
    REQUIRE_THROWS_AS( parseMultipartBoundary( "multipart/byteranges; boundary=" ), ProtocolError );
}


void
testParseBody()
{
    /* Layout as sent by Apache, including the leading CRLF and a part containing CRLF-like data. */
    const std::string body =
        "\r\n--B\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Range: bytes 0-4/100\r\n"
        "\r\n"
        "Hello"
        "\r\n--B\r\n"
        "Content-Range: bytes 50-53/100\r\n"
        "\r\n"
        "\r\n--"
        "\r\n--B--\r\n";

    const auto parts = parseMultipartByteRanges( body, "B" );
    REQUIRE_EQUAL( parts.size(), 2U );
    if ( parts.size() == 2 ) {
        REQUIRE_EQUAL( parts[0].range(), ByteRange( { 0, 5 } ) );
        REQUIRE_EQUAL( parts[0].rawData().toStringView(), std::string_view( "Hello" ) );
        REQUIRE_EQUAL( parts[1].range(), ByteRange( { 50, 54 } ) );
        REQUIRE_EQUAL( parts[1].rawData().toStringView(), std::string_view( "\r\n--" ) );
    }

    /* Bare LF line endings and no preamble. */
    const std::string lfBody =
        "--B\n"
        "content-range: bytes 10-12/20\n"
        "\n"
        "abc\n"
        "--B--\n";
    const auto lfParts = parseMultipartByteRanges( lfBody, "B" );
    REQUIRE_EQUAL( lfParts.size(), 1U );
    if ( !lfParts.empty() ) {
        REQUIRE_EQUAL( lfParts[0].rawData().toStringView(), std::string_view( "abc" ) );
    }
}


void
testMalformedBodies()
{
    /* Missing boundary. */
    REQUIRE_THROWS_AS( parseMultipartByteRanges( "no delimiter", "B" ), ProtocolError );

    /* Part without Content-Range. */
    REQUIRE_THROWS_AS( parseMultipartByteRanges( "--B\r\nContent-Type: x\r\n\r\nabc\r\n--B--\r\n", "B" ),
                       ProtocolError );

    /* Truncated part data. */
    REQUIRE_THROWS_AS( parseMultipartByteRanges( "--B\r\nContent-Range: bytes 0-9/10\r\n\r\nabc", "B" ),
                       ProtocolError );

    /* More data than declared. */
    REQUIRE_THROWS_AS( parseMultipartByteRanges( "--B\r\nContent-Range: bytes 0-1/10\r\n\r\nabc\r\n--B--\r\n", "B" ),
                       ProtocolError );

    /* Truncated headers. */
    REQUIRE_THROWS_AS( parseMultipartByteRanges( "--B\r\nContent-Range: bytes 0-1/10", "B" ), ProtocolError );
}


void
testDistributeParts()
{
    const auto makePart =
        [] ( size_t start, std::string_view data ) {
            const auto* const bytes = reinterpret_cast<const std::byte*>( data.data() );
            return Chunk( start, start + data.size(), std::vector<std::byte>( bytes, bytes + data.size() ) );
        };

    /* Exact matches in different order. */
    auto result = distributeParts( { { 10, 13 }, { 0, 2 } }, { makePart( 0, "ab" ), makePart( 10, "xyz" ) } );
    REQUIRE_EQUAL( result.size(), 2U );
    REQUIRE( result[0].has_value() && ( result[0]->rawData().toStringView() == "xyz" ) );
    REQUIRE( result[1].has_value() && ( result[1]->rawData().toStringView() == "ab" ) );

    /* Coalesced part serving two requested ranges. */
    result = distributeParts( { { 0, 2 }, { 3, 5 } }, { makePart( 0, "abcde" ) } );
    REQUIRE( result[0].has_value() && ( result[0]->rawData().toStringView() == "ab" ) );
    REQUIRE( result[1].has_value() && ( result[1]->rawData().toStringView() == "de" ) );
    REQUIRE( result[1].has_value() && ( result[1]->range() == ByteRange{ 3, 5 } ) );

    /* Missing part. */
    result = distributeParts( { { 0, 2 }, { 10, 12 } }, { makePart( 0, "ab" ) } );
    REQUIRE( result[0].has_value() );
    REQUIRE( !result[1].has_value() );

    /* Unrequested part. */
    REQUIRE_THROWS_AS( distributeParts( { { 0, 2 } }, { makePart( 0, "ab" ), makePart( 5, "x" ) } ), ProtocolError );
}


void
testFormatRangeHeader()
{
    REQUIRE_EQUAL( formatRangeHeader( { { 0, 100 } } ), std::string( "0-99" ) );
    REQUIRE_EQUAL( formatRangeHeader( { { 0, 100 }, { 50, 55 }, { 200, 400 } } ), std::string( "0-99,50-54,200-399" ) );
    REQUIRE_THROWS_AS( formatRangeHeader( { { 5, 5 } } ), std::invalid_argument );
}


int
main()
{
    testParseContentRange();
    testParseBoundary();
    testParseBody();
    testMalformedBodies();
    testDistributeParts();
    testFormatRangeHeader();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
