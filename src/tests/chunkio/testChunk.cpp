#include <cstddef>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <chunkio/Chunk.hpp>
#include <chunkio/Cursor.hpp>


using namespace chunkio;


[[nodiscard]] std::vector<std::byte>
toBytes( std::string_view text )
{
    std::vector<std::byte> result( text.size() );
    for ( size_t i = 0; i < text.size(); ++i ) {
        result[i] = static_cast<std::byte>( text[i] );
    }
    return result;
}


void
testByteRange()
{
    const ByteRange range{ 10, 15 };
    REQUIRE_EQUAL( range.size(), 5U );
    REQUIRE( range == ByteRange( { 10, 15 } ) );
    REQUIRE( range != ByteRange( { 10, 16 } ) );
    REQUIRE_EQUAL( toString( range ), std::string( "[10, 15)" ) );
    REQUIRE_EQUAL( ByteRange{}.size(), 0U );
}


void
testConstruction()
{
    const Chunk chunk( 100, 105, toBytes( "hello" ) );
    REQUIRE_EQUAL( chunk.start(), 100U );
    REQUIRE_EQUAL( chunk.stop(), 105U );
    REQUIRE_EQUAL( chunk.size(), 5U );
    REQUIRE_EQUAL( chunk.range(), ByteRange( { 100, 105 } ) );
    REQUIRE_EQUAL( chunk.rawData().toStringView(), std::string_view( "hello" ) );

    const Chunk empty( 7, 7, std::vector<std::byte>() );
    REQUIRE_EQUAL( empty.size(), 0U );
    REQUIRE( empty.contains( 7, 7 ) );

    /* The buffer must hold exactly the bytes of the range. */
    REQUIRE_THROWS_AS( Chunk( 0, 4, toBytes( "hello" ) ), InvariantViolation );
    REQUIRE_THROWS_AS( Chunk( 0, 6, toBytes( "hello" ) ), InvariantViolation );
    REQUIRE_THROWS_AS( Chunk( 5, 0, toBytes( "hello" ) ), InvariantViolation );
    REQUIRE_THROWS_AS( Chunk::view( 0, 1, nullptr, nullptr, 1 ), InvariantViolation );
}


void
testAbsoluteAccess()
{
    const Chunk chunk( 100, 110, toBytes( "0123456789" ) );

    REQUIRE( chunk.contains( 100, 110 ) );
    REQUIRE( chunk.contains( 105, 105 ) );
    REQUIRE( !chunk.contains( 99, 101 ) );
    REQUIRE( !chunk.contains( 109, 111 ) );
    REQUIRE( !chunk.contains( 105, 104 ) );

    REQUIRE_EQUAL( chunk.get( 100, 103 ).toStringView(), std::string_view( "012" ) );
    REQUIRE_EQUAL( chunk.get( 107, 110 ).toStringView(), std::string_view( "789" ) );
    REQUIRE_EQUAL( chunk.remainder( 108 ).toStringView(), std::string_view( "89" ) );
    REQUIRE_EQUAL( chunk.remainder( 110 ).size(), 0U );

    REQUIRE_THROWS_AS( chunk.get( 0, 3 ), InvariantViolation );
    REQUIRE_THROWS_AS( chunk.get( 108, 111 ), InvariantViolation );
    REQUIRE_THROWS_AS( chunk.remainder( 111 ), InvariantViolation );
}


void
testSharing()
{
    auto buffer = std::make_shared<std::vector<std::byte> >( toBytes( "abcdef" ) );
    std::weak_ptr<std::vector<std::byte> > observer = buffer;

    auto chunk = std::make_unique<Chunk>( Chunk::view( 20, 26, buffer, buffer->data(), buffer->size() ) );
    buffer.reset();
    REQUIRE( !observer.expired() );

    const auto slice = chunk->slice( 22, 24 );
    REQUIRE_EQUAL( slice.range(), ByteRange( { 22, 24 } ) );
    REQUIRE_EQUAL( slice.rawData().toStringView(), std::string_view( "cd" ) );
    REQUIRE( slice.data() == chunk->data() + 2 );

    const auto copy = *chunk;
    REQUIRE( copy.data() == chunk->data() );

    /* The slice and the copy keep the memory alive. */
    chunk.reset();
    REQUIRE( !observer.expired() );
    REQUIRE_EQUAL( slice.rawData().toStringView(), std::string_view( "cd" ) );
}


void
testCursor()
{
    /* 0x0102 as big-endian uint16, then a short string, then a uint32. */
    std::vector<std::byte> data = {
        std::byte( 0x01 ), std::byte( 0x02 ),
        std::byte( 3 ), std::byte( 'a' ), std::byte( 'b' ), std::byte( 'c' ),
        std::byte( 0x00 ), std::byte( 0x00 ), std::byte( 0x01 ), std::byte( 0x00 ),
    };
    const Chunk chunk( 1000, 1010, std::move( data ) );

    Cursor cursor( 1000 );
    REQUIRE_EQUAL( cursor.field<uint16_t>( chunk ), uint16_t( 0x0102 ) );
    REQUIRE_EQUAL( cursor.index(), 1002U );

    auto copy = cursor.copy();
    REQUIRE_EQUAL( cursor.string( chunk ), std::string( "abc" ) );
    REQUIRE_EQUAL( cursor.index(), 1006U );
    REQUIRE_EQUAL( copy.index(), 1002U );

    REQUIRE_EQUAL( cursor.field<uint32_t>( chunk ), uint32_t( 256 ) );
    REQUIRE_EQUAL( cursor.index(), 1010U );

    /* Reading past the end of the chunk is a programming error. */
    REQUIRE_THROWS_AS( cursor.field<uint8_t>( chunk ), InvariantViolation );
    REQUIRE_EQUAL( cursor.index(), 1010U );

    cursor.moveTo( 1003 );
    REQUIRE_EQUAL( cursor.bytes( chunk, 3 ).toStringView(), std::string_view( "abc" ) );

    cursor.moveTo( 999 );
    REQUIRE_THROWS_AS( cursor.bytes( chunk, 2 ), InvariantViolation );

    copy.skip( 1 );
    REQUIRE_EQUAL( copy.bytes( chunk, 1 ).toStringView(), std::string_view( "a" ) );

    Cursor overflowing( 1005 );
    REQUIRE_THROWS_AS( overflowing.bytes( chunk, std::numeric_limits<size_t>::max() ), InvariantViolation );
}


void
testLongCursorString()
{
    std::vector<std::byte> data = { std::byte( 255 ), std::byte( 0 ), std::byte( 0 ), std::byte( 1 ), std::byte( 44 ) };
    const std::string expected( 300, 'x' );
    for ( const auto c : expected ) {
        data.push_back( static_cast<std::byte>( c ) );
    }
    const auto size = data.size();
    const Chunk chunk( 0, size, std::move( data ) );

    Cursor cursor;
    REQUIRE_EQUAL( cursor.string( chunk ), expected );
    REQUIRE_EQUAL( cursor.index(), size );
}


int
main()
{
    testByteRange();
    testConstruction();
    testAbsoluteAccess();
    testSharing();
    testCursor();
    testLongCursorString();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
