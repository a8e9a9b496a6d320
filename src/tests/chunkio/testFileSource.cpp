#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <chunkio/file/FileSource.hpp>


using namespace chunkio;


const std::vector<ByteRange> TEST_RANGES = {
    { 0, 6 }, { 6, 10 }, { 10, 13 }, { 13, 20 }, { 20, 25 }, { 25, 30 }
};

const std::vector<std::string_view> EXPECTED_CONTENTS = {
    "******", "    ", "...", "+++++++", "!!!!!", "@@@@@"
};


void
testReadRanges( const std::filesystem::path& path,
                size_t                       numWorkers )
{
    SourceOptions options;
    options.numWorkers = numWorkers;
    FileSource source( path.string(), options );

    REQUIRE_EQUAL( source.numBytes().value_or( 0 ), TEST_FILE_CONTENTS.size() );
    REQUIRE_EQUAL( std::string( toString( source.state() ) ), std::string( "open" ) );

    auto futures = source.chunks( TEST_RANGES );
    REQUIRE_EQUAL( futures.size(), TEST_RANGES.size() );
    for ( size_t i = 0; i < futures.size(); ++i ) {
        const auto& chunk = futures[i].resolve();
        REQUIRE_EQUAL( chunk.range(), TEST_RANGES[i] );
        REQUIRE_EQUAL( chunk.rawData().toStringView(), EXPECTED_CONTENTS[i] );
    }

    /* Single requests in reverse order. */
    for ( size_t i = TEST_RANGES.size(); i > 0; --i ) {
        const auto& range = TEST_RANGES[i - 1];
        const auto future = source.chunk( range.start, range.stop );
        REQUIRE_EQUAL( future.resolve().rawData().toStringView(), EXPECTED_CONTENTS[i - 1] );
    }

    const auto statistics = source.statistics();
    REQUIRE_EQUAL( statistics.numRequests, 2 * TEST_RANGES.size() );
    REQUIRE_EQUAL( statistics.numRequestedChunks, 2 * TEST_RANGES.size() );
    REQUIRE_EQUAL( statistics.numRequestedBytes, 2 * TEST_FILE_CONTENTS.size() );
}


void
testEdgeCases( const std::filesystem::path& path )
{
    FileSource source( path.string() );

    const auto empty = source.chunk( 5, 5 );
    REQUIRE_EQUAL( empty.resolve().size(), 0U );
    REQUIRE_EQUAL( empty.resolve().range(), ByteRange( { 5, 5 } ) );

    REQUIRE_THROWS_AS( source.chunk( 10, 5 ), std::invalid_argument );
    REQUIRE_THROWS_AS( source.chunks( { { 0, 1 }, { 3, 2 } } ), std::invalid_argument );

    /* Ranges beyond the end of the file fail on their own without affecting the others. */
    auto futures = source.chunks( { { 25, 40 }, { 0, 6 } } );
    REQUIRE_THROWS_AS( futures[0].resolve(), FetchError );
    try {
        (void)futures[0].resolve();
    } catch ( const FetchError& exception ) {
        REQUIRE( exception.error() == Error::LENGTH_MISMATCH );
    }
    REQUIRE_EQUAL( futures[1].resolve().rawData().toStringView(), std::string_view( "******" ) );

    REQUIRE( source.chunks( {} ).empty() );
}


void
testClose( const std::filesystem::path& path )
{
    FileSource source( path.string() );
    const auto future = source.chunk( 0, 6 );
    REQUIRE_EQUAL( future.resolve().rawData().toStringView(), std::string_view( "******" ) );

    source.close();
    REQUIRE( source.closed() );
    REQUIRE_EQUAL( std::string( toString( source.state() ) ), std::string( "closed" ) );

    /* Closing is idempotent. */
    source.close();

    REQUIRE_THROWS_AS( source.chunk( 0, 1 ), StateError );
    REQUIRE_THROWS_AS( source.chunks( { { 0, 1 } } ), StateError );

    /* Chunks own their bytes and stay valid. */
    REQUIRE_EQUAL( future.resolve().rawData().toStringView(), std::string_view( "******" ) );
}


void
testOpenErrors( const std::filesystem::path& folder )
{
    REQUIRE_THROWS_AS( FileSource( ( folder / "does-not-exist" ).string() ), ResourceUnavailable );
    REQUIRE_THROWS_AS( FileSource( folder.string() ), ResourceUnavailable );

    try {
        FileSource source( ( folder / "does-not-exist" ).string() );
    } catch ( const SourceError& exception ) {
        REQUIRE( exception.error() == Error::RESOURCE_UNAVAILABLE );
        REQUIRE( std::string_view( exception.what() ).find( "does-not-exist" ) != std::string_view::npos );
    }
}


void
testEmptyFile( const std::filesystem::path& path )
{
    FileSource source( path.string() );
    REQUIRE_EQUAL( source.numBytes().value_or( 1 ), 0U );
    REQUIRE_EQUAL( source.chunk( 0, 0 ).resolve().size(), 0U );
    REQUIRE_THROWS_AS( source.chunk( 0, 1 ).resolve(), FetchError );
}


int
main()
{
    const auto tmpFolder = createTemporaryDirectory( "chunkio.testFileSource" );
    const auto path = tmpFolder.path() / "test.bin";
    writeFile( path, TEST_FILE_CONTENTS );
    const auto emptyPath = tmpFolder.path() / "empty.bin";
    writeFile( emptyPath, {} );

    for ( const size_t numWorkers : { 0, 1, 2 } ) {
        testReadRanges( path, numWorkers );
    }
    testEdgeCases( path );
    testClose( path );
    testOpenErrors( tmpFolder.path() );
    testEmptyFile( emptyPath );

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
