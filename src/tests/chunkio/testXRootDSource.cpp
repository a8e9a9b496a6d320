#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <chunkio/xrootd/MultithreadedXRootDSource.hpp>
#include <chunkio/xrootd/XRootDSource.hpp>


using namespace chunkio;


/* Overlapping, out of order, empty, and larger than the element size limit used below. */
const std::vector<ByteRange> TEST_RANGES = {
    { 0, 4 }, { 1, 5 }, { 100, 110 }, { 50, 50 }, { 0, 64 }, { 7, 9 }
};


[[nodiscard]] std::vector<std::string>
readAll( Source&                       source,
         const std::vector<ByteRange>& ranges )
{
    std::vector<std::string> result;
    auto futures = source.chunks( ranges );
    for ( size_t i = 0; i < futures.size(); ++i ) {
        const auto& chunk = futures[i].resolve();
        REQUIRE_EQUAL( chunk.range(), ranges[i] );
        result.emplace_back( chunk.rawData().toStringView() );
    }
    return result;
}


void
testMultithreaded( const std::string& url )
{
    for ( const size_t numWorkers : { 0U, 1U, 4U } ) {
        SourceOptions options;
        options.numWorkers = numWorkers;
        MultithreadedXRootDSource source( url, options );

        REQUIRE( source.numBytes().value_or( 0 ) > 0 );
        const auto head = source.chunk( 0, 4 ).resolve();
        REQUIRE_EQUAL( head.rawData().toStringView(), std::string_view( "root" ) );

        source.close();
        REQUIRE_THROWS_AS( source.chunk( 0, 4 ), StateError );
    }
}


void
testVectorRead( const std::string& url )
{
    SourceOptions referenceOptions;
    referenceOptions.numWorkers = 2;
    MultithreadedXRootDSource reference( url, referenceOptions );
    const auto expected = readAll( reference, TEST_RANGES );

    /* Server limits. */
    {
        XRootDSource source( url );
        REQUIRE( source.maxElementSize().has_value() );
        REQUIRE( readAll( source, TEST_RANGES ) == expected );
        REQUIRE_EQUAL( source.statistics().numRequestedChunks, TEST_RANGES.size() );
    }

    /* Tight limits force splitting into several batches and elements. */
    for ( const size_t numFallbackWorkers : { 0U, 3U } ) {
        SourceOptions options;
        options.maxNumElements = 2;
        options.maxElementSize = 3;
        options.numFallbackWorkers = numFallbackWorkers;
        XRootDSource source( url, options );

        REQUIRE_EQUAL( source.maxNumElements().value_or( 0 ), 2U );
        REQUIRE_EQUAL( source.maxElementSize().value_or( 0 ), 3U );
        REQUIRE( readAll( source, TEST_RANGES ) == expected );
        REQUIRE( source.statistics().numRequests > 1 );
    }

    /* The server may reject the whole vector read, so only the failure itself is checked. */
    XRootDSource source( url );
    const auto size = source.numBytes().value_or( 0 );
    const auto beyondEnd = source.chunk( size - 2, size + 10 );
    REQUIRE_THROWS_AS( beyondEnd.resolve(), SourceError );

    /* Later requests are not affected. */
    REQUIRE_EQUAL( source.chunk( 0, 4 ).resolve().rawData().toStringView(), std::string_view( "root" ) );
}


void
testOpenErrors( const std::string& url )
{
    const auto missing = url + ".does-not-exist";
    REQUIRE_THROWS_AS( XRootDSource( missing ), ResourceUnavailable );
    REQUIRE_THROWS_AS( MultithreadedXRootDSource( missing ), ResourceUnavailable );
}


int
main()
{
    /* Needs a reachable server with a ROOT file, e.g.,
     * root://eospublic.cern.ch//eos/root-eos/cms_opendata_2012_nanoaod/Run2012B_DoubleMuParked.root */
    const auto* const url = std::getenv( "CHUNKIO_XROOTD_TEST_URL" );
    if ( ( url == nullptr ) || ( std::string_view( url ).empty() ) ) {
        std::cerr << "Skipping XRootD tests because CHUNKIO_XROOTD_TEST_URL is not set.\n";
        return 0;
    }

    testMultithreaded( url );
    testVectorRead( url );
    testOpenErrors( url );

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
