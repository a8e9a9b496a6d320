#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <chunkio/chunkio.hpp>

#include "LocalHttpServer.hpp"


using namespace chunkio;


template<typename Expected>
[[nodiscard]] bool
isInstanceOf( const std::unique_ptr<Source>& source )
{
    return dynamic_cast<const Expected*>( source.get() ) != nullptr;
}


void
testUrlScheme()
{
    REQUIRE_EQUAL( urlScheme( "/tmp/file.root" ), std::string() );
    REQUIRE_EQUAL( urlScheme( "relative/file.root" ), std::string() );
    REQUIRE_EQUAL( urlScheme( "file:///tmp/file.root" ), std::string( "file" ) );
    REQUIRE_EQUAL( urlScheme( "HTTPS://example.com/file.root" ), std::string( "https" ) );
    REQUIRE_EQUAL( urlScheme( "root://eospublic.cern.ch//eos/file.root" ), std::string( "root" ) );
}


void
testLocalFiles( const std::string& path )
{
    auto source = openSource( path );
    REQUIRE( isInstanceOf<MemmapSource>( source ) );
    REQUIRE_EQUAL( source->identity(), path );
    REQUIRE_EQUAL( source->chunk( 0, 6 ).resolve().rawData().toStringView(), std::string_view( "******" ) );

    SourceOptions options;
    options.fileHandler = FileHandler::FILE;
    options.numWorkers = 2;
    source = openSource( path, options );
    REQUIRE( isInstanceOf<FileSource>( source ) );
    REQUIRE_EQUAL( source->options().numWorkers, 2U );
    REQUIRE_EQUAL( source->chunk( 25, 30 ).resolve().rawData().toStringView(), std::string_view( "@@@@@" ) );

    source = openSource( "file://" + path );
    REQUIRE( isInstanceOf<MemmapSource>( source ) );
    REQUIRE_EQUAL( source->numBytes().value_or( 0 ), TEST_FILE_CONTENTS.size() );

    REQUIRE_THROWS_AS( openSource( path + ".missing" ), ResourceUnavailable );
}


void
testHttp()
{
    LocalHttpServer server;
    server.addFile( "/test.bin", std::string( TEST_FILE_CONTENTS ) );

    auto source = openSource( server.url( "/test.bin" ) );
    REQUIRE( isInstanceOf<HTTPSource>( source ) );
    REQUIRE_EQUAL( source->chunk( 6, 10 ).resolve().rawData().toStringView(), std::string_view( "    " ) );

    SourceOptions options;
    options.httpHandler = HttpHandler::MULTITHREADED;
    source = openSource( server.url( "/test.bin" ), options );
    REQUIRE( isInstanceOf<MultithreadedHTTPSource>( source ) );
    REQUIRE_EQUAL( source->chunk( 10, 13 ).resolve().rawData().toStringView(), std::string_view( "..." ) );
    source.reset();

    REQUIRE_THROWS_AS( openSource( server.url( "/missing.bin" ) ), ResourceUnavailable );
}


void
testUnsupportedSchemes()
{
    REQUIRE_THROWS_AS( openSource( "ftp://example.com/file.root" ), std::invalid_argument );
    REQUIRE_THROWS_AS( openSource( "s3://bucket/file.root" ), std::invalid_argument );

    if ( !supportsXRootD() ) {
        REQUIRE_THROWS_AS( openSource( "root://eospublic.cern.ch//eos/file.root" ), ResourceUnavailable );
    }
}


int
main()
{
    const auto tmpFolder = createTemporaryDirectory( "chunkio.testOpenSource" );
    const auto path = std::filesystem::absolute( tmpFolder.path() / "test.bin" );
    writeFile( path, TEST_FILE_CONTENTS );

    testUrlScheme();
    testLocalFiles( path.string() );
    testHttp();
    testUnsupportedSchemes();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
