#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

#include <core/common.hpp>
#include <chunkio/chunkio.hpp>

#include "CLIHelper.hpp"


struct Arguments
{
    std::string input;
    std::vector<chunkio::ByteRange> ranges;
    chunkio::SourceOptions sourceOptions;
    bool printSize{ false };
};


void
printChunkcatHelp( const cxxopts::Options& options )
{
    std::cout
    << options.help()
    << "\n"
    << "Ranges are half-open byte offsets start:stop. All ranges are requested at once and written to\n"
    << "standard output in the order given. Without ranges, the whole resource is written.\n"
    << "\n"
    << "Examples:\n"
    << "\n"
    << "Print the first 100 bytes of a remote file:\n"
    << "  chunkcat https://example.com/file.root 0:100\n"
    << "\n"
    << "Read two ranges with one XRootD vector read:\n"
    << "  chunkcat --handler vector root://eospublic.cern.ch//eos/file.root 0:4 1000:2000\n"
    << "\n"
    << "Print the size of a local file:\n"
    << "  chunkcat -s file.bin\n"
    << std::endl;
}


[[nodiscard]] std::vector<chunkio::ByteRange>
wholeResource( const chunkio::Source& source )
{
    const auto size = source.numBytes();
    if ( !size ) {
        throw std::invalid_argument( "The size of " + source.identity() + " is unknown. Please specify ranges!" );
    }
    return { chunkio::ByteRange{ 0, *size } };
}


int
writeRanges( const Arguments& args )
{
    using namespace chunkio;

    auto source = openSource( args.input, args.sourceOptions );
    source->setShowProfileOnDestruction( args.sourceOptions.verbose );

    if ( args.printSize ) {
        const auto size = source->numBytes();
        if ( size ) {
            std::cout << *size << "\n";
        } else {
            std::cout << "unknown\n";
        }
        return 0;
    }

    const auto ranges = args.ranges.empty() ? wholeResource( *source ) : args.ranges;
    auto futures = source->chunks( ranges );
    for ( auto& future : futures ) {
        const auto& chunk = future.resolve();
        std::cout.write( reinterpret_cast<const char*>( chunk.data() ),
                         static_cast<std::streamsize>( chunk.size() ) );
        if ( !std::cout ) {
            throw std::runtime_error( "Failed to write to standard output!" );
        }
    }
    std::cout.flush();

    source->close();
    return 0;
}


int
chunkcatCLI( int                  argc,
             char const * const * argv )
{
    /* Cleaned, checked, and typed arguments. */
    Arguments args;

    cxxopts::Options options( "chunkcat",
                              "Writes byte ranges of local files, HTTP resources, or XRootD files to standard output" );
    options.add_options( "Source Options" )
        ( "w,workers", "Number of threads fetching ranges in parallel. 0 fetches on the calling thread.",
          cxxopts::value<unsigned int>()->default_value( "1" ) )
        ( "fallback-workers", "Number of threads for secondary work, e.g., after a failed memory map, "
                              "a refused multipart request, or for concurrent vector read batches.",
          cxxopts::value<unsigned int>()->default_value( "0" ) )
        ( "t,timeout", "Timeout in seconds for each network operation and each range. "
                       "Values smaller or equal 0 wait forever.",
          cxxopts::value<double>()->default_value( "30" ) )
        ( "max-elements", "Maximum number of ranges per XRootD vector read. Queried from the server by default.",
          cxxopts::value<size_t>() )
        ( "max-element-size", "Maximum size in bytes per XRootD vector read element. "
                              "Queried from the server by default.",
          cxxopts::value<size_t>() )
        ( "handler", "Backend variant. Possible values: file, memmap, http, multipart, xrootd, vector. "
                     "May be given once per backend family.",
          cxxopts::value<std::vector<std::string> >() );

    options.add_options( "Output Options" )
        ( "h,help"   , "Print this help message." )
        ( "s,size"   , "Print the size of the resource in bytes and exit." )
        ( "v,verbose", "Print debug output and profiling statistics." );

    options.add_options( "Positional" )
        ( "input", "URL or path to read from.", cxxopts::value<std::string>() )
        ( "ranges", "Byte ranges to write in the form start:stop.", cxxopts::value<std::vector<std::string> >() );

    options.parse_positional( { "input", "ranges" } );

    const auto parsedArgs = options.parse( argc, argv );

    /* Check against simple commands like help. */

    if ( parsedArgs.count( "help" ) > 0 ) {
        printChunkcatHelp( options );
        return 0;
    }

    if ( parsedArgs.count( "input" ) == 0 ) {
        std::cerr << "Please specify a URL or path to read from!\n\n";
        printChunkcatHelp( options );
        return 1;
    }
    args.input = parsedArgs["input"].as<std::string>();

    auto& sourceOptions = args.sourceOptions;
    sourceOptions.verbose = parsedArgs["verbose"].as<bool>();
    sourceOptions.numWorkers = parsedArgs["workers"].as<unsigned int>();
    sourceOptions.numFallbackWorkers = parsedArgs["fallback-workers"].as<unsigned int>();

    const auto timeout = parsedArgs["timeout"].as<double>();
    if ( timeout > 0 ) {
        sourceOptions.timeout = chunkio::SourceOptions::Seconds( timeout );
    } else {
        sourceOptions.timeout.reset();
    }

    sourceOptions.maxNumElements = getOptional<size_t>( parsedArgs, "max-elements" );
    sourceOptions.maxElementSize = getOptional<size_t>( parsedArgs, "max-element-size" );

    if ( const auto handlers = getOptional<std::vector<std::string> >( parsedArgs, "handler" ); handlers ) {
        for ( const auto& handler : *handlers ) {
            applyHandler( handler, sourceOptions );
        }
    }

    if ( const auto ranges = getOptional<std::vector<std::string> >( parsedArgs, "ranges" ); ranges ) {
        for ( const auto& range : *ranges ) {
            args.ranges.emplace_back( parseByteRange( range ) );
        }
    }

    args.printSize = parsedArgs["size"].as<bool>();

    if ( sourceOptions.verbose ) {
        std::cerr << "Input: " << args.input << "\n"
                  << "Workers: " << sourceOptions.numWorkers << ", fallback workers: "
                  << sourceOptions.numFallbackWorkers << "\n"
                  << "Ranges: " << args.ranges.size() << "\n";
    }

    return writeRanges( args );
}


#if !defined( WITHOUT_MAIN )
int
main( int argc, char** argv )
{
    try
    {
        return chunkcatCLI( argc, argv );
    }
    catch ( const chunkio::SourceError& exception )
    {
        std::cerr << "Caught " << exception.error() << " error: " << exception.what() << "\n";
        return 1;
    }
    catch ( const std::exception& exception )
    {
        const std::string_view message{ exception.what() };
        if ( message.empty() ) {
            std::cerr << "Caught exception with typeid: " << typeid( exception ).name() << "\n";
        } else {
            std::cerr << "Caught exception: " << message << "\n";
        }
        return 1;
    }

    return 1;
}
#endif
