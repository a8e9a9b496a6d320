#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "common.hpp"  // unixTimeInNanoseconds


namespace chunkio
{
int gnTests = 0;  // NOLINT
int gnTestErrors = 0;  // NOLINT


template<typename A,
         typename B>
void
requireEqual( const A&  a,
              const B&  b,
              const int line )
{
    ++gnTests;
    if ( a != b ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << a << " != " << b << "\n";
    }
}


void
require( bool               condition,
         std::string const& conditionString,
         int                line )
{
    ++gnTests;
    if ( !condition ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << conditionString << "\n";
    }
}


#define REQUIRE_EQUAL( a, b ) requireEqual( a, b, __LINE__ )  // NOLINT
#define REQUIRE( condition ) require( condition, #condition, __LINE__ )  // NOLINT
#define REQUIRE_THROWS( condition ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const std::exception& ) { \
        return true; \
    } \
    return false; \
} (), #condition, __LINE__ )  // NOLINT
/* Only succeeds if the thrown exception is derived from the given type. */
#define REQUIRE_THROWS_AS( condition, ExceptionType ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const ExceptionType& ) { \
        return true; \
    } catch ( const std::exception& exception ) { \
        std::cerr << "Caught unexpected exception: " << exception.what() << "\n"; \
    } \
    return false; \
} (), #condition " throws " #ExceptionType, __LINE__ )  // NOLINT


class ThreadSafeStreamBuffer:
    public std::stringbuf
{
protected:
    std::streamsize
    xsputn( char_type const* s,
            std::streamsize  count ) override
    {
        const std::scoped_lock lock( m_mutex );
        return std::stringbuf::xsputn( s, count );
    }

    int
    overflow( int c ) override
    {
        const std::scoped_lock lock( m_mutex );
        return std::stringbuf::overflow( c );
    }

    int
    sync() override
    {
        const std::scoped_lock lock( m_mutex );
        return std::stringbuf::sync();
    }

private:
    std::recursive_mutex m_mutex;
};


/**
 * Redirects everything written to the given stream into itself until closed. Use str() to get the output.
 */
class StreamInterceptor :
    public ThreadSafeStreamBuffer
{
public:
    explicit
    StreamInterceptor( std::ostream& out ) :
        m_out( out ),
        m_rdbuf( m_out.rdbuf( this ) )
    {}

    ~StreamInterceptor()
    {
        close();
    }

    void
    close()
    {
        if ( m_rdbuf.has_value() ) {
            /* Expected to return this and therefore can be ignored. */
            m_out.rdbuf( *m_rdbuf );
            m_rdbuf.reset();
        }
    }

    StreamInterceptor( const StreamInterceptor& ) = delete;
    StreamInterceptor( StreamInterceptor&& ) = delete;
    StreamInterceptor& operator=( const StreamInterceptor& ) = delete;
    StreamInterceptor& operator=( StreamInterceptor&& ) = delete;

private:
    std::ostream& m_out;
    std::optional<std::basic_streambuf<char>*> m_rdbuf;
};


class TemporaryDirectory
{
public:
    explicit
    TemporaryDirectory( std::filesystem::path path ) :
        m_path( std::move( path ) )
    {}

    TemporaryDirectory( TemporaryDirectory&& ) = default;

    TemporaryDirectory( const TemporaryDirectory& ) = delete;

    TemporaryDirectory&
    operator=( TemporaryDirectory&& ) = default;

    TemporaryDirectory&
    operator=( const TemporaryDirectory& ) = delete;

    ~TemporaryDirectory()
    {
        if ( !m_path.empty() ) {
            std::filesystem::remove_all( m_path );
        }
    }

    [[nodiscard]] operator std::filesystem::path() const
    {
        return m_path;
    }

    [[nodiscard]] const std::filesystem::path&
    path() const
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};


[[nodiscard]] inline TemporaryDirectory
createTemporaryDirectory( const std::string& title = "tmpTest" )
{
    const std::filesystem::path tmpFolderName = title + "." + std::to_string( unixTimeInNanoseconds() );
    std::filesystem::create_directory( tmpFolderName );
    return TemporaryDirectory( tmpFolderName );
}


inline void
writeFile( const std::filesystem::path& path,
           std::string_view             contents )
{
    std::ofstream file( path, std::ios::out | std::ios::binary | std::ios::trunc );
    file.write( contents.data(), static_cast<std::streamsize>( contents.size() ) );
    if ( !file ) {
        throw std::runtime_error( "Failed to write test file: " + path.string() );
    }
}


/**
 * The file used by all local source tests: 30 bytes of easily distinguishable runs.
 */
constexpr std::string_view TEST_FILE_CONTENTS = "******    ...+++++++!!!!!@@@@@";
}  // namespace chunkio
