#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <unistd.h>


namespace chunkio
{
template<typename I1,
         typename I2,
         typename Enable = typename std::enable_if_t<std::is_integral_v<I1> && std::is_integral_v<I2>> >
[[nodiscard]] constexpr I1
ceilDiv( I1 dividend,
         I2 divisor ) noexcept
{
    return ( dividend + divisor - 1 ) / divisor;
}


template<typename U,
         std::enable_if_t<std::is_unsigned_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingAddition( const U a,
                    const U b )
{
    return a > std::numeric_limits<U>::max() - b ? std::numeric_limits<U>::max() : a + b;
}


template<typename S, typename T>
std::ostream&
operator<<( std::ostream&   out,
            std::pair<S, T> pair )
{
    out << "(" << pair.first << "," << pair.second << ")";
    return out;
}


template<typename T>
std::ostream&
operator<<( std::ostream&         out,
            const std::vector<T>& vector )
{
    if ( vector.empty() ) {
        out << "{}";
        return out;
    }

    out << "{ ";
    for ( auto value = vector.begin(); value != vector.end(); ++value ) {
        if ( value != vector.begin() ) {
            out << ", ";
        }
        if constexpr ( std::is_same_v<T, uint8_t> ) {
            out << static_cast<uint16_t>( *value );
        } else {
            out << *value;
        }
    }
    out << " }";

    return out;
}


template<typename S, typename T>
[[nodiscard]] constexpr bool
startsWith( const S& fullString,
            const T& prefix,
            bool     caseSensitive = true ) noexcept
{
    if ( fullString.size() < prefix.size() ) {
        return false;
    }

    if ( caseSensitive ) {
        return std::equal( prefix.begin(), prefix.end(), fullString.begin() );
    }

    return std::equal( prefix.begin(), prefix.end(), fullString.begin(),
                       [] ( auto a, auto b ) { return std::tolower( a ) == std::tolower( b ); } );
}


[[nodiscard]] inline std::vector<std::string_view>
split( const std::string_view toSplit,
       const char             separator )
{
    std::vector<std::string_view> result;
    auto start = toSplit.begin();  // NOLINT(readability-qualified-auto)
    for ( auto it = toSplit.begin(); it != toSplit.end(); ++it ) {  // NOLINT(readability-qualified-auto)
        if ( *it == separator ) {
            result.emplace_back( toSplit.data() + std::distance( toSplit.begin(), start ),
                                 std::distance( start, it ) );
            start = it;
            ++start;
        }
    }

    if ( start != toSplit.end() ) {
        result.emplace_back( toSplit.data() + std::distance( toSplit.begin(), start ),
                             std::distance( start, toSplit.end() ) );
    }

    return result;
}


[[nodiscard]] constexpr std::string_view
trim( std::string_view toTrim ) noexcept
{
    constexpr std::string_view WHITESPACE = " \t\r\n";
    const auto first = toTrim.find_first_not_of( WHITESPACE );
    if ( first == std::string_view::npos ) {
        return {};
    }
    const auto last = toTrim.find_last_not_of( WHITESPACE );
    return toTrim.substr( first, last - first + 1 );
}


[[nodiscard]] inline std::string
toLower( std::string_view toConvert )
{
    std::string result( toConvert );
    std::transform( result.begin(), result.end(), result.begin(),
                    [] ( unsigned char c ) { return static_cast<char>( std::tolower( c ) ); } );
    return result;
}


[[nodiscard]] inline std::string
formatBytes( const uint64_t value )
{
    const std::array<std::pair<std::string_view, uint64_t>, 7U> UNITS{ {
        /* 64-bit maximum is 16 EiB, so these units cover all cases. */
        { "EiB", 1024ULL * 1024ULL * 1024ULL * 1024ULL * 1024ULL * 1024ULL },
        { "PiB", 1024ULL * 1024ULL * 1024ULL * 1024ULL * 1024ULL },
        { "TiB", 1024ULL * 1024ULL * 1024ULL * 1024ULL },
        { "GiB", 1024ULL * 1024ULL * 1024ULL },
        { "MiB", 1024ULL * 1024ULL },
        { "KiB", 1024ULL },
        { "B", 1ULL },
    } };

    std::stringstream result;
    for ( const auto& [unit, multiplier] : UNITS ) {
        const auto remainder = ( value / multiplier ) % 1024ULL;
        if ( remainder != 0 ) {
            if ( result.tellp() > 0 ) {
                result << " ";
            }
            result << remainder << " " << unit;
        }
    }

    if ( result.tellp() == 0 ) {
        return "0 B";
    }

    return std::move( result ).str();
}


[[nodiscard]] inline std::chrono::time_point<std::chrono::high_resolution_clock>
now() noexcept
{
    return std::chrono::high_resolution_clock::now();
}


/**
 * @return duration in seconds
 */
template<typename T>
[[nodiscard]] double
duration( const T& t0,
          const T& t1 = now() ) noexcept
{
    return std::chrono::duration<double>( t1 - t0 ).count();
}


[[nodiscard]] inline uint64_t
unixTimeInNanoseconds() noexcept
{
    const auto currentTime = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>( std::chrono::duration_cast<std::chrono::nanoseconds>( currentTime ).count() );
}


/**
 * Use like this:
 * @verbatim
 * std::cerr << ( ThreadSafeOutput() << "Hello" << i << "there" ).str();
 * @endverbatim
 */
class ThreadSafeOutput
{
public:
    ThreadSafeOutput()
    {
        using namespace std::chrono;
        const auto time = system_clock::now();
        const auto timePoint = system_clock::to_time_t( time );
        const auto subseconds = duration_cast<milliseconds>( time.time_since_epoch() ).count() % 1000;
        m_out << "[" << std::put_time( std::localtime( &timePoint ), "%H:%M:%S" ) << "." << subseconds << "]"
              << "[0x" << std::hex << std::this_thread::get_id() << std::dec << "]";
    }

    template<typename T>
    ThreadSafeOutput&
    operator<<( const T& value )
    {
        m_out << " " << value;
        return *this;
    }

    operator std::string() const
    {
        return m_out.str() + "\n";
    }

    [[nodiscard]] std::string
    str() const
    {
        return m_out.str() + "\n";
    }

private:
    std::stringstream m_out;
};


inline std::ostream&
operator<<( std::ostream&           out,
            const ThreadSafeOutput& output )
{
    out << output.str();
    return out;
}


[[nodiscard]] inline std::string
toString( std::future_status status ) noexcept
{
    switch ( status )
    {
    case std::future_status::ready:
        return "ready";
    case std::future_status::deferred:
        return "deferred";
    case std::future_status::timeout:
        return "timeout";
    }
    return "unknown future states";
}


enum class Endian
{
    LITTLE,
    BIG,
    UNKNOWN,
};


/**
 * g++-dM -E -x c++ /dev/null | grep -i endian
 * > #define __BYTE_ORDER__ __ORDER_LITTLE_ENDIAN__
 */
constexpr Endian ENDIAN =
#if defined( __BYTE_ORDER__ ) && defined( __ORDER_LITTLE_ENDIAN__ ) && ( __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__ )
    Endian::LITTLE
#elif defined( __BYTE_ORDER__ ) && defined( __ORDER_BIG_ENDIAN__ ) && ( __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__ )
    Endian::BIG
#else
    Endian::UNKNOWN
#endif
;


/**
 * Loads a big-endian value, which is the byte order of the file formats served by the sources.
 * Uses memcpy instead of reinterpret_cast to avoid strict-aliasing violations.
 */
template<typename T>
[[nodiscard]] T
loadBigEndian( const void* data ) noexcept
{
    static_assert( std::is_arithmetic_v<T>, "Only arithmetic types can be loaded!" );

    std::array<uint8_t, sizeof( T )> bytes{};
    std::memcpy( bytes.data(), data, sizeof( T ) );
    if constexpr ( ENDIAN != Endian::BIG ) {
        std::reverse( bytes.begin(), bytes.end() );
    }

    T result{};
    std::memcpy( &result, bytes.data(), sizeof( T ) );
    return result;
}
}  // namespace chunkio
