#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>


namespace chunkio
{
/**
 * Running min, max, mean and standard deviation of request sizes or fetch times for the source profiles.
 */
template<typename T>
struct Statistics
{
    [[nodiscard]] constexpr double
    average() const noexcept
    {
        return sum / count;
    }

    [[nodiscard]] constexpr double
    variance() const noexcept
    {
        /* Sample variance from the running sums: <x^2> - <x>^2 with Bessel's correction. */
        return ( sum2 / count - average() * average() ) * count / ( count - 1 );
    }

    [[nodiscard]] constexpr double
    standardDeviation() const noexcept
    {
        return std::sqrt( variance() );
    }

    constexpr void
    merge( T value ) noexcept
    {
        min = std::min( min, value );
        max = std::max( max, value );
        sum += value;
        sum2 += std::pow( static_cast<double>( value ), 2 );
        ++count;
    }

    /**
     * Formats "min <= mean +- stddev <= max" with all values rounded to the precision of the deviation.
     */
    [[nodiscard]] std::string
    formatAverageWithUncertainty( bool includeBounds = false ) const
    {
        if ( count == 0 ) {
            return "no values";
        }

        std::stringstream result;
        if ( ( count == 1 ) || ( min == max ) ) {
            result << average();
            return result.str();
        }

        const auto uncertainty = standardDeviation();
        /* Round uncertainty and value according to DIN 1333
         * @see https://www.tu-chemnitz.de/physik/PGP/files/Allgemeines/Rundungsregeln.pdf */

        /* Log10: 0.1 -> -1, 1 -> 0, 2 -> 0.301, 10 -> 1.
         * In order to scale to a range [0,100), we have to divide by 10^magnitude. */
        auto magnitude = std::floor( std::log10( uncertainty ) ) - 1;
        auto scaled = uncertainty / std::pow( 10, magnitude );

        /* Uncertainties beginning with 1 or 2 keep two significant digits, all others one. */
        if ( scaled >= 30 ) {
            magnitude += 1;
        }

        const auto roundToUncertainty =
            [magnitude] ( auto value )
            {
                return std::round( static_cast<double>( value ) / std::pow( 10, magnitude ) )
                       * std::pow( 10, magnitude );
            };

        result << std::fixed << std::setprecision( static_cast<int>( std::max( -magnitude, 0. ) ) );

        if ( includeBounds ) {
            result << roundToUncertainty( min ) << " <= ";
        }
        result << roundToUncertainty( average() ) << " +- " << roundToUncertainty( uncertainty );
        if ( includeBounds ) {
            result << " <= " << roundToUncertainty( max );
        }

        return result.str();
    }

public:
    T min{ std::numeric_limits<T>::max() };
    T max{ std::numeric_limits<T>::lowest() };

    double sum{ 0 };
    double sum2{ 0 };
    uint64_t count{ 0 };
};
}  // namespace chunkio
