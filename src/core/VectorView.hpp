#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <vector>


namespace chunkio
{
/**
 * Views are by their name read-only. This represents a read-only non-owned memory chunk.
 * Probably could be removed in favor of C++20 std::span.
 */
template<typename T>
class VectorView
{
public:
    using value_type = T;

public:
    constexpr
    VectorView() noexcept = default;

    constexpr
    VectorView( const VectorView<T>& ) noexcept = default;

    constexpr
    VectorView( VectorView<T>&& ) noexcept = default;

    constexpr VectorView<T>&
    operator=( const VectorView<T>& ) noexcept = default;

    constexpr VectorView<T>&
    operator=( VectorView<T>&& ) noexcept = default;

    template<typename Container,
             std::enable_if_t<std::is_same_v<Container, std::vector<T> >
                              || ( ( std::is_same_v<T, uint8_t>
                                     || std::is_same_v<T, char>
                                     || std::is_same_v<T, std::byte> ) &&
                                   ( std::is_same_v<typename Container::value_type, uint8_t>
                                     || std::is_same_v<typename Container::value_type, char>
                                     || std::is_same_v<typename Container::value_type, std::byte> ) )
             >* = nullptr>
    constexpr
    VectorView( const Container& vector ) noexcept :  // NOLINT
        m_data( reinterpret_cast<const T*>( vector.data() ) ),
        m_size( vector.size() )
    {}

    constexpr
    VectorView( const T* data,
                size_t   size ) noexcept :
        m_data( data ),
        m_size( size )
    {}

    [[nodiscard]] constexpr const T*
    begin() const noexcept
    {
        return m_data;
    }

    [[nodiscard]] constexpr const T*
    end() const noexcept
    {
        return m_data + m_size;
    }

    [[nodiscard]] constexpr const T*
    data() const noexcept
    {
        return m_data;
    }

    [[nodiscard]] constexpr size_t
    size() const noexcept
    {
        return m_size;
    }

    [[nodiscard]] constexpr bool
    empty() const noexcept
    {
        return m_size == 0;
    }

    [[nodiscard]] constexpr T
    operator[]( size_t i ) const noexcept
    {
        return m_data[i];
    }

    [[nodiscard]] constexpr T
    at( size_t i ) const
    {
        if ( i >= m_size ) {
            throw std::out_of_range( "VectorView index larger than size!" );
        }
        return m_data[i];
    }

    [[nodiscard]] std::string_view
    toStringView() const noexcept
    {
        static_assert( sizeof( T ) == 1, "Only byte views can be interpreted as strings!" );
        return { reinterpret_cast<const char*>( m_data ), m_size };
    }

private:
    const T* m_data{ nullptr };
    size_t   m_size{ 0 };
};
}  // namespace chunkio
