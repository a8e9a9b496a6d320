#pragma once

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "Error.hpp"


namespace chunkio
{
struct unique_file_descriptor
{
    explicit
    unique_file_descriptor( int fd ) :
        m_fd( fd )
    {}

    ~unique_file_descriptor()
    {
        close();
    }

    unique_file_descriptor() = default;

    unique_file_descriptor( const unique_file_descriptor& ) = delete;

    unique_file_descriptor&
    operator=( const unique_file_descriptor& ) = delete;

    unique_file_descriptor( unique_file_descriptor&& other ) noexcept :
        m_fd( other.m_fd )
    {
        other.m_fd = -1;
    }

    unique_file_descriptor&
    operator=( unique_file_descriptor&& other ) noexcept
    {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
        return *this;
    }

    [[nodiscard]] constexpr int
    operator*() const noexcept
    {
        return m_fd;
    }

    [[nodiscard]] constexpr bool
    valid() const noexcept
    {
        return m_fd >= 0;
    }

    void
    close()
    {
        if ( m_fd >= 0 ) {
            ::close( m_fd );
            m_fd = -1;
        }
    }

private:
    int m_fd{ -1 };
};


/**
 * @throws ResourceUnavailable if the file does not exist, is not readable, or is a directory.
 */
[[nodiscard]] inline unique_file_descriptor
throwingOpen( const std::string& filePath )
{
    unique_file_descriptor file( ::open( filePath.c_str(), O_RDONLY | O_CLOEXEC ) );  // NOLINT
    if ( !file.valid() ) {
        std::stringstream message;
        message << "Opening file '" << filePath << "' for reading failed: " << std::strerror( errno ) << "!";
        throw ResourceUnavailable( std::move( message ).str() );
    }

    struct stat fileStats{};
    if ( ( ::fstat( *file, &fileStats ) == 0 ) && S_ISDIR( fileStats.st_mode ) ) {  // NOLINT
        throw ResourceUnavailable( "Path '" + filePath + "' is a directory and not a file!" );
    }

    return file;
}


[[nodiscard]] inline size_t
fileSize( const int fileDescriptor )
{
    struct stat fileStats{};
    const auto result = ::fstat( fileDescriptor, &fileStats );

    if ( result == -1 ) {
        std::stringstream message;
        message << "Failed to get file size because of: " << std::strerror( errno ) << " (" << errno << ")";
        throw std::runtime_error( std::move( message ).str() );
    }
    return static_cast<size_t>( fileStats.st_size );
}


/**
 * Positioned read, which does not touch the file position and therefore may be called concurrently
 * on the same file descriptor. Retries on EINTR and after partial reads.
 * @return The number of bytes read. Less than @p size only if the end of file was reached.
 */
[[nodiscard]] inline size_t
preadAll( const int    fileDescriptor,
          void* const  buffer,
          const size_t size,
          const size_t offset )
{
    size_t nBytesRead{ 0 };
    while ( nBytesRead < size ) {
        const auto nBytesReadPerCall = ::pread( fileDescriptor, static_cast<char*>( buffer ) + nBytesRead,
                                                size - nBytesRead, static_cast<off_t>( offset + nBytesRead ) );
        if ( nBytesReadPerCall < 0 ) {
            if ( errno == EINTR ) {
                continue;
            }
            std::stringstream message;
            message << "Failed to read " << size << " B at offset " << offset << ": " << std::strerror( errno );
            throw std::runtime_error( std::move( message ).str() );
        }

        if ( nBytesReadPerCall == 0 ) {
            break;
        }
        nBytesRead += static_cast<size_t>( nBytesReadPerCall );
    }
    return nBytesRead;
}


/**
 * Read-only memory map of a whole file. The mapping stays valid after the file descriptor has been closed.
 */
class unique_memory_map
{
public:
    /**
     * @throws std::runtime_error if the file could not be mapped, e.g., because it is empty
     *         or because the file system does not support mmap.
     */
    unique_memory_map( const int    fileDescriptor,
                       const size_t size ) :
        m_size( size )
    {
        if ( size == 0 ) {
            throw std::runtime_error( "Cannot map an empty file!" );
        }

        auto* const mapping = ::mmap( nullptr, size, PROT_READ, MAP_SHARED, fileDescriptor, 0 );
        if ( mapping == MAP_FAILED ) {
            std::stringstream message;
            message << "Failed to map " << size << " B: " << std::strerror( errno ) << " (" << errno << ")";
            throw std::runtime_error( std::move( message ).str() );
        }
        m_data = static_cast<const std::byte*>( mapping );
    }

    ~unique_memory_map()
    {
        if ( m_data != nullptr ) {
            ::munmap( const_cast<std::byte*>( m_data ), m_size );
        }
    }

    unique_memory_map( const unique_memory_map& ) = delete;
    unique_memory_map( unique_memory_map&& ) = delete;
    unique_memory_map& operator=( const unique_memory_map& ) = delete;
    unique_memory_map& operator=( unique_memory_map&& ) = delete;

    [[nodiscard]] const std::byte*
    data() const noexcept
    {
        return m_data;
    }

    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_size;
    }

private:
    const std::byte* m_data{ nullptr };
    const size_t m_size;
};
}  // namespace chunkio
