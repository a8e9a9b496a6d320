#pragma once

#include <ostream>
#include <stdexcept>
#include <string>


namespace chunkio
{
enum class [[nodiscard]] Error
{
    NONE                    = 0x00,

    /* Open-time failures: missing file, unreachable host, server refusing the resource. */
    RESOURCE_UNAVAILABLE    = 0x10,

    /* A specific range could not be fetched: I/O error, bad status, short data. */
    FETCH_FAILED            = 0x20,
    LENGTH_MISMATCH         = 0x21,

    /* The peer does not honor the protocol feature that was relied upon. */
    PROTOCOL_VIOLATION      = 0x30,
    MULTIPART_UNSUPPORTED   = 0x31,

    TIMEOUT                 = 0x40,

    /* Operation on a closed source or a stopped worker pool. */
    INVALID_STATE           = 0x50,
    CANCELLED               = 0x51,

    INVARIANT_VIOLATION     = 0x60,
};


[[nodiscard]] inline std::string
toString( Error error )
{
    switch ( error )
    {
    case Error::NONE:
        return "No error.";
    case Error::RESOURCE_UNAVAILABLE:
        return "The resource does not exist or is unreachable!";
    case Error::FETCH_FAILED:
        return "Failed to fetch the requested byte range!";
    case Error::LENGTH_MISMATCH:
        return "The returned buffer length does not match the requested byte range!";
    case Error::PROTOCOL_VIOLATION:
        return "The peer violated the expected protocol!";
    case Error::MULTIPART_UNSUPPORTED:
        return "The server does not support multipart byte ranges!";
    case Error::TIMEOUT:
        return "The operation exceeded the configured timeout!";
    case Error::INVALID_STATE:
        return "The operation is not allowed in the current state!";
    case Error::CANCELLED:
        return "The task was cancelled because its source was closed!";
    case Error::INVARIANT_VIOLATION:
        return "Internal invariant violated!";
    }
    return "Unknown error code!";
}


inline std::ostream&
operator<<( std::ostream& out,
            Error         error )
{
    out << toString( error );
    return out;
}


/**
 * Base class of all recoverable errors a source reports.
 * The message should name the backend identity and the byte range involved.
 */
class SourceError :
    public std::runtime_error
{
public:
    SourceError( Error              error,
                 const std::string& message ) :
        std::runtime_error( message ),
        m_error( error )
    {}

    [[nodiscard]] Error
    error() const noexcept
    {
        return m_error;
    }

private:
    Error m_error;
};


class ResourceUnavailable :
    public SourceError
{
public:
    explicit
    ResourceUnavailable( const std::string& message ) :
        SourceError( Error::RESOURCE_UNAVAILABLE, message )
    {}
};


class FetchError :
    public SourceError
{
public:
    explicit
    FetchError( const std::string& message,
                Error              error = Error::FETCH_FAILED ) :
        SourceError( error, message )
    {}
};


class ProtocolError :
    public SourceError
{
public:
    explicit
    ProtocolError( const std::string& message,
                   Error              error = Error::PROTOCOL_VIOLATION ) :
        SourceError( error, message )
    {}
};


class Timeout :
    public SourceError
{
public:
    explicit
    Timeout( const std::string& message ) :
        SourceError( Error::TIMEOUT, message )
    {}
};


class StateError :
    public SourceError
{
public:
    explicit
    StateError( const std::string& message ) :
        SourceError( Error::INVALID_STATE, message )
    {}
};


class Cancelled :
    public SourceError
{
public:
    explicit
    Cancelled( const std::string& message ) :
        SourceError( Error::CANCELLED, message )
    {}
};


/**
 * Programming errors, e.g., constructing a chunk with a buffer of the wrong size. Not meant to be recovered from.
 */
class InvariantViolation :
    public std::logic_error
{
public:
    explicit
    InvariantViolation( const std::string& message ) :
        std::logic_error( message )
    {}
};
}  // namespace chunkio
