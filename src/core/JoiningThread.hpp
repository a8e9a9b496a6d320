#pragma once

#include <thread>
#include <utility>


namespace chunkio
{
/**
 * Thread that is joined when it goes out of scope. Worker pools and the connections of the test server
 * hold these so that no thread outlives the object whose members it uses.
 */
class JoiningThread
{
public:
    template<class Function>
    explicit
    JoiningThread( Function&& function ) :
        m_thread( std::forward<Function>( function ) )
    {}

    JoiningThread( JoiningThread&& ) = default;
    JoiningThread( const JoiningThread& ) = delete;
    JoiningThread& operator=( JoiningThread&& ) = delete;
    JoiningThread& operator=( const JoiningThread& ) = delete;

    ~JoiningThread()
    {
        if ( m_thread.joinable() ) {
            m_thread.join();
        }
    }

private:
    std::thread m_thread;
};
}  // namespace chunkio
