#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "Error.hpp"
#include "JoiningThread.hpp"


namespace chunkio
{
/**
 * Function evaluations can be given to a ThreadPool instance,
 * which assigns the evaluation to one of its threads to be evaluated in parallel.
 *
 * - With a thread count of 0, submitted tasks are evaluated immediately on the calling thread and the
 *   returned future is already resolved.
 * - With a thread count of 1, tasks are evaluated in submission order.
 * - With more threads, all workers pull from the same FIFO queue, i.e., tasks start in submission order
 *   but may finish in any order.
 */
class ThreadPool
{
private:
    /**
     * A small type-erasure function wrapper for non-copyable function objects with no function arguments.
     *
     * std::function<void()> won't work to wrap a functor holding a std::promise
     * because the former requires a copy-constructible object, which the latter is not.
     * @see http://www.open-std.org/jtc1/sc22/wg21/docs/lwg-defects.html#1287
     *
     * In contrast to std::packaged_task, the wrapped task can be cancelled, which stores a @ref Cancelled
     * exception into the result instead of the broken promise error a destroyed packaged_task would leave.
     */
    class PackagedTaskWrapper
    {
    private:
        struct BaseFunctor
        {
            virtual void
            operator()() = 0;

            virtual void
            cancel( std::exception_ptr reason ) = 0;

            virtual
            ~BaseFunctor() = default;
        };

        template<class T_Functor,
                 class T_Result>
        struct SpecializedFunctor :
            BaseFunctor
        {
            explicit
            SpecializedFunctor( T_Functor&& functor ) :
                m_functor( std::forward<T_Functor>( functor ) )
            {}

            void
            operator()() override
            {
                try {
                    if constexpr ( std::is_void_v<T_Result> ) {
                        m_functor();
                        m_promise.set_value();
                    } else {
                        m_promise.set_value( m_functor() );
                    }
                } catch ( ... ) {
                    m_promise.set_exception( std::current_exception() );
                }
            }

            void
            cancel( std::exception_ptr reason ) override
            {
                m_promise.set_exception( std::move( reason ) );
            }

            [[nodiscard]] std::future<T_Result>
            getFuture()
            {
                return m_promise.get_future();
            }

        private:
            std::decay_t<T_Functor> m_functor;
            std::promise<T_Result> m_promise;
        };

    public:
        template<class T_Functor,
                 class T_Result = std::invoke_result_t<T_Functor> >
        [[nodiscard]] static std::pair<PackagedTaskWrapper, std::future<T_Result> >
        create( T_Functor&& functor )
        {
            auto impl = std::make_unique<SpecializedFunctor<T_Functor, T_Result> >( std::forward<T_Functor>( functor ) );
            auto future = impl->getFuture();
            return { PackagedTaskWrapper( std::move( impl ) ), std::move( future ) };
        }

        void
        operator()()
        {
            ( *m_impl )();
        }

        void
        cancel( std::exception_ptr reason )
        {
            m_impl->cancel( std::move( reason ) );
        }

    private:
        explicit
        PackagedTaskWrapper( std::unique_ptr<BaseFunctor> impl ) :
            m_impl( std::move( impl ) )
        {}

    private:
        std::unique_ptr<BaseFunctor> m_impl;
    };

public:
    explicit
    ThreadPool( size_t threadCount ) :
        m_threadCount( threadCount )
    {
        m_threads.reserve( m_threadCount );
    }

    ~ThreadPool()
    {
        stop();
    }

    ThreadPool( const ThreadPool& ) = delete;
    ThreadPool( ThreadPool&& ) = delete;
    ThreadPool& operator=( const ThreadPool& ) = delete;
    ThreadPool& operator=( ThreadPool&& ) = delete;

    /**
     * Cancels all tasks that have not yet started and waits for the running ones to finish.
     * Calling this more than once is allowed. Tasks submitted afterwards are rejected.
     */
    void
    stop()
    {
        std::deque<PackagedTaskWrapper> cancelledTasks;
        std::vector<JoiningThread> threads;
        {
            const std::lock_guard lock( m_mutex );
            m_threadPoolRunning = false;
            std::swap( cancelledTasks, m_tasks );
            std::swap( threads, m_threads );
            m_pingWorkers.notify_all();
        }

        for ( auto& task : cancelledTasks ) {
            task.cancel( std::make_exception_ptr(
                Cancelled( "Task was cancelled because the worker pool was stopped before it could run!" ) ) );
        }

        /* The JoiningThread destructors wait for the tasks currently running. */
        threads.clear();
    }

    /**
     * Any function taking no arguments and returning any argument may be submitted to be executed.
     * The returned future can be used to access the result when it is really needed.
     * Exceptions thrown by the task are stored in the future and not thrown by this method.
     */
    template<class T_Functor, std::enable_if_t<std::is_invocable_v<T_Functor>, void>* = nullptr>
    [[nodiscard]] std::future<std::invoke_result_t<T_Functor> >
    submit( T_Functor&& task )
    {
        auto [packagedTask, resultFuture] = PackagedTaskWrapper::create( std::forward<T_Functor>( task ) );

        if ( m_threadCount == 0 ) {
            if ( !m_threadPoolRunning ) {
                throw StateError( "Cannot submit tasks to a stopped worker pool!" );
            }
            packagedTask();
            return std::move( resultFuture );
        }

        const std::lock_guard lock( m_mutex );

        if ( !m_threadPoolRunning ) {
            throw StateError( "Cannot submit tasks to a stopped worker pool!" );
        }

        m_tasks.emplace_back( std::move( packagedTask ) );

        if ( ( m_threads.size() < m_threadCount ) && ( m_idleThreadCount == 0 ) ) {
            spawnThread();
        }

        m_pingWorkers.notify_one();

        return std::move( resultFuture );
    }

    [[nodiscard]] size_t
    capacity() const noexcept
    {
        return m_threadCount;
    }

    [[nodiscard]] bool
    running() const noexcept
    {
        return m_threadPoolRunning;
    }

    [[nodiscard]] size_t
    unprocessedTasksCount() const
    {
        const std::lock_guard lock( m_mutex );
        return m_tasks.size();
    }

private:
    void
    workerMain()
    {
        while ( m_threadPoolRunning )
        {
            std::unique_lock<std::mutex> tasksLock( m_mutex );
            ++m_idleThreadCount;
            m_pingWorkers.wait( tasksLock, [this] () { return !m_tasks.empty() || !m_threadPoolRunning; } );
            --m_idleThreadCount;

            if ( !m_threadPoolRunning ) {
                break;
            }

            auto task = std::move( m_tasks.front() );
            m_tasks.pop_front();
            tasksLock.unlock();
            task();
        }
    }

    /**
     * Does not lock! Therefore it is a private method that should only be called with a lock.
     */
    void
    spawnThread()
    {
        m_threads.emplace_back( [this] () { workerMain(); } );
    }

private:
    std::atomic<bool> m_threadPoolRunning = true;

    const size_t m_threadCount;
    std::atomic<size_t> m_idleThreadCount{ 0 };

    /** Protects m_tasks AND m_pingWorkers or else the notify_all might go unnoticed! */
    mutable std::mutex m_mutex;
    std::deque<PackagedTaskWrapper> m_tasks;
    std::condition_variable m_pingWorkers;

    /**
     * Should come last so that it's lifetime is the shortest, i.e., there is no danger for the other
     * members to not yet be constructed or be already destructed while a task is still running.
     */
    std::vector<JoiningThread> m_threads;
};
}  // namespace chunkio
