#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <core/ThreadPool.hpp>


using namespace chunkio;


/**
 * Starts a thread pool with @p nThreads and submits @p nTasks tasks waiting for a fixed time.
 * The total time to finish is then compared to a prediction.
 * Because the threads do non-busy wait, the hardware concurrency is not a limiting factor for this test!
 */
void
testThreadPool( unsigned int nThreads,
                unsigned int nTasks )
{
    ThreadPool threadPool( nThreads );

    const auto t0 = now();

    const auto secondsToWait = 0.01;
    std::vector<std::future<unsigned int> > checksums;
    for ( unsigned int i = 0; i < nTasks; ++i ) {
        checksums.emplace_back(
            threadPool.submit(
                [i, secondsToWait] () {
                    std::this_thread::sleep_for( std::chrono::milliseconds( int( secondsToWait * 1000 ) ) );
                    return 1U << i;
                }
        ) );
    }

    for ( unsigned int i = 0; i < nTasks; ++i ) {
        REQUIRE_EQUAL( checksums[i].get(), 1U << i );
    }
    const auto durationMeasured = duration( t0 );
    const auto durationPredicted = secondsToWait * ceilDiv( nTasks, std::max( nThreads, 1U ) );

    std::cerr << "Checksums with " << nThreads << " threads took " << durationMeasured << "s "
              << "(predicted: " << durationPredicted << "s)\n";
    /* Timing is too unstable to check when running with TSAN or valgrind, which slow down execution! */
}


void
testInlineExecution()
{
    ThreadPool threadPool( 0 );
    REQUIRE_EQUAL( threadPool.capacity(), 0U );

    const auto callerId = std::this_thread::get_id();
    auto result = threadPool.submit( [] () { return std::this_thread::get_id(); } );

    /* The task must already have been evaluated on the calling thread. */
    REQUIRE( result.wait_for( std::chrono::seconds( 0 ) ) == std::future_status::ready );
    REQUIRE( result.get() == callerId );

    auto failing = threadPool.submit( [] () -> int { throw std::domain_error( "Expected" ); } );
    REQUIRE( failing.wait_for( std::chrono::seconds( 0 ) ) == std::future_status::ready );
    REQUIRE_THROWS_AS( failing.get(), std::domain_error );
}


void
testSubmissionOrder()
{
    ThreadPool threadPool( 1 );

    std::mutex mutex;
    std::vector<int> order;
    std::vector<std::future<void> > results;
    for ( int i = 0; i < 20; ++i ) {
        results.emplace_back( threadPool.submit( [&mutex, &order, i] () {
            const std::lock_guard lock( mutex );
            order.push_back( i );
        } ) );
    }

    for ( auto& result : results ) {
        result.get();
    }

    std::vector<int> expected( 20 );
    for ( int i = 0; i < 20; ++i ) {
        expected[i] = i;
    }
    REQUIRE_EQUAL( order, expected );
}


void
testExceptionsAreStored()
{
    ThreadPool threadPool( 2 );
    auto failing = threadPool.submit( [] () -> int { throw std::domain_error( "Expected" ); } );
    auto succeeding = threadPool.submit( [] () { return 3; } );

    REQUIRE_THROWS_AS( failing.get(), std::domain_error );
    REQUIRE_EQUAL( succeeding.get(), 3 );
}


void
testStopCancelsQueuedTasks()
{
    ThreadPool threadPool( 1 );

    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> started{ false };

    auto blocking = threadPool.submit( [released, &started] () {
        started = true;
        released.wait();
        return 1;
    } );
    auto queued = threadPool.submit( [] () { return 2; } );

    while ( !started ) {
        std::this_thread::sleep_for( std::chrono::milliseconds( 1 ) );
    }
    REQUIRE_EQUAL( threadPool.unprocessedTasksCount(), 1U );

    std::thread stopper( [&threadPool] () { threadPool.stop(); } );

    /* The queued task is cancelled immediately while the running one is waited for. */
    REQUIRE_THROWS_AS( queued.get(), Cancelled );
    release.set_value();
    stopper.join();

    REQUIRE_EQUAL( blocking.get(), 1 );
    REQUIRE( !threadPool.running() );
    REQUIRE_EQUAL( threadPool.unprocessedTasksCount(), 0U );
}


void
testSubmitAfterStop()
{
    for ( const auto nThreads : { 0U, 1U, 4U } ) {
        ThreadPool threadPool( nThreads );
        threadPool.stop();
        threadPool.stop();
        REQUIRE_THROWS_AS( threadPool.submit( [] () { return 0; } ), StateError );
    }
}


int
main()
{
    testThreadPool( 0, 3 );
    testThreadPool( 1, 1 );
    testThreadPool( 1, 2 );
    testThreadPool( 2, 1 );
    testThreadPool( 2, 2 );
    testThreadPool( 2, 3 );
    testThreadPool( 2, 6 );
    testThreadPool( 16, 16 );
    testThreadPool( 16, 17 );

    testInlineExecution();
    testSubmissionOrder();
    testExceptionsAreStored();
    testStopCancelsQueuedTasks();
    testSubmitAfterStop();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
