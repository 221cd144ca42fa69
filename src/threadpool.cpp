#include "threadpool.hpp"

namespace utils
{
    ThreadPool::~ThreadPool()
    {
        stop();
        join();
    }

    bool ThreadPool::submit( Request req )
    {
        boost::unique_lock<boost::mutex> lock( mMutex );
        if ( mQueueLimit > 0 && mRequests.size() >= mQueueLimit )
            return false;
        mRequests.push_back( req );
        mCondition.notify_one();
        return true;
    }

    bool ThreadPool::pop( Request &req )
    {
        boost::unique_lock<boost::mutex> lock( mMutex );
        while ( mRequests.empty() && mIsContinue )
            mCondition.wait( lock );

        if ( mRequests.empty() )
            return false;

        req = mRequests.front();
        mRequests.pop_front();
        return true;
    }

    void ThreadPool::work()
    {
        Request req;
        while ( pop( req ) ) {
            req();
        }
    }

    void ThreadPool::start()
    {
        for ( unsigned int i = 0 ; i < mThreadCount ; i++ )
            mThreads.push_back( std::make_shared<boost::thread>( &ThreadPool::work, this ) );
    }

    void ThreadPool::join()
    {
        for ( auto th : mThreads ) {
            if ( th->joinable() )
                th->join();
        }
        mThreads.clear();
    }

    void ThreadPool::stop()
    {
        boost::unique_lock<boost::mutex> lock( mMutex );
        mIsContinue = false;
        mCondition.notify_all();
    }
}
