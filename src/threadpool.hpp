#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include <boost/noncopyable.hpp>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include <deque>
#include <memory>
#include <vector>

namespace utils
{
    typedef boost::function<void ()> Request;

    class ThreadPool : private boost::noncopyable
    {
    public:
        /*!
         * @param queue_limit maximum number of requests waiting for a worker, 0 is unlimited.
         */
        ThreadPool( unsigned int thread_count, unsigned int queue_limit = 0 )
            : mIsContinue( true ), mThreadCount( thread_count ), mQueueLimit( queue_limit )
        {}

        ~ThreadPool();

        /*!
         * @return false if the queue is full and req was discarded.
         */
        bool submit( Request req );
        void start();

        /*!
         * workers finish the requests already submitted, then exit.
         */
        void stop();
        void join();

    private:
        bool         mIsContinue;
        unsigned int mThreadCount;
        unsigned int mQueueLimit;
        std::deque<Request> mRequests;

        std::vector<std::shared_ptr<boost::thread>> mThreads;
        boost::mutex mMutex;
        boost::condition_variable mCondition;

        void work();
        bool pop( Request &req );
    };
}

#endif
