#ifndef EVENTMONITOR_HPP
#define EVENTMONITOR_HPP

#include "containerruntime.hpp"
#include "nametable.hpp"
#include "names.hpp"
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <memory>
#include <string>
#include <vector>

namespace dockerdns
{
    struct EventMonitorParameters {
        std::string mDomain;

        // empty: all networks
        std::string mNetwork;

        EventMonitorParameters() : mDomain( "docker" )
        {}
    };

    /*!
     * keeps NameTable in sync with the container runtime.
     */
    class EventMonitor : private boost::noncopyable
    {
    public:
        EventMonitor( const EventMonitorParameters &params,
                      ContainerRuntimePtr runtime,
                      std::shared_ptr<NameTable> table )
            : mParameters( params ), mRuntime( runtime ), mTable( table ), mStopped( false )
        {}

        /*!
         * subscribe events, register running containers, then apply events
         * until the stream ends or stop() is called.
         * @throw RuntimeError the runtime cannot be reached.
         */
        void run();

        /*!
         * may be called from another thread.
         */
        void stop();

        void bootstrap();
        void handleEvent( const ContainerEvent &event );

        std::vector<Record> getRecords( const ContainerInfo &container ) const;

    private:
        EventMonitorParameters     mParameters;
        ContainerRuntimePtr        mRuntime;
        std::shared_ptr<NameTable> mTable;

        boost::mutex   mMutex;
        bool           mStopped;
        EventStreamPtr mStream;

        bool isStopped();
        std::vector<Record> inspect( const std::string &id ) const;
        void addRecords( const std::vector<Record> &records );
        void removeRecords( const std::vector<Record> &records );
    };
}

#endif
