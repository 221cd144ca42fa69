#include "eventmonitor.hpp"
#include <boost/log/trivial.hpp>

namespace dockerdns
{
    const std::string EVENT_TYPE_CONTAINER = "container";
    const std::string STATUS_START         = "start";
    const std::string STATUS_DIE           = "die";
    const std::string STATUS_RENAME        = "rename";

    std::vector<Record> EventMonitor::getRecords( const ContainerInfo &container ) const
    {
        std::vector<Record> records;

        std::string raw_name = container.mName;
        if ( raw_name.empty() ) {
            raw_name = container.mHostname;
            if ( raw_name.empty() ) {
                BOOST_LOG_TRIVIAL(warning) << "monitor: container " << container.mID << " has neither name nor hostname.";
                return records;
            }
            if ( container.mID.compare( 0, raw_name.size(), raw_name ) == 0 )
                BOOST_LOG_TRIVIAL(info) << "monitor: container " << container.mID << " uses hostname derived from its id.";
            else
                BOOST_LOG_TRIVIAL(debug) << "monitor: container " << container.mID << " uses hostname " << raw_name << ".";
        }

        std::string name = getName( raw_name, mParameters.mDomain );
        if ( name.empty() ) {
            BOOST_LOG_TRIVIAL(warning) << "monitor: container " << container.mID << " has no valid name(\"" << raw_name << "\").";
            return records;
        }

        std::string address;
        if ( ! mParameters.mNetwork.empty() ) {
            auto network = container.mNetworks.find( mParameters.mNetwork );
            if ( network != container.mNetworks.end() )
                address = network->second;
        }
        if ( address.empty() )
            address = container.mIPAddress;

        records.push_back( Record( container.mID, name, container.mRunning, address ) );
        return records;
    }

    std::vector<Record> EventMonitor::inspect( const std::string &id ) const
    {
        return getRecords( mRuntime->inspectContainer( id ) );
    }

    void EventMonitor::addRecords( const std::vector<Record> &records )
    {
        for ( auto &record : records ) {
            if ( ! record.hasAddress() ) {
                BOOST_LOG_TRIVIAL(info) << "monitor: " << record.mName << " has no address.";
                continue;
            }
            mTable->add( record.mName, record.mAddress );
        }
    }

    void EventMonitor::removeRecords( const std::vector<Record> &records )
    {
        for ( auto &record : records )
            mTable->remove( record.mName );
    }

    bool EventMonitor::isStopped()
    {
        boost::mutex::scoped_lock lock( mMutex );
        return mStopped;
    }

    void EventMonitor::bootstrap()
    {
        std::vector<ContainerInfo> containers = mRuntime->listRunningContainers();
        BOOST_LOG_TRIVIAL(info) << "monitor: found " << containers.size() << " running containers.";

        for ( auto &container : containers ) {
            if ( isStopped() )
                return;
            if ( ! mParameters.mNetwork.empty() && container.mNetworkMode != mParameters.mNetwork ) {
                BOOST_LOG_TRIVIAL(debug) << "monitor: skipped " << container.mID << " on network " << container.mNetworkMode << ".";
                continue;
            }

            try {
                std::vector<Record> records = inspect( container.mID );
                std::vector<Record> running;
                for ( auto &record : records ) {
                    if ( record.mRunning )
                        running.push_back( record );
                }
                addRecords( running );
            }
            catch ( std::exception &e ) {
                BOOST_LOG_TRIVIAL(error) << "monitor: cannot inspect " << container.mID << ": " << e.what();
            }
        }
    }

    void EventMonitor::handleEvent( const ContainerEvent &event )
    {
        if ( event.mType != EVENT_TYPE_CONTAINER || event.mID.empty() )
            return;

        BOOST_LOG_TRIVIAL(debug) << "monitor: event " << event.mStatus << " " << event.mID << ".";

        if ( event.mStatus == STATUS_START ) {
            addRecords( inspect( event.mID ) );
        }
        else if ( event.mStatus == STATUS_DIE ) {
            removeRecords( inspect( event.mID ) );
        }
        else if ( event.mStatus == STATUS_RENAME ) {
            std::string old_name = getName( event.getAttribute( "oldName" ), mParameters.mDomain );
            std::string new_name = getName( event.getAttribute( "name" ), mParameters.mDomain );
            mTable->rename( old_name, new_name );
        }
    }

    void EventMonitor::run()
    {
        EventStreamPtr stream = mRuntime->streamEvents();
        {
            boost::mutex::scoped_lock lock( mMutex );
            if ( mStopped ) {
                stream->close();
                return;
            }
            mStream = stream;
        }

        bootstrap();

        BOOST_LOG_TRIVIAL(info) << "monitor: waiting for events.";
        ContainerEvent event;
        while ( ! isStopped() && stream->next( event ) ) {
            try {
                handleEvent( event );
            }
            catch ( std::exception &e ) {
                BOOST_LOG_TRIVIAL(error) << "monitor: " << event.mStatus << " " << event.mID << " failed: " << e.what();
            }
        }
        BOOST_LOG_TRIVIAL(info) << "monitor: event stream ended.";
    }

    void EventMonitor::stop()
    {
        boost::mutex::scoped_lock lock( mMutex );
        mStopped = true;
        if ( mStream )
            mStream->close();
    }
}
