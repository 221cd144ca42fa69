#ifndef CONTAINERRUNTIME_HPP
#define CONTAINERRUNTIME_HPP

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dockerdns
{
    /*!
     * thrown when the container runtime cannot be reached or answers with an error.
     */
    class RuntimeError : public std::runtime_error
    {
    public:
        RuntimeError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    struct ContainerInfo {
        std::string mID;
        std::string mName;
        std::string mHostname;
        bool        mRunning;
        std::string mNetworkMode;

        // default network
        std::string mIPAddress;

        // network name -> IP address
        std::map<std::string, std::string> mNetworks;

        ContainerInfo() : mRunning( false )
        {}
    };

    struct ContainerEvent {
        std::string mType;
        std::string mID;
        std::string mStatus;
        std::map<std::string, std::string> mAttributes;

        std::string getAttribute( const std::string &key ) const
        {
            auto attr = mAttributes.find( key );
            if ( attr == mAttributes.end() )
                return "";
            return attr->second;
        }
    };

    /*!
     * infinite, non-restartable sequence of runtime events.
     */
    class EventStream
    {
    public:
        virtual ~EventStream() {}

        /*!
         * block until the next event.
         * @return false at the end of the stream or after close().
         * @throw RuntimeError connection failure.
         */
        virtual bool next( ContainerEvent &event ) = 0;

        /*!
         * may be called from another thread to unblock next().
         */
        virtual void close() = 0;
    };
    typedef std::shared_ptr<EventStream> EventStreamPtr;

    class ContainerRuntime
    {
    public:
        virtual ~ContainerRuntime() {}

        virtual std::vector<ContainerInfo> listRunningContainers() = 0;

        /*!
         * @throw RuntimeError unknown container or connection failure.
         */
        virtual ContainerInfo inspectContainer( const std::string &id ) = 0;

        virtual EventStreamPtr streamEvents() = 0;
    };
    typedef std::shared_ptr<ContainerRuntime> ContainerRuntimePtr;
}

#endif
