#ifndef DNS_SERVER_HPP
#define DNS_SERVER_HPP

#include "dns.hpp"
#include "nametable.hpp"
#include "resolver.hpp"
#include "udpv4server.hpp"
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace dockerdns
{
    struct DnsResponderParameters {
        std::string  mBindAddress;
        uint16_t     mBindPort;
        unsigned int mThreadCount;
        unsigned int mQueueLimit;
        TTL          mTTL;

        DnsResponderParameters()
            : mBindAddress( "0.0.0.0" ),
              mBindPort( 53 ),
              mThreadCount( 4 ),
              mQueueLimit( 1024 ),
              mTTL( 0 )
        {}
    };

    /*!
     * answers UDP queries from NameTable, forwarding unknown names to the resolver.
     */
    class DnsResponder : private boost::noncopyable
    {
    public:
        /*!
         * @param resolver nullptr disables recursive resolution.
         */
        DnsResponder( const DnsResponderParameters &params,
                      std::shared_ptr<NameTable> table,
                      ResolverPtr resolver )
            : mParameters( params ), mTable( table ), mResolver( resolver ), mStopped( false )
        {}

        /*!
         * @throw SocketError cannot bind the address.
         */
        void bind();

        /*!
         * receive queries until stop() is called. bind() must be called before.
         */
        void serve();

        /*!
         * may be called from another thread.
         */
        void stop();

        uint16_t getLocalPort() const;

        MessageInfo generateResponse( const MessageInfo &query ) const;

    private:
        DnsResponderParameters         mParameters;
        std::shared_ptr<NameTable>     mTable;
        ResolverPtr                    mResolver;
        std::unique_ptr<udpv4::Server> mServer;
        std::atomic<bool>              mStopped;

        void replyOverUDP( udpv4::PacketInfo request );
        boost::optional<std::string> resolve( const Domainname &name ) const;
    };
}

#endif
