#ifndef RESOLVER_HPP
#define RESOLVER_HPP

#include "domainname.hpp"
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace dockerdns
{
    class ResolverError : public std::runtime_error
    {
    public:
        ResolverError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * no upstream answered in time.
     */
    class ResolverTimeout : public ResolverError
    {
    public:
        ResolverTimeout( const std::string &msg ) : ResolverError( msg )
        {
        }
    };

    /*!
     * NXDOMAIN or no A record in the answer.
     */
    class ResolverNotFound : public ResolverError
    {
    public:
        ResolverNotFound( const std::string &msg ) : ResolverError( msg )
        {
        }
    };

    class Resolver
    {
    public:
        virtual ~Resolver() {}

        /*!
         * @return IPv4 address of name.
         * @throw ResolverTimeout, ResolverNotFound, ResolverError
         */
        virtual std::string resolve( const Domainname &name ) = 0;
    };
    typedef std::shared_ptr<Resolver> ResolverPtr;

    struct UpstreamResolverParameters {
        // "address" or "address:port"
        std::vector<std::string> mServers;
        unsigned int             mTimeout;

        UpstreamResolverParameters() : mTimeout( 3000 )
        {}
    };

    /*!
     * stub resolver sending recursion desired A queries to upstream servers over UDP.
     * Servers are tried in order, once each.
     */
    class UpstreamResolver : public Resolver, private boost::noncopyable
    {
    public:
        UpstreamResolver( const UpstreamResolverParameters &params );

        virtual std::string resolve( const Domainname &name );

    private:
        UpstreamResolverParameters mParameters;

        boost::mutex       mRandomMutex;
        std::random_device mSeedGenerator;
        std::mt19937       mRandomEngine;

        uint16_t generateID();
        std::string query( const std::string &server, const Domainname &name );
    };
}

#endif
