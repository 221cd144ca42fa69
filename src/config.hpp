#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <boost/cstdint.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace dockerdns
{
    class ConfigError : public std::runtime_error
    {
    public:
        ConfigError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    struct StaticRecord {
        std::string mName;
        std::string mAddress;
    };

    struct Config {
        std::string  mBindAddress;
        uint16_t     mBindPort;
        std::string  mDomain;
        std::string  mNetwork;
        std::vector<std::string>  mResolvers;
        bool         mRecursion;
        std::vector<StaticRecord> mRecords;
        std::string  mDockerSocket;
        uint32_t     mTTL;
        unsigned int mTimeout;
        unsigned int mThreadCount;
        std::string  mLogLevel;

        Config()
            : mBindAddress( "0.0.0.0" ),
              mBindPort( 53 ),
              mDomain( "docker" ),
              mRecursion( true ),
              mDockerSocket( "/var/run/docker.sock" ),
              mTTL( 0 ),
              mTimeout( 3 ),
              mThreadCount( 4 ),
              mLogLevel( "info" )
        {}
    };

    /*!
     * parse "name:address". The name goes through getName() with domain.
     * @throw ConfigError missing separator, empty name or non-IPv4 address.
     */
    StaticRecord parseStaticRecord( const std::string &record, const std::string &domain );

    /*!
     * @return socket path of a "unix://" URL.
     * @throw ConfigError other schemes.
     */
    std::string parseDockerURL( const std::string &url );

    /*!
     * parse the command line and the YAML file given by --config. Options on
     * the command line take precedence over the file.
     * @return false when --help was requested (usage is written to usage).
     * @throw ConfigError
     */
    bool parseConfig( int argc, char **argv, Config &config, std::ostream &usage = std::cerr );
}

#endif
