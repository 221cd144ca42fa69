#include "config.hpp"
#include "names.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace dockerdns
{
    const std::string UNIX_SCHEME = "unix://";
    const uint16_t    DNS_PORT    = 53;

    StaticRecord parseStaticRecord( const std::string &record, const std::string &domain )
    {
        std::string::size_type separator = record.find( ':' );
        if ( separator == std::string::npos )
            throw ConfigError( "record \"" + record + "\" must be name:address" );

        StaticRecord static_record;
        static_record.mName    = getName( record.substr( 0, separator ), domain );
        static_record.mAddress = record.substr( separator + 1 );

        if ( static_record.mName.empty() )
            throw ConfigError( "record \"" + record + "\" has no valid name" );
        if ( ! isIPv4Address( static_record.mAddress ) )
            throw ConfigError( "record \"" + record + "\" has invalid IPv4 address" );
        return static_record;
    }

    std::string parseDockerURL( const std::string &url )
    {
        if ( url.compare( 0, UNIX_SCHEME.size(), UNIX_SCHEME ) != 0 )
            throw ConfigError( "docker url \"" + url + "\" is not supported (unix:///path only)" );
        std::string path = url.substr( UNIX_SCHEME.size() );
        if ( path.empty() )
            throw ConfigError( "docker url \"" + url + "\" has no socket path" );
        return path;
    }

    /*!
     * convert the top level map of a YAML config file into "--key=value" arguments.
     */
    static std::vector<std::string> loadConfigFile( const std::string &config_filename )
    {
        std::ifstream fs( config_filename );
        std::istreambuf_iterator<char> begin( fs );
        std::istreambuf_iterator<char> end;

        if ( !fs ) {
            throw ConfigError( "cannot load config file \"" + config_filename + "\"" );
        }
        std::string config( begin, end );

        YAML::Node top;
        try {
            top = YAML::Load( config );
        }
        catch( YAML::ParserException &e ) {
            throw ConfigError( "cannot parse config file \"" + config_filename + "\": " + e.what() );
        }

        std::vector<std::string> args;
        if ( top.IsNull() )
            return args;
        if ( ! top.IsMap() )
            throw ConfigError( "config file \"" + config_filename + "\" must be a map" );

        try {
            for ( YAML::const_iterator option = top.begin() ; option != top.end() ; ++option ) {
                std::string key = option->first.as<std::string>();
                const YAML::Node &value = option->second;

                if ( key == "config" )
                    throw ConfigError( "config file cannot include another config file" );

                if ( key == "no-recursion" ) {
                    if ( value.as<bool>() )
                        args.push_back( "--no-recursion" );
                }
                else if ( value.IsSequence() ) {
                    for ( YAML::const_iterator item = value.begin() ; item != value.end() ; ++item )
                        args.push_back( "--" + key + "=" + item->as<std::string>() );
                }
                else if ( value.IsScalar() ) {
                    args.push_back( "--" + key + "=" + value.as<std::string>() );
                }
                else if ( ! value.IsNull() ) {
                    throw ConfigError( "option \"" + key + "\" in config file must be a scalar or a list" );
                }
            }
        }
        catch ( YAML::Exception &e ) {
            throw ConfigError( "invalid config file \"" + config_filename + "\": " + e.what() );
        }
        return args;
    }

    bool parseConfig( int argc, char **argv, Config &config, std::ostream &usage )
    {
        namespace po = boost::program_options;

        const std::vector<std::string> default_resolvers = { "8.8.8.8", "8.8.4.4" };

        po::options_description desc( "dockerdns" );
        desc.add_options()( "help,h", "print this message" )

            ( "dns-bind,b",   po::value<std::string>()->default_value( "0.0.0.0:53" ), "bind address[:port]" )
            ( "domain,d",     po::value<std::string>()->default_value( "docker" ), "base domain" )
            ( "network,n",    po::value<std::string>(), "only register containers of this network" )
            ( "resolver,r",   po::value<std::vector<std::string>>()->default_value( default_resolvers, "8.8.8.8 8.8.4.4" ),
              "upstream resolver address[:port]" )
            ( "no-recursion", po::bool_switch(), "do not forward unknown names" )
            ( "record",       po::value<std::vector<std::string>>(), "static record name:address" )
            ( "docker-url",   po::value<std::string>()->default_value( "unix:///var/run/docker.sock" ), "docker engine url" )
            ( "ttl",          po::value<uint32_t>()->default_value( 0 ), "TTL of answers" )
            ( "timeout",      po::value<unsigned int>()->default_value( 3 ), "upstream timeout(sec)" )
            ( "thread,t",     po::value<unsigned int>()->default_value( 4 ), "responder thread count" )
            ( "log-level,l",  po::value<std::string>()->default_value( "info" ), "trace, debug, info, warning, error, fatal" )
            ( "config,c",     po::value<std::string>(), "YAML config file" );

        po::variables_map vm;
        try {
            po::store( po::parse_command_line( argc, argv, desc ), vm );

            if ( vm.count( "help" ) ) {
                usage << desc << std::endl;
                return false;
            }

            // values already given on the command line are kept by store()
            if ( vm.count( "config" ) ) {
                std::vector<std::string> args = loadConfigFile( vm["config"].as<std::string>() );
                po::store( po::command_line_parser( args ).options( desc ).run(), vm );
            }
            po::notify( vm );
        }
        catch ( po::error &e ) {
            throw ConfigError( e.what() );
        }

        try {
            splitAddressAndPort( vm["dns-bind"].as<std::string>(), DNS_PORT, config.mBindAddress, config.mBindPort );
        }
        catch ( InvalidAddressFormatError &e ) {
            throw ConfigError( std::string( "invalid bind address: " ) + e.what() );
        }

        config.mDomain = vm["domain"].as<std::string>();
        if ( vm.count( "network" ) )
            config.mNetwork = vm["network"].as<std::string>();

        config.mResolvers = vm["resolver"].as<std::vector<std::string>>();
        for ( auto &resolver : config.mResolvers ) {
            try {
                std::string address;
                uint16_t    port;
                splitAddressAndPort( resolver, DNS_PORT, address, port );
            }
            catch ( InvalidAddressFormatError &e ) {
                throw ConfigError( std::string( "invalid resolver: " ) + e.what() );
            }
        }
        config.mRecursion = ! vm["no-recursion"].as<bool>();

        config.mRecords.clear();
        if ( vm.count( "record" ) ) {
            for ( auto &record : vm["record"].as<std::vector<std::string>>() )
                config.mRecords.push_back( parseStaticRecord( record, config.mDomain ) );
        }

        config.mDockerSocket = parseDockerURL( vm["docker-url"].as<std::string>() );
        config.mTTL          = vm["ttl"].as<uint32_t>();
        config.mTimeout      = vm["timeout"].as<unsigned int>();
        config.mThreadCount  = vm["thread"].as<unsigned int>();
        if ( config.mTimeout == 0 )
            throw ConfigError( "timeout must be greater than 0" );
        if ( config.mThreadCount == 0 )
            throw ConfigError( "thread count must be greater than 0" );

        config.mLogLevel = vm["log-level"].as<std::string>();
        try {
            logger::toLevel( config.mLogLevel );
        }
        catch ( std::runtime_error &e ) {
            throw ConfigError( e.what() );
        }

        return true;
    }
}
