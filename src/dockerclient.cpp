#include "dockerclient.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <limits>
#include <sys/socket.h>

namespace dockerdns
{
    namespace http = boost::beast::http;
    typedef boost::asio::local::stream_protocol local;

    const size_t      EVENT_CHUNK_SIZE = 4096;
    const std::string DOCKER_HOST      = "docker";

    // {"type":["container"]}
    const std::string EVENTS_TARGET = "/events?filters=%7B%22type%22%3A%5B%22container%22%5D%7D";

    static const nlohmann::json *findMember( const nlohmann::json &node, std::initializer_list<const char *> path )
    {
        const nlohmann::json *current = &node;
        for ( const char *key : path ) {
            if ( ! current->is_object() )
                return nullptr;
            auto member = current->find( key );
            if ( member == current->end() )
                return nullptr;
            current = &*member;
        }
        return current;
    }

    static std::string getString( const nlohmann::json &node, std::initializer_list<const char *> path )
    {
        const nlohmann::json *member = findMember( node, path );
        if ( member == nullptr || ! member->is_string() )
            return "";
        return member->get<std::string>();
    }

    static void getNetworks( const nlohmann::json &node, ContainerInfo &info )
    {
        const nlohmann::json *networks = findMember( node, { "NetworkSettings", "Networks" } );
        if ( networks == nullptr || ! networks->is_object() )
            return;
        for ( auto network = networks->begin() ; network != networks->end() ; ++network ) {
            info.mNetworks[ network.key() ] = getString( network.value(), { "IPAddress" } );
        }
    }

    static nlohmann::json parseJSON( const std::string &json )
    {
        try {
            return nlohmann::json::parse( json );
        }
        catch ( nlohmann::json::exception &e ) {
            throw RuntimeError( std::string( "invalid JSON: " ) + e.what() );
        }
    }

    static ContainerInfo decodeContainerSummary( const nlohmann::json &node )
    {
        if ( ! node.is_object() )
            throw RuntimeError( "container summary is not an object" );

        ContainerInfo info;
        info.mID          = getString( node, { "Id" } );
        info.mRunning     = getString( node, { "State" } ) == "running";
        info.mNetworkMode = getString( node, { "HostConfig", "NetworkMode" } );

        const nlohmann::json *names = findMember( node, { "Names" } );
        if ( names != nullptr && names->is_array() && ! names->empty() && names->front().is_string() )
            info.mName = names->front().get<std::string>();

        getNetworks( node, info );
        return info;
    }

    ContainerInfo parseContainerSummary( const std::string &json )
    {
        return decodeContainerSummary( parseJSON( json ) );
    }

    std::vector<ContainerInfo> parseContainerList( const std::string &json )
    {
        nlohmann::json top = parseJSON( json );
        if ( ! top.is_array() )
            throw RuntimeError( "container list is not an array" );

        std::vector<ContainerInfo> containers;
        for ( auto &node : top )
            containers.push_back( decodeContainerSummary( node ) );
        return containers;
    }

    ContainerInfo parseContainerInspect( const std::string &json )
    {
        nlohmann::json node = parseJSON( json );
        if ( ! node.is_object() )
            throw RuntimeError( "container is not an object" );

        ContainerInfo info;
        info.mID          = getString( node, { "Id" } );
        info.mName        = getString( node, { "Name" } );
        info.mHostname    = getString( node, { "Config", "Hostname" } );
        info.mNetworkMode = getString( node, { "HostConfig", "NetworkMode" } );
        info.mIPAddress   = getString( node, { "NetworkSettings", "IPAddress" } );

        const nlohmann::json *running = findMember( node, { "State", "Running" } );
        info.mRunning = running != nullptr && running->is_boolean() && running->get<bool>();

        getNetworks( node, info );
        return info;
    }

    ContainerEvent parseEvent( const std::string &json )
    {
        nlohmann::json node = parseJSON( json );
        if ( ! node.is_object() )
            throw RuntimeError( "event is not an object" );

        ContainerEvent event;
        event.mID = getString( node, { "id" } );
        if ( event.mID.empty() )
            event.mID = getString( node, { "Actor", "ID" } );
        event.mStatus = getString( node, { "status" } );
        if ( event.mStatus.empty() )
            event.mStatus = getString( node, { "Action" } );

        // engines before API 1.22 send no Type
        event.mType = getString( node, { "Type" } );
        if ( event.mType.empty() && ! event.mID.empty() && ! event.mStatus.empty() )
            event.mType = "container";

        const nlohmann::json *attributes = findMember( node, { "Actor", "Attributes" } );
        if ( attributes != nullptr && attributes->is_object() ) {
            for ( auto attr = attributes->begin() ; attr != attributes->end() ; ++attr ) {
                if ( attr.value().is_string() )
                    event.mAttributes[ attr.key() ] = attr.value().get<std::string>();
            }
        }
        return event;
    }

    static void sendRequest( local::socket &socket, const std::string &target )
    {
        http::request<http::empty_body> request( http::verb::get, target, 11 );
        request.set( http::field::host, DOCKER_HOST );
        request.set( http::field::user_agent, "dockerdns" );
        http::write( socket, request );
    }

    DockerEventStream::DockerEventStream( const std::string &socket_path, const std::string &target )
        : mSocket( mIOContext ), mClosed( false )
    {
        mParser.body_limit( std::numeric_limits<std::uint64_t>::max() );

        try {
            mSocket.connect( local::endpoint( socket_path ) );
            sendRequest( mSocket, target );
            http::read_header( mSocket, mBuffer, mParser );
        }
        catch ( boost::system::system_error &e ) {
            throw RuntimeError( "cannot GET " + target + " from " + socket_path + ": " + e.what() );
        }

        if ( mParser.get().result() != http::status::ok )
            throw RuntimeError( "GET " + target + " returned " + std::to_string( mParser.get().result_int() ) );

        BOOST_LOG_TRIVIAL(debug) << "docker: subscribed events via " << socket_path << ".";
    }

    DockerEventStream::~DockerEventStream()
    {
        boost::system::error_code ec;
        mSocket.close( ec );
    }

    bool DockerEventStream::popLine( std::string &line )
    {
        while ( true ) {
            std::string::size_type newline = mPending.find( '\n' );
            if ( newline == std::string::npos )
                return false;

            line = mPending.substr( 0, newline );
            mPending.erase( 0, newline + 1 );
            if ( ! line.empty() && line[ line.size() - 1 ] == '\r' )
                line.erase( line.size() - 1 );
            if ( ! line.empty() )
                return true;
        }
    }

    bool DockerEventStream::next( ContainerEvent &event )
    {
        std::string line;
        while ( true ) {
            while ( popLine( line ) ) {
                try {
                    event = parseEvent( line );
                    return true;
                }
                catch ( RuntimeError &e ) {
                    BOOST_LOG_TRIVIAL(warning) << "docker: skipped event \"" << line << "\": " << e.what();
                }
            }

            if ( mClosed || mParser.is_done() )
                return false;

            char chunk[ EVENT_CHUNK_SIZE ];
            mParser.get().body().data = chunk;
            mParser.get().body().size = sizeof( chunk );

            boost::system::error_code ec;
            http::read_some( mSocket, mBuffer, mParser, ec );
            if ( ec == http::error::need_buffer )
                ec = {};
            if ( ec ) {
                if ( mClosed || ec == boost::asio::error::eof || ec == http::error::end_of_stream ) {
                    BOOST_LOG_TRIVIAL(debug) << "docker: event stream closed(" << ec.message() << ").";
                    return false;
                }
                throw RuntimeError( "cannot read events: " + ec.message() );
            }
            mPending.append( chunk, sizeof( chunk ) - mParser.get().body().size );
        }
    }

    void DockerEventStream::close()
    {
        mClosed = true;
        // unblocks a read_some() running in another thread
        ::shutdown( mSocket.native_handle(), SHUT_RDWR );
    }

    std::string DockerClient::get( const std::string &target ) const
    {
        try {
            boost::asio::io_context io_context;
            local::socket socket( io_context );
            socket.connect( local::endpoint( mSocketPath ) );
            sendRequest( socket, target );

            boost::beast::flat_buffer          buffer;
            http::response<http::string_body> response;
            http::read( socket, buffer, response );

            boost::system::error_code ec;
            socket.shutdown( local::socket::shutdown_both, ec );

            if ( response.result() != http::status::ok )
                throw RuntimeError( "GET " + target + " returned " + std::to_string( response.result_int() ) +
                                    ": " + response.body() );
            return response.body();
        }
        catch ( boost::system::system_error &e ) {
            throw RuntimeError( "cannot GET " + target + " from " + mSocketPath + ": " + e.what() );
        }
    }

    std::vector<ContainerInfo> DockerClient::listRunningContainers()
    {
        return parseContainerList( get( "/containers/json" ) );
    }

    ContainerInfo DockerClient::inspectContainer( const std::string &id )
    {
        return parseContainerInspect( get( "/containers/" + id + "/json" ) );
    }

    EventStreamPtr DockerClient::streamEvents()
    {
        return std::make_shared<DockerEventStream>( mSocketPath, EVENTS_TARGET );
    }
}
