#ifndef DOCKERCLIENT_HPP
#define DOCKERCLIENT_HPP

#include "containerruntime.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <string>

namespace dockerdns
{
    /*!
     * decode one element of GET /containers/json.
     * @throw RuntimeError malformed JSON.
     */
    ContainerInfo parseContainerSummary( const std::string &json );

    /*!
     * decode GET /containers/{id}/json.
     * @throw RuntimeError malformed JSON.
     */
    ContainerInfo parseContainerInspect( const std::string &json );

    /*!
     * decode GET /containers/json.
     * @throw RuntimeError malformed JSON or not an array.
     */
    std::vector<ContainerInfo> parseContainerList( const std::string &json );

    /*!
     * decode one line of GET /events.
     * @throw RuntimeError malformed JSON.
     */
    ContainerEvent parseEvent( const std::string &json );

    /*!
     * chunked response of GET /events. Each line of the body is a JSON object.
     */
    class DockerEventStream : public EventStream
    {
    public:
        /*!
         * send the request and read the response header.
         * @throw RuntimeError
         */
        DockerEventStream( const std::string &socket_path, const std::string &target );
        virtual ~DockerEventStream();

        virtual bool next( ContainerEvent &event );
        virtual void close();

    private:
        typedef boost::beast::http::response_parser<boost::beast::http::buffer_body> Parser;

        boost::asio::io_context                 mIOContext;
        boost::asio::local::stream_protocol::socket mSocket;
        boost::beast::flat_buffer               mBuffer;
        Parser                                  mParser;
        std::string                             mPending;
        std::atomic<bool>                       mClosed;

        bool popLine( std::string &line );
    };

    /*!
     * Docker Engine API client over the local unix socket.
     * Each request uses its own connection.
     */
    class DockerClient : public ContainerRuntime
    {
    public:
        DockerClient( const std::string &socket_path ) : mSocketPath( socket_path )
        {}

        virtual std::vector<ContainerInfo> listRunningContainers();
        virtual ContainerInfo inspectContainer( const std::string &id );
        virtual EventStreamPtr streamEvents();

    private:
        std::string mSocketPath;

        /*!
         * @return response body of a 200 response.
         * @throw RuntimeError connection failure or other status.
         */
        std::string get( const std::string &target ) const;
    };
}

#endif
