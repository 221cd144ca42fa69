#ifndef UDPV4SERVER_HPP
#define UDPV4SERVER_HPP

#include "udpv4client.hpp"
#include "wireformat.hpp"
#include <boost/cstdint.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <vector>

namespace udpv4
{

    struct ServerParameters {
        std::string mAddress;
        uint16_t    mPort;

        ServerParameters()
            : mAddress( "0.0.0.0" ), mPort( 0 )
        {}
    };

    /*!
     * UDP socket bound to a local address. Concurrent sendPacket calls are safe;
     * receivePacket must be called from a single thread.
     */
    class Server : private boost::noncopyable
    {
    private:
        ServerParameters mParameters;
        int              mUDPSocket;

        void openSocket();
        bool isEnableSocket() const;

    public:
        /*!
         * the socket is bound when the server is constructed.
         * @throw SocketError cannot create or bind the socket.
         */
        Server( const ServerParameters &param );
        ~Server();

        uint16_t sendPacket( const ClientParameters &dest, const uint8_t *data, uint16_t size );
        uint16_t sendPacket( const ClientParameters &dest, const std::vector<uint8_t> &packet )
        {
            return sendPacket( dest, packet.data(), packet.size() );
        }
        uint16_t sendPacket( const ClientParameters &dest, const WireFormat &packet )
        {
            return sendPacket( dest, packet.begin(), packet.size() );
        }

        PacketInfo receivePacket();

        /*!
         * @return true when a datagram can be received within timeout_msec.
         */
        bool isReadable( int timeout_msec );

        /*!
         * @return bound port (useful when the server was bound to port 0).
         */
        uint16_t getLocalPort() const;

        void closeSocket();
    };
}

#endif
