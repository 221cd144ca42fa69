#include "udpv4server.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace udpv4
{

    const uint16_t UDP_RECEIVE_BUFFER_SIZE = 65535;

    Server::Server( const ServerParameters &param )
        : mParameters( param ), mUDPSocket( -1 )
    {
        openSocket();
    }

    Server::~Server()
    {
        closeSocket();
    }

    bool Server::isEnableSocket() const
    {
        return mUDPSocket >= 0;
    }

    void Server::openSocket()
    {
        if ( isEnableSocket() ) {
            closeSocket();
        }

        mUDPSocket = socket( AF_INET, SOCK_DGRAM, IPPROTO_UDP );
        if ( mUDPSocket < 0 ) {
            std::string msg = getErrorMessage( "cannot create socket", errno );
            throw SocketError( msg );
        }

        int one = 1;
        int err = setsockopt( mUDPSocket, SOL_SOCKET, SO_REUSEADDR, &one, sizeof( one ) );
        if ( err ) {
            std::string msg = getErrorMessage( "cannot setsocketopt SO_REUSEADDR", errno );
            closeSocket();
            throw SocketError( msg );
        }

        sockaddr_in socket_address;
        std::memset( &socket_address, 0, sizeof( socket_address ) );
        socket_address.sin_family = AF_INET;
        socket_address.sin_addr   = convertAddressStringToBinary( mParameters.mAddress );
        socket_address.sin_port   = htons( mParameters.mPort );
        if ( bind( mUDPSocket, reinterpret_cast<const sockaddr *>( &socket_address ), sizeof( socket_address ) ) < 0 ) {
            int error_num = errno;
            closeSocket();
            std::ostringstream str;
            str << "cannot bind to " << mParameters.mAddress << ":" << mParameters.mPort << ".";
            throw SocketError( getErrorMessage( str.str(), error_num ) );
        }
    }

    void Server::closeSocket()
    {
        if ( isEnableSocket() ) {
            close( mUDPSocket );
            mUDPSocket = -1;
        }
    }

    uint16_t Server::sendPacket( const ClientParameters &dest, const uint8_t *data, uint16_t size )
    {
        if ( ! isEnableSocket() )
            throw SocketError( "socket is already closed" );

        sockaddr_in socket_address;
        std::memset( &socket_address, 0, sizeof( socket_address ) );
        socket_address.sin_family = AF_INET;
        socket_address.sin_addr   = convertAddressStringToBinary( dest.mAddress );
        socket_address.sin_port   = htons( dest.mPort );
        int sent_size             = sendto( mUDPSocket,
                                            data,
                                            size,
                                            0,
                                            reinterpret_cast<const sockaddr *>( &socket_address ),
                                            sizeof( socket_address ) );
        if ( sent_size < 0 ) {
            std::ostringstream s;
            s << "cannot send to " << dest.mAddress << ":" << dest.mPort << ".";
            std::string msg = getErrorMessage( s.str(), errno );
            throw SocketError( msg );
        }
        return sent_size;
    }

    bool Server::isReadable( int timeout_msec )
    {
        if ( ! isEnableSocket() )
            return false;

        pollfd pfd;
        pfd.fd      = mUDPSocket;
        pfd.events  = POLLIN;
        pfd.revents = 0;

        int ready = poll( &pfd, 1, timeout_msec );
        if ( ready < 0 ) {
            if ( errno == EINTR )
                return false;
            throw SocketError( getErrorMessage( "cannot poll", errno ) );
        }
        return ready > 0;
    }

    uint16_t Server::getLocalPort() const
    {
        sockaddr_in socket_address;
        socklen_t   socket_address_size = sizeof( socket_address );
        if ( getsockname( mUDPSocket, reinterpret_cast<sockaddr *>( &socket_address ), &socket_address_size ) < 0 )
            throw SocketError( getErrorMessage( "cannot getsockname", errno ) );
        return ntohs( socket_address.sin_port );
    }

    PacketInfo Server::receivePacket()
    {
        if ( ! isEnableSocket() )
            throw SocketError( "socket is already closed" );

        std::vector<uint8_t> receive_buffer;
        receive_buffer.resize( UDP_RECEIVE_BUFFER_SIZE );
        sockaddr_in source_address;
        socklen_t   source_address_size = sizeof( source_address );

        int recv_size = recvfrom( mUDPSocket,
                                  receive_buffer.data(),
                                  receive_buffer.size(),
                                  0,
                                  reinterpret_cast<sockaddr *>( &source_address ),
                                  &source_address_size );
        if ( recv_size < 0 ) {
            std::string msg = getErrorMessage( "cannot recvfrom", errno );
            throw SocketError( msg );
        }

        PacketInfo info;
        info.mSourceAddress = convertAddressBinaryToString( source_address.sin_addr );
        info.mSourcePort    = ntohs( source_address.sin_port );
        info.mPayload.insert( info.mPayload.end(), receive_buffer.begin(), receive_buffer.begin() + recv_size );

        return info;
    }
}
