#include "udpv4client.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace udpv4
{

    const uint16_t UDP_RECEIVE_BUFFER_SIZE = 65535;

    Client::~Client()
    {
        closeSocket();
    }

    bool Client::isEnableSocket() const
    {
        return mUDPSocket >= 0;
    }

    void Client::openSocket()
    {
        if ( isEnableSocket() ) {
            closeSocket();
        }

        mUDPSocket = socket( AF_INET, SOCK_DGRAM, IPPROTO_UDP );
        if ( mUDPSocket < 0 ) {
            std::string msg = getErrorMessage( "cannot create socket", errno );
            throw SocketError( msg );
        }
        sockaddr_in socket_address;
        std::memset( &socket_address, 0, sizeof( socket_address ) );
        socket_address.sin_family = AF_INET;
        socket_address.sin_addr   = convertAddressStringToBinary( mParameters.mAddress );
        socket_address.sin_port   = htons( mParameters.mPort );
        if ( connect( mUDPSocket, reinterpret_cast<const sockaddr *>( &socket_address ), sizeof( socket_address ) ) <
             0 ) {
            int error_num = errno;
            closeSocket();
            throw SocketError( getErrorMessage( "cannot connect to " + mParameters.mAddress, error_num ) );
        }
    }

    void Client::closeSocket()
    {
        if ( isEnableSocket() ) {
            close( mUDPSocket );
            mUDPSocket = -1;
        }
    }

    uint16_t Client::sendPacket( const uint8_t *data, uint16_t size )
    {
        if ( ! isEnableSocket() )
            openSocket();

        int sent_size = send( mUDPSocket, data, size, 0 );
        if ( sent_size < 0 ) {
            std::string msg = getErrorMessage( "cannot send to " + mParameters.mAddress, errno );
            throw SocketError( msg );
        }
        return sent_size;
    }

    bool Client::receivePacket( PacketInfo &info, int timeout_msec )
    {
        if ( ! isEnableSocket() )
            openSocket();

        pollfd pfd;
        pfd.fd      = mUDPSocket;
        pfd.events  = POLLIN;
        pfd.revents = 0;

        int ready;
        do {
            ready = poll( &pfd, 1, timeout_msec );
        } while ( ready < 0 && errno == EINTR );
        if ( ready < 0 )
            throw SocketError( getErrorMessage( "cannot poll", errno ) );
        if ( ready == 0 )
            return false;

        sockaddr_in          peer_address;
        socklen_t            peer_address_size = sizeof( peer_address );
        std::vector<uint8_t> receive_buffer( UDP_RECEIVE_BUFFER_SIZE );
        int                  recv_size = recvfrom( mUDPSocket,
                                                   receive_buffer.data(),
                                                   receive_buffer.size(),
                                                   0,
                                                   reinterpret_cast<sockaddr *>( &peer_address ),
                                                   &peer_address_size );
        if ( recv_size < 0 ) {
            throw SocketError( getErrorMessage( "cannot recv packet", errno ) );
        }

        info.mSourceAddress = convertAddressBinaryToString( peer_address.sin_addr );
        info.mSourcePort    = ntohs( peer_address.sin_port );
        info.mPayload.assign( receive_buffer.begin(), receive_buffer.begin() + recv_size );
        return true;
    }
}
