#ifndef UDPV4CLIENT_HPP
#define UDPV4CLIENT_HPP

#include "wireformat.hpp"
#include <boost/cstdint.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <vector>

namespace udpv4
{

    struct ClientParameters {
        std::string mAddress;
        uint16_t    mPort;

        ClientParameters() : mPort( 0 )
        {}
    };

    struct PacketInfo {
        std::string          mSourceAddress;
        uint16_t             mSourcePort;
        std::vector<uint8_t> mPayload;

        PacketInfo() : mSourcePort( 0 )
        {}

        /*!
         * @return payload length of UDP packet(bytes)
         */
        uint16_t getPayloadLength() const
        {
            return mPayload.size();
        }

        const uint8_t *getData() const
        {
            return mPayload.data();
        }

        const uint8_t *begin() const
        {
            return getData();
        }

        const uint8_t *end() const
        {
            return begin() + mPayload.size();
        }
    };

    /*!
     * UDP socket connected to a single peer.
     */
    class Client : private boost::noncopyable
    {
    private:
        ClientParameters mParameters;
        int              mUDPSocket;

        void openSocket();
        void closeSocket();
        bool isEnableSocket() const;

    public:
        Client( const ClientParameters &param ) : mParameters( param ), mUDPSocket( -1 )
        {
        }

        ~Client();

        uint16_t sendPacket( const uint8_t *data, uint16_t size );
        uint16_t sendPacket( const std::vector<uint8_t> &packet )
        {
            return sendPacket( packet.data(), packet.size() );
        }
        uint16_t sendPacket( const WireFormat &packet )
        {
            return sendPacket( packet.begin(), packet.size() );
        }

        /*!
         * wait for a datagram from the peer.
         * @param timeout_msec negative value waits forever.
         * @return false when no datagram arrived before the timeout.
         * @throw SocketError receive error (e.g. ICMP port unreachable).
         */
        bool receivePacket( PacketInfo &info, int timeout_msec = -1 );
    };
}

#endif
