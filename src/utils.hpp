#ifndef UTILS_HPP
#define UTILS_HPP

#include <arpa/inet.h>
#include <boost/cstdint.hpp>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <vector>

typedef std::vector<uint8_t> PacketData;

/*!
 * thrown when a textual IP address cannot be converted to in_addr.
 */
class InvalidAddressFormatError : public std::runtime_error
{
public:
    InvalidAddressFormatError( const std::string &msg ) : std::runtime_error( msg )
    {
    }
};

/*!
 * thrown when a socket operation fails.
 */
class SocketError : public std::runtime_error
{
public:
    SocketError( const std::string &msg ) : std::runtime_error( msg )
    {
    }
};

std::string getErrorMessage( const std::string &msg, int error_number );

in_addr convertAddressStringToBinary( const std::string &str, int address_family = AF_INET );
std::string convertAddressBinaryToString( in_addr bin, int address_family = AF_INET );
bool isIPv4Address( const std::string &str );

/*!
 * split "address:port" into its parts. When no port is given, default_port is used.
 * @throw InvalidAddressFormatError address is not IPv4 or port is not a number in 1-65535.
 */
void splitAddressAndPort( const std::string &str, uint16_t default_port,
                          std::string &address, uint16_t &port );

void encodeToHex( const std::vector<uint8_t> &src, std::string &dst );

#endif
