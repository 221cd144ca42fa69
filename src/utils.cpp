#include "utils.hpp"
#include <boost/lexical_cast.hpp>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>

const int ERROR_BUFFER_SIZE = 256;

std::string getErrorMessage( const std::string &msg, int error_number )
{
    char  buff[ ERROR_BUFFER_SIZE ];
    char *err = strerror_r( error_number, buff, sizeof( buff ) );
    return msg + "(" + err + ")";
}

in_addr convertAddressStringToBinary( const std::string &str, int address_family )
{
    in_addr address;
    if ( inet_pton( address_family, str.c_str(), &address ) > 0 )
        return address;
    else
        throw InvalidAddressFormatError( str + " is invalid IPv4 address" );
}

std::string convertAddressBinaryToString( in_addr bin, int address_family )
{
    char address[ INET_ADDRSTRLEN ];
    if ( NULL == inet_ntop( address_family, &bin, address, sizeof( address ) ) ) {
        throw InvalidAddressFormatError( "cannot convert address from bin to text" );
    }
    return std::string( address );
}

bool isIPv4Address( const std::string &str )
{
    in_addr address;
    return inet_pton( AF_INET, str.c_str(), &address ) > 0;
}

void splitAddressAndPort( const std::string &str, uint16_t default_port,
                          std::string &address, uint16_t &port )
{
    std::string::size_type colon = str.rfind( ':' );
    if ( colon == std::string::npos ) {
        address = str;
        port    = default_port;
    }
    else {
        address = str.substr( 0, colon );
        try {
            unsigned int p = boost::lexical_cast<unsigned int>( str.substr( colon + 1 ) );
            if ( p == 0 || p > 0xffff )
                throw InvalidAddressFormatError( "port of " + str + " is out of range" );
            port = p;
        }
        catch ( boost::bad_lexical_cast & ) {
            throw InvalidAddressFormatError( "port of " + str + " is not a number" );
        }
    }

    if ( ! isIPv4Address( address ) )
        throw InvalidAddressFormatError( address + " is invalid IPv4 address" );
}

void encodeToHex( const std::vector<uint8_t> &src, std::string &dst )
{
    dst.clear();

    if ( src.empty() ) {
        dst = "00";
        return;
    }

    std::ostringstream os;
    for ( uint8_t v : src ) {
        os << std::setw( 2 ) << std::setfill( '0' ) << std::hex << std::noshowbase << std::uppercase;
        os << (unsigned int)v;
    }
    dst = os.str();
}
