#ifndef WIREFORMAT_HPP
#define WIREFORMAT_HPP

#include "utils.hpp"
#include <arpa/inet.h>
#include <boost/cstdint.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/*!
 * output buffer of a DNS message.
 */
class WireFormat
{
private:
    PacketData mBuffer;

    void checkIndex( uint16_t i ) const
    {
        if ( i >= mBuffer.size() )
            throw std::runtime_error( "range error" );
    }

public:
    WireFormat()
    {
        mBuffer.reserve( 512 );
    }
    WireFormat( const PacketData &data ) : mBuffer( data )
    {
    }
    WireFormat( const uint8_t *begin, const uint8_t *end ) : mBuffer( begin, end )
    {
    }

    void push_back( uint8_t v )
    {
        if ( mBuffer.size() >= 0xffff )
            throw std::runtime_error( "DNS message is too large" );
        mBuffer.push_back( v );
    }

    uint8_t pop_back();

    void clear()
    {
        mBuffer.clear();
    }

    void pushUInt8( uint8_t v )
    {
        push_back( v );
    }

    void pushUInt16HtoN( uint16_t v )
    {
        push_back( ( uint8_t )( 0xff & ( v >> 8 ) ) );
        push_back( ( uint8_t )( 0xff & ( v >> 0 ) ) );
    }

    void pushUInt32HtoN( uint32_t v )
    {
        push_back( ( uint8_t )( 0xff & ( v >> 24 ) ) );
        push_back( ( uint8_t )( 0xff & ( v >> 16 ) ) );
        push_back( ( uint8_t )( 0xff & ( v >> 8 ) ) );
        push_back( ( uint8_t )( 0xff & ( v >> 0 ) ) );
    }

    void pushBuffer( const uint8_t *begin, const uint8_t *end )
    {
        for ( ; begin != end; begin++ )
            push_back( *begin );
    }

    void pushBuffer( const PacketData &data )
    {
        pushBuffer( data.data(), data.data() + data.size() );
    }

    void pushBuffer( const std::string &data )
    {
        for ( char c : data )
            push_back( static_cast<uint8_t>( c ) );
    }

    const uint8_t &operator[]( uint16_t i ) const
    {
        checkIndex( i );
        return mBuffer[ i ];
    }

    uint8_t &operator[]( uint16_t i )
    {
        checkIndex( i );
        return mBuffer[ i ];
    }

    const uint8_t &at( uint16_t i ) const
    {
        return ( *this )[ i ];
    }

    /*!
     * overwrite a 16bit field which was already pushed (e.g. RDLENGTH).
     */
    void setUInt16HtoN( uint16_t position, uint16_t v );

    uint16_t size() const
    {
        return mBuffer.size();
    }

    const uint8_t *begin() const
    {
        return mBuffer.data();
    }

    const uint8_t *end() const
    {
        return mBuffer.data() + mBuffer.size();
    }

    const PacketData &get() const
    {
        return mBuffer;
    }
};

#endif
