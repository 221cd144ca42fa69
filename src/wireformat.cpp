#include "wireformat.hpp"

uint8_t WireFormat::pop_back()
{
    if ( mBuffer.empty() )
        throw std::runtime_error( "cannot pop_back because buffer is emptry." );
    uint8_t ret = mBuffer.back();
    mBuffer.pop_back();
    return ret;
}

void WireFormat::setUInt16HtoN( uint16_t position, uint16_t v )
{
    checkIndex( position + 1 );
    mBuffer[ position ]     = ( uint8_t )( 0xff & ( v >> 8 ) );
    mBuffer[ position + 1 ] = ( uint8_t )( 0xff & ( v >> 0 ) );
}
