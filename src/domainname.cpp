#include "domainname.hpp"
#include <iomanip>
#include <cstring>
#include <cctype>
#include <sstream>

namespace dockerdns
{
    static uint8_t toLower( uint8_t c )
    {
        if ( 'A' <= c && c <= 'Z' ) {
            return 'a' + c - 'A';
        }
        return c;
    }

    static std::string toLowerLabel( const std::string &label )
    {
        std::string lower_label;
        for ( unsigned int i = 0; i < label.size(); i++ )
            lower_label.push_back( toLower( label[ i ] ) );
        return lower_label;
    }

    static void throwInvalidDomainnameString( const char *name, const char *reason )
    {
        std::ostringstream os;
        os << "invalid domainname string: \"" << name << "\" (" << reason << ")";
        throw DomainnameError( os.str() );
    }

    static void pushLabel( const char *name, const std::string &label, std::deque<std::string> &labels )
    {
        if ( label.empty() )
            throwInvalidDomainnameString( name, "empty label" );
        if ( label.size() > MAX_LABEL_LENGTH )
            throwInvalidDomainnameString( name, "too long label" );
        labels.push_back( label );
    }

    static void stringToLabels( const char *name, std::deque<std::string> &labels )
    {
        labels.clear();

        if ( name == NULL || name[ 0 ] == 0 )
            return;

        // "." is the root.
        if ( name[ 0 ] == '.' && name[ 1 ] == 0 )
            return;

        unsigned int name_length = std::strlen( name );
        std::string  label;
        for ( unsigned int i = 0; i < name_length; i++ ) {
            if ( name[ i ] == '\\' ) {
                if ( name_length <= i + 1 )
                    throwInvalidDomainnameString( name, "bad escape" );
                if ( name[ i + 1 ] == '\\' ) {
                    label.push_back( '\\' );
                    i++;
                }
                else if ( name[ i + 1 ] == '.' ) {
                    label.push_back( '.' );
                    i++;
                }
                else if ( std::isdigit( name[ i + 1 ] ) ) {
                    if ( name_length <= i + 3 ||
                         name[ i + 1 ] < '0' || name[ i + 1 ] > '2' ||
                         ! std::isdigit( name[ i + 2 ] ) ||
                         ! std::isdigit( name[ i + 3 ] ) ) {
                        throwInvalidDomainnameString( name, "bad escape" );
                    }
                    int code = ( name[ i + 1 ] - '0' ) * 100 + ( name[ i + 2 ] - '0' ) * 10 + ( name[ i + 3 ] - '0' );
                    if ( code > 255 )
                        throwInvalidDomainnameString( name, "bad escape" );
                    label.push_back( (uint8_t)code );
                    i += 3;
                }
                else
                    throwInvalidDomainnameString( name, "bad escape" );
            }
            else if ( name[ i ] == '.' ) {
                pushLabel( name, label, labels );
                label = "";
            }
            else {
                label.push_back( name[ i ] );
            }
        }
        // trailing dot leaves an empty last label.
        if ( label != "" )
            pushLabel( name, label, labels );

        unsigned int wire_length = 1;
        for ( auto &l : labels )
            wire_length += 1 + l.size();
        if ( wire_length > MAX_DOMAINNAME_LENGTH )
            throwInvalidDomainnameString( name, "too long name" );
    }

    static void canonicalizeLabels( const std::deque<std::string> &from,
                                    std::deque<std::string> &to )
    {
        to.clear();
        for ( unsigned int i = 0; i < from.size(); i++ ) {
            to.push_back( toLowerLabel( from[ i ] ) );
        }
    }

    Domainname::Domainname( const std::deque<std::string> &l )
        : labels( l )
    {
        canonicalizeLabels( labels, canonical_labels );
    }

    Domainname::Domainname( const char *name )
    {
        stringToLabels( name, labels );
        canonicalizeLabels( labels, canonical_labels );
    }

    Domainname::Domainname( const std::string &name )
    {
        stringToLabels( name.c_str(), labels );
        canonicalizeLabels( labels, canonical_labels );
    }

    std::string Domainname::toString() const
    {
        if ( labels.empty() )
            return ".";

        std::stringstream result;
        for ( auto label : labels ) {
            for ( auto c : label ) {
                if ( c == '\\' ) {
                    result << "\\\\";
                }
                else if ( c == '.' ) {
                    result << "\\.";
                }
                else if ( std::isprint( static_cast<unsigned char>( c ) ) ) {
                    result << c;
                }
                else {
                    result << '\\' << std::dec << std::setw( 3 ) << std::setfill( '0' )
                           << (unsigned int)(uint8_t)c;
                }
            }
            result << '.';
        }

        return result.str();
    }

    const uint8_t *Domainname::parsePacket( Domainname &   ref_domainname,
                                            const uint8_t *packet_begin,
                                            const uint8_t *packet_end,
                                            const uint8_t *begin,
                                            int            recur )
    {
        if ( recur > 100 ) {
            throw FormatError( "detected domainname decompress loop" );
        }
        if ( packet_begin == packet_end ) {
            throw FormatError( "cannot parse empty data as a domainname" );
        }

        const uint8_t *p = begin;
        while ( true ) {
            if ( p >= packet_end )
                throw FormatError( "domainname size is too short(truncated ?)" );
            if ( *p == 0 )
                break;

            // compressed name
            if ( ( *p & 0xC0 ) == 0xC0 ) {
                if ( packet_end - p < 2 ) {
                    throw FormatError( "domainname size is too short for decompression" );
                }
                int offset = ( ( p[ 0 ] << 8 ) + p[ 1 ] ) & 0x3fff;
                if ( packet_begin + offset >= p ) {
                    throw FormatError( "detected forward reference of domainname decompression" );
                }

                parsePacket( ref_domainname, packet_begin, packet_end, packet_begin + offset, recur + 1 );
                return p + 2;
            }
            if ( *p & 0xC0 )
                throw FormatError( "unsupported label type" );

            uint8_t label_length = *p;
            p++;

            if ( packet_end - p < label_length )
                throw FormatError( "domainname size is too short(truncated ?)" );
            ref_domainname.addSuffix( std::string( reinterpret_cast<const char *>( p ), label_length ) );
            p += label_length;

            if ( ref_domainname.size() > MAX_DOMAINNAME_LENGTH )
                throw FormatError( "too long domainname" );
        }

        p++;
        return p;
    }

    unsigned int Domainname::size() const
    {
        unsigned int size = 1;
        for ( auto &label : labels ) {
            size += ( 1 + label.size() );
        }
        return size;
    }

    Domainname Domainname::getCanonicalDomainname() const
    {
        return Domainname( getCanonicalLabels() );
    }

    void Domainname::addSuffix( const std::string &label )
    {
        labels.push_back( label );
        canonical_labels.push_back( toLowerLabel( label ) );
    }

    void Domainname::popSubdomain()
    {
        labels.pop_front();
        canonical_labels.pop_front();
    }

    std::ostream &operator<<( std::ostream &os, const Domainname &name )
    {
        return os << name.toString();
    }

    bool Domainname::operator==( const Domainname &rhs ) const
    {
        return getCanonicalLabels() == rhs.getCanonicalLabels();
    }

    bool Domainname::operator<( const Domainname &rhs ) const
    {
        auto llabel = getCanonicalLabels().rbegin();
        auto rlabel = rhs.getCanonicalLabels().rbegin();

        for ( ; true; llabel++, rlabel++ ) {
            if ( rlabel == rhs.getCanonicalLabels().rend() )
                return false;
            if ( llabel == getCanonicalLabels().rend() )
                return true;
            if ( *llabel == *rlabel )
                continue;
            return *llabel < *rlabel;
        }
    }

    uint16_t OffsetDB::findDomainname( const Domainname &name ) const
    {
        OffsetContainerIterator offset = mOffsets.find( name );
        if ( offset == mOffsets.end() )
            return NOT_FOUND;
        else
            return offset->second;
    }

    void OffsetDB::add( const Domainname &name, uint16_t offset )
    {
        // compression pointers are 14 bits.
        if ( offset > 0x3fff )
            return;
        if ( NOT_FOUND == findDomainname( name ) )
            mOffsets.insert( std::make_pair( name, offset ) );
    }

    uint16_t OffsetDB::outputWireFormat( const Domainname &original, WireFormat &message )
    {
        uint16_t pos        = message.size();
        uint16_t wrote_size = 0;

        for ( Domainname name = original; name.getLabelCount() > 0; ) {
            uint16_t offset = findDomainname( name );
            if ( offset != NOT_FOUND ) {
                message.pushUInt8( 0xC0 | ( ( offset >> 8 ) & 0xff ) );
                message.pushUInt8( 0xff & offset );
                wrote_size += 2;
                return wrote_size;
            }
            else {
                add( name, pos );
                std::string label = name.getLabels().front();
                message.pushUInt8( label.size() );
                message.pushBuffer( label );
                pos += ( 1 + label.size() );
                wrote_size += ( 1 + label.size() );
                name.popSubdomain();
            }
        }
        message.pushUInt8( 0 );
        wrote_size++;

        return wrote_size;
    }
}
