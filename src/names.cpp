#include "names.hpp"

namespace dockerdns
{
    static bool isNameCharacter( char c )
    {
        return ( 'a' <= c && c <= 'z' ) ||
            ( 'A' <= c && c <= 'Z' ) ||
            ( '0' <= c && c <= '9' ) ||
            c == '_' || c == '.' || c == '-';
    }

    std::string getName( const std::string &raw_name, const std::string &domain )
    {
        std::string name;
        for ( char c : raw_name ) {
            if ( isNameCharacter( c ) )
                name.push_back( c );
        }
        if ( ! name.empty() && name[ name.size() - 1 ] == '.' )
            name.erase( name.size() - 1 );
        if ( name.empty() )
            return name;

        if ( domain.empty() )
            return name;
        return name + "." + domain;
    }
}
