#ifndef NAMES_HPP
#define NAMES_HPP

#include <string>

namespace dockerdns
{
    /*!
     * resolvable (name, address) pair derived from a container at inspection time.
     */
    struct Record {
        std::string mID;
        std::string mName;
        bool        mRunning;
        std::string mAddress;

        Record() : mRunning( false )
        {}

        Record( const std::string &id, const std::string &name, bool running, const std::string &address )
            : mID( id ), mName( name ), mRunning( running ), mAddress( address )
        {}

        bool hasAddress() const
        {
            return ! mAddress.empty();
        }
    };

    /*!
     * derive the fully qualified name of a container or static record.
     * Characters outside [A-Za-z0-9_.-] and a trailing dot are removed, then "." + domain is appended.
     * @return empty string when nothing of raw_name remains.
     */
    std::string getName( const std::string &raw_name, const std::string &domain );
}

#endif
