#include "nametable.hpp"
#include "utils.hpp"
#include <boost/log/trivial.hpp>
#include <boost/thread/locks.hpp>

namespace dockerdns
{
    bool NameTable::getKey( const std::string &name, Domainname &key )
    {
        try {
            Domainname parsed( name );
            if ( parsed.isRoot() ) {
                BOOST_LOG_TRIVIAL(debug) << "nametable: empty name \"" << name << "\".";
                return false;
            }
            key = parsed.getCanonicalDomainname();
            return true;
        }
        catch ( DomainnameError &e ) {
            BOOST_LOG_TRIVIAL(debug) << "nametable: " << e.what();
        }
        return false;
    }

    void NameTable::add( const std::string &name, const std::string &address )
    {
        Domainname key;
        if ( ! getKey( name, key ) ) {
            BOOST_LOG_TRIVIAL(warning) << "nametable: ignored invalid name \"" << name << "\".";
            return;
        }
        if ( ! isIPv4Address( address ) ) {
            BOOST_LOG_TRIVIAL(warning) << "nametable: ignored invalid address \"" << address
                                       << "\" for " << key << ".";
            return;
        }

        boost::unique_lock<boost::shared_mutex> lock( mMutex );
        mStorage[ key ] = address;
        BOOST_LOG_TRIVIAL(info) << "nametable: added " << key << " -> " << address << ".";
    }

    NameTable::Address NameTable::get( const std::string &name ) const
    {
        Domainname key;
        if ( ! getKey( name, key ) )
            return Address();

        boost::shared_lock<boost::shared_mutex> lock( mMutex );
        Storage::const_iterator entry = mStorage.find( key );
        if ( entry == mStorage.end() )
            return Address();
        return entry->second;
    }

    void NameTable::rename( const std::string &old_name, const std::string &new_name )
    {
        if ( old_name.empty() || new_name.empty() || old_name == new_name )
            return;

        Domainname old_key, new_key;
        if ( ! getKey( old_name, old_key ) || ! getKey( new_name, new_key ) )
            return;

        boost::unique_lock<boost::shared_mutex> lock( mMutex );
        Storage::iterator entry = mStorage.find( old_key );
        if ( entry == mStorage.end() )
            return;

        std::string address = entry->second;
        mStorage.erase( entry );
        mStorage[ new_key ] = address;
        BOOST_LOG_TRIVIAL(info) << "nametable: renamed " << old_key << " -> " << new_key
                                << " (" << address << ").";
    }

    void NameTable::remove( const std::string &name )
    {
        Domainname key;
        if ( ! getKey( name, key ) )
            return;

        boost::unique_lock<boost::shared_mutex> lock( mMutex );
        if ( mStorage.erase( key ) > 0 )
            BOOST_LOG_TRIVIAL(info) << "nametable: removed " << key << ".";
    }

    size_t NameTable::size() const
    {
        boost::shared_lock<boost::shared_mutex> lock( mMutex );
        return mStorage.size();
    }
}
