#ifndef NAMETABLE_HPP
#define NAMETABLE_HPP

#include "domainname.hpp"
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <map>
#include <string>

namespace dockerdns
{
    /*!
     * name to IPv4 address table shared by the event monitor(writer) and the
     * DNS responder(readers).
     * Keys are canonical domainnames, so "Web.Docker." and "web.docker" are the same entry.
     */
    class NameTable : private boost::noncopyable
    {
    public:
        typedef boost::optional<std::string> Address;

        /*!
         * insert or overwrite. A malformed name or a non-IPv4 address is logged and ignored.
         */
        void add( const std::string &name, const std::string &address );

        Address get( const std::string &name ) const;

        /*!
         * move the address of old_name to new_name.
         * No-op when either name is empty, they are equal, or old_name has no entry.
         */
        void rename( const std::string &old_name, const std::string &new_name );

        void remove( const std::string &name );

        size_t size() const;

    private:
        typedef std::map<Domainname, std::string> Storage;

        Storage                    mStorage;
        mutable boost::shared_mutex mMutex;

        /*!
         * @return false when name cannot be a key.
         */
        static bool getKey( const std::string &name, Domainname &key );
    };
}

#endif
