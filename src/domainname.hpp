#ifndef DOMAINNAME_HPP
#define DOMAINNAME_HPP

#include "wireformat.hpp"
#include <deque>
#include <map>
#include <iostream>
#include <stdexcept>
#include <boost/operators.hpp>

namespace dockerdns
{
    const unsigned int MAX_LABEL_LENGTH      = 63;
    const unsigned int MAX_DOMAINNAME_LENGTH = 255;

    /*!
     * thrown when a DNS message is malformed.
     */
    class FormatError : public std::runtime_error
    {
    public:
        FormatError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * thrown when a string is not a valid domainname.
     */
    class DomainnameError : public std::runtime_error
    {
    public:
        DomainnameError( const std::string &msg )
            : std::runtime_error( msg )
        {
        }
    };

    class Domainname : public boost::less_than_comparable<Domainname>
    {
    private:
        std::deque<std::string> labels;
        std::deque<std::string> canonical_labels;

    public:
        Domainname( const std::deque<std::string> &l = std::deque<std::string>() );

        /*!
         * parse presentation format("www.Example.com." or "www.example.com").
         * @throw DomainnameError empty label, too long label or name, bad escape.
         */
        explicit Domainname( const std::string &name );
        Domainname( const char *name );

        std::string toString() const;

        /*!
         * length of the uncompressed wire format.
         */
        unsigned int size() const;

        const std::deque<std::string> &getLabels() const
        {
            return labels;
        }
        const std::deque<std::string> &getCanonicalLabels() const
        {
            return canonical_labels;
        }
        uint32_t getLabelCount() const
        {
            return labels.size();
        }
        bool isRoot() const
        {
            return labels.empty();
        }

        void addSuffix( const std::string & );
        void popSubdomain();

        Domainname getCanonicalDomainname() const;

        static const uint8_t *parsePacket( Domainname &   ref_domainname,
                                           const uint8_t *packet_begin,
                                           const uint8_t *packet_end,
                                           const uint8_t *begin,
                                           int            recur = 0 );

        bool operator==( const Domainname &rhs ) const;
        bool operator<( const Domainname &rhs ) const;
    };

    std::ostream &operator<<( std::ostream &os, const Domainname &name );

    /*!
     * offsets of domainnames already written to a message, for name compression.
     */
    class OffsetDB
    {
    private:
        typedef std::map<Domainname, uint16_t>  OffsetContainer;
        typedef OffsetContainer::const_iterator OffsetContainerIterator;

        OffsetContainer mOffsets;

        uint16_t findDomainname( const Domainname &name ) const;
        void add( const Domainname &name, uint16_t offset );

    public:
        static const uint16_t NOT_FOUND = 0xffff;

        uint16_t outputWireFormat( const Domainname &, WireFormat & );
    };
}

#endif
