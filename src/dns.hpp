#ifndef DNS_HPP
#define DNS_HPP

#include "utils.hpp"
#include "domainname.hpp"
#include <boost/cstdint.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dockerdns
{
    typedef uint8_t Opcode;
    const Opcode    OPCODE_QUERY  = 0;
    const Opcode    OPCODE_NOTIFY = 4;
    const Opcode    OPCODE_UPDATE = 5;

    typedef uint16_t Class;
    const Class      CLASS_IN   = 1;
    const Class      CLASS_CH   = 3;
    const Class      CLASS_HS   = 4;
    const Class      CLASS_NONE = 254;
    const Class      CLASS_ANY  = 255;

    typedef uint16_t Type;
    const Type       TYPE_A     = 1;
    const Type       TYPE_NS    = 2;
    const Type       TYPE_CNAME = 5;
    const Type       TYPE_SOA   = 6;
    const Type       TYPE_PTR   = 12;
    const Type       TYPE_MX    = 15;
    const Type       TYPE_TXT   = 16;
    const Type       TYPE_AAAA  = 28;
    const Type       TYPE_SRV   = 33;
    const Type       TYPE_OPT   = 41;
    const Type       TYPE_IXFR  = 251;
    const Type       TYPE_AXFR  = 252;
    const Type       TYPE_ANY   = 255;

    typedef uint32_t TTL;

    typedef uint8_t    ResponseCode;
    const ResponseCode NO_ERROR        = 0;
    const ResponseCode FORMAT_ERROR    = 1;
    const ResponseCode SERVER_ERROR    = 2;
    const ResponseCode NAME_ERROR      = 3;
    const ResponseCode NXDOMAIN        = 3;
    const ResponseCode NOT_IMPLEMENTED = 4;
    const ResponseCode REFUSED         = 5;

    class RDATA;
    typedef std::shared_ptr<RDATA> RDATAPtr;

    class RDATA
    {
    public:
        virtual ~RDATA()
        {
        }

        virtual std::string toString() const                                     = 0;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const = 0;
        virtual Type     type() const                                            = 0;
        virtual uint16_t size() const                                            = 0;
    };

    /*!
     * RDATA of a type this server does not interpret.
     */
    class RecordRaw : public RDATA
    {
    private:
        uint16_t             mRRType;
        std::vector<uint8_t> mData;

    public:
        RecordRaw( uint16_t t, const std::vector<uint8_t> &d )
            : mRRType( t ), mData( d )
        {
        }

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual Type type() const
        {
            return mRRType;
        }
        virtual uint16_t size() const
        {
            return mData.size();
        }

        static RDATAPtr parse( Type t, const uint8_t *begin, const uint8_t *end );
    };

    class RecordA : public RDATA
    {
    private:
        in_addr mSinAddr;

    public:
        RecordA( in_addr addr );
        RecordA( const std::string &in_address );

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual Type type() const
        {
            return TYPE_A;
        }
        virtual uint16_t size() const
        {
            return sizeof( mSinAddr );
        }

        std::string getAddress() const;
        static RDATAPtr parse( const uint8_t *begin, const uint8_t *end );
    };

    class RecordAAAA : public RDATA
    {
    private:
        uint8_t mSinAddr[ 16 ];

    public:
        RecordAAAA( const uint8_t *sin_addr );

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual Type type() const
        {
            return TYPE_AAAA;
        }
        virtual uint16_t size() const
        {
            return sizeof( mSinAddr );
        }

        static RDATAPtr parse( const uint8_t *begin, const uint8_t *end );
    };

    class RecordCNAME : public RDATA
    {
    private:
        Domainname mDomainname;

    public:
        RecordCNAME( const Domainname &name );

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual Type type() const
        {
            return TYPE_CNAME;
        }
        virtual uint16_t size() const
        {
            return mDomainname.size();
        }

        const Domainname &getCanonicalName() const { return mDomainname; }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *packet_end,
                               const uint8_t *rdata_begin,  const uint8_t *rdata_end );
    };

    struct QuestionSectionEntry {
        Domainname mDomainname;
        Type       mType;
        Class      mClass;

        QuestionSectionEntry() : mType( 0 ), mClass( 0 )
        {
        }
    };

    struct ResourceRecord {
        Domainname mDomainname;
        Type       mType;
        Class      mClass;
        TTL        mTTL;
        RDATAPtr   mRData;

        ResourceRecord() : mType( 0 ), mClass( 0 ), mTTL( 0 )
        {
        }
    };

    struct MessageInfo {
        uint16_t mID;

        bool    mQueryResponse;
        Opcode  mOpcode;
        bool    mAuthoritativeAnswer;
        bool    mTruncation;
        bool    mRecursionDesired;
        bool    mRecursionAvailable;
        bool    mZeroField;
        bool    mAuthenticData;
        bool    mCheckingDisabled;
        uint8_t mResponseCode;

        std::vector<QuestionSectionEntry> mQuestionSection;
        std::vector<ResourceRecord>       mAnswerSection;
        std::vector<ResourceRecord>       mAuthoritySection;
        std::vector<ResourceRecord>       mAdditionalSection;

        MessageInfo()
            : mID( 0 ), mQueryResponse( false ), mOpcode( 0 ), mAuthoritativeAnswer( false ), mTruncation( false ),
              mRecursionDesired( false ), mRecursionAvailable( false ), mZeroField( false ),
              mAuthenticData( false ), mCheckingDisabled( false ), mResponseCode( NO_ERROR )
        {
        }

        const std::vector<QuestionSectionEntry> &getQuestionSection() const { return mQuestionSection; }
        const std::vector<ResourceRecord> &getAnswerSection() const { return mAnswerSection; }

        void pushQuestionSection( const QuestionSectionEntry &e ) { mQuestionSection.push_back( e ); }
        void pushAnswerSection( const ResourceRecord &e ) { mAnswerSection.push_back( e ); }

        void generateMessage( WireFormat & ) const;
    };

    /*!
     * @throw FormatError malformed or truncated message.
     */
    MessageInfo parseDNSMessage( const uint8_t *begin, const uint8_t *end );

    std::ostream &operator<<( std::ostream &os, const MessageInfo &message );
    std::string typeCodeToString( Type t );
    std::string classCodeToString( Class c );
    std::string responseCodeToString( uint8_t rcode );

    struct PacketHeaderField {
        uint16_t id;

        uint8_t recursion_desired : 1;
        uint8_t truncation : 1;
        uint8_t authoritative_answer : 1;
        uint8_t opcode : 4;
        uint8_t query_response : 1;

        uint8_t response_code : 4;
        uint8_t checking_disabled : 1;
        uint8_t authentic_data : 1;
        uint8_t zero_field : 1;
        uint8_t recursion_available : 1;

        uint16_t question_count;
        uint16_t answer_count;
        uint16_t authority_count;
        uint16_t additional_infomation_count;
    };
}

#endif
