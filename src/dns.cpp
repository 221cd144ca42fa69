#include "dns.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>

namespace dockerdns
{
    typedef std::pair<QuestionSectionEntry, const uint8_t *> QuestionSectionEntryPair;
    typedef std::pair<ResourceRecord, const uint8_t *>       ResourceRecordPair;

    static void generateQuestion( const QuestionSectionEntry &q, WireFormat &message, OffsetDB &offset_db );
    static void generateResourceRecord( const ResourceRecord &r, WireFormat &message, OffsetDB &offset_db );
    static QuestionSectionEntryPair parseQuestion( const uint8_t *begin, const uint8_t *end, const uint8_t *section );
    static ResourceRecordPair parseResourceRecord( const uint8_t *begin, const uint8_t *end, const uint8_t *section );

    template <typename T>
    static T getBytes( const uint8_t **pos, const uint8_t *end )
    {
        if ( end - *pos < static_cast<long>( sizeof( T ) ) )
            throw FormatError( "too short data for fixed size field" );
        T v;
        std::memcpy( &v, *pos, sizeof( T ) );
        *pos += sizeof( T );
        return v;
    }

    void MessageInfo::generateMessage( WireFormat &message ) const
    {
        OffsetDB offset_db;

        PacketHeaderField header;
        header.id                   = htons( mID );
        header.opcode               = mOpcode;
        header.query_response       = mQueryResponse;
        header.authoritative_answer = mAuthoritativeAnswer;
        header.truncation           = mTruncation;
        header.recursion_desired    = mRecursionDesired;
        header.recursion_available  = mRecursionAvailable;
        header.zero_field           = 0;
        header.authentic_data       = mAuthenticData;
        header.checking_disabled    = mCheckingDisabled;
        header.response_code        = mResponseCode;

        header.question_count              = htons( mQuestionSection.size() );
        header.answer_count                = htons( mAnswerSection.size() );
        header.authority_count             = htons( mAuthoritySection.size() );
        header.additional_infomation_count = htons( mAdditionalSection.size() );

        message.pushBuffer( reinterpret_cast<const uint8_t *>( &header ),
                            reinterpret_cast<const uint8_t *>( &header ) + sizeof( header ) );

        for ( auto &q : mQuestionSection ) {
            generateQuestion( q, message, offset_db );
        }
        for ( auto &r : mAnswerSection ) {
            generateResourceRecord( r, message, offset_db );
        }
        for ( auto &r : mAuthoritySection ) {
            generateResourceRecord( r, message, offset_db );
        }
        for ( auto &r : mAdditionalSection ) {
            generateResourceRecord( r, message, offset_db );
        }
    }

    MessageInfo parseDNSMessage( const uint8_t *begin, const uint8_t *end )
    {
        const uint8_t *packet = begin;

        if ( end - begin < static_cast<long>( sizeof( PacketHeaderField ) ) ) {
            throw FormatError( "too short message size( less than DNS message header size )." );
        }

        MessageInfo       packet_info;
        PacketHeaderField header;
        std::memcpy( &header, begin, sizeof( header ) );

        packet_info.mID                  = ntohs( header.id );
        packet_info.mQueryResponse       = header.query_response;
        packet_info.mOpcode              = header.opcode;
        packet_info.mAuthoritativeAnswer = header.authoritative_answer;
        packet_info.mTruncation          = header.truncation;
        packet_info.mRecursionAvailable  = header.recursion_available;
        packet_info.mRecursionDesired    = header.recursion_desired;
        packet_info.mZeroField           = header.zero_field;
        packet_info.mCheckingDisabled    = header.checking_disabled;
        packet_info.mAuthenticData       = header.authentic_data;
        packet_info.mResponseCode        = header.response_code;

        int question_count              = ntohs( header.question_count );
        int answer_count                = ntohs( header.answer_count );
        int authority_count             = ntohs( header.authority_count );
        int additional_infomation_count = ntohs( header.additional_infomation_count );

        packet += sizeof( PacketHeaderField );
        for ( int i = 0; i < question_count; i++ ) {
            QuestionSectionEntryPair pair = parseQuestion( begin, end, packet );
            packet_info.mQuestionSection.push_back( pair.first );
            packet = pair.second;
        }
        for ( int i = 0; i < answer_count; i++ ) {
            ResourceRecordPair pair = parseResourceRecord( begin, end, packet );
            packet_info.mAnswerSection.push_back( pair.first );
            packet = pair.second;
        }
        for ( int i = 0; i < authority_count; i++ ) {
            ResourceRecordPair pair = parseResourceRecord( begin, end, packet );
            packet_info.mAuthoritySection.push_back( pair.first );
            packet = pair.second;
        }
        for ( int i = 0; i < additional_infomation_count; i++ ) {
            ResourceRecordPair pair = parseResourceRecord( begin, end, packet );
            packet_info.mAdditionalSection.push_back( pair.first );
            packet = pair.second;
        }

        return packet_info;
    }

    static void generateQuestion( const QuestionSectionEntry &question, WireFormat &message, OffsetDB &offset_db )
    {
        offset_db.outputWireFormat( question.mDomainname, message );
        message.pushUInt16HtoN( question.mType );
        message.pushUInt16HtoN( question.mClass );
    }

    static QuestionSectionEntryPair parseQuestion( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *p )
    {
        QuestionSectionEntry question;
        const uint8_t *      pos = Domainname::parsePacket( question.mDomainname, packet_begin, packet_end, p );

        question.mType  = ntohs( getBytes<uint16_t>( &pos, packet_end ) );
        question.mClass = ntohs( getBytes<uint16_t>( &pos, packet_end ) );

        return QuestionSectionEntryPair( question, pos );
    }

    static void generateResourceRecord( const ResourceRecord &record, WireFormat &message, OffsetDB &offset_db )
    {
        offset_db.outputWireFormat( record.mDomainname, message );
        message.pushUInt16HtoN( record.mType );
        message.pushUInt16HtoN( record.mClass );
        message.pushUInt32HtoN( record.mTTL );

        uint16_t rdlength_position = message.size();
        message.pushUInt16HtoN( 0 );
        if ( record.mRData ) {
            record.mRData->outputWireFormat( message, offset_db );
            message.setUInt16HtoN( rdlength_position, message.size() - rdlength_position - 2 );
        }
    }

    static ResourceRecordPair parseResourceRecord( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *section_begin )
    {
        ResourceRecord record;

        const uint8_t *pos   = Domainname::parsePacket( record.mDomainname, packet_begin, packet_end, section_begin );
        record.mType         = ntohs( getBytes<uint16_t>( &pos, packet_end ) );
        record.mClass        = ntohs( getBytes<uint16_t>( &pos, packet_end ) );
        record.mTTL          = ntohl( getBytes<uint32_t>( &pos, packet_end ) );
        uint16_t data_length = ntohs( getBytes<uint16_t>( &pos, packet_end ) );

        if ( packet_end - pos < data_length )
            throw FormatError( "RDATA is truncated" );

        switch ( record.mType ) {
        case TYPE_A:
            record.mRData = RecordA::parse( pos, pos + data_length );
            break;
        case TYPE_AAAA:
            record.mRData = RecordAAAA::parse( pos, pos + data_length );
            break;
        case TYPE_CNAME:
            record.mRData = RecordCNAME::parse( packet_begin, packet_end, pos, pos + data_length );
            break;
        default:
            record.mRData = RecordRaw::parse( record.mType, pos, pos + data_length );
            break;
        }
        pos += data_length;

        return ResourceRecordPair( record, pos );
    }

    std::string classCodeToString( Class c )
    {
        switch ( c ) {
        case CLASS_IN:
            return "IN";
        case CLASS_CH:
            return "CH";
        case CLASS_HS:
            return "HS";
        case CLASS_NONE:
            return "NONE";
        case CLASS_ANY:
            return "ANY";
        }
        std::ostringstream os;
        os << "CLASS" << c;
        return os.str();
    }

    std::string typeCodeToString( Type t )
    {
        switch ( t ) {
        case TYPE_A:
            return "A";
        case TYPE_NS:
            return "NS";
        case TYPE_CNAME:
            return "CNAME";
        case TYPE_SOA:
            return "SOA";
        case TYPE_PTR:
            return "PTR";
        case TYPE_MX:
            return "MX";
        case TYPE_TXT:
            return "TXT";
        case TYPE_AAAA:
            return "AAAA";
        case TYPE_SRV:
            return "SRV";
        case TYPE_OPT:
            return "OPT";
        case TYPE_IXFR:
            return "IXFR";
        case TYPE_AXFR:
            return "AXFR";
        case TYPE_ANY:
            return "ANY";
        }
        std::ostringstream os;
        os << "TYPE" << t;
        return os.str();
    }

    std::string responseCodeToString( uint8_t rcode )
    {
        switch ( rcode ) {
        case NO_ERROR:
            return "NOERROR";
        case FORMAT_ERROR:
            return "FORMERR";
        case SERVER_ERROR:
            return "SERVFAIL";
        case NAME_ERROR:
            return "NXDOMAIN";
        case NOT_IMPLEMENTED:
            return "NOTIMP";
        case REFUSED:
            return "REFUSED";
        }
        std::ostringstream os;
        os << "RCODE" << (unsigned int)rcode;
        return os.str();
    }

    std::ostream &operator<<( std::ostream &os, const MessageInfo &res )
    {
        os << "ID: "                   << res.mID << std::endl
           << "Query/Response: "       << ( res.mQueryResponse ? "Response" : "Query" ) << std::endl
           << "OpCode:"                << (unsigned int)res.mOpcode << std::endl
           << "Authoritative Answer: " << res.mAuthoritativeAnswer << std::endl
           << "Truncation: "           << res.mTruncation << std::endl
           << "Recursion Desired: "    << res.mRecursionDesired << std::endl
           << "Recursion Available: "  << res.mRecursionAvailable << std::endl
           << "Checking Disabled: "    << res.mCheckingDisabled << std::endl
           << "Response Code: "        << responseCodeToString( res.mResponseCode ) << std::endl;

        for ( auto &q : res.mQuestionSection )
            os << "Query: " << q.mDomainname << " " << classCodeToString( q.mClass ) << " " << typeCodeToString( q.mType ) << std::endl;
        for ( auto &a : res.mAnswerSection )
            os << "Answer: " << a.mDomainname << " " << a.mTTL << " " << classCodeToString( a.mClass ) << " "
               << typeCodeToString( a.mType ) << " " << ( a.mRData ? a.mRData->toString() : "" ) << std::endl;
        for ( auto &a : res.mAuthoritySection )
            os << "Authority: " << a.mDomainname << " " << a.mTTL << " " << classCodeToString( a.mClass ) << " "
               << typeCodeToString( a.mType ) << " " << ( a.mRData ? a.mRData->toString() : "" ) << std::endl;
        for ( auto &a : res.mAdditionalSection )
            os << "Additional: " << a.mDomainname << " " << a.mTTL << " " << classCodeToString( a.mClass ) << " "
               << typeCodeToString( a.mType ) << " " << ( a.mRData ? a.mRData->toString() : "" ) << std::endl;

        return os;
    }

    std::string RecordRaw::toString() const
    {
        std::string hex;
        encodeToHex( mData, hex );
        std::ostringstream os;
        os << "type: RAW(" << mRRType << "), data: " << hex;
        return os.str();
    }

    void RecordRaw::outputWireFormat( WireFormat &message, OffsetDB & ) const
    {
        message.pushBuffer( mData );
    }

    RDATAPtr RecordRaw::parse( Type t, const uint8_t *begin, const uint8_t *end )
    {
        return RDATAPtr( new RecordRaw( t, std::vector<uint8_t>( begin, end ) ) );
    }

    RecordA::RecordA( in_addr addr ) : mSinAddr( addr )
    {
    }

    RecordA::RecordA( const std::string &addr )
        : mSinAddr( convertAddressStringToBinary( addr ) )
    {
    }

    std::string RecordA::toString() const
    {
        return convertAddressBinaryToString( mSinAddr );
    }

    void RecordA::outputWireFormat( WireFormat &message, OffsetDB & ) const
    {
        const uint8_t *p = reinterpret_cast<const uint8_t *>( &mSinAddr );
        message.pushBuffer( p, p + sizeof( mSinAddr ) );
    }

    std::string RecordA::getAddress() const
    {
        return toString();
    }

    RDATAPtr RecordA::parse( const uint8_t *begin, const uint8_t *end )
    {
        if ( end - begin != 4 )
            throw FormatError( "invalid A Record length" );
        in_addr addr;
        std::memcpy( &addr, begin, sizeof( addr ) );
        return RDATAPtr( new RecordA( addr ) );
    }

    RecordAAAA::RecordAAAA( const uint8_t *addr )
    {
        std::memcpy( mSinAddr, addr, sizeof( mSinAddr ) );
    }

    std::string RecordAAAA::toString() const
    {
        char buf[ INET6_ADDRSTRLEN ];
        if ( NULL == inet_ntop( AF_INET6, mSinAddr, buf, sizeof( buf ) ) )
            throw InvalidAddressFormatError( "cannot convert IPv6 address from bin to text" );
        return std::string( buf );
    }

    void RecordAAAA::outputWireFormat( WireFormat &message, OffsetDB & ) const
    {
        message.pushBuffer( mSinAddr, mSinAddr + sizeof( mSinAddr ) );
    }

    RDATAPtr RecordAAAA::parse( const uint8_t *begin, const uint8_t *end )
    {
        if ( end - begin != 16 )
            throw FormatError( "invalid AAAA Record length" );
        return RDATAPtr( new RecordAAAA( begin ) );
    }

    RecordCNAME::RecordCNAME( const Domainname &name ) : mDomainname( name )
    {
    }

    std::string RecordCNAME::toString() const
    {
        return mDomainname.toString();
    }

    void RecordCNAME::outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const
    {
        offset_db.outputWireFormat( mDomainname, message );
    }

    RDATAPtr RecordCNAME::parse( const uint8_t *packet_begin, const uint8_t *packet_end,
                                 const uint8_t *rdata_begin,  const uint8_t *rdata_end )
    {
        Domainname name;
        const uint8_t *pos = Domainname::parsePacket( name, packet_begin, packet_end, rdata_begin );
        if ( pos != rdata_end )
            throw FormatError( "invalid CNAME Record length" );
        return RDATAPtr( new RecordCNAME( name ) );
    }
}
