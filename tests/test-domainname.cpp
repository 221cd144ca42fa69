#include "domainname.hpp"
#include "gtest/gtest.h"
#include <cstring>
#include <iostream>

class DomainnameTest : public ::testing::Test
{

public:
    virtual void SetUp()
    {
    }

    virtual void TearDown()
    {
    }
};

TEST_F( DomainnameTest, ConstructFromString )
{
    dockerdns::Domainname web( std::string( "Web.Docker" ) );

    ASSERT_EQ( 2, web.getLabelCount() );
    EXPECT_STREQ( "Web",    web.getLabels()[0].c_str() );
    EXPECT_STREQ( "Docker", web.getLabels()[1].c_str() );
    EXPECT_STREQ( "web",    web.getCanonicalLabels()[0].c_str() );
    EXPECT_STREQ( "docker", web.getCanonicalLabels()[1].c_str() );
}

TEST_F( DomainnameTest, TrailingDotIsIgnored )
{
    dockerdns::Domainname absolute( "web.docker." );
    dockerdns::Domainname relative( "web.docker" );

    EXPECT_EQ( absolute, relative );
    EXPECT_EQ( 2, absolute.getLabelCount() );
}

TEST_F( DomainnameTest, Root )
{
    EXPECT_TRUE( dockerdns::Domainname( "" ).isRoot() );
    EXPECT_TRUE( dockerdns::Domainname( "." ).isRoot() );
    EXPECT_STREQ( ".", dockerdns::Domainname( "" ).toString().c_str() );
}

TEST_F( DomainnameTest, EmptyLabel )
{
    EXPECT_THROW( { dockerdns::Domainname( "a..b" ); }, dockerdns::DomainnameError );
    EXPECT_THROW( { dockerdns::Domainname( ".a" ); }, dockerdns::DomainnameError );
}

TEST_F( DomainnameTest, TooLongLabel )
{
    std::string label_63( 63, 'a' );
    std::string label_64( 64, 'a' );

    EXPECT_NO_THROW( { dockerdns::Domainname( label_63 + ".docker" ); } );
    EXPECT_THROW( { dockerdns::Domainname( label_64 + ".docker" ); }, dockerdns::DomainnameError );
}

TEST_F( DomainnameTest, TooLongName )
{
    std::string label( 63, 'a' );
    // 4 * 64 + 1 = 257 octets in wire format
    std::string name = label + "." + label + "." + label + "." + label;

    EXPECT_THROW( { dockerdns::Domainname( name ); }, dockerdns::DomainnameError );
}

TEST_F( DomainnameTest, EscapedDot )
{
    dockerdns::Domainname name( "a\\.b.docker" );

    ASSERT_EQ( 2, name.getLabelCount() );
    EXPECT_STREQ( "a.b", name.getLabels()[0].c_str() );
    EXPECT_THROW( { dockerdns::Domainname( "a\\" ); }, dockerdns::DomainnameError );
}

TEST_F( DomainnameTest, less_than )
{
    dockerdns::Domainname lhs( "1.docker" );
    dockerdns::Domainname rhs( "2.docker" );

    EXPECT_TRUE( lhs < rhs );
    EXPECT_FALSE( rhs < lhs );
}

TEST_F( DomainnameTest, equal_ignore_case )
{
    dockerdns::Domainname lhs( "Web.docker" );
    dockerdns::Domainname rhs( "web.DOCKER" );

    EXPECT_FALSE( lhs < rhs );
    EXPECT_FALSE( rhs < lhs );
    EXPECT_TRUE( lhs == rhs );
}

TEST_F( DomainnameTest, CanonicalDomainname )
{
    dockerdns::Domainname web( "WEB.Docker" );

    EXPECT_STREQ( "WEB.Docker.", web.toString().c_str() );
    EXPECT_STREQ( "web.docker.", web.getCanonicalDomainname().toString().c_str() );
}

TEST_F( DomainnameTest, OutputWireFormat )
{
    WireFormat           message;
    dockerdns::OffsetDB  offset_db;
    EXPECT_EQ( 12, offset_db.outputWireFormat( dockerdns::Domainname( "web.docker" ), message ) );
    // only "db" is written, "docker" is a pointer to offset 4
    EXPECT_EQ( 5, offset_db.outputWireFormat( dockerdns::Domainname( "db.Docker" ), message ) );

    const uint8_t expected[] = { 3, 'w', 'e', 'b', 6, 'd', 'o', 'c', 'k', 'e', 'r', 0,
                                 2, 'd', 'b', 0xc0, 0x04 };
    ASSERT_EQ( sizeof( expected ), message.size() );
    EXPECT_EQ( 0, std::memcmp( expected, message.begin(), sizeof( expected ) ) );
    EXPECT_EQ( 12, dockerdns::Domainname( "web.docker" ).size() );
}

TEST_F( DomainnameTest, ParseCompressedName )
{
    // "docker" at offset 0, "web" + pointer to offset 0 at offset 8
    const uint8_t packet[] = { 6, 'd', 'o', 'c', 'k', 'e', 'r', 0,
                               3, 'w', 'e', 'b', 0xc0, 0x00 };

    dockerdns::Domainname name;
    const uint8_t *next = dockerdns::Domainname::parsePacket( name, packet, packet + sizeof( packet ), packet + 8 );

    EXPECT_EQ( packet + sizeof( packet ), next );
    EXPECT_EQ( dockerdns::Domainname( "web.docker" ), name );
}

TEST_F( DomainnameTest, ParseCompressionLoop )
{
    const uint8_t packet[] = { 0xc0, 0x00 };

    dockerdns::Domainname name;
    EXPECT_THROW( { dockerdns::Domainname::parsePacket( name, packet, packet + sizeof( packet ), packet ); },
                  dockerdns::FormatError );
}

TEST_F( DomainnameTest, ParseTruncatedName )
{
    const uint8_t packet[] = { 3, 'w', 'e' };

    dockerdns::Domainname name;
    EXPECT_THROW( { dockerdns::Domainname::parsePacket( name, packet, packet + sizeof( packet ), packet ); },
                  dockerdns::FormatError );
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
