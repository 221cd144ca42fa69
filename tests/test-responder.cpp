#include "dns_server.hpp"
#include "udpv4client.hpp"
#include "gtest/gtest.h"
#include <boost/thread.hpp>
#include <map>

class FakeResolver : public dockerdns::Resolver
{
public:
    std::map<std::string, std::string> mAddresses;
    bool mTimeout;
    bool mBroken;
    int  mQueryCount;

    FakeResolver() : mTimeout( false ), mBroken( false ), mQueryCount( 0 )
    {}

    virtual std::string resolve( const dockerdns::Domainname &name )
    {
        mQueryCount++;
        if ( mTimeout )
            throw dockerdns::ResolverTimeout( "timeout" );
        if ( mBroken )
            throw dockerdns::ResolverError( "SERVFAIL" );
        auto address = mAddresses.find( name.getCanonicalDomainname().toString() );
        if ( address == mAddresses.end() )
            throw dockerdns::ResolverNotFound( "NXDOMAIN" );
        return address->second;
    }
};

static dockerdns::MessageInfo makeQuery( const std::string &name, dockerdns::Type type, uint16_t id = 0x1234 )
{
    dockerdns::MessageInfo query;
    query.mID               = id;
    query.mRecursionDesired = true;

    dockerdns::QuestionSectionEntry question;
    question.mDomainname = name.c_str();
    question.mType       = type;
    question.mClass      = dockerdns::CLASS_IN;
    query.pushQuestionSection( question );
    return query;
}

static std::string getAnswerAddress( const dockerdns::MessageInfo &response )
{
    if ( response.getAnswerSection().size() != 1 )
        return "";
    auto a = std::dynamic_pointer_cast<dockerdns::RecordA>( response.getAnswerSection()[0].mRData );
    if ( ! a )
        return "";
    return a->getAddress();
}

class DnsResponderTest : public ::testing::Test
{

public:
    std::shared_ptr<dockerdns::NameTable> table;
    std::shared_ptr<FakeResolver>         resolver;
    dockerdns::DnsResponderParameters     params;

    virtual void SetUp()
    {
        table    = std::make_shared<dockerdns::NameTable>();
        resolver = std::make_shared<FakeResolver>();
        params.mBindAddress = "127.0.0.1";
        params.mBindPort    = 0;
        params.mThreadCount = 2;
    }

    virtual void TearDown()
    {
    }
};

TEST_F( DnsResponderTest, AuthoritativeAnswer )
{
    table->add( "web.docker", "172.17.0.2" );
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo response = responder.generateResponse( makeQuery( "Web.Docker.", dockerdns::TYPE_A ) );

    EXPECT_EQ( 0x1234, response.mID );
    EXPECT_TRUE( response.mQueryResponse );
    EXPECT_TRUE( response.mAuthoritativeAnswer );
    EXPECT_TRUE( response.mRecursionDesired );
    EXPECT_TRUE( response.mRecursionAvailable );
    EXPECT_EQ( dockerdns::NO_ERROR, response.mResponseCode );
    ASSERT_EQ( 1, response.getQuestionSection().size() );
    EXPECT_STREQ( "Web.Docker.", response.getQuestionSection()[0].mDomainname.toString().c_str() );

    ASSERT_EQ( 1, response.getAnswerSection().size() );
    EXPECT_EQ( dockerdns::TYPE_A, response.getAnswerSection()[0].mType );
    EXPECT_EQ( 0, response.getAnswerSection()[0].mTTL );
    EXPECT_STREQ( "Web.Docker.", response.getAnswerSection()[0].mDomainname.toString().c_str() );
    EXPECT_EQ( "172.17.0.2", getAnswerAddress( response ) );
    EXPECT_EQ( 0, resolver->mQueryCount );
}

TEST_F( DnsResponderTest, ConfiguredTTL )
{
    table->add( "web.docker", "172.17.0.2" );
    params.mTTL = 30;
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo response = responder.generateResponse( makeQuery( "web.docker", dockerdns::TYPE_ANY ) );

    ASSERT_EQ( 1, response.getAnswerSection().size() );
    EXPECT_EQ( 30, response.getAnswerSection()[0].mTTL );
}

TEST_F( DnsResponderTest, AAAAOfKnownName )
{
    table->add( "web.docker", "172.17.0.2" );
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo response = responder.generateResponse( makeQuery( "web.docker", dockerdns::TYPE_AAAA ) );

    EXPECT_TRUE( response.mAuthoritativeAnswer );
    EXPECT_TRUE( response.getAnswerSection().empty() );
    EXPECT_EQ( 0, resolver->mQueryCount );
}

TEST_F( DnsResponderTest, RecursiveAnswer )
{
    resolver->mAddresses["example.com."] = "93.184.216.34";
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo response = responder.generateResponse( makeQuery( "example.com", dockerdns::TYPE_A ) );

    EXPECT_FALSE( response.mAuthoritativeAnswer );
    EXPECT_TRUE( response.mRecursionAvailable );
    EXPECT_EQ( "93.184.216.34", getAnswerAddress( response ) );
}

TEST_F( DnsResponderTest, RecursionFailures )
{
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo nxdomain = responder.generateResponse( makeQuery( "nonexistent.example", dockerdns::TYPE_A ) );
    EXPECT_FALSE( nxdomain.mAuthoritativeAnswer );
    EXPECT_EQ( dockerdns::NO_ERROR, nxdomain.mResponseCode );
    EXPECT_TRUE( nxdomain.getAnswerSection().empty() );

    resolver->mTimeout = true;
    EXPECT_TRUE( responder.generateResponse( makeQuery( "slow.example", dockerdns::TYPE_A ) ).getAnswerSection().empty() );

    resolver->mTimeout = false;
    resolver->mBroken  = true;
    EXPECT_TRUE( responder.generateResponse( makeQuery( "broken.example", dockerdns::TYPE_A ) ).getAnswerSection().empty() );
}

TEST_F( DnsResponderTest, NoResolver )
{
    dockerdns::DnsResponder responder( params, table, nullptr );

    dockerdns::MessageInfo response = responder.generateResponse( makeQuery( "worker.docker", dockerdns::TYPE_A ) );

    EXPECT_FALSE( response.mAuthoritativeAnswer );
    EXPECT_FALSE( response.mRecursionAvailable );
    EXPECT_TRUE( response.getAnswerSection().empty() );
}

TEST_F( DnsResponderTest, OtherTypeIsNotResolved )
{
    table->add( "web.docker", "172.17.0.2" );
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo response = responder.generateResponse( makeQuery( "web.docker", dockerdns::TYPE_MX ) );

    EXPECT_FALSE( response.mAuthoritativeAnswer );
    EXPECT_TRUE( response.getAnswerSection().empty() );
    EXPECT_EQ( 0, resolver->mQueryCount );
}

TEST_F( DnsResponderTest, NoQuestion )
{
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo query;
    query.mID = 0x4321;
    dockerdns::MessageInfo response = responder.generateResponse( query );

    EXPECT_EQ( 0x4321, response.mID );
    EXPECT_TRUE( response.mQueryResponse );
    EXPECT_EQ( dockerdns::FORMAT_ERROR, response.mResponseCode );
}

TEST_F( DnsResponderTest, OnlyFirstQuestionIsAnswered )
{
    table->add( "web.docker", "172.17.0.2" );
    table->add( "other.docker", "172.17.0.3" );
    dockerdns::DnsResponder responder( params, table, resolver );

    dockerdns::MessageInfo query = makeQuery( "web.docker", dockerdns::TYPE_A );
    dockerdns::QuestionSectionEntry second;
    second.mDomainname = "other.docker";
    second.mType       = dockerdns::TYPE_A;
    second.mClass      = dockerdns::CLASS_IN;
    query.pushQuestionSection( second );

    dockerdns::MessageInfo response = responder.generateResponse( query );

    ASSERT_EQ( 1, response.getQuestionSection().size() );
    EXPECT_STREQ( "web.docker.", response.getQuestionSection()[0].mDomainname.toString().c_str() );
    EXPECT_EQ( "172.17.0.2", getAnswerAddress( response ) );
}

TEST_F( DnsResponderTest, ServeOverUDP )
{
    table->add( "web.docker", "172.17.0.2" );
    dockerdns::DnsResponder responder( params, table, resolver );
    responder.bind();
    ASSERT_NE( 0, responder.getLocalPort() );

    boost::thread server( &dockerdns::DnsResponder::serve, &responder );

    udpv4::ClientParameters client_params;
    client_params.mAddress = "127.0.0.1";
    client_params.mPort    = responder.getLocalPort();
    udpv4::Client client( client_params );

    // garbage is dropped without a reply
    const uint8_t garbage[] = { 0x01, 0x02, 0x03 };
    client.sendPacket( garbage, sizeof( garbage ) );

    WireFormat query_packet;
    makeQuery( "web.docker", dockerdns::TYPE_A, 0xbeef ).generateMessage( query_packet );
    client.sendPacket( query_packet );

    udpv4::PacketInfo response_packet;
    bool received = client.receivePacket( response_packet, 3000 );

    responder.stop();
    server.join();

    ASSERT_TRUE( received );
    dockerdns::MessageInfo response = dockerdns::parseDNSMessage( response_packet.begin(), response_packet.end() );
    EXPECT_EQ( 0xbeef, response.mID );
    EXPECT_TRUE( response.mAuthoritativeAnswer );
    EXPECT_EQ( "172.17.0.2", getAnswerAddress( response ) );
}

TEST_F( DnsResponderTest, ResponseMessageIsNotAnswered )
{
    table->add( "web.docker", "172.17.0.2" );
    dockerdns::DnsResponder responder( params, table, resolver );
    responder.bind();

    boost::thread server( &dockerdns::DnsResponder::serve, &responder );

    udpv4::ClientParameters client_params;
    client_params.mAddress = "127.0.0.1";
    client_params.mPort    = responder.getLocalPort();
    udpv4::Client client( client_params );

    dockerdns::MessageInfo reflected = makeQuery( "web.docker", dockerdns::TYPE_A, 0x0bad );
    reflected.mQueryResponse = true;
    WireFormat reflected_packet;
    reflected.generateMessage( reflected_packet );
    client.sendPacket( reflected_packet );

    udpv4::PacketInfo response_packet;
    bool received_reflected = client.receivePacket( response_packet, 1000 );

    WireFormat query_packet;
    makeQuery( "web.docker", dockerdns::TYPE_A, 0xbeef ).generateMessage( query_packet );
    client.sendPacket( query_packet );
    bool received = client.receivePacket( response_packet, 3000 );

    responder.stop();
    server.join();

    EXPECT_FALSE( received_reflected );
    ASSERT_TRUE( received );
    EXPECT_EQ( 0xbeef, dockerdns::parseDNSMessage( response_packet.begin(), response_packet.end() ).mID );
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
