#include "config.hpp"
#include "names.hpp"
#include "gtest/gtest.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

class ConfigTest : public ::testing::Test
{

public:
    std::string mConfigFile;

    virtual void SetUp()
    {
        char path[] = "/tmp/dockerdns-test-XXXXXX";
        int  fd     = mkstemp( path );
        if ( fd >= 0 )
            close( fd );
        mConfigFile = path;
    }

    virtual void TearDown()
    {
        std::remove( mConfigFile.c_str() );
    }

    void writeConfig( const std::string &yaml )
    {
        std::ofstream fs( mConfigFile );
        fs << yaml;
    }

    bool parse( std::vector<std::string> args, dockerdns::Config &config )
    {
        args.insert( args.begin(), "dockerdns" );
        std::vector<char *> argv;
        for ( auto &arg : args )
            argv.push_back( &arg[ 0 ] );
        argv.push_back( nullptr );

        std::ostringstream usage;
        return dockerdns::parseConfig( args.size(), argv.data(), config, usage );
    }
};

TEST_F( ConfigTest, GetName )
{
    EXPECT_EQ( "web.docker",        dockerdns::getName( "/web", "docker" ) );
    EXPECT_EQ( "my_app-1.docker",   dockerdns::getName( "my_app-1", "docker" ) );
    EXPECT_EQ( "web.docker",        dockerdns::getName( "we b!", "docker" ) );
    EXPECT_EQ( "web.docker",        dockerdns::getName( "web.", "docker" ) );
    EXPECT_EQ( "web.example.local", dockerdns::getName( "web", "example.local" ) );
    EXPECT_EQ( "",                  dockerdns::getName( "/", "docker" ) );
    EXPECT_EQ( "",                  dockerdns::getName( "", "docker" ) );
}

TEST_F( ConfigTest, StaticRecord )
{
    dockerdns::StaticRecord record = dockerdns::parseStaticRecord( "gateway:10.0.0.1", "docker" );

    EXPECT_EQ( "gateway.docker", record.mName );
    EXPECT_EQ( "10.0.0.1",       record.mAddress );
}

TEST_F( ConfigTest, InvalidStaticRecord )
{
    EXPECT_THROW( { dockerdns::parseStaticRecord( "gateway", "docker" ); },            dockerdns::ConfigError );
    EXPECT_THROW( { dockerdns::parseStaticRecord( ":10.0.0.1", "docker" ); },          dockerdns::ConfigError );
    EXPECT_THROW( { dockerdns::parseStaticRecord( "gateway:10.0.0", "docker" ); },     dockerdns::ConfigError );
    EXPECT_THROW( { dockerdns::parseStaticRecord( "gateway:", "docker" ); },           dockerdns::ConfigError );
}

TEST_F( ConfigTest, DockerURL )
{
    EXPECT_EQ( "/var/run/docker.sock", dockerdns::parseDockerURL( "unix:///var/run/docker.sock" ) );
    EXPECT_THROW( { dockerdns::parseDockerURL( "tcp://127.0.0.1:2375" ); }, dockerdns::ConfigError );
    EXPECT_THROW( { dockerdns::parseDockerURL( "unix://" ); }, dockerdns::ConfigError );
}

TEST_F( ConfigTest, Defaults )
{
    dockerdns::Config config;
    ASSERT_TRUE( parse( {}, config ) );

    EXPECT_EQ( "0.0.0.0", config.mBindAddress );
    EXPECT_EQ( 53,        config.mBindPort );
    EXPECT_EQ( "docker",  config.mDomain );
    EXPECT_EQ( "",        config.mNetwork );
    ASSERT_EQ( 2,         config.mResolvers.size() );
    EXPECT_EQ( "8.8.8.8", config.mResolvers[0] );
    EXPECT_EQ( "8.8.4.4", config.mResolvers[1] );
    EXPECT_TRUE( config.mRecursion );
    EXPECT_TRUE( config.mRecords.empty() );
    EXPECT_EQ( "/var/run/docker.sock", config.mDockerSocket );
    EXPECT_EQ( 0,      config.mTTL );
    EXPECT_EQ( 3,      config.mTimeout );
    EXPECT_EQ( 4,      config.mThreadCount );
    EXPECT_EQ( "info", config.mLogLevel );
}

TEST_F( ConfigTest, CommandLine )
{
    dockerdns::Config config;
    ASSERT_TRUE( parse( { "-b", "127.0.0.1:5353", "-d", "local", "-n", "backend",
                          "-r", "1.1.1.1", "-r", "9.9.9.9:5300",
                          "--record", "gateway:10.0.0.1", "--ttl", "30", "-l", "debug" },
                        config ) );

    EXPECT_EQ( "127.0.0.1", config.mBindAddress );
    EXPECT_EQ( 5353,        config.mBindPort );
    EXPECT_EQ( "local",     config.mDomain );
    EXPECT_EQ( "backend",   config.mNetwork );
    ASSERT_EQ( 2,           config.mResolvers.size() );
    EXPECT_EQ( "9.9.9.9:5300", config.mResolvers[1] );
    ASSERT_EQ( 1,           config.mRecords.size() );
    EXPECT_EQ( "gateway.local", config.mRecords[0].mName );
    EXPECT_EQ( 30,          config.mTTL );
    EXPECT_EQ( "debug",     config.mLogLevel );
}

TEST_F( ConfigTest, NoRecursion )
{
    dockerdns::Config config;
    ASSERT_TRUE( parse( { "--no-recursion" }, config ) );
    EXPECT_FALSE( config.mRecursion );
}

TEST_F( ConfigTest, Help )
{
    dockerdns::Config config;
    EXPECT_FALSE( parse( { "--help" }, config ) );
}

TEST_F( ConfigTest, InvalidOptions )
{
    dockerdns::Config config;
    EXPECT_THROW( { parse( { "--dns-bind", "localhost" }, config ); }, dockerdns::ConfigError );
    EXPECT_THROW( { parse( { "--resolver", "8.8.8.8:99999" }, config ); }, dockerdns::ConfigError );
    EXPECT_THROW( { parse( { "--record", "broken" }, config ); }, dockerdns::ConfigError );
    EXPECT_THROW( { parse( { "--log-level", "verbose" }, config ); }, dockerdns::ConfigError );
    EXPECT_THROW( { parse( { "--ttl", "abc" }, config ); }, dockerdns::ConfigError );
    EXPECT_THROW( { parse( { "--unknown" }, config ); }, dockerdns::ConfigError );
}

TEST_F( ConfigTest, ConfigFile )
{
    writeConfig( "domain: local\n"
                 "network: backend\n"
                 "resolver:\n"
                 "  - 1.1.1.1\n"
                 "  - 1.0.0.1\n"
                 "no-recursion: true\n"
                 "record: [ \"gateway:10.0.0.1\", \"nas:10.0.0.2\" ]\n"
                 "ttl: 60\n" );

    dockerdns::Config config;
    ASSERT_TRUE( parse( { "--config", mConfigFile }, config ) );

    EXPECT_EQ( "local",   config.mDomain );
    EXPECT_EQ( "backend", config.mNetwork );
    ASSERT_EQ( 2,         config.mResolvers.size() );
    EXPECT_EQ( "1.0.0.1", config.mResolvers[1] );
    EXPECT_FALSE( config.mRecursion );
    ASSERT_EQ( 2,         config.mRecords.size() );
    EXPECT_EQ( "nas.local", config.mRecords[1].mName );
    EXPECT_EQ( 60,        config.mTTL );
}

TEST_F( ConfigTest, CommandLineOverridesConfigFile )
{
    writeConfig( "domain: local\n"
                 "ttl: 60\n" );

    dockerdns::Config config;
    ASSERT_TRUE( parse( { "--config", mConfigFile, "--domain", "cluster" }, config ) );

    EXPECT_EQ( "cluster", config.mDomain );
    EXPECT_EQ( 60,        config.mTTL );
}

TEST_F( ConfigTest, InvalidConfigFile )
{
    dockerdns::Config config;

    writeConfig( "domain: [ unterminated\n" );
    EXPECT_THROW( { parse( { "--config", mConfigFile }, config ); }, dockerdns::ConfigError );

    writeConfig( "- not\n- a map\n" );
    EXPECT_THROW( { parse( { "--config", mConfigFile }, config ); }, dockerdns::ConfigError );

    writeConfig( "colour: blue\n" );
    EXPECT_THROW( { parse( { "--config", mConfigFile }, config ); }, dockerdns::ConfigError );

    EXPECT_THROW( { parse( { "--config", "/nonexistent/dockerdns.yaml" }, config ); }, dockerdns::ConfigError );
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
