#include "config.hpp"
#include "dns_server.hpp"
#include "dockerclient.hpp"
#include "eventmonitor.hpp"
#include "logger.hpp"
#include "nametable.hpp"
#include "resolver.hpp"
#include <boost/log/trivial.hpp>
#include <boost/thread.hpp>
#include <iostream>
#include <signal.h>

namespace
{
    void runMonitor( dockerdns::EventMonitor &monitor )
    {
        try {
            monitor.run();
        }
        catch ( std::exception &e ) {
            BOOST_LOG_TRIVIAL(error) << "monitor: stopped: " << e.what();
        }
    }
}

int main( int argc, char **argv )
{
    dockerdns::Config config;
    try {
        if ( ! dockerdns::parseConfig( argc, argv, config ) )
            return 1;
    }
    catch ( dockerdns::ConfigError &e ) {
        BOOST_LOG_TRIVIAL(fatal) << "config: " << e.what();
        return 1;
    }

    dockerdns::logger::initialize( config.mLogLevel );

    auto table = std::make_shared<dockerdns::NameTable>();
    for ( auto &record : config.mRecords )
        table->add( record.mName, record.mAddress );

    dockerdns::ResolverPtr resolver;
    if ( config.mRecursion && ! config.mResolvers.empty() ) {
        dockerdns::UpstreamResolverParameters resolver_params;
        resolver_params.mServers = config.mResolvers;
        resolver_params.mTimeout = config.mTimeout * 1000;
        resolver = std::make_shared<dockerdns::UpstreamResolver>( resolver_params );
    }

    dockerdns::DnsResponderParameters responder_params;
    responder_params.mBindAddress = config.mBindAddress;
    responder_params.mBindPort    = config.mBindPort;
    responder_params.mThreadCount = config.mThreadCount;
    responder_params.mTTL         = config.mTTL;
    dockerdns::DnsResponder responder( responder_params, table, resolver );

    dockerdns::EventMonitorParameters monitor_params;
    monitor_params.mDomain  = config.mDomain;
    monitor_params.mNetwork = config.mNetwork;
    dockerdns::EventMonitor monitor( monitor_params,
                                     std::make_shared<dockerdns::DockerClient>( config.mDockerSocket ),
                                     table );

    // worker threads inherit the mask, signals are collected by sigwait only
    sigset_t signals;
    sigemptyset( &signals );
    sigaddset( &signals, SIGINT );
    sigaddset( &signals, SIGTERM );
    pthread_sigmask( SIG_BLOCK, &signals, nullptr );

    try {
        responder.bind();
    }
    catch ( std::runtime_error &e ) {
        BOOST_LOG_TRIVIAL(fatal) << "dns.server.udp: " << e.what();
        return 1;
    }

    boost::thread responder_thread( &dockerdns::DnsResponder::serve, &responder );
    boost::thread monitor_thread( runMonitor, boost::ref( monitor ) );

    int signal_number = 0;
    sigwait( &signals, &signal_number );
    BOOST_LOG_TRIVIAL(info) << "dockerdns: received signal " << signal_number << ", shutting down.";

    responder.stop();
    monitor.stop();
    responder_thread.join();
    monitor_thread.join();

    return 0;
}
