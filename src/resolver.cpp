#include "resolver.hpp"
#include "dns.hpp"
#include "udpv4client.hpp"
#include "utils.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>

namespace dockerdns
{
    const uint16_t DNS_PORT = 53;

    /*!
     * thrown by query() when the server did not answer in time.
     */
    class QueryTimeout : public std::runtime_error
    {
    public:
        QueryTimeout( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    UpstreamResolver::UpstreamResolver( const UpstreamResolverParameters &params )
        : mParameters( params ), mSeedGenerator(), mRandomEngine( mSeedGenerator() )
    {
    }

    uint16_t UpstreamResolver::generateID()
    {
        boost::mutex::scoped_lock lock( mRandomMutex );
        std::uniform_int_distribution<uint16_t> distribution( 0, 0xffff );
        return distribution( mRandomEngine );
    }

    std::string UpstreamResolver::query( const std::string &server, const Domainname &name )
    {
        udpv4::ClientParameters client_params;
        splitAddressAndPort( server, DNS_PORT, client_params.mAddress, client_params.mPort );
        udpv4::Client client( client_params );

        MessageInfo request;
        request.mID               = generateID();
        request.mOpcode           = OPCODE_QUERY;
        request.mRecursionDesired = true;

        QuestionSectionEntry question;
        question.mDomainname = name;
        question.mType       = TYPE_A;
        question.mClass      = CLASS_IN;
        request.pushQuestionSection( question );

        WireFormat request_packet;
        request.generateMessage( request_packet );
        client.sendPacket( request_packet );

        typedef std::chrono::steady_clock Clock;
        Clock::time_point deadline = Clock::now() + std::chrono::milliseconds( mParameters.mTimeout );

        while ( true ) {
            auto remain = std::chrono::duration_cast<std::chrono::milliseconds>( deadline - Clock::now() ).count();
            if ( remain <= 0 )
                throw QueryTimeout( "no response from " + server );

            udpv4::PacketInfo response_packet;
            if ( ! client.receivePacket( response_packet, remain ) )
                throw QueryTimeout( "no response from " + server );

            MessageInfo response;
            try {
                response = parseDNSMessage( response_packet.begin(), response_packet.end() );
            }
            catch ( FormatError &e ) {
                BOOST_LOG_TRIVIAL(debug) << "resolver: ignored malformed response from " << server << ": " << e.what();
                continue;
            }
            if ( ! response.mQueryResponse || response.mID != request.mID ) {
                BOOST_LOG_TRIVIAL(debug) << "resolver: ignored response with id " << response.mID
                                         << " from " << server << ".";
                continue;
            }

            if ( response.mResponseCode == NXDOMAIN )
                throw ResolverNotFound( name.toString() + " does not exist" );
            if ( response.mResponseCode != NO_ERROR )
                throw ResolverError( server + " returned " + responseCodeToString( response.mResponseCode ) );

            for ( auto &answer : response.getAnswerSection() ) {
                if ( answer.mType != TYPE_A || answer.mClass != CLASS_IN )
                    continue;
                std::shared_ptr<RecordA> a = std::dynamic_pointer_cast<RecordA>( answer.mRData );
                if ( a )
                    return a->getAddress();
            }
            throw ResolverNotFound( name.toString() + " has no A record" );
        }
    }

    std::string UpstreamResolver::resolve( const Domainname &name )
    {
        if ( mParameters.mServers.empty() )
            throw ResolverError( "no upstream server" );

        std::string last_error;
        bool        timed_out = false;
        for ( auto &server : mParameters.mServers ) {
            try {
                std::string address = query( server, name );
                BOOST_LOG_TRIVIAL(debug) << "resolver: " << name << " -> " << address << " via " << server << ".";
                return address;
            }
            catch ( QueryTimeout &e ) {
                BOOST_LOG_TRIVIAL(debug) << "resolver: " << e.what() << ".";
                timed_out = true;
            }
            catch ( SocketError &e ) {
                BOOST_LOG_TRIVIAL(debug) << "resolver: " << server << ": " << e.what();
                last_error = e.what();
            }
            catch ( InvalidAddressFormatError &e ) {
                last_error = e.what();
            }
        }

        if ( last_error.empty() && timed_out )
            throw ResolverTimeout( "timed out resolving " + name.toString() );
        throw ResolverError( "cannot resolve " + name.toString() + ": " + last_error );
    }
}
