#include "dns_server.hpp"
#include "threadpool.hpp"
#include <boost/bind.hpp>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace dockerdns
{
    // interval to check the stop flag
    const int RECEIVE_POLL_INTERVAL_MSEC = 200;

    void DnsResponder::bind()
    {
        udpv4::ServerParameters params;
        params.mAddress = mParameters.mBindAddress;
        params.mPort    = mParameters.mBindPort;
        mServer.reset( new udpv4::Server( params ) );

        BOOST_LOG_TRIVIAL(info) << "dns.server.udp: listening on " << params.mAddress << ":" << getLocalPort() << ".";
    }

    uint16_t DnsResponder::getLocalPort() const
    {
        if ( ! mServer )
            return 0;
        return mServer->getLocalPort();
    }

    void DnsResponder::serve()
    {
        if ( ! mServer )
            throw SocketError( "responder is not bound" );

        utils::ThreadPool pool( mParameters.mThreadCount, mParameters.mQueueLimit );
        pool.start();

        try {
            while ( ! mStopped ) {
                if ( ! mServer->isReadable( RECEIVE_POLL_INTERVAL_MSEC ) )
                    continue;
                try {
                    udpv4::PacketInfo request = mServer->receivePacket();
                    if ( ! pool.submit( boost::bind( &DnsResponder::replyOverUDP, this, request ) ) )
                        BOOST_LOG_TRIVIAL(warning) << "dns.server.udp: dropped query from " << request.mSourceAddress
                                                   << ":" << request.mSourcePort << " (too many pending queries).";
                }
                catch ( SocketError &e ) {
                    BOOST_LOG_TRIVIAL(warning) << "dns.server.udp: " << e.what();
                }
            }
        }
        catch ( std::runtime_error &e ) {
            BOOST_LOG_TRIVIAL(error) << "dns.server.udp: exception: " << e.what();
        }

        pool.stop();
        pool.join();
        mServer->closeSocket();
        BOOST_LOG_TRIVIAL(info) << "dns.server.udp: stopped.";
    }

    void DnsResponder::stop()
    {
        mStopped = true;
    }

    boost::optional<std::string> DnsResponder::resolve( const Domainname &name ) const
    {
        if ( ! mResolver )
            return boost::none;

        try {
            return mResolver->resolve( name );
        }
        catch ( ResolverTimeout &e ) {
            BOOST_LOG_TRIVIAL(debug) << "dns.server.udp: " << e.what();
        }
        catch ( ResolverNotFound &e ) {
            BOOST_LOG_TRIVIAL(debug) << "dns.server.udp: " << e.what();
        }
        catch ( std::exception &e ) {
            BOOST_LOG_TRIVIAL(error) << "dns.server.udp: cannot resolve " << name << ": " << e.what();
        }
        return boost::none;
    }

    MessageInfo DnsResponder::generateResponse( const MessageInfo &query ) const
    {
        MessageInfo response;
        response.mID                 = query.mID;
        response.mQueryResponse      = true;
        response.mOpcode             = query.mOpcode;
        response.mRecursionDesired   = query.mRecursionDesired;
        response.mRecursionAvailable = mResolver != nullptr;

        if ( query.mQuestionSection.empty() ) {
            response.mResponseCode = FORMAT_ERROR;
            return response;
        }

        // only the first question is answered and echoed
        const QuestionSectionEntry &question = query.mQuestionSection[ 0 ];
        response.pushQuestionSection( question );
        if ( question.mType != TYPE_A && question.mType != TYPE_AAAA && question.mType != TYPE_ANY )
            return response;

        boost::optional<std::string> address = mTable->get( question.mDomainname.toString() );
        if ( address ) {
            response.mAuthoritativeAnswer = true;
            // no IPv6 address is known for containers
            if ( question.mType == TYPE_AAAA )
                address = boost::none;
        }
        else {
            address = resolve( question.mDomainname );
        }

        if ( address ) {
            ResourceRecord answer;
            answer.mDomainname = question.mDomainname;
            answer.mType       = TYPE_A;
            answer.mClass      = CLASS_IN;
            answer.mTTL        = mParameters.mTTL;
            answer.mRData      = std::make_shared<RecordA>( *address );
            response.pushAnswerSection( answer );
        }
        return response;
    }

    void DnsResponder::replyOverUDP( udpv4::PacketInfo request )
    {
        try {
            BOOST_LOG_TRIVIAL(debug) << "dns.server.udp: received DNS message from "
                                     << request.mSourceAddress << ":" << request.mSourcePort << ".";

            MessageInfo query;
            try {
                query = parseDNSMessage( request.begin(), request.end() );
            }
            catch ( FormatError &e ) {
                BOOST_LOG_TRIVIAL(info) << "dns.server.udp: dropped malformed message from "
                                        << request.mSourceAddress << ":" << request.mSourcePort << "(" << e.what() << ").";
                return;
            }
            BOOST_LOG_TRIVIAL(trace) << "dns.server.udp: Query: " << query;
            if ( query.mQueryResponse ) {
                BOOST_LOG_TRIVIAL(info) << "dns.server.udp: dropped response message from "
                                        << request.mSourceAddress << ":" << request.mSourcePort << ".";
                return;
            }

            MessageInfo response = generateResponse( query );
            BOOST_LOG_TRIVIAL(trace) << "dns.server.udp: Response: " << response;

            WireFormat response_packet;
            response.generateMessage( response_packet );

            udpv4::ClientParameters client;
            client.mAddress = request.mSourceAddress;
            client.mPort    = request.mSourcePort;
            mServer->sendPacket( client, response_packet );

            BOOST_LOG_TRIVIAL(debug) << "dns.server.udp: sent DNS message to "
                                     << client.mAddress << ":" << client.mPort << ".";
        }
        catch ( std::exception &e ) {
            BOOST_LOG_TRIVIAL(error) << "dns.server.udp: recv/send response failed(" << e.what() << ") from "
                                     << request.mSourceAddress << ":" << request.mSourcePort << ".";
        }
    }
}
