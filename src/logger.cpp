#include "logger.hpp"
#include <stdexcept>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <iostream>

namespace dockerdns
{
    namespace logger
    {
        Level toLevel( const std::string &level )
        {
            if ( level == "trace" )
                return TRACE;
            if ( level == "debug" )
                return DEBUG;
            if ( level == "info" )
                return INFO;
            if ( level == "warning" )
                return WARNING;
            if ( level == "error" )
                return ERROR;
            if ( level == "fatal" )
                return FATAL;

            throw std::runtime_error( "Unknown log level " + level + "." );
        }

        void initialize( Level level )
        {
            namespace expr = boost::log::expressions;

            boost::log::core::get()->set_filter( boost::log::trivial::severity >= level );
            boost::log::add_common_attributes();
            boost::log::add_console_log( std::clog,
                                         boost::log::keywords::format =
                                         ( expr::stream
                                           << expr::format_date_time<boost::posix_time::ptime>( "TimeStamp", "%Y-%m-%d %H:%M:%S.%f" )
                                           << " [" << boost::log::trivial::severity << "] "
                                           << expr::smessage ) );
        }

        void initialize( const std::string &level )
        {
            initialize( toLevel( level ) );
        }
    }
}
