#include "base/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace
{
    std::shared_ptr<spdlog::sinks::sink> &sharedFileSink()
    {
        static std::shared_ptr<spdlog::sinks::sink> sink;
        return sink;
    }

    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    void setDebugPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S.%F][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag, bool debug_mode = false, const std::string &basepath = "" )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( basepath.size() > 0 )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else if ( sharedFileSink() )
        {
            logger = std::make_shared<spdlog::logger>( tag, sharedFileSink() );
            spdlog::initialize_logger( logger );
        }
        else
        {
            // stdout carries the encoded numbers
            logger = spdlog::stderr_color_mt( tag );
        }
        if ( debug_mode )
        {
            setDebugPattern( *logger );
        }
        else
        {
            setGlobalPattern( *logger );
        }
        return logger;
    }
} // namespace

namespace phonecode::base
{
    Logger createLogger( const std::string &tag, const std::string &basepath )
    {
        static std::mutex           mutex;
        std::lock_guard<std::mutex> lock( mutex );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, spdlog::get_level() <= spdlog::level::debug, basepath );
        }
        return logger;
    }

    void setLogLevel( spdlog::level::level_enum level )
    {
        spdlog::set_level( level );
    }

    outcome::result<void> setLogFile( const std::string &path )
    {
        try
        {
            sharedFileSink() = std::make_shared<spdlog::sinks::basic_file_sink_mt>( path );
        }
        catch ( const spdlog::spdlog_ex & )
        {
            return LoggerError::CANNOT_OPEN_LOG_FILE;
        }
        return outcome::success();
    }
} // namespace phonecode::base

OUTCOME_CPP_DEFINE_CATEGORY_3( phonecode::base, LoggerError, e )
{
    using E = phonecode::base::LoggerError;
    switch ( e )
    {
        case E::CANNOT_OPEN_LOG_FILE:
            return "Log file cannot be opened for writing";
    }
    return "Unknown error";
}
