
#ifndef PHONECODE_APPLICATION_ENCODING_APPLICATION_HPP
#define PHONECODE_APPLICATION_ENCODING_APPLICATION_HPP

#include <istream>
#include <ostream>

#include "application/app_config.hpp"
#include "base/logger.hpp"

namespace phonecode::application
{

    /**
     * Loads the dictionary, reads the phone numbers and prints every encoding
     * of every number.
     */
    class EncodingApplication
    {
    public:
        /**
         * @param config parsed configuration
         * @param in phone numbers when the configuration names no input file
         * @param out receives the "<number>: <encoding>" lines
         */
        EncodingApplication( AppConfigPtr config, std::istream &in, std::ostream &out );

        /**
         * @return process exit code, 0 on success
         */
        int run();

    private:
        AppConfigPtr  config_;
        std::istream &in_;
        std::ostream &out_;
        base::Logger  logger_ = base::createLogger( "EncodingApplication" );
    };

    /**
     * Applies the log file and verbosity of the configuration to the loggers
     * created afterwards
     * @return error if the log file cannot be opened
     */
    outcome::result<void> configureLogging( const AppConfiguration &config );

} // namespace phonecode::application

#endif // PHONECODE_APPLICATION_ENCODING_APPLICATION_HPP
