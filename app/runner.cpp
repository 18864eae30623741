/**
 * @file       runner.cpp
 * @brief      Entry point of the phone number encoder
 */

#include <iostream>

#include "application/encoding_application.hpp"
#include "application/impl/app_config_impl.hpp"

/**
 * @brief       Prints every dictionary encoding of every phone number read
 * @param[in]   argc
 * @param[in]   argv
 * @return      0 on success, 1 on configuration, dictionary or input errors
 */
int main( int argc, char **argv )
{
    auto configuration = std::make_shared<phonecode::application::AppConfigurationImpl>();

    auto initialized = configuration->initialize_from_args( argc, argv );
    if ( !initialized )
    {
        std::cerr << initialized.error().message() << std::endl << configuration->help();
        return 1;
    }
    if ( configuration->help_requested() )
    {
        std::cout << configuration->help();
        return 0;
    }

    auto logging = phonecode::application::configureLogging( *configuration );
    if ( !logging )
    {
        std::cerr << logging.error().message() << ": " << configuration->log_file() << std::endl;
        return 1;
    }

    phonecode::application::EncodingApplication app( configuration, std::cin, std::cout );
    return app.run();
}
