
#include "application/encoding_application.hpp"

#include "dictionary/dictionary_loader.hpp"
#include "encoding/impl/phone_number_encoder.hpp"
#include "input/phone_number_reader.hpp"
#include "output/result_writer.hpp"

namespace phonecode::application
{

    EncodingApplication::EncodingApplication( AppConfigPtr config, std::istream &in, std::ostream &out ) :
        config_( std::move( config ) ), in_( in ), out_( out )
    {
    }

    int EncodingApplication::run()
    {
        dictionary::DictionaryLoader loader( { config_->max_word_length(), config_->max_dictionary_size() } );
        auto                         dictionary = loader.loadFile( config_->dictionary_path() );
        if ( !dictionary )
        {
            logger_->error( "Cannot load dictionary {}: {}", config_->dictionary_path(), dictionary.error().message() );
            return 1;
        }

        input::PhoneNumberReader reader( config_->max_number_length() );
        auto numbers = config_->input_path() ? reader.readFile( *config_->input_path() ) : reader.read( in_ );
        if ( !numbers )
        {
            logger_->error( "Cannot read phone numbers: {}", numbers.error().message() );
            return 1;
        }

        encoding::PhoneNumberEncoder encoder( dictionary.value(), config_->max_number_length() );
        output::ResultWriter         writer( out_ );

        size_t encodings = 0;
        for ( const auto &number : numbers.value() )
        {
            auto encoded = encoder.encode( number );
            if ( !encoded )
            {
                logger_->warn( "Skipping '{}': {}", number, encoded.error().message() );
                continue;
            }
            encodings += writer.write( encoded.value() );
        }
        logger_->info( "Printed {} encodings of {} phone numbers", encodings, numbers.value().size() );
        return 0;
    }

    outcome::result<void> configureLogging( const AppConfiguration &config )
    {
        if ( !config.log_file().empty() )
        {
            auto log_file = base::setLogFile( config.log_file() );
            if ( !log_file )
            {
                return log_file.error();
            }
        }
        base::setLogLevel( config.verbosity() );
        return outcome::success();
    }

} // namespace phonecode::application
