
#include "application/impl/app_config_impl.hpp"

#include <limits>
#include <sstream>

#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/pt_util.hpp"

namespace phonecode::application
{
    namespace
    {
        constexpr int kMaxLimit = std::numeric_limits<int>::max();

        /// Positive integer entry shared by the command line and the file
        outcome::result<size_t> toLimit( int value )
        {
            OUTCOME_TRY( auto &&checked, ensureInRange( value, 1, kMaxLimit ) );
            return static_cast<size_t>( checked );
        }

        outcome::result<spdlog::level::level_enum> toLevel( int value )
        {
            OUTCOME_TRY( auto &&checked,
                         ensureInRange( value, static_cast<int>( spdlog::level::trace ), static_cast<int>( spdlog::level::off ) ) );
            return static_cast<spdlog::level::level_enum>( checked );
        }
    } // namespace

    outcome::result<void> AppConfigurationImpl::initialize_from_args( int argc, const char *const *argv )
    {
        namespace po = boost::program_options;

        po::options_description description( "Command line options" );
        // clang-format off
        description.add_options()
            ("help,h", "Print out options")
            ("dictionary,d", po::value<std::string>(), "Word list, one word per line")
            ("input,i", po::value<std::string>(), "Phone number list, one number per line. Standard input if missing")
            ("config,c", po::value<std::string>(), "JSON configuration file. Command line values take precedence")
            ("max_number_length", po::value<int>(), "Maximal number of digits of a phone number")
            ("max_word_length", po::value<int>(), "Maximal number of letters of a dictionary word")
            ("max_dictionary_size", po::value<int>(), "Maximal number of dictionary words")
            ("verbosity,v", po::value<int>(), "Log level (0-trace, 5-only critical, 6-no logs)")
            ("log_file", po::value<std::string>(), "Write logs to this file instead of stderr");
        // clang-format on

        std::ostringstream help;
        help << description;
        help_ = help.str();

        po::variables_map vm;
        try
        {
            po::store( po::parse_command_line( argc, argv, description ), vm );
            po::notify( vm );
        }
        catch ( const po::error &err )
        {
            logger_->error( "Command line: {}", err.what() );
            return ConfigReaderError::PARSER_ERROR;
        }

        if ( vm.count( "help" ) != 0 )
        {
            help_requested_ = true;
            return outcome::success();
        }

        auto config_it = vm.find( "config" );
        if ( config_it != vm.end() )
        {
            OUTCOME_TRY( loadFromJson( config_it->second.as<std::string>() ) );
        }
        OUTCOME_TRY( loadOptions( vm ) );

        if ( dictionary_path_.empty() )
        {
            logger_->error( "No dictionary given, use --dictionary or the 'dictionary' entry of the config file" );
            return ConfigReaderError::MISSING_ENTRY;
        }
        return outcome::success();
    }

    outcome::result<void> AppConfigurationImpl::loadFromJson( const std::string &file_path )
    {
        boost::property_tree::ptree tree;
        try
        {
            boost::property_tree::read_json( file_path, tree );
        }
        catch ( const boost::property_tree::json_parser_error &e )
        {
            logger_->error( "Config file {}: {}", file_path, e.what() );
            return ConfigReaderError::PARSER_ERROR;
        }
        return loadFields( tree );
    }

    outcome::result<void> AppConfigurationImpl::loadFields( const boost::property_tree::ptree &tree )
    {
        if ( auto dictionary = tree.get_optional<std::string>( "dictionary" ) )
        {
            dictionary_path_ = *dictionary;
        }
        if ( auto input = tree.get_optional<std::string>( "input" ) )
        {
            input_path_ = *input;
        }
        if ( auto log_file = tree.get_optional<std::string>( "log_file" ) )
        {
            log_file_ = *log_file;
        }

        for ( auto [key, target] : { std::make_pair( "max_number_length", &max_number_length_ ),
                                     std::make_pair( "max_word_length", &max_word_length_ ),
                                     std::make_pair( "max_dictionary_size", &max_dictionary_size_ ) } )
        {
            if ( tree.count( key ) == 0 )
            {
                continue;
            }
            auto value = toLimit( tree.get_optional<int>( key ).value_or( 0 ) );
            if ( !value )
            {
                logger_->error( "Config entry '{}' must be a positive integer", key );
                return value.error();
            }
            *target = value.value();
        }

        if ( tree.count( "verbosity" ) != 0 )
        {
            auto level = toLevel( tree.get_optional<int>( "verbosity" ).value_or( -1 ) );
            if ( !level )
            {
                logger_->error( "Config entry 'verbosity' must be in [0, 6]" );
                return level.error();
            }
            verbosity_ = level.value();
        }
        return outcome::success();
    }

    outcome::result<void> AppConfigurationImpl::loadOptions( const boost::program_options::variables_map &vm )
    {
        if ( vm.count( "dictionary" ) != 0 )
        {
            dictionary_path_ = vm["dictionary"].as<std::string>();
        }
        if ( vm.count( "input" ) != 0 )
        {
            input_path_ = vm["input"].as<std::string>();
        }
        if ( vm.count( "log_file" ) != 0 )
        {
            log_file_ = vm["log_file"].as<std::string>();
        }

        for ( auto [key, target] : { std::make_pair( "max_number_length", &max_number_length_ ),
                                     std::make_pair( "max_word_length", &max_word_length_ ),
                                     std::make_pair( "max_dictionary_size", &max_dictionary_size_ ) } )
        {
            if ( vm.count( key ) == 0 )
            {
                continue;
            }
            auto value = toLimit( vm[key].as<int>() );
            if ( !value )
            {
                logger_->error( "Option --{} must be a positive integer", key );
                return value.error();
            }
            *target = value.value();
        }

        if ( vm.count( "verbosity" ) != 0 )
        {
            auto level = toLevel( vm["verbosity"].as<int>() );
            if ( !level )
            {
                logger_->error( "Option --verbosity must be in [0, 6]" );
                return level.error();
            }
            verbosity_ = level.value();
        }
        return outcome::success();
    }

} // namespace phonecode::application
