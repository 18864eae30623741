
#ifndef PHONECODE_APPLICATION_IMPL_APP_CONFIG_IMPL_HPP
#define PHONECODE_APPLICATION_IMPL_APP_CONFIG_IMPL_HPP

#include "application/app_config.hpp"

#include <boost/program_options/variables_map.hpp>
#include <boost/property_tree/ptree.hpp>

#include "base/logger.hpp"

namespace phonecode::application
{

    /**
     * Configuration read from the command line and an optional JSON file.
     * Values given on the command line take precedence over the file.
     */
    class AppConfigurationImpl : public AppConfiguration
    {
    public:
        static constexpr size_t kDefaultMaxNumberLength   = 50;
        static constexpr size_t kDefaultMaxWordLength     = 50;
        static constexpr size_t kDefaultMaxDictionarySize = 75000;

        AppConfigurationImpl() = default;

        ~AppConfigurationImpl() override = default;

        const std::string &dictionary_path() const override
        {
            return dictionary_path_;
        }

        const boost::optional<std::string> &input_path() const override
        {
            return input_path_;
        }

        size_t max_number_length() const override
        {
            return max_number_length_;
        }

        size_t max_word_length() const override
        {
            return max_word_length_;
        }

        size_t max_dictionary_size() const override
        {
            return max_dictionary_size_;
        }

        spdlog::level::level_enum verbosity() const override
        {
            return verbosity_;
        }

        const std::string &log_file() const override
        {
            return log_file_;
        }

        bool help_requested() const override
        {
            return help_requested_;
        }

        const std::string &help() const override
        {
            return help_;
        }

        outcome::result<void> initialize_from_args( int argc, const char *const *argv ) override;

    private:
        outcome::result<void> loadFromJson( const std::string &file_path );
        outcome::result<void> loadFields( const boost::property_tree::ptree &tree );
        outcome::result<void> loadOptions( const boost::program_options::variables_map &vm );

        std::string                  dictionary_path_;
        boost::optional<std::string> input_path_;
        size_t                       max_number_length_   = kDefaultMaxNumberLength;
        size_t                       max_word_length_     = kDefaultMaxWordLength;
        size_t                       max_dictionary_size_ = kDefaultMaxDictionarySize;
        spdlog::level::level_enum    verbosity_           = spdlog::level::info;
        std::string                  log_file_;
        bool                         help_requested_ = false;
        std::string                  help_;

        base::Logger logger_ = base::createLogger( "AppConfiguration" );
    };

} // namespace phonecode::application

#endif // PHONECODE_APPLICATION_IMPL_APP_CONFIG_IMPL_HPP
