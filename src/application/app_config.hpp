
#ifndef PHONECODE_APP_CONFIG_HPP
#define PHONECODE_APP_CONFIG_HPP

#include <spdlog/spdlog.h>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "outcome/outcome.hpp"

namespace phonecode::application
{

    /**
   * Parse and store application config.
   */
    class AppConfiguration
    {
    public:
        virtual ~AppConfiguration() = default;

        /**
        * @return word list file path.
        */
        [[nodiscard]] virtual const std::string &dictionary_path() const = 0;

        /**
        * @return phone number list file path, none to read standard input.
        */
        [[nodiscard]] virtual const boost::optional<std::string> &input_path() const = 0;

        /**
        * @return maximal number of digits of a phone number.
        */
        [[nodiscard]] virtual size_t max_number_length() const = 0;

        /**
        * @return maximal number of letters of a dictionary word.
        */
        [[nodiscard]] virtual size_t max_word_length() const = 0;

        /**
        * @return maximal number of dictionary words.
        */
        [[nodiscard]] virtual size_t max_dictionary_size() const = 0;

        /**
        * @return log level (0-trace, 5-only critical, 6-no logs).
        */
        [[nodiscard]] virtual spdlog::level::level_enum verbosity() const = 0;

        /**
        * @return file receiving the logs, empty for stderr.
        */
        [[nodiscard]] virtual const std::string &log_file() const = 0;

        /**
        * @return true if only the usage was asked for.
        */
        [[nodiscard]] virtual bool help_requested() const = 0;

        /**
        * @return usage text of the command line options.
        */
        [[nodiscard]] virtual const std::string &help() const = 0;

        virtual outcome::result<void> initialize_from_args( int argc, const char *const *argv ) = 0;
    };

    using AppConfigPtr = std::shared_ptr<AppConfiguration>;

} // namespace phonecode::application

#endif // PHONECODE_APP_CONFIG_HPP
