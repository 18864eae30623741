
#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(phonecode::application,
                            ConfigReaderError,
                            e) {
  using E = phonecode::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the command line and the config file";
    case E::PARSER_ERROR:
      return "Command line or config file cannot be parsed";
    case E::INVALID_VALUE:
      return "A configuration value is out of range";
  }
  return "Unknown error";
}
