
#include "dictionary/dictionary_loader.hpp"

#include <fstream>

#include <boost/algorithm/string/trim.hpp>

namespace phonecode::dictionary {

  DictionaryLoader::DictionaryLoader(DictionaryLimits limits)
      : limits_{limits} {}

  outcome::result<std::shared_ptr<InMemoryDictionary>> DictionaryLoader::load(
      std::istream &input) const {
    auto dictionary = std::make_shared<InMemoryDictionary>(limits_);
    std::string line;
    size_t line_number = 0;
    size_t skipped = 0;
    while (std::getline(input, line)) {
      ++line_number;
      boost::algorithm::trim(line);
      if (line.empty()) {
        continue;
      }
      auto added = dictionary->addWord(line);
      if (!added) {
        if (added.error() == DictionaryError::DICTIONARY_FULL) {
          logger_->error("Dictionary limit of {} words reached at line {}",
                         limits_.max_dictionary_size,
                         line_number);
          return added.error();
        }
        logger_->warn("Skipping word '{}' at line {}: {}",
                      line,
                      line_number,
                      added.error().message());
        ++skipped;
      }
    }
    if (input.bad()) {
      logger_->error("Reading dictionary failed after line {}", line_number);
      return DictionaryError::READ_FAILED;
    }
    logger_->info("Loaded {} words, skipped {}", dictionary->size(), skipped);
    return dictionary;
  }

  outcome::result<std::shared_ptr<InMemoryDictionary>>
  DictionaryLoader::loadFile(const std::string &path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
      logger_->error("Cannot open dictionary file {}", path);
      return DictionaryError::FILE_NOT_FOUND;
    }
    logger_->debug("Reading dictionary from {}", path);
    return load(file);
  }

}  // namespace phonecode::dictionary
