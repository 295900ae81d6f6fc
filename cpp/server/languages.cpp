#include "server/languages.hpp"

namespace server {

std::vector<std::string> Language::Command(const std::string& code) const {
  std::vector<std::string> command = interpreter;
  command.push_back(code);
  return command;
}

const std::vector<Language>& Languages() {
  static const std::vector<Language> languages = {
      {"python", "python:3.9-slim", {"python", "-c"}},
      {"javascript", "node:18-alpine", {"node", "-e"}},
  };
  return languages;
}

kj::Maybe<const Language&> FindLanguage(kj::StringPtr name) {
  for (const Language& language : Languages()) {
    if (name == language.name) return language;
  }
  return nullptr;
}

}  // namespace server
