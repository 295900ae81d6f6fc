#ifndef SERVER_LANGUAGES_HPP
#define SERVER_LANGUAGES_HPP

#include <kj/common.h>
#include <kj/string.h>
#include <string>
#include <vector>

namespace server {

// A language the gateway can run: the image providing its interpreter and
// how to invoke the interpreter on a program given as a string.
struct Language {
  const char* name;
  const char* image;
  std::vector<std::string> interpreter;

  // Command line that runs code.
  std::vector<std::string> Command(const std::string& code) const;
};

// Looks up a supported language by name.
kj::Maybe<const Language&> FindLanguage(kj::StringPtr name);

// All the supported languages, in a stable order.
const std::vector<Language>& Languages();

}  // namespace server

#endif
