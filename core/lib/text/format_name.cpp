// toolxml/text/format_name.cpp
//
#include "toolxml/text/format_name.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace toolxml
{

namespace
{

bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }

// An upper-case letter starts a new word when it follows a lower-case
// letter, or when it is not the first character and a lower-case letter
// follows it (the last capital of an acronym).
std::string insert_word_breaks(std::string_view s)
{
  std::string out;
  out.reserve(s.size() + 8);
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (is_upper(c) && i > 0) {
      const bool after_lower = is_lower(s[i - 1]);
      const bool before_lower = i + 1 < s.size() && is_lower(s[i + 1]);
      if (after_lower || before_lower) {
        out.push_back(' ');
      }
    }
    out.push_back(c);
  }
  return out;
}

std::vector<std::string> split_on_space(const std::string & s)
{
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = s.find(' ', start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

}  // namespace

std::string pretty_format_name(std::string_view class_name)
{
  std::string out;
  bool first = true;
  for (auto & token : split_on_space(insert_word_breaks(class_name))) {
    if (token == "Fmt") {
      token = "Format";
    } else if (token == "Dir") {
      token = "Directory";
    }
    if (!first) {
      out.push_back(' ');
    }
    out += token;
    first = false;
  }
  return out;
}

}  // namespace toolxml
