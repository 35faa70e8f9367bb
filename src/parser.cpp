#include "parser.hpp"

#include <cctype>

namespace memsched {

std::vector<std::string> ParseTokens(const std::string& line) {
  std::vector<std::string> tokens;
  std::string current;
  bool in_quotes = false;
  bool has_token = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '\\' && i + 1 < line.size() && line[i + 1] == '"') {
        current += '"';
        ++i;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        current += c;
      }
      continue;
    }

    if (c == '#') {
      break;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (has_token) {
        tokens.push_back(current);
        current.clear();
        has_token = false;
      }
    } else if (c == '"') {
      in_quotes = true;
      has_token = true;
    } else {
      current += c;
      has_token = true;
    }
  }

  if (has_token) {
    tokens.push_back(current);
  }
  return tokens;
}

}  // namespace memsched
