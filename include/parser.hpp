#ifndef MEMSCHED_PARSER_H_
#define MEMSCHED_PARSER_H_

#include <string>
#include <vector>

namespace memsched {

// Splits a line on whitespace. Double-quoted runs form one token (quotes
// dropped, \" escapes a quote) and an unquoted '#' ends the line.
std::vector<std::string> ParseTokens(const std::string& line);

}  // namespace memsched

#endif
