#pragma once
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>

// JSON body describing where a request body failed to parse: 1-based
// line/column of the offending byte and a short excerpt with a caret.
inline nlohmann::json describe_parse_error(const std::string &raw,
                                           const nlohmann::json::parse_error &e,
                                           size_t window = 40) {
  const size_t byte_pos = std::min<size_t>(e.byte, raw.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < byte_pos; ++i) {
    if (raw[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }

  const size_t start = byte_pos > window ? byte_pos - window : 0;
  const size_t stop = std::min(raw.size(), byte_pos + window);
  std::string excerpt = raw.substr(start, stop - start);
  excerpt += "\n" + std::string(byte_pos - start, ' ') + "^";

  return nlohmann::json{{"ok", false},
                        {"error", "invalid json"},
                        {"line", line},
                        {"column", col},
                        {"context", excerpt}};
}
