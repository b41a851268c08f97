#include "util/string_parsing.hpp"
#include <charconv>
#include <system_error>

namespace headerpipe {
namespace util {

namespace {

template <typename T>
std::optional<T> ParseWhole(const std::string& str, T min, T max) {
  // from_chars rejects leading whitespace, '+' and, for unsigned types, '-'
  if (str.empty()) {
    return std::nullopt;
  }

  T value{};
  const char* begin = str.data();
  const char* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<uint64_t> SafeParseUInt64(const std::string& str, uint64_t min, uint64_t max) {
  return ParseWhole<uint64_t>(str, min, max);
}

std::vector<std::string> SplitCommaList(const std::string& str) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t comma = str.find(',', pos);
    if (comma == std::string::npos) {
      comma = str.size();
    }
    if (comma > pos) {
      items.push_back(str.substr(pos, comma - pos));
    }
    pos = comma + 1;
  }
  return items;
}

} // namespace util
} // namespace headerpipe
