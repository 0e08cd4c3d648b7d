#include "util/StringUtil.hpp"

#include "util/Exception.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>

namespace util {

inline int64_t atoi_safe(const std::string& s) {
  std::string t = strip(s);
  int64_t value = 0;
  const char* begin = t.data();
  const char* end = t.data() + t.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (t.empty() || ec != std::errc() || ptr != end) {
    throw util::CleanException("atoi failure {}(\"{}\")", __func__, s);
  }
  return value;
}

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  std::string_view sep(t);

  if (sep.empty()) {
    std::string_view sv(s);
    std::size_t pos = 0, n = sv.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      result.emplace_back(sv.substr(start, pos - start));
    }
  } else {
    std::size_t start = 0, end;
    while ((end = s.find(sep, start)) != std::string::npos) {
      result.emplace_back(s.data() + start, end - start);
      start = end + sep.size();
    }
    // last segment
    result.emplace_back(s.data() + start, s.size() - start);
  }

  return result;
}

inline std::string strip(const std::string& s) {
  auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)); };
  auto first = std::find_if_not(s.begin(), s.end(), is_space);
  auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (first >= last) return "";
  return std::string(first, last);
}

}  // namespace util
