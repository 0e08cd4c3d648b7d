#include "lotto/BasicTypes.hpp"

#include <format>

namespace lotto {

template <size_t N>
std::string to_string(const std::array<number_t, N>& numbers) {
  std::string s = "[";
  for (size_t i = 0; i < N; ++i) {
    if (i) s += ", ";
    s += std::format("{}", numbers[i]);
  }
  s += "]";
  return s;
}

}  // namespace lotto
