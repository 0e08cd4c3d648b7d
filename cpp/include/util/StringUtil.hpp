#pragma once

/*
 * Various string utilities
 */
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace util {

/*
 * Parses the entire string s as a base-10 integer. Surrounding whitespace is ignored.
 *
 * Raises util::CleanException if parse fails.
 */
int64_t atoi_safe(const std::string& s);

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

/*
 * Strips leading and trailing whitespace.
 */
std::string strip(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
