/**
 * @file Util.hpp
 * @brief Text helpers shared by name lookups and settings parsing
 */

#ifndef CATREC_UTIL_HPP
#define CATREC_UTIL_HPP

#include <string>

namespace catrec {

/// ASCII lower-case copy; enum names and setting values are ASCII.
std::string to_lower(std::string s);

/// Copy without leading or trailing whitespace.
std::string trim(const std::string& s);

} // namespace catrec

#endif // CATREC_UTIL_HPP
