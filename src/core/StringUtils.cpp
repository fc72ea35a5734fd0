#include "StringUtils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace StringUtils {

std::string formatBytes(std::uint64_t bytes) {
  const double kb = bytes / 1024.0;
  const double mb = bytes / (1024.0 * 1024.0);
  const double gb = bytes / (1024.0 * 1024.0 * 1024.0);
  char buf[32];
  if (gb > 1.0) {
    std::snprintf(buf, sizeof(buf), "%.1f GB", gb);
  } else if (mb > 1.0) {
    std::snprintf(buf, sizeof(buf), "%.1f MB", mb);
  } else if (kb > 1.0) {
    std::snprintf(buf, sizeof(buf), "%.1f kB", kb);
  } else {
    std::snprintf(buf, sizeof(buf), "%llu Bytes",
                  static_cast<unsigned long long>(bytes));
  }
  return buf;
}

std::string toLower(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string trim(const std::string &s) {
  auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(s.begin(), s.end(), isSpace);
  auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
  if (begin >= end)
    return {};
  return std::string(begin, end);
}

std::string toHex(const unsigned char *data, std::size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out += digits[data[i] >> 4];
    out += digits[data[i] & 0x0F];
  }
  return out;
}

bool splitChecksum(const std::string &checksum, std::string &algorithm,
                   std::string &digest) {
  auto pos = checksum.find(':');
  if (pos == std::string::npos || pos == 0 || pos + 1 >= checksum.size())
    return false;
  algorithm = toLower(trim(checksum.substr(0, pos)));
  digest = toLower(trim(checksum.substr(pos + 1)));
  return !algorithm.empty() && !digest.empty();
}

double safe_stod(const std::string &s) {
  if (s.empty()) {
    return 0.0;
  }
  // strtod is exception-free and stable where from_chars(double) is missing.
  char *endptr = nullptr;
  double val = std::strtod(s.c_str(), &endptr);
  if (endptr == s.c_str()) {
    return 0.0;
  }
  return val;
}

} // namespace StringUtils
