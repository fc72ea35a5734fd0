#pragma once

#include <cstdint>
#include <string>

namespace StringUtils {

// Human-readable size as shown in the download list, e.g. "1.4 GB",
// "512.0 kB", "17 Bytes".
std::string formatBytes(std::uint64_t bytes);

// Lower-case copy (ASCII only).
std::string toLower(const std::string &s);

// Strip leading/trailing whitespace.
std::string trim(const std::string &s);

// Lower-case hex encoding of a byte buffer.
std::string toHex(const unsigned char *data, std::size_t len);

// Split "algorithm:hexdigest" into its parts. Returns false if there is no
// ':' or either side is empty.
bool splitChecksum(const std::string &checksum, std::string &algorithm,
                   std::string &digest);

// Safely convert a string to a double, returning 0.0 on failure.
double safe_stod(const std::string &s);

} // namespace StringUtils
