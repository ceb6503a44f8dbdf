#pragma once

#include "http_client.hpp"

#include <iosfwd>

namespace socksget {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFatal = 1;
inline constexpr int kExitUsage = 2;

void printUsage(std::ostream& out, const char* program_name);

// Parses argv, runs the download and maps the outcome to an exit code:
// kExitSuccess, kExitFatal (unknown size, verification or I/O failure) or
// kExitUsage. Usage text, the progress panel and diagnostics go to `err`.
// A null client selects CurlHttpClient.
int runCli(int argc, const char* const argv[], std::ostream& err, HttpClientPtr client = nullptr);

} // namespace socksget
