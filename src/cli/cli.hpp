#pragma once

#include <guid/guid.hpp>
#include <guid/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace guid::cli {

struct Options {
    std::string prefix;
    unsigned count = 1;
    std::optional<std::string> separator;
    bool serial = false;
    std::string output;                 // empty: stdout
    std::optional<bool> slug;
    std::string scan;
    bool json = false;
    std::string config_path;
    bool verbose = false;
    bool help = false;
};

// Flags take one or two leading dashes: -n 5, --n 5
Result<Options> parse_args(const std::vector<std::string>& args);

std::string usage();

// Draws n guids from default_generator(). Unless serial, the work is
// spread over hardware_concurrency() threads.
Result<std::vector<Guid>> generate(unsigned n, bool serial);

std::string render(const std::vector<Guid>& guids, bool slug,
                   const std::string& separator);

// ANSI C style local time: "Mon Jan  2 15:04:05 2006"
std::string format_time(Guid::Clock::time_point t);

// Field breakdown of a guid string, as a JSON object or as labelled lines
Result<std::string> scan_json(const std::string& text);
Result<std::string> scan_text(const std::string& text);

// {"error": ..., "code": ...} plus "cause" and "hint" when set
std::string json_error(const GuidError& err);

int run(int argc, char** argv);

} // namespace guid::cli
