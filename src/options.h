#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "position.h"

struct AppOptions
{
    std::optional<std::string> startFen;
    RuleOptions rules{};
    bool showHelp{false};
};

// Problems are written to errors; std::nullopt means the command line was unusable.
std::optional<AppOptions> parse_options(int argc, const char* const argv[], std::ostream& errors);

void print_usage(std::ostream& out, const std::string& program);
