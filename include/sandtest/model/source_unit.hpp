#pragma once

#include <string>

namespace sandtest {

/// A named, in-memory translation unit. Never written to disk
struct SourceUnit
{
    std::string unit_name;
    std::string source_text;

    bool operator==(const SourceUnit& rhs) const = default;
};

} // namespace sandtest
