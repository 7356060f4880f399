//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.cpp
// Purpose: Implements STRATA_TRACE parsing and the trace streams.
// Key invariants: Topic flags are computed once and cached.
// Ownership/Lifetime: The null stream is a function-local static.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <array>
#include <cstdlib>
#include <iostream>
#include <streambuf>
#include <string>

namespace strata::support
{
namespace
{
constexpr std::size_t kTopicCount = 5;

class NullBuffer : public std::streambuf
{
  protected:
    int overflow(int c) override
    {
        return traits_type::not_eof(c);
    }
};

std::array<bool, kTopicCount> parseTraceVariable()
{
    std::array<bool, kTopicCount> enabled{};
    const char *raw = std::getenv("STRATA_TRACE");
    if (!raw)
        return enabled;

    std::string_view list(raw);
    while (!list.empty())
    {
        auto comma = list.find(',');
        std::string_view item = list.substr(0, comma);
        for (std::size_t i = 0; i < kTopicCount; ++i)
        {
            auto topic = static_cast<TraceTopic>(i);
            if (item == "all" || item == traceTopicName(topic))
                enabled[i] = true;
        }
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return enabled;
}
} // namespace

std::string_view traceTopicName(TraceTopic topic)
{
    switch (topic)
    {
        case TraceTopic::DomTree:
            return "domtree";
        case TraceTopic::Dataflow:
            return "dataflow";
        case TraceTopic::DeadCode:
            return "dce";
        case TraceTopic::Liveness:
            return "liveness";
        case TraceTopic::Spills:
            return "spills";
    }
    return "";
}

bool traceEnabled(TraceTopic topic)
{
    static const std::array<bool, kTopicCount> enabled = parseTraceVariable();
    return enabled[static_cast<std::size_t>(topic)];
}

std::ostream &trace(TraceTopic topic)
{
    if (!traceEnabled(topic))
    {
        static NullBuffer buffer;
        static std::ostream sink(&buffer);
        return sink;
    }
    std::cerr << '[' << traceTopicName(topic) << "] ";
    return std::cerr;
}

} // namespace strata::support
