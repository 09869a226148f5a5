/// @file src/core/timescale.cpp
/// @brief Timescale wire tags.

#include "cmf/types.hpp"
#include "cmf/errors.hpp"

#include <fmt/format.h>

#include <string>

namespace cmf {

const char* to_string(Timescale t) noexcept {
    switch (t) {
        case Timescale::Monthly:  return "monthly";
        case Timescale::Weekly:   return "weekly";
        case Timescale::Daily:    return "daily";
        case Timescale::Intraday: return "intraday";
    }
    return "daily";
}

std::optional<Timescale> try_parse_timescale(std::string_view tag) noexcept {
    for (Timescale t : ALL_TIMESCALES) {
        if (tag == to_string(t)) {
            return t;
        }
    }
    return std::nullopt;
}

Timescale parse_timescale(std::string_view tag) {
    if (auto t = try_parse_timescale(tag)) {
        return *t;
    }
    throw InvalidConfigurationError(fmt::format(
        "unsupported timescale '{}' (expected monthly, weekly, daily or intraday)", tag));
}

}  // namespace cmf
