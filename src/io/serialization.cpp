/// @file src/io/serialization.cpp
/// @brief nlohmann/json mapping of metrics, interpretations and readouts.

#include "cmf/serialization.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cmf {

using nlohmann::json;

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

/// Read an enum stored as a wire tag; nullopt on an unknown tag.
template <typename Parse>
auto read_tag(const json& j, const char* key, Parse parse) {
    return parse(j.at(key).get<std::string>());
}

std::optional<std::string> read_nullable_string(const json& j, const char* key) {
    const json& v = j.at(key);
    if (v.is_null()) {
        return std::nullopt;
    }
    return v.get<std::string>();
}

}  // anonymous namespace

// ─── ManifoldMetrics ──────────────────────────────────────────────────────────

json to_json(const ManifoldMetrics& m) {
    json attractors = json::array();
    for (const Attractor& a : m.attractors) {
        attractors.push_back({{"price", a.price}, {"strength", a.strength}});
    }
    return {
        {"timestamp",     m.timestamps},
        {"prices",        m.prices},
        {"curvature",     m.curvature},
        {"entropy",       m.entropy},
        {"local_entropy", m.local_entropy},
        {"singularities", m.singularities},
        {"attractors",    std::move(attractors)},
        {"ricci_flow",    m.flow},
        {"tension",       m.tension},
        {"timescale",     to_string(m.timescale)},
    };
}

std::optional<ManifoldMetrics> metrics_from_json(const json& j) noexcept {
    try {
        ManifoldMetrics m;
        m.timestamps    = j.at("timestamp").get<std::vector<double>>();
        m.prices        = j.at("prices").get<std::vector<double>>();
        m.curvature     = j.at("curvature").get<std::vector<double>>();
        m.entropy       = j.at("entropy").get<double>();
        m.local_entropy = j.at("local_entropy").get<std::vector<double>>();
        m.flow          = j.at("ricci_flow").get<std::vector<double>>();
        m.tension       = j.at("tension").get<std::vector<double>>();

        for (const json& idx : j.at("singularities")) {
            if (!idx.is_number_unsigned()) {
                return std::nullopt;
            }
            m.singularities.push_back(idx.get<std::size_t>());
        }

        for (const json& a : j.at("attractors")) {
            m.attractors.push_back(Attractor{
                .price    = a.at("price").get<double>(),
                .strength = a.at("strength").get<double>(),
            });
        }

        const auto scale = read_tag(j, "timescale", try_parse_timescale);
        if (!scale) {
            return std::nullopt;
        }
        m.timescale = *scale;

        if (!m.is_consistent()) {
            return std::nullopt;
        }
        return m;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ─── Interpretation ───────────────────────────────────────────────────────────

json to_json(const Interpretation& i) {
    json nearest = nullptr;
    if (i.nearest_attractor) {
        nearest = {
            {"price",       i.nearest_attractor->price},
            {"description", i.nearest_attractor->description},
        };
    }
    return {
        {"phase",               to_string(i.phase)},
        {"confidence",          i.confidence},
        {"conductor_reading",   to_string(i.conductor)},
        {"singer_reading",      to_string(i.singer)},
        {"curvature_state",     i.curvature_state},
        {"tension_description", i.tension_description},
        {"entropy_state",       i.entropy_state},
        {"wave_position",       optional_to_json(i.wave_position)},
        {"nearest_attractor",   std::move(nearest)},
        {"pull_strength",       i.pull_strength},
        {"narrative",           i.narrative},
        {"warning",             optional_to_json(i.warning)},
        {"curvature_value",     i.curvature_value},
        {"entropy_value",       i.entropy_value},
        {"tension_value",       i.tension_value},
    };
}

std::optional<Interpretation> interpretation_from_json(const json& j) noexcept {
    try {
        Interpretation i;

        const auto phase     = read_tag(j, "phase", try_parse_phase);
        const auto conductor = read_tag(j, "conductor_reading", try_parse_conductor);
        const auto singer    = read_tag(j, "singer_reading", try_parse_singer);
        if (!phase || !conductor || !singer) {
            return std::nullopt;
        }
        i.phase     = *phase;
        i.conductor = *conductor;
        i.singer    = *singer;

        i.confidence          = j.at("confidence").get<double>();
        i.curvature_state     = j.at("curvature_state").get<std::string>();
        i.tension_description = j.at("tension_description").get<std::string>();
        i.entropy_state       = j.at("entropy_state").get<std::string>();
        i.wave_position       = read_nullable_string(j, "wave_position");
        i.pull_strength       = j.at("pull_strength").get<double>();
        i.narrative           = j.at("narrative").get<std::string>();
        i.warning             = read_nullable_string(j, "warning");
        i.curvature_value     = j.at("curvature_value").get<double>();
        i.entropy_value       = j.at("entropy_value").get<double>();
        i.tension_value       = j.at("tension_value").get<double>();

        const json& nearest = j.at("nearest_attractor");
        if (!nearest.is_null()) {
            i.nearest_attractor = NearestAttractor{
                .price       = nearest.at("price").get<double>(),
                .description = nearest.at("description").get<std::string>(),
            };
        }
        return i;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ─── PulseReading ─────────────────────────────────────────────────────────────

json to_json(const PulseReading& p) {
    json nearest = nullptr;
    if (p.nearest_attractor) {
        nearest = {
            {"price",        p.nearest_attractor->price},
            {"distance",     p.nearest_attractor->distance},
            {"distance_pct", p.nearest_attractor->distance_pct},
        };
    }
    return {
        {"current_price",        p.current_price},
        {"entropy",              p.entropy},
        {"entropy_level",        to_string(p.entropy_level)},
        {"tension",              p.tension},
        {"tension_level",        to_string(p.tension_level)},
        {"nearest_attractor",    std::move(nearest)},
        {"recent_singularities", p.recent_singularities},
        {"manifold_state",       to_string(p.state)},
    };
}

std::optional<PulseReading> pulse_from_json(const json& j) noexcept {
    try {
        PulseReading p;

        const auto entropy_level = read_tag(j, "entropy_level", try_parse_level);
        const auto tension_level = read_tag(j, "tension_level", try_parse_level);
        const auto state         = read_tag(j, "manifold_state", try_parse_pulse_state);
        if (!entropy_level || !tension_level || !state) {
            return std::nullopt;
        }
        p.entropy_level = *entropy_level;
        p.tension_level = *tension_level;
        p.state         = *state;

        p.current_price        = j.at("current_price").get<double>();
        p.entropy              = j.at("entropy").get<double>();
        p.tension              = j.at("tension").get<double>();
        p.recent_singularities = j.at("recent_singularities").get<std::size_t>();

        const json& nearest = j.at("nearest_attractor");
        if (!nearest.is_null()) {
            p.nearest_attractor = AttractorDistance{
                .price        = nearest.at("price").get<double>(),
                .distance     = nearest.at("distance").get<double>(),
                .distance_pct = nearest.at("distance_pct").get<double>(),
            };
        }
        return p;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ─── ModelQuality ─────────────────────────────────────────────────────────────

json to_json(const ModelQuality& q) {
    return {
        {"overall",            q.overall},
        {"consistency",        q.consistency},
        {"signal_clarity",     q.signal_clarity},
        {"sample_sufficiency", q.sample_sufficiency},
        {"grade",              std::string(1, q.grade)},
    };
}

std::optional<ModelQuality> quality_from_json(const json& j) noexcept {
    try {
        ModelQuality q;
        q.overall            = j.at("overall").get<int>();
        q.consistency        = j.at("consistency").get<int>();
        q.signal_clarity     = j.at("signal_clarity").get<int>();
        q.sample_sufficiency = j.at("sample_sufficiency").get<int>();

        const auto grade = j.at("grade").get<std::string>();
        if (grade.size() != 1 || std::string_view("ABCD").find(grade[0]) == std::string_view::npos) {
            return std::nullopt;
        }
        q.grade = grade[0];
        return q;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ─── PriceProjection ──────────────────────────────────────────────────────────

json to_json(const PriceProjection& p) {
    json targets = json::array();
    for (const ProjectionTarget& t : p.targets) {
        targets.push_back({
            {"price",        t.price},
            {"strength",     t.strength},
            {"distance_pct", t.distance_pct},
            {"direction",    t.above ? "above" : "below"},
        });
    }
    return {
        {"current_price", p.current_price},
        {"horizon",       to_string(p.horizon)},
        {"projected_range", {
            {"low",       p.low},
            {"high",      p.high},
            {"range_pct", p.range_pct},
        }},
        {"targets", std::move(targets)},
        {"directional_bias", {
            {"direction",  to_string(p.bias)},
            {"confidence", p.bias_confidence},
        }},
    };
}

std::optional<PriceProjection> projection_from_json(const json& j) noexcept {
    try {
        PriceProjection p;

        const auto horizon = read_tag(j, "horizon", try_parse_horizon);
        const json& bias_obj = j.at("directional_bias");
        const auto bias = read_tag(bias_obj, "direction", try_parse_bias);
        if (!horizon || !bias) {
            return std::nullopt;
        }
        p.horizon         = *horizon;
        p.bias            = *bias;
        p.bias_confidence = bias_obj.at("confidence").get<int>();

        p.current_price = j.at("current_price").get<double>();
        const json& range = j.at("projected_range");
        p.low       = range.at("low").get<double>();
        p.high      = range.at("high").get<double>();
        p.range_pct = range.at("range_pct").get<double>();

        for (const json& t : j.at("targets")) {
            const auto direction = t.at("direction").get<std::string>();
            if (direction != "above" && direction != "below") {
                return std::nullopt;
            }
            p.targets.push_back(ProjectionTarget{
                .price        = t.at("price").get<double>(),
                .strength     = t.at("strength").get<double>(),
                .distance_pct = t.at("distance_pct").get<double>(),
                .above        = direction == "above",
            });
        }
        return p;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ─── Detail listings / display text ───────────────────────────────────────────

json to_json(const SingularityEvent& e) {
    return {
        {"index",     e.index},
        {"timestamp", e.timestamp},
        {"price",     e.price},
        {"curvature", e.curvature},
        {"tension",   e.tension},
        {"entropy",   e.entropy},
    };
}

json to_json(const AttractorLevel& a) {
    return {
        {"price",        a.price},
        {"strength",     a.strength},
        {"distance_pct", a.distance_pct},
    };
}

json to_json(const phrases::InterpretationText& t) {
    return {
        {"phase_title",    t.phase_title},
        {"phase_detail",   t.phase_detail},
        {"conductor_view", t.conductor_view},
        {"singer_view",    t.singer_view},
        {"curvature",      t.curvature},
        {"tension",        t.tension},
        {"entropy",        t.entropy},
        {"wave_context",   t.wave_context},
        {"narrative",      t.narrative},
        {"warning",        optional_to_json(t.warning)},
    };
}

// ─── FractalSummary / MultiScaleResult ────────────────────────────────────────

json to_json(const FractalSummary& s) {
    return {
        {"fractal_consistency", s.consistency},
        {"dominant_phase", s.dominant_phase ? json(to_string(*s.dominant_phase)) : json(nullptr)},
    };
}

json to_json(const MultiScaleResult& r) {
    json scales = json::object();
    for (const auto& [scale, metrics] : r.scales) {
        scales[to_string(scale)] = to_json(metrics);
    }
    json failures = json::object();
    for (const auto& [scale, message] : r.failures) {
        failures[to_string(scale)] = message;
    }
    return {{"scales", std::move(scales)}, {"failures", std::move(failures)}};
}

}  // namespace cmf
