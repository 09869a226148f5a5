/// @file src/main.cpp
/// @brief CMF CLI entry point.
///
/// Usage:
///   cmf --analyze <csv_file> [--timescale T] [--sensitivity S] [--horizon H] [--json]
///   cmf --multiscale <csv_file> [--sensitivity S] [--json]
///   cmf --help

#include "cmf/data_loader.hpp"
#include "cmf/errors.hpp"
#include "cmf/interpreter.hpp"
#include "cmf/metrics.hpp"
#include "cmf/multiscale.hpp"
#include "cmf/phrase_bank.hpp"
#include "cmf/readout.hpp"
#include "cmf/serialization.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  cmf --analyze <csv_file> [options]     Analyze one timescale\n"
        "  cmf --multiscale <csv_file> [options]  Analyze every timescale\n"
        "  cmf --help                             Show this help\n"
        "\n"
        "Options:\n"
        "  --timescale <monthly|weekly|daily|intraday>   (default daily)\n"
        "  --sensitivity <S>     singularity threshold multiplier in (0, 100]\n"
        "  --horizon <micro|short|medium|long|macro>     projection horizon\n"
        "  --json                emit JSON instead of a text report\n"
        "\n"
        "CSV format (header required; close or price column):\n"
        "  timestamp,open,high,low,close,volume\n"
    );
}

struct Options {
    std::string     csv_path;
    cmf::Timescale  timescale   = cmf::Timescale::Daily;
    cmf::Horizon    horizon     = cmf::Horizon::Medium;
    double          sensitivity = cmf::constants::DEFAULT_SENSITIVITY;
    bool            json        = false;
};

/// Parse the arguments after the mode flag. Prints the problem and returns
/// nullopt on any unknown or malformed option.
std::optional<Options> parse_options(int argc, char* argv[]) {
    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a CSV file path\n", argv[1]);
        return std::nullopt;
    }

    Options opts;
    opts.csv_path = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--timescale" && has_value) {
            const auto t = cmf::try_parse_timescale(argv[++i]);
            if (!t) {
                fmt::print(stderr, "Error: unknown timescale '{}'\n", argv[i]);
                return std::nullopt;
            }
            opts.timescale = *t;
        } else if (arg == "--horizon" && has_value) {
            const auto h = cmf::try_parse_horizon(argv[++i]);
            if (!h) {
                fmt::print(stderr, "Error: unknown horizon '{}'\n", argv[i]);
                return std::nullopt;
            }
            opts.horizon = *h;
        } else if (arg == "--sensitivity" && has_value) {
            const char* text = argv[++i];
            char* end = nullptr;
            errno = 0;
            opts.sensitivity = std::strtod(text, &end);
            if (end == text || *end != '\0' || errno == ERANGE) {
                fmt::print(stderr, "Error: invalid sensitivity '{}'\n", text);
                return std::nullopt;
            }
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

std::optional<cmf::PriceSeries> load(const std::string& filepath) {
    auto series = cmf::DataLoader::load_csv(filepath);
    if (!series) {
        fmt::print(stderr, "Error: cannot read '{}' (missing file or no close/price column)\n",
                   filepath);
        return std::nullopt;
    }
    if (series->skipped_rows > 0) {
        fmt::print(stderr, "Warning: skipped {} malformed rows in '{}'\n",
                   series->skipped_rows, filepath);
    }
    return series;
}

void print_report(const cmf::ManifoldMetrics& metrics,
                  const cmf::Interpretation& interp,
                  const cmf::PulseReading& pulse,
                  const cmf::ModelQuality& quality,
                  const cmf::PriceProjection& projection) {
    fmt::print("── Manifold ({}, {} samples) ──\n", cmf::to_string(metrics.timescale), metrics.size());
    fmt::print("  global entropy   {:.4f}\n", metrics.entropy);
    fmt::print("  curvature        {:+.4f}\n", interp.curvature_value);
    fmt::print("  tension          {:+.4f}\n", interp.tension_value);
    fmt::print("  local entropy    {:.4f}\n", interp.entropy_value);
    fmt::print("  singularities    {}\n", metrics.singularities.size());
    for (const cmf::SingularityEvent& e : cmf::singularity_events(metrics)) {
        fmt::print("    #{:<5} price {:.2f}  curvature {:+.3f}  tension {:+.3f}\n",
                   e.index, e.price, e.curvature, e.tension);
    }
    for (const cmf::AttractorLevel& a : cmf::attractor_levels(metrics, pulse.current_price)) {
        fmt::print("  attractor        {:.2f}  (strength {:.3f}, {:+.2f}%)\n",
                   a.price, a.strength, a.distance_pct);
    }

    const auto text = cmf::phrases::interpretation_text(interp);
    fmt::print("\n── {} ──\n", text.phase_title);
    fmt::print("  {}\n", text.phase_detail);
    fmt::print("  phase            {}  (confidence {:.2f})\n",
               cmf::to_string(interp.phase), interp.confidence);
    fmt::print("  conductor        {}: {}\n", cmf::to_string(interp.conductor), text.conductor_view);
    fmt::print("  singer           {}: {}\n", cmf::to_string(interp.singer), text.singer_view);
    fmt::print("  curvature        {}\n", interp.curvature_state);
    fmt::print("  tension          {}\n", interp.tension_description);
    fmt::print("  entropy          {}\n", interp.entropy_state);
    if (interp.wave_position) {
        fmt::print("  wave             {}\n", *interp.wave_position);
    }
    if (interp.nearest_attractor) {
        fmt::print("  attractor        {} (pull {:.3f})\n",
                   interp.nearest_attractor->description, interp.pull_strength);
    }
    fmt::print("\n  {}\n", interp.narrative);
    if (interp.warning) {
        fmt::print("\n  !! {}\n", *interp.warning);
    }

    fmt::print("\n── Pulse ──\n");
    fmt::print("  state            {}\n", cmf::to_string(pulse.state));
    fmt::print("  entropy level    {}\n", cmf::to_string(pulse.entropy_level));
    fmt::print("  tension level    {}\n", cmf::to_string(pulse.tension_level));
    fmt::print("  recent singular. {}\n", pulse.recent_singularities);

    fmt::print("\n── Model quality: {} ({}) ──\n", quality.grade, quality.overall);
    fmt::print("  consistency {}  clarity {}  sample {}\n",
               quality.consistency, quality.signal_clarity, quality.sample_sufficiency);

    fmt::print("\n── Projection ({}) ──\n", cmf::to_string(projection.horizon));
    fmt::print("  range            {:.2f} .. {:.2f}  (±{:.2f}%)\n",
               projection.low, projection.high, projection.range_pct);
    fmt::print("  bias             {} ({})\n",
               cmf::to_string(projection.bias), projection.bias_confidence);
}

/// Analyze one timescale. Returns 0 on success, 1 on error.
int run_analyze(const Options& opts) {
    const auto series = load(opts.csv_path);
    if (!series) {
        return 1;
    }

    const cmf::ManifoldEngine engine(cmf::EngineConfig{.sensitivity = opts.sensitivity});
    const auto metrics = engine.analyze(series->prices, series->timestamps,
                                        opts.timescale, series->volume);

    const cmf::ManifoldInterpreter interpreter;
    const auto interp     = interpreter.interpret(metrics);
    const auto pulse      = cmf::pulse(metrics);
    const auto quality    = cmf::model_quality(metrics);
    const auto projection = cmf::project(metrics, pulse.current_price, opts.horizon);

    if (opts.json) {
        nlohmann::json singularities = nlohmann::json::array();
        for (const cmf::SingularityEvent& e : cmf::singularity_events(metrics)) {
            singularities.push_back(cmf::to_json(e));
        }
        nlohmann::json attractors = nlohmann::json::array();
        for (const cmf::AttractorLevel& a : cmf::attractor_levels(metrics, pulse.current_price)) {
            attractors.push_back(cmf::to_json(a));
        }
        const nlohmann::json out = {
            {"metrics",        cmf::to_json(metrics)},
            {"interpretation", cmf::to_json(interp)},
            {"pulse",          cmf::to_json(pulse)},
            {"model_quality",  cmf::to_json(quality)},
            {"projection",     cmf::to_json(projection)},
            {"text",           cmf::to_json(cmf::phrases::interpretation_text(interp))},
            {"singularities",  singularities},
            {"attractors",     attractors},
        };
        fmt::print("{}\n", out.dump(2));
    } else {
        print_report(metrics, interp, pulse, quality, projection);
    }
    return 0;
}

/// Analyze every timescale. Returns 0 if at least one scale succeeded.
int run_multiscale(const Options& opts) {
    const auto series = load(opts.csv_path);
    if (!series) {
        return 1;
    }

    const cmf::MultiScaleAnalyzer analyzer(cmf::EngineConfig{.sensitivity = opts.sensitivity});
    const auto result = analyzer.analyze_multiscale(series->prices, series->timestamps,
                                                    {}, series->volume);

    const cmf::ManifoldInterpreter interpreter;
    std::map<cmf::Timescale, cmf::Interpretation> interps;
    for (const auto& [scale, metrics] : result.scales) {
        interps.emplace(scale, interpreter.interpret(metrics));
    }
    const auto summary = cmf::fractal_summary(interps);

    if (opts.json) {
        nlohmann::json out = cmf::to_json(result);
        nlohmann::json readings = nlohmann::json::object();
        for (const auto& [scale, interp] : interps) {
            readings[cmf::to_string(scale)] = cmf::to_json(interp);
        }
        out["interpretations"] = std::move(readings);
        out["fractal"] = cmf::to_json(summary);
        fmt::print("{}\n", out.dump(2));
    } else {
        for (const auto& [scale, interp] : interps) {
            fmt::print("{:<9} {:<24} conductor={:<18} singer={:<18} confidence={:.2f}\n",
                       cmf::to_string(scale), cmf::to_string(interp.phase),
                       cmf::to_string(interp.conductor), cmf::to_string(interp.singer),
                       interp.confidence);
        }
        for (const auto& [scale, message] : result.failures) {
            fmt::print("{:<9} failed: {}\n", cmf::to_string(scale), message);
        }
        fmt::print("\nfractal consistency {}%  dominant phase {}\n", summary.consistency,
                   summary.dominant_phase ? cmf::to_string(*summary.dominant_phase) : "none");
    }

    if (result.scales.empty()) {
        fmt::print(stderr, "Error: no timescale could be analyzed\n");
        return 1;
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--analyze" && mode != "--multiscale") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    const auto opts = parse_options(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        return mode == "--analyze" ? run_analyze(*opts) : run_multiscale(*opts);
    } catch (const cmf::ManifoldError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
