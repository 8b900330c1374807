#include "scan_config.h"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace sectorscan {

namespace {

std::string GetEnv(const char* key) {
    const char* val = std::getenv(key);
    return val ? std::string(val) : std::string();
}

double ParseDouble(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    return parsed;
}

long ParseLong(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

outliers::Universe ParseUniverseOrThrow(const std::string& value) {
    auto universe = outliers::ParseUniverse(value);
    if (!universe) {
        throw std::invalid_argument("unknown universe '" + value + "' (expected sp500 or russell2000)");
    }
    return *universe;
}

} // namespace

ScanConfig ParseScanArgs(int argc, const char* const* argv) {
    ScanConfig config;

    if (auto env = GetEnv("DB_CONNECTION_STRING"); !env.empty()) {
        config.db_conn_str = env;
    }
    if (auto env = GetEnv("SECTORSCAN_UNIVERSE"); !env.empty()) {
        config.universe = ParseUniverseOrThrow(env);
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--universe") {
            config.universe = ParseUniverseOrThrow(next());
        } else if (arg == "--threshold") {
            double t = ParseDouble(arg, next());
            if (!std::isfinite(t) || t <= 0.0) {
                throw std::invalid_argument("--threshold must be a positive number");
            }
            config.threshold = t;
        } else if (arg == "--sector_id") {
            long id = ParseLong(arg, next());
            if (id < std::numeric_limits<int>::min() || id > std::numeric_limits<int>::max()) {
                throw std::invalid_argument("--sector_id out of range");
            }
            config.sector_id = static_cast<int>(id);
        } else if (arg == "--input") {
            config.input_path = next();
        } else if (arg == "--output") {
            config.output_path = next();
        } else if (arg == "--db_conn") {
            config.db_conn_str = next();
        } else if (arg == "--pool_size") {
            long n = ParseLong(arg, next());
            if (n < 1) throw std::invalid_argument("--pool_size must be at least 1");
            config.pool_size = static_cast<size_t>(n);
        } else if (arg == "--parallel") {
            long n = ParseLong(arg, next());
            if (n < 1) throw std::invalid_argument("--parallel must be at least 1");
            config.max_parallel_sectors = static_cast<size_t>(n);
        } else if (arg == "--no_persist") {
            config.persist = false;
        } else if (arg == "--log_level") {
            auto value = next();
            auto level = spdlog::level::from_str(value);
            // from_str maps unknown names to off
            if (level == spdlog::level::off && value != "off") {
                throw std::invalid_argument("unknown log level '" + value + "'");
            }
            config.log_level = level;
        } else {
            throw std::invalid_argument("unknown argument '" + arg + "'");
        }
    }
    return config;
}

std::string ScanUsage() {
    return "Usage: outlier_scan [options]\n"
           "  --universe <sp500|russell2000>   stock universe (default sp500)\n"
           "  --threshold <x>                  composite score cut-off (default 1.5 sp500, 2.0 russell2000)\n"
           "  --sector_id <id>                 scan a single sector\n"
           "  --input <file.json>              score rows from a JSON file instead of the database\n"
           "  --output <file.json>             write results to a file instead of stdout\n"
           "  --db_conn <conninfo>             PostgreSQL connection (env DB_CONNECTION_STRING)\n"
           "  --pool_size <n>                  DB connection pool size (default 4)\n"
           "  --parallel <n>                   sectors scored concurrently (default 1)\n"
           "  --no_persist                     do not record detections\n"
           "  --log_level <level>              trace|debug|info|warn|err|critical|off\n";
}

} // namespace sectorscan
