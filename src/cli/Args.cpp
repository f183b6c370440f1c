#include "cli/Args.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/core.h>

namespace mpc::cli {

namespace {

struct Option {
    std::string key;
    std::optional<std::string> value;
};

// Splits "--key=value" into its parts; "--key" yields no value.
Option splitOption(const std::string& arg) {
    const auto eq = arg.find('=');
    if (arg.starts_with("--") && eq != std::string::npos) return {arg.substr(0, eq), arg.substr(eq + 1)};
    return {arg, std::nullopt};
}

}

std::optional<unsigned int> parseUInt(const std::string& s) {
    if (s.empty()) return std::nullopt;

    unsigned long long v = 0;
    for (const char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned long long>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }
    return static_cast<unsigned int>(v);
}

spdlog::level::level_enum parseLevel(const std::string& s) {
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });

    // Long spellings accepted alongside spdlog's own names
    if (lower == "warning") lower = "warn";
    if (lower == "error") lower = "err";
    if (lower == "fatal") lower = "critical";

    const auto lvl = spdlog::level::from_str(lower);
    // from_str falls back to "off" for anything it does not know
    if (lvl == spdlog::level::off && lower != "off")
        throw ArgsError(fmt::format("Invalid log level: {}", s));
    return lvl;
}

Args parse(const std::vector<std::string>& argv) {
    Args args;

    for (size_t i = 0; i < argv.size(); ++i) {
        const auto opt = splitOption(argv[i]);
        const auto& key = opt.key;

        const auto value = [&]() -> std::string {
            if (opt.value) return *opt.value;
            if (i + 1 >= argv.size()) throw ArgsError(fmt::format("Option {} requires a value", key));
            return argv[++i];
        };

        const auto uintValue = [&](const std::string& k) -> unsigned int {
            const auto raw = value();
            const auto n = parseUInt(raw);
            if (!n || *n == 0) throw ArgsError(fmt::format("Option {} expects a positive integer, got '{}'", k, raw));
            return *n;
        };

        if (key == "--help" || key == "-h") args.help = true;
        else if (key == "--source" || key == "-s") args.source = value();
        else if (key == "--target" || key == "-t") args.target = value();
        else if (key == "--threads" || key == "-n") args.threads = uintValue(key);
        else if (key == "--max-attempts") args.maxAttempts = uintValue(key);
        else if (key == "--work-dir" || key == "-w") args.workDir = value();
        else if (key == "--queue" || key == "-q") args.queueName = value();
        else if (key == "--config" || key == "-c") args.configPath = value();
        else if (key == "--log" || key == "-l") args.logLevel = parseLevel(value());
        else if (key == "--dry-run") args.dryRun = true;
        else if (key == "--move") args.move = true;
        else if (key == "--fast") args.fast = true;
        else if (key == "--create") args.create = true;
        else throw ArgsError(fmt::format("Unknown argument: {}", argv[i]));
    }

    if (args.help) return args;
    if (!args.source) throw ArgsError("Missing required option --source");
    if (!args.target) throw ArgsError("Missing required option --target");
    return args;
}

Args parse(const int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse(args);
}

void Args::applyTo(config::Config& cnf) const {
    if (source) cnf.run.source = *source;
    if (target) cnf.run.destination = *target;
    if (threads) cnf.run.workers = *threads;
    if (maxAttempts) cnf.copy.max_attempts = *maxAttempts;
    if (workDir) cnf.run.work_dir = *workDir;
    if (queueName) cnf.run.queue_file = *queueName;
    if (logLevel) cnf.logging.setVerbosity(*logLevel);
    if (dryRun) cnf.copy.dry_run = true;
    if (move) cnf.copy.move = true;
    if (fast) cnf.copy.checksum = false;
    if (create) cnf.run.create_destination = true;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {} --source <srcPath> --target <trgPath> [options]\n"
        "Copy files from the source folder to the target path on separate workers.\n"
        "Source and target must share the same final folder name.\n\n"
        "Options:\n"
        "  -s, --source <path>      Source path\n"
        "  -t, --target <path>      Target path\n"
        "  -n, --threads <N>        Number of concurrent copies (default 1)\n"
        "      --dry-run            Report what rsync would do without writing\n"
        "      --move               Remove source files after a successful copy\n"
        "      --fast               Compare by size and time instead of checksum\n"
        "      --create             Create the target path if it does not exist\n"
        "      --max-attempts <N>   Attempts per file before it is recorded as failed\n"
        "  -w, --work-dir <dir>     Directory for the queue file, logs and reports\n"
        "  -q, --queue <name>       Queue file name inside the work directory\n"
        "                           (default: derived from source and target)\n"
        "  -l, --log <level>        Log level as WARN, INFO, DEBUG, etc\n"
        "  -c, --config <file>      YAML configuration file (default {})\n"
        "  -h, --help               Show this help\n",
        program, config::DEFAULT_CONFIG_PATH.string());
}

}
