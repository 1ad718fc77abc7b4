/**
 * @file main.cpp
 * @brief lineproto_csv command-line entry point.
 *
 * Wires the modules into a conversion run:
 *   Config → Logger → (Metrics) → DirectoryConverter | single-document convert
 */

#include "batch/directory_converter.hpp"
#include "convert/converter.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

using namespace lineproto_csv;

namespace {

constexpr const char* kDefaultConfigPath = "config/lineproto_csv.toml";

struct CLIArgs {
    std::filesystem::path config_path = kDefaultConfigPath;
    bool config_given = false;
    std::string input_dir;
    std::string output_dir;
    std::string file;
    std::optional<uint32_t> threads;
    std::string log_dir;
    std::string log_level;
    bool help = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: lineproto_csv [OPTIONS]\n"
       << "  --config <path>       Configuration file (default: " << kDefaultConfigPath << ")\n"
       << "  --input-dir <path>    Directory of line protocol files\n"
       << "  --output-dir <path>   Directory for the generated CSV files\n"
       << "  --file <path>         Convert one file ('-' for stdin) and print CSV to stdout\n"
       << "  --threads <n>         Worker threads for directory mode (0 = all cores)\n"
       << "  --log-dir <path>      Write NDJSON logs here instead of stderr\n"
       << "  --log-level <level>   debug, info, warn or error\n"
       << "  --help, -h            Show this help message\n";
}

std::optional<uint32_t> parse_uint(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&]() { return i + 1 < argc; };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--config" && needs_value()) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--input-dir" && needs_value()) {
            args.input_dir = argv[++i];
        } else if (arg == "--output-dir" && needs_value()) {
            args.output_dir = argv[++i];
        } else if (arg == "--file" && needs_value()) {
            args.file = argv[++i];
        } else if (arg == "--threads" && needs_value()) {
            args.threads = parse_uint(argv[++i]);
            if (!args.threads) return make_error<CLIArgs>("Invalid --threads value: " + std::string{argv[i]});
        } else if (arg == "--log-dir" && needs_value()) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && needs_value()) {
            args.log_level = argv[++i];
        } else {
            return make_error<CLIArgs>("Unknown or incomplete argument: " + arg);
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty()) {
        return std::make_unique<StderrSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "lineproto_csv",
                                          telemetry.max_file_size_mb,
                                          telemetry.rotate_count);
}

/**
 * @brief Single-document mode: CSV goes to stdout, nothing at all on NoData.
 */
int run_single(const std::string& file, Logger& logger) {
    std::string content;
    if (file == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        auto read = read_text_file(file);
        if (!read) {
            logger.error("Cannot read input", {{"error", read.error().message}});
            return 1;
        }
        content = std::move(read).value();
    }

    auto conversion = convert(content, logger);
    if (!conversion.has_data()) {
        logger.info("No valid line protocol data found", {{"file", file}});
        return 0;
    }
    std::cout << *conversion.csv;
    std::cout.flush();
    return 0;
}

int run_directory(const Config& config, Logger& logger) {
    std::unique_ptr<MetricsCollector> metrics;
    if (config.telemetry.metrics && !config.telemetry.log_dir.empty()) {
        try {
            metrics = std::make_unique<MetricsCollector>(std::make_unique<JsonFileSink>(
                config.telemetry.log_dir, "conversion_metrics",
                config.telemetry.max_file_size_mb, config.telemetry.rotate_count));
        } catch (const std::filesystem::filesystem_error& err) {
            logger.warn("Metrics disabled: cannot open metrics file", {{"error", err.what()}});
        }
    }

    const auto options = BatchOptions::from_config(config);
    logger.info("Starting line protocol to CSV conversion",
                {{"input_dir", std::filesystem::absolute(options.input_dir).string()},
                 {"output_dir", std::filesystem::absolute(options.output_dir).string()}});

    auto summary = convert_directory(options, logger, metrics.get());
    if (!summary) {
        logger.error("Conversion failed", {{"error", summary.error().message}});
        return 1;
    }

    write_summary(std::cout, *summary);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << "\n";
        print_usage(std::cerr);
        return 1;
    }
    const auto& args = *args_result;
    if (args.help) {
        print_usage(std::cout);
        return 0;
    }

    // Load configuration; a missing default file just means defaults.
    Config config = default_config();
    if (args.config_given || std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (!args.input_dir.empty()) config.input.dir = args.input_dir;
    if (!args.output_dir.empty()) config.output.dir = args.output_dir;
    if (args.threads) config.executor.thread_count = *args.threads;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    try {
        log_sink = make_log_sink(config.telemetry);
    } catch (const std::filesystem::filesystem_error& err) {
        std::cerr << "Cannot open log directory: " << err.what() << std::endl;
        return 1;
    }
    Logger logger(std::move(log_sink), *level);

    const int status = args.file.empty()
        ? run_directory(config, logger)
        : run_single(args.file, logger);

    logger.flush();
    return status;
}
