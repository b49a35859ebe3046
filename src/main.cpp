#include "core/console_progress.hpp"
#include "core/container_metadata_source.hpp"
#include "core/exif_metadata_source.hpp"
#include "core/metadata_resolver.hpp"
#include "core/pipeline_runner.hpp"
#include "core/poco_config_manager.hpp"
#include "core/retry_policy.hpp"
#include "core/run_controls.hpp"
#include "core/run_signal_manager.hpp"
#include "geocode/geocode_cache.hpp"
#include "geocode/nominatim_geocoder.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <unistd.h>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Media Organizer - sorts photos and videos by capture date and place" << std::endl;
        std::cout << "Usage: " << program << " --input DIR [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --input, -i DIR        Directory to organize (required)" << std::endl;
        std::cout << "  --output, -o DIR       Organized tree root (default from config)" << std::endl;
        std::cout << "  --trash, -t DIR        Duplicate quarantine root (default from config)" << std::endl;
        std::cout << "  --config, -c FILE      Configuration file (default config.json)" << std::endl;
        std::cout << "  --strategy NAME        exact | perceptual" << std::endl;
        std::cout << "  --naming NAME          Date_Location | Date | Location | Dynamic" << std::endl;
        std::cout << "  --extensions LIST      Comma separated extensions to process (jpg,png,...)" << std::endl;
        std::cout << "  --log-level LEVEL      TRACE | DEBUG | INFO | WARN | ERROR" << std::endl;
        std::cout << "  --no-geocode           Resolve places from the cache only" << std::endl;
        std::cout << "  --help, -h             Show this help message" << std::endl;
        std::cout << "Signals: SIGUSR1 pauses, SIGUSR2 resumes, SIGINT/SIGTERM cancel" << std::endl;
    }

    std::set<std::string> parseExtensionList(const std::string &list)
    {
        std::set<std::string> extensions;
        std::stringstream ss(list);
        std::string item;
        while (std::getline(ss, item, ','))
        {
            if (!item.empty() && item[0] == '.')
                item = item.substr(1);
            std::transform(item.begin(), item.end(), item.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (!item.empty())
                extensions.insert(item);
        }
        return extensions;
    }
}

int main(int argc, char *argv[])
{
    std::string input_dir;
    std::string output_dir;
    std::string trash_dir;
    std::string config_path = "config.json";
    std::string strategy_arg;
    std::string naming_arg;
    std::string extensions_arg;
    std::string log_level_arg;
    bool no_geocode = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto next_value = [&](std::string &target) -> bool
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--input" || arg == "-i")
            ok = next_value(input_dir);
        else if (arg == "--output" || arg == "-o")
            ok = next_value(output_dir);
        else if (arg == "--trash" || arg == "-t")
            ok = next_value(trash_dir);
        else if (arg == "--config" || arg == "-c")
            ok = next_value(config_path);
        else if (arg == "--strategy")
            ok = next_value(strategy_arg);
        else if (arg == "--naming")
            ok = next_value(naming_arg);
        else if (arg == "--extensions")
            ok = next_value(extensions_arg);
        else if (arg == "--log-level")
            ok = next_value(log_level_arg);
        else if (arg == "--no-geocode")
            no_geocode = true;
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            ok = false;
        }

        if (!ok)
        {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (input_dir.empty())
    {
        std::cerr << "Error: --input is required" << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    if (!strategy_arg.empty() && !DuplicateStrategies::isValid(strategy_arg))
    {
        std::cerr << "Error: unknown duplicate strategy " << strategy_arg << std::endl;
        return 1;
    }

    // Configuration: file values over defaults, then command line over both
    auto &config = PocoConfigManager::getInstance();
    if (!std::filesystem::exists(config_path))
    {
        if (config.save(config_path))
            Logger::info("Created new " + config_path + " with default values");
        else
            Logger::warn("Using built-in defaults; could not write " + config_path);
    }
    else if (config.load(config_path))
    {
        Logger::info("Configuration loaded from " + config_path);
    }
    else
    {
        Logger::warn("Could not read " + config_path + ", using built-in defaults");
    }
    config.validateConfig();

    Logger::init(log_level_arg.empty() ? config.getLogLevel() : log_level_arg);
    Logger::addFileSink(config.getLogFile());

    if (output_dir.empty())
        output_dir = config.getOutputDir();
    if (trash_dir.empty())
        trash_dir = config.getTrashDir();

    PipelineOptions options;
    options.duplicate_strategy = strategy_arg.empty() ? config.getDuplicateStrategy()
                                                      : DuplicateStrategies::fromString(strategy_arg);
    options.naming_convention = naming_arg.empty() ? config.getNamingConvention()
                                                   : NamingConventions::fromString(naming_arg);
    options.media_extensions = config.getMediaExtensions();
    if (!extensions_arg.empty())
    {
        options.included_extensions = parseExtensionList(extensions_arg);
        if (options.included_extensions->empty())
            Logger::warn("--extensions names no extension, every file will be skipped");
    }
    options.chunk_size = config.getHashChunkSize();

    // Collaborators
    ExifMetadataSource image_source;
    ContainerMetadataSource video_source;
    MetadataResolver resolver(image_source, video_source);

    std::unique_ptr<NominatimGeocoder> geocoder;
    if (!no_geocode && config.isGeocodeEnabled())
    {
        NominatimSettings settings;
        settings.host = config.getGeocodeHost();
        settings.user_agent = config.getGeocodeUserAgent();
        settings.language = config.getGeocodeLanguage();
        settings.timeout_seconds = config.getGeocodeTimeoutSeconds();
        settings.min_interval_ms = config.getGeocodeMinIntervalMs();
        geocoder = std::make_unique<NominatimGeocoder>(settings);
    }
    else
    {
        Logger::info("Reverse geocoding disabled, places come from the cache only");
    }

    GeocodeCache geocode_cache(geocoder.get(), GeocodeCacheStore(config.getGeocodeCachePath()),
                               RetryPolicy(config.getGeocodeMaxAttempts(), config.getGeocodeBackoffMs()));

    RunControls controls;
    auto &signals = RunSignalManager::getInstance();
    signals.attach(&controls);
    signals.installSignalHandlers();

    // Progress and the current status share one terminal line
    ConsoleProgress console(std::cout);
    RunCallbacks callbacks = console.callbacks();

    Logger::info("Starting media organizer (PID: " + std::to_string(getpid()) + ")");
    PipelineRunner runner(resolver, geocode_cache);
    auto future_report = runner.runAsync(input_dir, output_dir, trash_dir, options, callbacks, controls);
    RunReport report = future_report.get();
    std::cout << std::endl;

    signals.uninstallSignalHandlers();
    signals.attach(nullptr);

    std::cout << "Result:      " << PipelineStates::getName(report.state) << std::endl;
    std::cout << "Processed:   " << report.processed << "/" << report.total << std::endl;
    std::cout << "Organized:   " << report.organized << std::endl;
    std::cout << "Quarantined: " << report.quarantined << std::endl;
    std::cout << "Skipped:     " << report.skipped << std::endl;
    std::cout << "Failed:      " << report.failed << std::endl;
    if (!report.failure_message.empty())
    {
        std::cout << "Error:       " << report.failure_message << std::endl;
    }

    switch (report.state)
    {
    case PipelineState::COMPLETED:
        return 0;
    case PipelineState::CANCELLED:
        return 2;
    default:
        return 1;
    }
}
