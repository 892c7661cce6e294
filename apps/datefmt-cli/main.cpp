// =============================================================================
// datefmt - Command Line Tool
// Version: 1.2.0
// =============================================================================

#include <cstdio>
#include <iostream>
#include <string>

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/common/cli.hpp"
#include "datefmt/common/logging.hpp"
#include "datefmt/config/config.hpp"
#include "datefmt/format/datefmt.hpp"

namespace cfg = datefmt::config;
namespace fmt = datefmt::format;
namespace lg = datefmt::logging;

namespace {

int fail(const datefmt::ErrorInfo& error) {
    std::cerr << "datefmt: " << error.to_string() << "\n";
    if (error.position) {
        std::cerr << "  at position " << *error.position << "\n";
    }
    return 1;
}

int usage_error(const std::string& message) {
    std::cerr << "datefmt: " << message << "\n";
    return 2;
}

// Settings from --config and the environment, then the command line
datefmt::Result<cfg::FormatSettings> settings_from(const datefmt::cli::ArgParser& args) {
    datefmt::Optional<datefmt::Path> config_path;
    if (auto path = args.get("config")) config_path = datefmt::Path(*path);

    auto loaded = cfg::load_settings(config_path);
    if (!loaded) return loaded.error();
    cfg::FormatSettings settings = std::move(loaded).value();

    if (auto zone = args.get("zone")) settings.zone = *zone;
    if (auto locale = args.get("locale")) settings.locale = *locale;
    if (auto chronology = args.get("chronology")) settings.chronology = *chronology;
    if (args.has("pivot-year")) {
        auto pivot = args.get_int<datefmt::Int32>("pivot-year");
        if (!pivot) {
            return datefmt::ErrorInfo(datefmt::ErrorCode::INVALID_ARGUMENT,
                                      "--pivot-year expects a 32-bit integer", "cli");
        }
        settings.pivot_year = *pivot;
    }
    if (args.flag("verbose")) settings.log_level = lg::LogLevel::DBG;
    return settings;
}

datefmt::Result<datefmt::chrono::Instant> instant_from(const datefmt::cli::ArgParser& args) {
    if (!args.has("instant")) return datefmt::chrono::Instant::now();
    auto millis = args.get_int("instant");
    if (!millis) {
        return datefmt::ErrorInfo(datefmt::ErrorCode::INVALID_ARGUMENT,
                                  "--instant expects milliseconds since the epoch", "cli");
    }
    return datefmt::chrono::Instant(*millis);
}

// The formatter named by --pattern or --format, configured by settings
datefmt::Result<fmt::Formatter> formatter_from(const datefmt::cli::ArgParser& args,
                                               const cfg::FormatSettings& settings) {
    auto pattern = args.get("pattern");
    auto name = args.get("format");
    if (pattern && name) {
        return datefmt::ErrorInfo(datefmt::ErrorCode::INVALID_ARGUMENT,
                                  "--pattern and --format are mutually exclusive", "cli");
    }
    if (!pattern && !name) {
        return datefmt::ErrorInfo(datefmt::ErrorCode::INVALID_ARGUMENT,
                                  "one of --pattern or --format is required", "cli");
    }
    auto base = pattern ? datefmt::compile(*pattern) : datefmt::formatter(*name);
    if (!base) return base.error();
    return settings.apply(*base);
}

int cmd_show(const datefmt::cli::ArgParser& args, const cfg::FormatSettings& settings) {
    auto instant = instant_from(args);
    if (!instant) return fail(instant.error());

    for (const auto* entry : fmt::Registry::instance().printers()) {
        auto configured = settings.apply(entry->formatter);
        if (!configured) return fail(configured.error());
        auto text = configured->print(*instant);
        if (!text) return fail(text.error());
        std::printf("%-40s%s\n", entry->name.c_str(), text->c_str());
    }
    return 0;
}

int cmd_print(const datefmt::cli::ArgParser& args, const cfg::FormatSettings& settings) {
    auto formatter = formatter_from(args, settings);
    if (!formatter) return fail(formatter.error());
    auto instant = instant_from(args);
    if (!instant) return fail(instant.error());

    auto text = formatter->print(*instant);
    if (!text) return fail(text.error());
    std::cout << *text << "\n";
    return 0;
}

int cmd_parse(const datefmt::cli::ArgParser& args, const cfg::FormatSettings& settings) {
    auto text = args.positional(1);
    if (!text) return usage_error("parse needs the text to parse");

    if (!args.has("pattern") && !args.has("format")) {
        auto zone = datefmt::chrono::zones::for_id(settings.zone);
        if (!zone) return fail(zone.error());
        auto resolved = fmt::resolve(*text, fmt::Registry::instance(), *zone);
        if (!resolved) return fail(resolved.error());
        std::cout << resolved->instant.epoch_millis() << "\t" << resolved->formatter_name << "\n";
        return 0;
    }

    auto formatter = formatter_from(args, settings);
    if (!formatter) return fail(formatter.error());
    auto instant = formatter->parse(*text);
    if (!instant) return fail(instant.error());
    std::cout << instant->epoch_millis() << "\n";
    return 0;
}

// Effective settings as an INI file accepted by --config
int cmd_config(const cfg::FormatSettings& settings) {
    std::cout << settings.to_config().to_string();
    return 0;
}

int cmd_list() {
    for (const auto& listing : datefmt::list_registry()) {
        std::printf("%-40s%s%s\n", listing.name.c_str(),
                    listing.capabilities.can_parse ? "parse " : "      ",
                    listing.capabilities.can_print ? "print" : "");
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    datefmt::cli::ArgParser args("datefmt", "Print and parse date-times with Joda-style patterns");
    args.add_positional("command", "show, print, parse, list or config", false)
        .add_positional("text", "Text to parse", false)
        .add_option("pattern", 'p', "Pattern such as yyyy-MM-dd'T'HH:mm")
        .add_option("format", 'f', "Built-in formatter name")
        .add_option("instant", 'i', "Milliseconds since the epoch [default: now]")
        .add_option("zone", 'z', "Zone id such as UTC or +05:30")
        .add_option("locale", 'l', "Locale id: en, fr or de")
        .add_option("chronology", 0, "ISO or Julian")
        .add_option("pivot-year", 0, "Pivot year for two-digit years")
        .add_option("config", 'c', "INI configuration file")
        .add_flag("verbose", 'v', "Debug logging on stderr")
        .add_flag("version", 0, "Print the version and exit");

    if (!args.parse(argc, argv)) {
        if (args.help_requested()) {
            args.show_help();
            return 0;
        }
        std::cerr << "datefmt: " << args.error() << "\n\n";
        args.show_help(std::cerr);
        return 2;
    }
    if (args.flag("version")) {
        std::cout << "datefmt " << datefmt::library_version().to_string() << "\n";
        return 0;
    }
    if (!args.positional(0)) {
        return usage_error("a command is required");
    }
    if (!args.extra_args().empty()) {
        return usage_error("unexpected argument '" + args.extra_args().front() + "'");
    }

    auto settings = settings_from(args);
    if (!settings) return fail(settings.error());
    settings->configure_logging();

    const std::string command = *args.positional(0);
    int status;
    if (command == "show") {
        status = cmd_show(args, *settings);
    } else if (command == "print") {
        status = cmd_print(args, *settings);
    } else if (command == "parse") {
        status = cmd_parse(args, *settings);
    } else if (command == "list") {
        status = cmd_list();
    } else if (command == "config") {
        status = cmd_config(*settings);
    } else {
        status = usage_error("unknown command '" + command + "'");
    }

    lg::LogManager::instance().shutdown();
    return status;
}
