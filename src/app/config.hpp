#pragma once

#include "core/result.hpp"

#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <chrono>

namespace ledmark::app {

enum class RunMode {
    Bookmark,  // scan, then bookmark what was found
    Restore,   // remove ledgered bookmarks
};

/**
 * Config - Everything one run needs, resolved from the command line and the
 * environment.
 */
struct Config {
    RunMode mode = RunMode::Bookmark;
    std::chrono::milliseconds scan_duration{std::chrono::seconds(30)};
    QString output_path = QStringLiteral("discovered_services.json");
    QString profile_path;  // empty: search under search_root
    QString ledger_path;
    QString folder_name = QStringLiteral("LED Strips");
    QString search_root;
    QStringList excluded_keywords;
    QString backend;  // "avahi", "mdns" or empty for the platform default
    bool debug = false;
};

/**
 * <AppDataLocation>/ledger.jsonl
 */
[[nodiscard]] QString default_ledger_path();

/**
 * Register every ledmark option on `parser`.
 */
void add_options(QCommandLineParser& parser);

/**
 * Build a Config from a parser that already processed the arguments.
 *
 * Environment variables LEDMARK_PROFILE_PATH, LEDMARK_LEDGER_PATH and
 * LEDMARK_DISCOVERY_BACKEND supply defaults; options given on the command line
 * win. Invalid combinations and values fail with InvalidArgument.
 */
[[nodiscard]] Result<Config> config_from_parser(const QCommandLineParser& parser,
                                                const QProcessEnvironment& env);

} // namespace ledmark::app
