#include "app/config.hpp"

#include "storage/profile_locator.hpp"

#include <QDir>
#include <QStandardPaths>

namespace ledmark::app {
namespace {

QString value_or_env(const QCommandLineParser& parser, const QString& option,
                     const QProcessEnvironment& env, const QString& variable) {
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    return env.value(variable);
}

Result<Config> invalid(std::string message) {
    return Result<Config>::err(Error{ErrorKind::InvalidArgument, std::move(message)});
}

} // namespace

QString default_ledger_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(base).filePath(QStringLiteral("ledger.jsonl"));
}

void add_options(QCommandLineParser& parser) {
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("duration")},
        QStringLiteral("Discovery duration in seconds (default 30)."),
        QStringLiteral("seconds")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("restore")},
        QStringLiteral("Remove the bookmarks previously added by ledmark.")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("output")},
        QStringLiteral("JSON file receiving the discovered devices (default discovered_services.json)."),
        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("profile-path")},
        QStringLiteral("Use this places.sqlite instead of searching (also LEDMARK_PROFILE_PATH)."),
        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("ledger")},
        QStringLiteral("Ledger of added bookmarks (also LEDMARK_LEDGER_PATH)."),
        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("folder")},
        QStringLiteral("Bookmark folder under the Bookmarks Menu (default \"LED Strips\")."),
        QStringLiteral("title")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("search-root")},
        QStringLiteral("Directory searched for places.sqlite (default: home directory)."),
        QStringLiteral("dir")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("exclude")},
        QStringLiteral("Skip profiles whose path contains this text; repeatable, replaces the defaults."),
        QStringLiteral("keyword")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("backend")},
        QStringLiteral("Discovery backend: avahi or mdns (also LEDMARK_DISCOVERY_BACKEND)."),
        QStringLiteral("name")));
    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging.")));
}

Result<Config> config_from_parser(const QCommandLineParser& parser, const QProcessEnvironment& env) {
    Config config;

    if (parser.isSet(QStringLiteral("restore"))) {
        if (parser.isSet(QStringLiteral("duration")) || parser.isSet(QStringLiteral("output"))) {
            return invalid("--restore cannot be combined with --duration or --output");
        }
        config.mode = RunMode::Restore;
    }

    if (parser.isSet(QStringLiteral("duration"))) {
        bool ok = false;
        const auto seconds = parser.value(QStringLiteral("duration")).toInt(&ok);
        if (!ok || seconds <= 0) {
            return invalid("--duration must be a positive number of seconds, got '" +
                           parser.value(QStringLiteral("duration")).toStdString() + "'");
        }
        config.scan_duration = std::chrono::seconds(seconds);
    }

    if (parser.isSet(QStringLiteral("output"))) {
        config.output_path = parser.value(QStringLiteral("output"));
        if (config.output_path.isEmpty()) {
            return invalid("--output must not be empty");
        }
    }

    config.profile_path = value_or_env(parser, QStringLiteral("profile-path"), env,
                                       QStringLiteral("LEDMARK_PROFILE_PATH"));

    config.ledger_path = value_or_env(parser, QStringLiteral("ledger"), env,
                                      QStringLiteral("LEDMARK_LEDGER_PATH"));
    if (config.ledger_path.isEmpty()) {
        config.ledger_path = default_ledger_path();
    }

    if (parser.isSet(QStringLiteral("folder"))) {
        config.folder_name = parser.value(QStringLiteral("folder")).trimmed();
        if (config.folder_name.isEmpty()) {
            return invalid("--folder must not be empty");
        }
    }

    config.search_root = parser.isSet(QStringLiteral("search-root"))
        ? parser.value(QStringLiteral("search-root"))
        : QDir::homePath();

    config.excluded_keywords = parser.isSet(QStringLiteral("exclude"))
        ? parser.values(QStringLiteral("exclude"))
        : storage::default_excluded_keywords();

    config.backend = value_or_env(parser, QStringLiteral("backend"), env,
                                  QStringLiteral("LEDMARK_DISCOVERY_BACKEND"))
                         .trimmed()
                         .toLower();
    if (!config.backend.isEmpty() && config.backend != QStringLiteral("avahi") &&
        config.backend != QStringLiteral("mdns")) {
        return invalid("Unknown discovery backend '" + config.backend.toStdString() +
                       "' (expected avahi or mdns)");
    }

    config.debug = parser.isSet(QStringLiteral("debug"));
    return Result<Config>::ok(std::move(config));
}

} // namespace ledmark::app
