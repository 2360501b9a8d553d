#include <catch2/catch_test_macros.hpp>
#include "app/config.hpp"
#include "app/prompt.hpp"
#include "storage/profile_locator.hpp"

#include <QDir>

using namespace ledmark;
using namespace ledmark::app;

namespace {

Result<Config> parse(QStringList args, const QProcessEnvironment& env = QProcessEnvironment()) {
    QCommandLineParser parser;
    add_options(parser);
    args.prepend(QStringLiteral("ledmark"));
    REQUIRE(parser.parse(args));
    return config_from_parser(parser, env);
}

} // namespace

TEST_CASE("Config defaults", "[config]") {
    auto config = parse({});
    REQUIRE(config.is_ok());
    const auto& c = config.unwrap();

    REQUIRE(c.mode == RunMode::Bookmark);
    REQUIRE(c.scan_duration == std::chrono::seconds(30));
    REQUIRE(c.output_path == QStringLiteral("discovered_services.json"));
    REQUIRE(c.profile_path.isEmpty());
    REQUIRE(c.ledger_path == default_ledger_path());
    REQUIRE(c.ledger_path.endsWith(QStringLiteral("ledger.jsonl")));
    REQUIRE(c.folder_name == QStringLiteral("LED Strips"));
    REQUIRE(c.search_root == QDir::homePath());
    REQUIRE(c.excluded_keywords == storage::default_excluded_keywords());
    REQUIRE(c.backend.isEmpty());
    REQUIRE_FALSE(c.debug);
}

TEST_CASE("Config reads every option", "[config]") {
    auto config = parse({
        QStringLiteral("--duration"), QStringLiteral("5"),
        QStringLiteral("--output"), QStringLiteral("/tmp/devices.json"),
        QStringLiteral("--profile-path"), QStringLiteral("/p/places.sqlite"),
        QStringLiteral("--ledger"), QStringLiteral("/tmp/ledger.jsonl"),
        QStringLiteral("--folder"), QStringLiteral("Lights"),
        QStringLiteral("--search-root"), QStringLiteral("/srv"),
        QStringLiteral("--exclude"), QStringLiteral("backup"),
        QStringLiteral("--exclude"), QStringLiteral("snap"),
        QStringLiteral("--backend"), QStringLiteral("MDNS"),
        QStringLiteral("--debug"),
    });
    REQUIRE(config.is_ok());
    const auto& c = config.unwrap();

    REQUIRE(c.scan_duration == std::chrono::seconds(5));
    REQUIRE(c.output_path == QStringLiteral("/tmp/devices.json"));
    REQUIRE(c.profile_path == QStringLiteral("/p/places.sqlite"));
    REQUIRE(c.ledger_path == QStringLiteral("/tmp/ledger.jsonl"));
    REQUIRE(c.folder_name == QStringLiteral("Lights"));
    REQUIRE(c.search_root == QStringLiteral("/srv"));
    REQUIRE(c.excluded_keywords == QStringList{QStringLiteral("backup"), QStringLiteral("snap")});
    REQUIRE(c.backend == QStringLiteral("mdns"));
    REQUIRE(c.debug);
}

TEST_CASE("Config takes defaults from the environment", "[config]") {
    QProcessEnvironment env;
    env.insert(QStringLiteral("LEDMARK_PROFILE_PATH"), QStringLiteral("/env/places.sqlite"));
    env.insert(QStringLiteral("LEDMARK_LEDGER_PATH"), QStringLiteral("/env/ledger.jsonl"));
    env.insert(QStringLiteral("LEDMARK_DISCOVERY_BACKEND"), QStringLiteral("avahi"));

    SECTION("Environment only") {
        auto config = parse({}, env);
        REQUIRE(config.is_ok());
        REQUIRE(config.unwrap().profile_path == QStringLiteral("/env/places.sqlite"));
        REQUIRE(config.unwrap().ledger_path == QStringLiteral("/env/ledger.jsonl"));
        REQUIRE(config.unwrap().backend == QStringLiteral("avahi"));
    }

    SECTION("Command line wins") {
        auto config = parse({QStringLiteral("--profile-path"), QStringLiteral("/cli/places.sqlite"),
                             QStringLiteral("--backend"), QStringLiteral("mdns")},
                            env);
        REQUIRE(config.is_ok());
        REQUIRE(config.unwrap().profile_path == QStringLiteral("/cli/places.sqlite"));
        REQUIRE(config.unwrap().ledger_path == QStringLiteral("/env/ledger.jsonl"));
        REQUIRE(config.unwrap().backend == QStringLiteral("mdns"));
    }
}

TEST_CASE("Config restore mode", "[config]") {
    auto config = parse({QStringLiteral("--restore")});
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().mode == RunMode::Restore);

    for (const auto& extra : {QStringLiteral("--duration"), QStringLiteral("--output")}) {
        auto mixed = parse({QStringLiteral("--restore"), extra, QStringLiteral("10")});
        REQUIRE(mixed.is_err());
        REQUIRE(mixed.unwrap_err().kind == ErrorKind::InvalidArgument);
    }
}

TEST_CASE("Config rejects invalid values", "[config]") {
    const QList<QStringList> invalid{
        {QStringLiteral("--duration"), QStringLiteral("0")},
        {QStringLiteral("--duration"), QStringLiteral("-3")},
        {QStringLiteral("--duration"), QStringLiteral("soon")},
        {QStringLiteral("--folder"), QStringLiteral("  ")},
        {QStringLiteral("--backend"), QStringLiteral("bonjour")},
    };
    for (const auto& args : invalid) {
        auto config = parse(args);
        REQUIRE(config.is_err());
        REQUIRE(config.unwrap_err().kind == ErrorKind::InvalidArgument);
    }
}

TEST_CASE("parse_choice maps answers onto options", "[prompt]") {
    const QStringList options{QStringLiteral("/a/places.sqlite"), QStringLiteral("/b/places.sqlite")};

    REQUIRE(parse_choice(QStringLiteral("1"), options) == options.at(0));
    REQUIRE(parse_choice(QStringLiteral(" 2\n"), options) == options.at(1));
    REQUIRE(parse_choice(QStringLiteral("/b/places.sqlite\n"), options) == options.at(1));
    REQUIRE_FALSE(parse_choice(QStringLiteral("3"), options).has_value());
    REQUIRE_FALSE(parse_choice(QStringLiteral("0"), options).has_value());
    REQUIRE_FALSE(parse_choice(QString{}, options).has_value());
    REQUIRE_FALSE(parse_choice(QStringLiteral("/c/places.sqlite"), options).has_value());
}
