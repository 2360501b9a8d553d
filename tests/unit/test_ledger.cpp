#include <catch2/catch_test_macros.hpp>
#include "storage/ledger.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace ledmark;
using namespace ledmark::storage;

namespace {

BookmarkEntry entry(int64_t id, std::string title) {
    return BookmarkEntry{
        .id = id,
        .title = std::move(title),
        .url = "http://10.0.0." + std::to_string(id) + ":80/",
        .parent_folder_id = 12,
        .added_at = Timestamp(1'700'000'000'000'000 + id),
        .database = "/home/user/.mozilla/firefox/abcd.default/places.sqlite",
    };
}

QByteArray read_all(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    return file.readAll();
}

} // namespace

TEST_CASE("Ledger entries encode as one JSON object per line", "[ledger]") {
    const auto line = Ledger::encode(entry(42, "alpha"));
    REQUIRE_FALSE(line.contains('\n'));

    auto decoded = Ledger::decode(line);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->id == 42);
    REQUIRE(decoded->title == "alpha");
    REQUIRE(decoded->url == "http://10.0.0.42:80/");
    REQUIRE(decoded->parent_folder_id == 12);
    REQUIRE(decoded->added_at == Timestamp(1'700'000'000'000'042));
    REQUIRE(decoded->database == "/home/user/.mozilla/firefox/abcd.default/places.sqlite");
}

TEST_CASE("Ledger::decode rejects lines that are not entries", "[ledger]") {
    REQUIRE_FALSE(Ledger::decode("not json").has_value());
    REQUIRE_FALSE(Ledger::decode("[1, 2]").has_value());
    REQUIRE_FALSE(Ledger::decode(R"({"title":"no id"})").has_value());
}

TEST_CASE("Ledger appends and reads back in order", "[ledger]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    Ledger ledger(dir.filePath(QStringLiteral("nested/state/ledger.jsonl")));

    SECTION("Missing file reads as empty") {
        auto lines = ledger.read();
        REQUIRE(lines.is_ok());
        REQUIRE(lines.unwrap().empty());
    }

    SECTION("Appended entries") {
        REQUIRE(ledger.append(entry(1, "alpha")).is_ok());
        REQUIRE(ledger.append(entry(2, "beta")).is_ok());

        auto lines = ledger.read();
        REQUIRE(lines.is_ok());
        REQUIRE(lines.unwrap().size() == 2);
        REQUIRE(lines.unwrap()[0].entry->title == "alpha");
        REQUIRE(lines.unwrap()[1].entry->title == "beta");
        REQUIRE(read_all(ledger.path()).count('\n') == 2);
    }
}

TEST_CASE("Ledger::replace keeps unreadable lines verbatim", "[ledger]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("ledger.jsonl"));

    {
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(Ledger::encode(entry(1, "alpha")) + '\n');
        file.write("garbage from an older version\n");
        file.write("\n");
        file.write(Ledger::encode(entry(2, "beta")) + '\n');
    }

    Ledger ledger(path);
    auto lines = ledger.read().unwrap();
    REQUIRE(lines.size() == 3);
    REQUIRE_FALSE(lines[1].entry.has_value());

    // Drop alpha, as restore does after deleting it.
    lines.erase(lines.begin());
    REQUIRE(ledger.replace(lines).is_ok());

    const auto content = read_all(path);
    REQUIRE(content == "garbage from an older version\n" + Ledger::encode(entry(2, "beta")) + '\n');
}
