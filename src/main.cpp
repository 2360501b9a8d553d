#include <QCoreApplication>
#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <QTextStream>

#include <memory>

#include "app/config.hpp"
#include "app/logging.hpp"
#include "app/prompt.hpp"
#include "app/session.hpp"
#include "network/discovery.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("ledmark");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("ledmark");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Discover WLED controllers on the local network and bookmark them in Firefox."));
    parser.addHelpOption();
    parser.addVersionOption();
    ledmark::app::add_options(parser);
    parser.process(app);

    auto config_result = ledmark::app::config_from_parser(parser, QProcessEnvironment::systemEnvironment());
    if (config_result.is_err()) {
        QTextStream(stderr) << QString::fromStdString(config_result.unwrap_err().message) << QLatin1Char('\n')
                            << parser.helpText();
        return 1;
    }
    const auto config = std::move(config_result).unwrap();

    const auto log_path = ledmark::app::default_log_file_path();
    auto logging = ledmark::app::install_logging({.debug = config.debug, .file_path = log_path});
    if (logging.is_err()) {
        qWarning() << "ledmark: file logging disabled:"
                   << QString::fromStdString(logging.unwrap_err().message);
    } else if (!log_path.isEmpty()) {
        qInfo() << "ledmark: logging to" << log_path;
    }

    std::unique_ptr<ledmark::network::DiscoveryEngine> engine;
    if (config.mode == ledmark::app::RunMode::Bookmark) {
        auto backend = ledmark::network::createDiscoveryBackend(config.backend);
        if (!backend) {
            QTextStream(stderr) << "Discovery backend '" << config.backend << "' is not available\n";
            return 1;
        }
        engine = std::make_unique<ledmark::network::DiscoveryEngine>(std::move(backend));
    }

    ledmark::app::Session session(config, engine.get(), ledmark::app::make_terminal_selector());
    const auto outcome = session.run();

    QTextStream out(stdout);
    if (outcome.error) {
        QTextStream(stderr) << QString::fromStdString(outcome.error->message) << QLatin1Char('\n');
    }
    if (outcome.snapshot) {
        out << "Backup: " << QString::fromStdString(outcome.snapshot->backup_path) << '\n';
    }
    if (outcome.succeeded()) {
        if (config.mode == ledmark::app::RunMode::Restore) {
            out << "Removed " << outcome.removed << " bookmarks\n";
        } else {
            out << "Bookmarked " << outcome.added.size() << " of " << outcome.devices.size()
                << " devices in \"" << config.folder_name << "\"\n";
        }
    }

    return ledmark::app::exit_code_for(outcome);
}
