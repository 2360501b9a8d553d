#include "app/prompt.hpp"

#include <QLoggingCategory>
#include <QProcess>
#include <QStandardPaths>
#include <QTextStream>

namespace ledmark::app {
namespace {

Q_LOGGING_CATEGORY(lmPromptLog, "ledmark.session")

std::optional<QString> choose_with_fzf(const QString& fzf, const QStringList& options) {
    QProcess process;
    // fzf draws on the terminal through stderr/tty; only the choice comes back on stdout.
    process.setProcessChannelMode(QProcess::ForwardedErrorChannel);
    process.start(fzf, QStringList{});
    if (!process.waitForStarted()) {
        qCWarning(lmPromptLog) << "Failed to start fzf:" << process.errorString();
        return std::nullopt;
    }

    process.write(options.join(QLatin1Char('\n')).toUtf8());
    process.closeWriteChannel();
    if (!process.waitForFinished(-1)) {
        qCWarning(lmPromptLog) << "fzf did not finish:" << process.errorString();
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return std::nullopt;
    }
    return parse_choice(QString::fromUtf8(process.readAllStandardOutput()), options);
}

std::optional<QString> choose_with_stdin(const QStringList& options) {
    QTextStream out(stderr);
    out << "Several places.sqlite files were found:\n";
    for (int i = 0; i < options.size(); ++i) {
        out << "  " << (i + 1) << ") " << options.at(i) << '\n';
    }
    out << "Select one [1-" << options.size() << "]: ";
    out.flush();

    QTextStream in(stdin);
    const auto answer = in.readLine();
    if (answer.isNull()) {
        return std::nullopt;
    }
    return parse_choice(answer, options);
}

} // namespace

std::optional<QString> parse_choice(const QString& answer, const QStringList& options) {
    const auto trimmed = answer.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    if (options.contains(trimmed)) {
        return trimmed;
    }

    bool ok = false;
    const auto index = trimmed.toInt(&ok);
    if (ok && index >= 1 && index <= options.size()) {
        return options.at(index - 1);
    }
    return std::nullopt;
}

storage::ProfileSelector make_terminal_selector() {
    return [](const QStringList& options) -> std::optional<QString> {
        const auto fzf = QStandardPaths::findExecutable(QStringLiteral("fzf"));
        auto chosen = fzf.isEmpty() ? choose_with_stdin(options) : choose_with_fzf(fzf, options);
        if (!chosen) {
            qCWarning(lmPromptLog) << "No profile selected";
        }
        return chosen;
    };
}

} // namespace ledmark::app
