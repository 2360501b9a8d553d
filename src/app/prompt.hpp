#pragma once

#include "storage/profile_locator.hpp"

#include <QString>
#include <QStringList>

#include <optional>

namespace ledmark::app {

/**
 * Map a typed answer onto one of `options`: a 1-based index or the exact
 * text of an option. Anything else, including an empty answer, is nullopt.
 */
[[nodiscard]] std::optional<QString> parse_choice(const QString& answer, const QStringList& options);

/**
 * A selector that asks the user on the terminal. Uses fzf when it is on the
 * PATH, a numbered list read from stdin otherwise.
 */
[[nodiscard]] storage::ProfileSelector make_terminal_selector();

} // namespace ledmark::app
