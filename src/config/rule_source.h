#pragma once
#include "classify/ports.h"
#include <QMap>
#include <QString>

// Reads rule sets written in Java properties syntax:
//
//   # comment
//   java.sql.SQLTransientException = RETRY
//   sqlState.40001 = RETRY
//   sqlState.23505;duplicate\ key = THROW
//
// Keys end at the first unescaped '=', ':' or whitespace; a trailing backslash
// continues the logical line. Files are decoded as UTF-8.
namespace RuleSource {
    Result<QMap<QString, QString>> parse(const QString& text, const QString& origin = {});
    Result<QMap<QString, QString>> loadFile(const QString& path);

    // Looks the name up in the Qt resource system (":/<name>").
    Result<QMap<QString, QString>> loadResource(const QString& name);
}
