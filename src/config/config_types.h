#pragma once
#include <QString>
#include <QMap>
#include <QList>

struct TypeDeclaration {
    QString name;
    QString parent;    // empty = root type
};

struct LoggingOptions {
    QString logDir;    // empty = no log file
    QString level = "info";
};

struct ClassifierConfig {
    QList<TypeDeclaration> types;
    QString rulesFile;              // absolute once loaded by ConfigStore
    QMap<QString, QString> rules;   // inline rules, override rulesFile entries
    LoggingOptions logging;

    bool hasRules() const {
        return !rulesFile.isEmpty() || !rules.isEmpty();
    }
};
