#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "adapters/registry/type_registry.h"
#include "cli/error_spec.h"
#include "config/config_store.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"

namespace {

enum ExitCode { ExitRetry = 0, ExitNoRetry = 1, ExitConfigError = 2 };

int fail(const ConfigFailure& failure) {
    QTextStream(stderr) << "error: " << failure.toString() << Qt::endl;
    return ExitConfigError;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("retry-classifier"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Decides whether an error chain should be retried according to a rule set."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("JSON config declaring error types, rules and logging."),
        QStringLiteral("file"));
    QCommandLineOption rulesOption({QStringLiteral("r"), QStringLiteral("rules")},
        QStringLiteral("Properties file of rules; replaces rules_file from the config."),
        QStringLiteral("file"));
    QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Print the winning rule and log at debug level to stderr."));
    parser.addOption(configOption);
    parser.addOption(rulesOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("errors"),
        QStringLiteral("Error chain, outermost first, each as Type[#code][:message]."),
        QStringLiteral("error..."));
    parser.process(app);

    const bool verbose = parser.isSet(verboseOption);

    // --- 1. Config + Log ---
    ConfigStore configStore;
    ClassifierConfig config;
    if (parser.isSet(configOption)) {
        auto loaded = configStore.load(parser.value(configOption));
        if (!loaded)
            return fail(loaded.error());
        config = configStore.config();
    }
    if (parser.isSet(rulesOption))
        config.rulesFile = parser.value(rulesOption);
    if (verbose)
        config.logging.level = QStringLiteral("debug");

    auto logging = Bootstrap::applyLogging(config.logging);
    if (!logging)
        return fail(logging.error());
    if (verbose) {
        QObject::connect(&LogManager::instance(), &LogManager::logEntry, &app,
            [](int level, const QString&, const QString& category, const QString& message) {
                QTextStream(stderr) << LogManager::formatMessage(
                    static_cast<LogManager::Level>(level), category, message) << Qt::endl;
            });
    }

    // --- 2. Types + classifier ---
    TypeRegistry registry;
    Bootstrap bootstrap(registry);
    auto classifier = bootstrap.build(config);
    if (!classifier)
        return fail(classifier.error());

    // --- 3. Classify ---
    auto error = ErrorSpec::parseChain(parser.positionalArguments(), registry);
    if (!error)
        return fail(error.error());

    const Decision decision = (*classifier)->classify(*error);
    QTextStream out(stdout);
    out << (decision.shouldRetry() ? "RETRY" : "THROW");
    if (verbose) {
        if (decision.rule)
            out << " (" << decision.rule->toString() << " on " << decision.matchedType.name() << ")";
        else
            out << " (no matching rule)";
    }
    out << Qt::endl;

    return decision.shouldRetry() ? ExitRetry : ExitNoRetry;
}
