#include <QTest>

#include "adapters/registry/type_registry.h"
#include "cli/error_spec.h"

class TestErrorSpec : public QObject {
    Q_OBJECT

private:
    TypeRegistry registry;
    ErrorType timeout;
    ErrorType wrapper;

private slots:
    void initTestCase() {
        timeout = registry.registerType(QStringLiteral("db::Timeout"),
                                        QStringLiteral("SqlError")).value();
        wrapper = registry.registerType(QStringLiteral("app.Wrapper")).value();
    }

    void testTypeOnly() {
        auto error = ErrorSpec::parse(QStringLiteral("app.Wrapper"), registry);
        QVERIFY(error.has_value());
        QVERIFY(error->type == wrapper);
        QVERIFY(!error->message);
        QVERIFY(!error->errorCode);
        QVERIFY(!error->cause);
    }

    void testWithCode() {
        auto error = ErrorSpec::parse(QStringLiteral("SqlError#40001"), registry);
        QVERIFY(error.has_value());
        QVERIFY(error->type == registry.errorCodeType());
        QCOMPARE(error->errorCode.value_or(QString()), QStringLiteral("40001"));
        QVERIFY(!error->message);
    }

    void testCodeIsTrimmed() {
        auto error = ErrorSpec::parse(QStringLiteral("SqlError# 40001 :deadlock"), registry);
        QVERIFY(error.has_value());
        QCOMPARE(error->errorCode.value_or(QString()), QStringLiteral("40001"));
        QCOMPARE(error->message.value_or(QString()), QStringLiteral("deadlock"));
    }

    void testWithCodeAndMessage() {
        auto error = ErrorSpec::parse(QStringLiteral("SqlError#40001:could not serialize: retry"),
                                      registry);
        QVERIFY(error.has_value());
        QCOMPARE(error->errorCode.value_or(QString()), QStringLiteral("40001"));
        QCOMPARE(error->message.value_or(QString()),
                 QStringLiteral("could not serialize: retry"));
    }

    void testHashInMessageIsKept() {
        auto error = ErrorSpec::parse(QStringLiteral("app.Wrapper:job #12 failed"), registry);
        QVERIFY(error.has_value());
        QVERIFY(!error->errorCode);
        QCOMPARE(error->message.value_or(QString()), QStringLiteral("job #12 failed"));
    }

    void testEmptyMessage() {
        auto error = ErrorSpec::parse(QStringLiteral("app.Wrapper:"), registry);
        QVERIFY(error.has_value());
        QVERIFY(error->message.has_value());
        QVERIFY(error->message->isEmpty());
    }

    void testScopedTypeName() {
        auto error = ErrorSpec::parse(QStringLiteral("db::Timeout:lost connection"), registry);
        QVERIFY(error.has_value());
        QVERIFY(error->type == timeout);
        QCOMPARE(error->message.value_or(QString()), QStringLiteral("lost connection"));
    }

    void testUnknownType() {
        auto error = ErrorSpec::parse(QStringLiteral("no.Such#1:msg"), registry);
        QVERIFY(!error.has_value());
        QCOMPARE(error.error().kind, FailureKind::UnknownType);
        QCOMPARE(error.error().value, QStringLiteral("no.Such"));
    }

    void testNoType() {
        auto error = ErrorSpec::parse(QStringLiteral("#40001:msg"), registry);
        QVERIFY(!error.has_value());
        QCOMPARE(error.error().kind, FailureKind::InvalidConfig);
    }

    void testChainOrder() {
        auto chain = ErrorSpec::parseChain({QStringLiteral("app.Wrapper:outer"),
                                            QStringLiteral("app.Wrapper:middle"),
                                            QStringLiteral("db::Timeout#57014:inner")},
                                           registry);
        QVERIFY(chain.has_value());

        const QList<const RaisedError*> errors = chain->chain();
        QCOMPARE(errors.size(), 3);
        QCOMPARE(errors[0]->message.value_or(QString()), QStringLiteral("outer"));
        QCOMPARE(errors[1]->message.value_or(QString()), QStringLiteral("middle"));
        QVERIFY(errors[2]->type == timeout);
        QCOMPARE(errors[2]->errorCode.value_or(QString()), QStringLiteral("57014"));
    }

    void testChainStopsAtBadSpec() {
        auto chain = ErrorSpec::parseChain({QStringLiteral("app.Wrapper"),
                                            QStringLiteral("no.Such")},
                                           registry);
        QVERIFY(!chain.has_value());
        QCOMPARE(chain.error().kind, FailureKind::UnknownType);
    }

    void testEmptyChain() {
        auto chain = ErrorSpec::parseChain({}, registry);
        QVERIFY(!chain.has_value());
        QCOMPARE(chain.error().kind, FailureKind::InvalidConfig);
    }
};

QTEST_MAIN(TestErrorSpec)
#include "tst_error_spec.moc"
