#include "common/recording_connection.h"
#include "common/test_base.h"

#include "logdb/DbAppender.hpp"
#include "logdb/Errors.hpp"
#include "logdb/Transaction.hpp"

#include <QRegularExpression>
#include <QSignalSpy>
#include <QTest>

using namespace logdb;

/**
 * Contract: DbAppender
 *
 * - Capabilities and dialect resolved once at construction
 * - One parent statement per append, closed on every exit path
 * - Per-event transaction committed on success, rolled back on failure
 * - append() contains failures; appendOrThrow() propagates them
 */
class TestDbAppender : public TestBase
{
    Q_OBJECT

private slots:
    void testCapabilitiesProbedAtConstruction();
    void testConfigOverridesCapabilities();
    void testDialectFromDriverName();
    void testConfiguredDialectWins();
    void testNoKeyStrategyIsConfigurationError();
    void testAppendCommitsPerEvent();
    void testAppendWithoutTransaction();
    void testFailureIsContained();
    void testAppendOrThrowPropagates();
    void testPrepareFailureIsContained();
    void testAppenderRecoversAfterFailure();
    void testScopedTransactionRollsBackUnlessCommitted();
};

void TestDbAppender::testCapabilitiesProbedAtConstruction()
{
    RecordingConnection connection;
    connection.capabilities.batchUpdates = true;
    connection.capabilities.generatedKeys = true;

    DbAppender appender(connection);
    connection.capabilities.batchUpdates = false;

    QVERIFY(appender.capabilities().batchUpdates);
    QVERIFY(appender.capabilities().generatedKeys);
}

void TestDbAppender::testConfigOverridesCapabilities()
{
    RecordingConnection connection;
    connection.driver = "QPSQL";
    connection.capabilities.generatedKeys = true;

    AppenderConfig config;
    config.generatedKeys = false;
    config.batchUpdates = true;
    DbAppender appender(connection, config);

    QVERIFY(!appender.capabilities().generatedKeys);
    QVERIFY(appender.capabilities().batchUpdates);
}

void TestDbAppender::testDialectFromDriverName()
{
    RecordingConnection connection;
    connection.driver = "QMYSQL";

    DbAppender appender(connection);

    QCOMPARE(appender.dialect().kind(), SqlDialectKind::MySQL);
}

void TestDbAppender::testConfiguredDialectWins()
{
    RecordingConnection connection;
    connection.driver = "QODBC";
    AppenderConfig config;
    config.dialect = "mssql";

    DbAppender appender(connection, config);

    QCOMPARE(appender.dialect().kind(), SqlDialectKind::MsSQL);
}

void TestDbAppender::testNoKeyStrategyIsConfigurationError()
{
    RecordingConnection connection;
    connection.driver = "QODBC";
    connection.capabilities.generatedKeys = false;

    QVERIFY_THROWS_EXCEPTION(ConfigurationError, DbAppender appender(connection));
}

void TestDbAppender::testAppendCommitsPerEvent()
{
    RecordingConnection connection;
    connection.capabilities.generatedKeys = true;
    connection.nextEventId = 5;
    DbAppender appender(connection);
    QSignalSpy appended(&appender, &DbAppender::eventAppended);

    LoggingEvent event = makeEvent();
    event.mdcProperties = PropertyMap{{"req", "42"}};
    QVERIFY(appender.append(event));

    QCOMPARE(connection.transactionsBegun, 1);
    QCOMPARE(connection.commits, 1);
    QCOMPARE(connection.rollbacks, 0);
    QCOMPARE(appender.appendedCount(), qint64(1));
    QCOMPARE(appended.count(), 1);
    QCOMPARE(appended.first().first().toLongLong(), qint64(5));
    for (const auto& statement : connection.statements) {
        QVERIFY(statement->closed);
    }
}

void TestDbAppender::testAppendWithoutTransaction()
{
    RecordingConnection connection;
    connection.capabilities.generatedKeys = true;
    AppenderConfig config;
    config.transactionMode = TransactionMode::None;
    DbAppender appender(connection, config);

    const AppendOutcome outcome = appender.appendOrThrow(makeEvent());

    QCOMPARE(outcome.stage, AppendStage::ExceptionsWritten);
    QCOMPARE(connection.transactionsBegun, 0);
    QCOMPARE(connection.commits, 0);
}

void TestDbAppender::testFailureIsContained()
{
    RecordingConnection connection;
    connection.capabilities.generatedKeys = true;
    connection.failExecuteOn = "logging_event_property";
    DbAppender appender(connection);
    QSignalSpy failed(&appender, &DbAppender::appendFailed);
    QSignalSpy appended(&appender, &DbAppender::eventAppended);

    LoggingEvent event = makeEvent();
    event.mdcProperties = PropertyMap{{"req", "42"}};

    QTest::ignoreMessage(QtCriticalMsg,
                         QRegularExpression("Problem appending event at stage key-resolved: .*"));
    QVERIFY(!appender.append(event));

    QCOMPARE(failed.count(), 1);
    QCOMPARE(appended.count(), 0);
    QCOMPARE(appender.failedCount(), qint64(1));
    QCOMPARE(appender.appendedCount(), qint64(0));
    QCOMPARE(connection.commits, 0);
    QCOMPARE(connection.rollbacks, 1);
    for (const auto& statement : connection.statements) {
        QVERIFY(statement->closed);
    }
}

void TestDbAppender::testAppendOrThrowPropagates()
{
    RecordingConnection connection;
    connection.capabilities.generatedKeys = true;
    connection.reportGeneratedKeys = false;
    connection.driver = "QODBC";
    DbAppender appender(connection);

    QVERIFY_THROWS_EXCEPTION(KeyResolutionError, appender.appendOrThrow(makeEvent()));
    QCOMPARE(connection.rollbacks, 1);
    QCOMPARE(appender.failedCount(), qint64(0));
}

void TestDbAppender::testPrepareFailureIsContained()
{
    RecordingConnection connection;
    connection.capabilities.generatedKeys = true;
    connection.failPrepareOn = "INSERT INTO logging_event (";
    DbAppender appender(connection);

    QTest::ignoreMessage(QtCriticalMsg, QRegularExpression("Problem appending event at stage idle: .*"));
    QVERIFY(!appender.append(makeEvent()));
    QVERIFY(connection.statements.isEmpty());
    QCOMPARE(connection.rollbacks, 1);
}

void TestDbAppender::testAppenderRecoversAfterFailure()
{
    RecordingConnection connection;
    connection.capabilities.generatedKeys = true;
    connection.failExecuteOn = "logging_event_exception";
    DbAppender appender(connection);

    LoggingEvent broken = makeEvent("broken", "ERROR");
    broken.throwableLines = QStringList{"boom"};
    QTest::ignoreMessage(QtCriticalMsg, QRegularExpression("Problem appending event .*"));
    QVERIFY(!appender.append(broken));

    connection.failExecuteOn.clear();
    QVERIFY(appender.append(broken));
    QCOMPARE(appender.appendedCount(), qint64(1));
    QCOMPARE(appender.failedCount(), qint64(1));
    QCOMPARE(connection.commits, 1);
}

void TestDbAppender::testScopedTransactionRollsBackUnlessCommitted()
{
    RecordingConnection connection;
    {
        ScopedTransaction transaction(connection);
    }
    QCOMPARE(connection.rollbacks, 1);

    {
        ScopedTransaction transaction(connection);
        transaction.commit();
    }
    QCOMPARE(connection.commits, 1);
    QCOMPARE(connection.rollbacks, 1);
    QCOMPARE(connection.transactionsBegun, 2);
}

QTEST_GUILESS_MAIN(TestDbAppender)
#include "test_db_appender.moc"
