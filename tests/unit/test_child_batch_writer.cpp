#include "common/recording_connection.h"
#include "common/test_base.h"

#include "logdb/ChildBatchWriter.hpp"
#include "logdb/Errors.hpp"
#include "logdb/SqlConstants.hpp"

#include <QSet>
#include <QTest>

using namespace logdb;

class TestChildBatchWriter : public TestBase
{
    Q_OBJECT

private slots:
    void testEmptyPropertiesPrepareNothing();
    void testEmptyThrowablePreparesNothing();
    void testPropertiesExecutedIndividually();
    void testPropertiesBatched();
    void testThrowableLinesKeepOrder();
    void testThrowableLinesBatched();
    void testFailurePropagatesAndClosesStatement();
};

void TestChildBatchWriter::testEmptyPropertiesPrepareNothing()
{
    RecordingConnection connection;
    const ChildBatchWriter writer(connection, true);

    QCOMPARE(insertProperties(writer, 1, PropertyMap()), 0);
    QVERIFY(connection.statements.isEmpty());
}

void TestChildBatchWriter::testEmptyThrowablePreparesNothing()
{
    RecordingConnection connection;
    const ChildBatchWriter writer(connection, false);

    QCOMPARE(insertThrowable(writer, 1, QStringList()), 0);
    QVERIFY(connection.statements.isEmpty());
}

void TestChildBatchWriter::testPropertiesExecutedIndividually()
{
    RecordingConnection connection;
    const ChildBatchWriter writer(connection, false);
    const PropertyMap properties{{"env", "staging"}, {"req", "42"}, {"user", "alice"}};

    QCOMPARE(insertProperties(writer, 9, properties), 3);

    const auto recorded = connection.statementsFor("logging_event_property");
    QCOMPARE(recorded.size(), 1);
    QCOMPARE(recorded.first()->sql, QString(sql::INSERT_PROPERTY));
    QCOMPARE(recorded.first()->executeCalls, 3);
    QCOMPARE(recorded.first()->executeBatchCalls, 0);
    QVERIFY(recorded.first()->closed);

    PropertyMap written;
    for (const QVariantList& row : recorded.first()->executedRows) {
        QCOMPARE(row[sql::CHILD_EVENT_ID].toLongLong(), qint64(9));
        written.insert(row[sql::CHILD_KEY].toString(), row[sql::CHILD_VALUE].toString());
    }
    QCOMPARE(written, properties);
}

void TestChildBatchWriter::testPropertiesBatched()
{
    RecordingConnection connection;
    const ChildBatchWriter writer(connection, true);
    PropertyMap properties;
    for (int i = 0; i < 5; ++i) {
        properties.insert(QString("key%1").arg(i), QString("value%1").arg(i));
    }

    QCOMPARE(insertProperties(writer, 3, properties), 5);

    const auto recorded = connection.statementsFor("logging_event_property");
    QCOMPARE(recorded.size(), 1);
    QCOMPARE(recorded.first()->executeBatchCalls, 1);
    QCOMPARE(recorded.first()->executeCalls, 0);
    QCOMPARE(recorded.first()->addBatchCalls, 5);
    QCOMPARE(recorded.first()->batchedRows.size(), 5);

    QSet<QString> keys;
    for (const QVariantList& row : recorded.first()->batchedRows) {
        keys.insert(row[sql::CHILD_KEY].toString());
    }
    QCOMPARE(keys.size(), 5);
}

void TestChildBatchWriter::testThrowableLinesKeepOrder()
{
    RecordingConnection connection;
    const ChildBatchWriter writer(connection, false);
    const QStringList lines{
        "java.lang.RuntimeException: boom",
        "\tat com.x.Y.run(Y.java:10)",
        "\tat java.lang.Thread.run(Thread.java:750)"
    };

    QCOMPARE(insertThrowable(writer, 4, lines), 3);

    const QList<QVariantList> rows = connection.rowsFor("logging_event_exception");
    QCOMPARE(rows.size(), 3);
    for (int i = 0; i < rows.size(); ++i) {
        QCOMPARE(rows[i][sql::CHILD_EVENT_ID].toLongLong(), qint64(4));
        QCOMPARE(rows[i][sql::CHILD_KEY].toInt(), i);
        QCOMPARE(rows[i][sql::CHILD_VALUE].toString(), lines[i]);
    }
}

void TestChildBatchWriter::testThrowableLinesBatched()
{
    RecordingConnection connection;
    const ChildBatchWriter writer(connection, true);

    QCOMPARE(insertThrowable(writer, 4, QStringList{"a", "b"}), 2);

    const auto recorded = connection.statementsFor("logging_event_exception");
    QCOMPARE(recorded.size(), 1);
    QCOMPARE(recorded.first()->executeBatchCalls, 1);
    QCOMPARE(recorded.first()->batchedRows[1][sql::CHILD_KEY].toInt(), 1);
    QCOMPARE(recorded.first()->batchedRows[1][sql::CHILD_VALUE].toString(), QString("b"));
}

void TestChildBatchWriter::testFailurePropagatesAndClosesStatement()
{
    RecordingConnection connection;
    connection.failExecuteOn = "logging_event_exception";
    const ChildBatchWriter writer(connection, false);

    QVERIFY_THROWS_EXCEPTION(WriteError, insertThrowable(writer, 1, QStringList{"a", "b", "c"}));

    const auto recorded = connection.statementsFor("logging_event_exception");
    QCOMPARE(recorded.size(), 1);
    // No retry after the first failing row
    QCOMPARE(recorded.first()->executeCalls, 1);
    QVERIFY(recorded.first()->closed);
}

QTEST_GUILESS_MAIN(TestChildBatchWriter)
#include "test_child_batch_writer.moc"
