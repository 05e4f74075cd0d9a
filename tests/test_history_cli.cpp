#include <QtTest/QtTest>

#include <QDir>
#include <QTemporaryDir>

#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "report/HistoryCli.hpp"
#include "test_support.hpp"

using namespace jobhist;

class HistoryCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testCsvAcrossTwoFiles();
    void testHeaderAndUserFilter();
    void testRecordTypeFromFilter();
    void testReverseJson();
    void testJobIdArguments();
    void testAverageRow();
    void testMissingDayWarning();
    void testSetupErrorsWriteNothing_data();
    void testSetupErrorsWriteNothing();
    void testHelp();
    void testRecordTypeList();

private:
    int runCli(const QStringList &args, std::string &out, std::string &err) const;

    QTemporaryDir m_tempDir;
    QString m_root;
    const QDate m_today{2025, 3, 10};
};

void HistoryCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("JOBHIST_LOG_DIR", m_tempDir.filePath(QStringLiteral("logs")).toUtf8());
    qunsetenv("JOBHIST_CONFIG");
    qunsetenv("JOBHIST_LOG_ROOT");

    m_root = m_tempDir.filePath(QStringLiteral("accounting"));
    QVERIFY(QDir().mkpath(m_root));

    const QString day1 = QStringLiteral("03/01/2025 ");
    QVERIFY(testing::writeTextFile(
        m_root + QStringLiteral("/20250301"),
        testing::queueLine(day1 + QStringLiteral("01:00:00"), QStringLiteral("101.server"))
            + testing::endLine(day1 + QStringLiteral("02:00:00"), QStringLiteral("101.server"),
                               QStringLiteral("vanderwb"), 36)
            + QByteArray("03/01/2025 99:99:99;E;broken.server;user=nobody\n")
            + testing::queueLine(day1 + QStringLiteral("03:00:00"), QStringLiteral("102.server"))
            + testing::endLine(day1 + QStringLiteral("04:00:00"), QStringLiteral("102.server"),
                               QStringLiteral("smith"), 4)));

    const QString day2 = QStringLiteral("03/02/2025 ");
    QVERIFY(testing::writeTextFile(
        m_root + QStringLiteral("/20250302"),
        testing::queueLine(day2 + QStringLiteral("05:00:00"), QStringLiteral("103.server"))
            + testing::endLine(day2 + QStringLiteral("06:00:00"), QStringLiteral("103.server"),
                               QStringLiteral("vanderwb"), 2)));
}

int HistoryCliTests::runCli(const QStringList &args, std::string &out, std::string &err) const
{
    std::stringstream outBuffer;
    std::stringstream errBuffer;
    auto *oldOut = std::cout.rdbuf(outBuffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(errBuffer.rdbuf());

    HistoryCli cli(m_today);
    const int code = cli.run(QStringList{QStringLiteral("jobhist")} + args);

    std::cout.rdbuf(oldOut);
    std::cerr.rdbuf(oldErr);
    out = outBuffer.str();
    err = errBuffer.str();
    return code;
}

void HistoryCliTests::testCsvAcrossTwoFiles()
{
    std::string out;
    std::string err;
    const int code = runCli({QStringLiteral("--root"), m_root,
                             QStringLiteral("--period"), QStringLiteral("20250301-20250302"),
                             QStringLiteral("--types"), QStringLiteral("all"),
                             QStringLiteral("--filter"), QStringLiteral("record_type==E"),
                             QStringLiteral("--csv"), QStringLiteral("--no-header"),
                             QStringLiteral("--list"), QStringLiteral("id,user,numcpus")},
                            out, err);
    QCOMPARE(code, 0);

    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("101.server,vanderwb,36\n"
                            "102.server,smith,4\n"
                            "103.server,vanderwb,2\n"));

    const QStringList warnings = QString::fromStdString(err).split(QLatin1Char('\n'),
                                                                   Qt::SkipEmptyParts);
    QCOMPARE(warnings.size(), qsizetype(1));
    QVERIFY(warnings.front().startsWith(QStringLiteral("jobhist: warning: ")));
    QVERIFY(warnings.front().contains(QStringLiteral("20250301:3")));
}

void HistoryCliTests::testHeaderAndUserFilter()
{
    std::string out;
    std::string err;
    const int code = runCli({QStringLiteral("--root"), m_root,
                             QStringLiteral("--period"), QStringLiteral("2025-03-01-2025-03-02"),
                             QStringLiteral("--user"), QStringLiteral("vanderwb"),
                             QStringLiteral("--format"), QStringLiteral("csv"),
                             QStringLiteral("--list"), QStringLiteral("short_id,numcpus")},
                            out, err);
    QCOMPARE(code, 0);
    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("short_id,numcpus\n101,36\n103,2\n"));
}

void HistoryCliTests::testRecordTypeFromFilter()
{
    const QStringList common{QStringLiteral("--root"), m_root,
                             QStringLiteral("--period"), QStringLiteral("20250301-20250302"),
                             QStringLiteral("--csv"), QStringLiteral("--no-header"),
                             QStringLiteral("--list"), QStringLiteral("id,type")};
    std::string out;
    std::string err;

    // Without --types, a record_type clause picks the records to read.
    QCOMPARE(runCli(common + QStringList{QStringLiteral("--filter"),
                                         QStringLiteral("record_type==Q")},
                    out, err),
             0);
    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("101.server,queued\n"
                            "102.server,queued\n"
                            "103.server,queued\n"));

    // Neither: end records only.
    QCOMPARE(runCli(common, out, err), 0);
    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("101.server,ended\n"
                            "102.server,ended\n"
                            "103.server,ended\n"));

    // Overlapping explicit types narrow to the filter's.
    QCOMPARE(runCli(common + QStringList{QStringLiteral("--types"), QStringLiteral("Q,E"),
                                         QStringLiteral("--filter"),
                                         QStringLiteral("record_type==Q;id==102.server")},
                    out, err),
             0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("102.server,queued\n"));
}

void HistoryCliTests::testReverseJson()
{
    std::string out;
    std::string err;
    const int code = runCli({QStringLiteral("--root"), m_root,
                             QStringLiteral("--anchor"), QStringLiteral("20250302"),
                             QStringLiteral("--days"), QStringLiteral("1"),
                             QStringLiteral("--reverse"), QStringLiteral("--json"),
                             QStringLiteral("--block-size"), QStringLiteral("17"),
                             QStringLiteral("--list"), QStringLiteral("id")},
                            out, err);
    QCOMPARE(code, 0);

    const auto doc = nlohmann::json::parse(out);
    QCOMPARE(doc["count"].get<int>(), 3);
    QCOMPARE(QString::fromStdString(doc["records"][0]["id"].get<std::string>()),
             QStringLiteral("103.server"));
    QCOMPARE(QString::fromStdString(doc["records"][2]["id"].get<std::string>()),
             QStringLiteral("101.server"));
}

void HistoryCliTests::testJobIdArguments()
{
    std::string out;
    std::string err;
    const int code = runCli({QStringLiteral("--root"), m_root,
                             QStringLiteral("--period"), QStringLiteral("20250301-20250302"),
                             QStringLiteral("--csv"), QStringLiteral("--no-header"),
                             QStringLiteral("--list"), QStringLiteral("id"),
                             QStringLiteral("102"), QStringLiteral("103.server")},
                            out, err);
    QCOMPARE(code, 0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("102.server\n103.server\n"));
}

void HistoryCliTests::testAverageRow()
{
    std::string out;
    std::string err;
    const int code = runCli({QStringLiteral("--root"), m_root,
                             QStringLiteral("--period"), QStringLiteral("20250301-20250302"),
                             QStringLiteral("--filter"), QStringLiteral("numcpus>=4"),
                             QStringLiteral("--csv"), QStringLiteral("--average"),
                             QStringLiteral("--list"), QStringLiteral("id,numcpus")},
                            out, err);
    QCOMPARE(code, 0);
    QCOMPARE(QString::fromStdString(out),
             QStringLiteral("id,numcpus\n101.server,36\n102.server,4\nAverage,20.00\n"));
}

void HistoryCliTests::testMissingDayWarning()
{
    std::string out;
    std::string err;
    const int code = runCli({QStringLiteral("--root"), m_root,
                             QStringLiteral("--anchor"), QStringLiteral("2025-03-03"),
                             QStringLiteral("--days"), QStringLiteral("1"),
                             QStringLiteral("--csv"), QStringLiteral("--no-header"),
                             QStringLiteral("--list"), QStringLiteral("id")},
                            out, err);
    QCOMPARE(code, 0);
    QCOMPARE(QString::fromStdString(out), QStringLiteral("103.server\n"));
    QVERIFY(QString::fromStdString(err).contains(QStringLiteral("20250303")));
    QVERIFY(!QString::fromStdString(out).contains(QStringLiteral("warning")));
}

void HistoryCliTests::testSetupErrorsWriteNothing_data()
{
    QTest::addColumn<QStringList>("args");
    QTest::addColumn<QString>("message");

    QTest::newRow("unknown field") << QStringList{QStringLiteral("--filter"),
                                                  QStringLiteral("bogus==1")}
                                   << QStringLiteral("unknown field 'bogus'");
    QTest::newRow("bad literal") << QStringList{QStringLiteral("--filter"),
                                                QStringLiteral("numcpus>many")}
                                 << QStringLiteral("numcpus");
    QTest::newRow("future window") << QStringList{QStringLiteral("--anchor"),
                                                  QStringLiteral("20250311")}
                                   << QStringLiteral("future");
    QTest::newRow("reversed period") << QStringList{QStringLiteral("--period"),
                                                    QStringLiteral("20250302-20250301")}
                                     << QStringLiteral("after");
    QTest::newRow("bad specifier") << QStringList{QStringLiteral("--list"),
                                                  QStringLiteral("user:t")}
                                   << QStringLiteral("user");
    QTest::newRow("bad format") << QStringList{QStringLiteral("--format"),
                                               QStringLiteral("xml")}
                                << QStringLiteral("invalid format");
    QTest::newRow("bad types") << QStringList{QStringLiteral("--types"), QStringLiteral("EZ")}
                               << QStringLiteral("record type");
    QTest::newRow("types disjoint from filter")
        << QStringList{QStringLiteral("--types"), QStringLiteral("E"),
                       QStringLiteral("--filter"), QStringLiteral("record_type==Q")}
        << QStringLiteral("share nothing");
    QTest::newRow("unknown option") << QStringList{QStringLiteral("--frobnicate")}
                                    << QStringLiteral("frobnicate");
    QTest::newRow("bad block size") << QStringList{QStringLiteral("--block-size"),
                                                   QStringLiteral("0")}
                                    << QStringLiteral("block size");
}

void HistoryCliTests::testSetupErrorsWriteNothing()
{
    QFETCH(QStringList, args);
    QFETCH(QString, message);

    std::string out;
    std::string err;
    const int code = runCli(QStringList{QStringLiteral("--root"), m_root} + args, out, err);
    QCOMPARE(code, 1);
    QVERIFY(out.empty());
    QVERIFY2(QString::fromStdString(err).contains(message), err.c_str());
}

void HistoryCliTests::testHelp()
{
    std::string out;
    std::string err;
    QCOMPARE(runCli({QStringLiteral("--help")}, out, err), 0);
    QVERIFY(QString::fromStdString(out).contains(QStringLiteral("jobhist [options]")));
}

void HistoryCliTests::testRecordTypeList()
{
    QVERIFY(parseRecordTypeList(QStringLiteral("all")).empty());
    const auto types = parseRecordTypeList(QStringLiteral("e, s"));
    QCOMPARE(types.size(), static_cast<size_t>(2));
    QVERIFY(types.contains(RecordType::Ended));
    QVERIFY(types.contains(RecordType::Started));

    QCOMPARE(QString::fromStdString(
                 appendEqualityClause("numcpus>1", "user", QStringLiteral("o\"brien"))),
             QStringLiteral("numcpus>1;user==\"o\\\"brien\""));
}

QTEST_MAIN(HistoryCliTests)
#include "test_history_cli.moc"
