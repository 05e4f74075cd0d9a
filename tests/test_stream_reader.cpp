#include <QtTest/QtTest>

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTime>

#include <algorithm>

#include "query/stream_reader.hpp"
#include "test_support.hpp"

using namespace jobhist;

namespace {

struct Sample {
    QByteArray content;
    qint64 malformedLineNumber = 0;
    qint64 malformedOffset = 0;
    int longestLine = 0;
};

Sample buildSample()
{
    const QByteArray first = testing::endLine(QStringLiteral("03/01/2025 01:00:00"),
                                              QStringLiteral("1.server"), QStringLiteral("alice"), 4);
    const QByteArray second = testing::endLine(QStringLiteral("03/01/2025 02:00:00"),
                                               QStringLiteral("2.server"), QStringLiteral("bob"), 8,
                                               QStringLiteral("jobname=\"long name with spaces\""));
    const QByteArray malformed = "this is not an accounting record\n";
    const QByteArray crlf = "03/01/2025 03:00:00;Q;3.server;queue=main\r\n";
    QByteArray last = testing::endLine(QStringLiteral("03/01/2025 04:00:00"),
                                       QStringLiteral("4.server"), QStringLiteral("carol"), 16);
    last.chop(1);

    Sample sample;
    sample.content = first + "\n" + second + malformed + crlf + "   \n" + last;
    sample.malformedLineNumber = 4;
    sample.malformedOffset = first.size() + 1 + second.size();
    for (const QByteArray &line : {first, second, malformed, crlf, last}) {
        sample.longestLine = std::max(sample.longestLine, static_cast<int>(line.size()));
    }
    return sample;
}

QStringList readIds(const LogFileRef &file, Direction direction, ReaderOptions options)
{
    QStringList ids;
    LogStreamReader reader(file, direction, std::move(options));
    while (auto record = reader.next()) {
        ids.push_back(QString::fromStdString(record->jobId()));
    }
    return ids;
}

} // namespace

class StreamReaderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testForwardOrder();
    void testReverseMatchesForward_data();
    void testReverseMatchesForward();
    void testMalformedLineReported();
    void testLongLineAcrossManyBlocks();
    void testMissingFile();
    void testEmptyFile();
    void testRecordTypePushDown();
    void testFileClosedWhenExhausted();
    void testBufferIsBoundedByBlockSize();
    void testLargeFileBufferBound_data();
    void testLargeFileBufferBound();
    void testAbandonedReaderReleasesFile();

private:
    QTemporaryDir m_tempDir;
    Sample m_sample;
    LogFileRef m_file;
    LogFileRef m_largeFile;
    int m_largeRecords = 0;
    int m_largeLongestLine = 0;
};

void StreamReaderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("JOBHIST_LOG_DIR", m_tempDir.filePath(QStringLiteral("logs")).toUtf8());
    m_sample = buildSample();
    m_file = LogFileRef{m_tempDir.filePath(QStringLiteral("20250301")), QDate(2025, 3, 1)};
    QVERIFY(testing::writeTextFile(m_file.path, m_sample.content));

    // Several MB of end records, with a long job name every thousandth line.
    QByteArray large;
    m_largeRecords = 12000;
    for (int i = 0; i < m_largeRecords; ++i) {
        const QString time = QStringLiteral("03/02/2025 ")
            + QTime(0, 0).addSecs(i % 86400).toString(QStringLiteral("HH:mm:ss"));
        const QString extra = i % 1000 == 0
            ? QStringLiteral("jobname=%1").arg(QString(2000, QLatin1Char('x')))
            : QString();
        const QByteArray line = testing::endLine(time, QStringLiteral("%1.server").arg(i),
                                                 QStringLiteral("alice"), 1 + i % 64, extra);
        m_largeLongestLine = std::max(m_largeLongestLine, static_cast<int>(line.size()));
        large += line;
    }
    QVERIFY(large.size() > 4 * 1000 * 1000);
    m_largeFile = LogFileRef{m_tempDir.filePath(QStringLiteral("20250302")), QDate(2025, 3, 2)};
    QVERIFY(testing::writeTextFile(m_largeFile.path, large));
}

void StreamReaderTests::testForwardOrder()
{
    testing::CollectingSink sink;
    ReaderOptions options;
    options.diagnostics = &sink;

    const QStringList ids = readIds(m_file, Direction::Forward, options);
    QCOMPARE(ids, QStringList({QStringLiteral("1.server"), QStringLiteral("2.server"),
                               QStringLiteral("3.server"), QStringLiteral("4.server")}));
}

void StreamReaderTests::testReverseMatchesForward_data()
{
    QTest::addColumn<int>("blockSize");

    for (int size : {1, 2, 3, 5, 7, 13, 64, 100, 333, 4096, 1 << 20}) {
        QTest::newRow(qPrintable(QStringLiteral("block %1").arg(size))) << size;
    }
}

void StreamReaderTests::testReverseMatchesForward()
{
    QFETCH(int, blockSize);

    ReaderOptions options;
    options.blockSize = static_cast<std::size_t>(blockSize);

    QStringList forward = readIds(m_file, Direction::Forward, options);
    const QStringList reverse = readIds(m_file, Direction::Reverse, options);
    std::reverse(forward.begin(), forward.end());
    QCOMPARE(reverse, forward);
}

void StreamReaderTests::testMalformedLineReported()
{
    testing::CollectingSink forwardSink;
    ReaderOptions forwardOptions;
    forwardOptions.diagnostics = &forwardSink;
    QCOMPARE(readIds(m_file, Direction::Forward, forwardOptions).size(), qsizetype(4));

    QCOMPARE(forwardSink.diagnostics.size(), static_cast<size_t>(1));
    const Diagnostic &forward = forwardSink.diagnostics.front();
    QCOMPARE(forward.kind, DiagnosticKind::MalformedRecord);
    QCOMPARE(QString::fromStdString(forward.path), m_file.path);
    QCOMPARE(static_cast<qint64>(forward.location), m_sample.malformedLineNumber);

    testing::CollectingSink reverseSink;
    ReaderOptions reverseOptions;
    reverseOptions.blockSize = 7;
    reverseOptions.diagnostics = &reverseSink;
    QCOMPARE(readIds(m_file, Direction::Reverse, reverseOptions).size(), qsizetype(4));

    QCOMPARE(reverseSink.diagnostics.size(), static_cast<size_t>(1));
    QCOMPARE(reverseSink.diagnostics.front().kind, DiagnosticKind::MalformedRecord);
    QCOMPARE(static_cast<qint64>(reverseSink.diagnostics.front().location),
             m_sample.malformedOffset);
}

void StreamReaderTests::testLongLineAcrossManyBlocks()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString longName(5000, QLatin1Char('x'));
    const QByteArray content =
        testing::queueLine(QStringLiteral("03/02/2025 00:00:01"), QStringLiteral("10.server"))
        + testing::endLine(QStringLiteral("03/02/2025 00:00:02"), QStringLiteral("11.server"),
                           QStringLiteral("dave"), 2, QStringLiteral("jobname=") + longName)
        + testing::queueLine(QStringLiteral("03/02/2025 00:00:03"), QStringLiteral("12.server"));
    const LogFileRef file{tempDir.filePath(QStringLiteral("20250302")), QDate(2025, 3, 2)};
    QVERIFY(testing::writeTextFile(file.path, content));

    ReaderOptions options;
    options.blockSize = 16;
    LogStreamReader reader(file, Direction::Reverse, options);

    auto newest = reader.next();
    QVERIFY(newest.has_value());
    QCOMPARE(QString::fromStdString(newest->jobId()), QStringLiteral("12.server"));

    auto middle = reader.next();
    QVERIFY(middle.has_value());
    QCOMPARE(QString::fromStdString(middle->jobId()), QStringLiteral("11.server"));
    QVERIFY(*middle->field("jobname") == FieldValue{longName.toStdString()});

    auto oldest = reader.next();
    QVERIFY(oldest.has_value());
    QCOMPARE(QString::fromStdString(oldest->jobId()), QStringLiteral("10.server"));
    QVERIFY(!reader.next().has_value());
}

void StreamReaderTests::testMissingFile()
{
    testing::CollectingSink sink;
    ReaderOptions options;
    options.diagnostics = &sink;

    const LogFileRef missing{m_tempDir.filePath(QStringLiteral("20250228")), QDate(2025, 2, 28)};
    LogStreamReader reader(missing, Direction::Reverse, options);
    QVERIFY(!reader.next().has_value());
    QVERIFY(!reader.next().has_value());

    QCOMPARE(sink.diagnostics.size(), static_cast<size_t>(1));
    QCOMPARE(sink.diagnostics.front().kind, DiagnosticKind::MissingFile);
    QCOMPARE(QString::fromStdString(sink.diagnostics.front().path), missing.path);
    QCOMPARE(QString::fromStdString(sink.diagnostics.front().date), QStringLiteral("2025-02-28"));
}

void StreamReaderTests::testEmptyFile()
{
    const LogFileRef empty{m_tempDir.filePath(QStringLiteral("20250227")), QDate(2025, 2, 27)};
    QVERIFY(testing::writeTextFile(empty.path, QByteArray()));

    testing::CollectingSink sink;
    ReaderOptions options;
    options.diagnostics = &sink;
    QVERIFY(readIds(empty, Direction::Forward, options).isEmpty());
    QVERIFY(readIds(empty, Direction::Reverse, options).isEmpty());
    QVERIFY(sink.diagnostics.empty());
}

void StreamReaderTests::testRecordTypePushDown()
{
    testing::CollectingSink sink;
    ReaderOptions options;
    options.recordTypes = {RecordType::Ended};
    options.diagnostics = &sink;

    QCOMPARE(readIds(m_file, Direction::Forward, options),
             QStringList({QStringLiteral("1.server"), QStringLiteral("2.server"),
                          QStringLiteral("4.server")}));
    // The line without a header still reaches the decoder and is reported.
    QCOMPARE(sink.countOf(DiagnosticKind::MalformedRecord), static_cast<size_t>(1));
}

void StreamReaderTests::testFileClosedWhenExhausted()
{
    LogStreamReader reader(m_file, Direction::Forward);
    QVERIFY(!reader.isOpen());
    QVERIFY(reader.next().has_value());
    QVERIFY(reader.isOpen());
    while (reader.next().has_value()) {
    }
    QVERIFY(!reader.isOpen());
    QCOMPARE(reader.recordsProduced(), static_cast<size_t>(4));
}

void StreamReaderTests::testBufferIsBoundedByBlockSize()
{
    for (std::size_t blockSize : {std::size_t{8}, std::size_t{256}, std::size_t{1024}}) {
        ReaderOptions options;
        options.blockSize = blockSize;
        LogStreamReader reader(m_file, Direction::Reverse, options);
        while (reader.next().has_value()) {
        }
        QVERIFY(reader.peakBufferedBytes() > 0);
        QVERIFY(reader.peakBufferedBytes()
                <= blockSize + static_cast<std::size_t>(m_sample.longestLine));
    }
}

void StreamReaderTests::testLargeFileBufferBound_data()
{
    QTest::addColumn<bool>("reverse");
    QTest::addColumn<int>("blockSize");

    QTest::newRow("forward") << false << 4096;
    QTest::newRow("reverse 4 KiB") << true << 4096;
    QTest::newRow("reverse default") << true << static_cast<int>(kDefaultBlockSize);
}

void StreamReaderTests::testLargeFileBufferBound()
{
    QFETCH(bool, reverse);
    QFETCH(int, blockSize);

    ReaderOptions options;
    options.blockSize = static_cast<std::size_t>(blockSize);
    LogStreamReader reader(m_largeFile, reverse ? Direction::Reverse : Direction::Forward,
                           options);
    int count = 0;
    while (reader.next().has_value()) {
        ++count;
    }
    QCOMPARE(count, m_largeRecords);

    const std::size_t bound = static_cast<std::size_t>(blockSize + m_largeLongestLine);
    QVERIFY2(reader.peakBufferedBytes() <= bound,
             qPrintable(QStringLiteral("peak %1 > bound %2")
                            .arg(reader.peakBufferedBytes())
                            .arg(bound)));
}

void StreamReaderTests::testAbandonedReaderReleasesFile()
{
    const QDir fdDir(QStringLiteral("/proc/self/fd"));
    if (!fdDir.exists()) {
        QSKIP("no /proc/self/fd on this platform");
    }
    const QString target = QFileInfo(m_largeFile.path).canonicalFilePath();
    const auto descriptorsOnFile = [&fdDir, &target] {
        int count = 0;
        for (const QFileInfo &entry : fdDir.entryInfoList(QDir::AllEntries | QDir::System
                                                          | QDir::NoDotAndDotDot)) {
            if (entry.symLinkTarget() == target) {
                ++count;
            }
        }
        return count;
    };
    QCOMPARE(descriptorsOnFile(), 0);

    for (Direction direction : {Direction::Forward, Direction::Reverse}) {
        {
            LogStreamReader reader(m_largeFile, direction);
            for (int i = 0; i < 10; ++i) {
                QVERIFY(reader.next().has_value());
            }
            QVERIFY(reader.isOpen());
            QCOMPARE(descriptorsOnFile(), 1);
        }
        QCOMPARE(descriptorsOnFile(), 0);
    }
}

QTEST_MAIN(StreamReaderTests)
#include "test_stream_reader.moc"
