#include <QtTest/QtTest>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include "../../../src/core/transcription/DiagnosticDump.hpp"
#include "../../../src/core/transcription/TranscriptNormalizer.hpp"
#include "../../utils/TestUtils.hpp"

using namespace Scribe;
using namespace Scribe::Test;

class TestTranscriptNormalizer : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testFormatTimestamp_data();
    void testFormatTimestamp();
    void testToMilliseconds();

    void testParseWellFormedDocument();
    void testParseEmptySegments();
    void testSchemaViolations_data();
    void testSchemaViolations();
    void testTruncatedOutputIsDumped();
    void testParseWithoutDiagnosticBase();
    void testUnwritableDumpKeepsParseError();

    void testArtifactLayout();
    void testWriteArtifact();
    void testWriteArtifactFailure();

private:
    QString workDir_;
};

void TestTranscriptNormalizer::initTestCase() {
    workDir_ = TestUtils::createTempDirectory("normalizer");
    QVERIFY(!workDir_.isEmpty());
}

void TestTranscriptNormalizer::testFormatTimestamp_data() {
    QTest::addColumn<double>("seconds");
    QTest::addColumn<QString>("expected");

    QTest::newRow("zero") << 0.0 << "00:00:00.000";
    QTest::newRow("fraction") << 1.5 << "00:00:01.500";
    QTest::newRow("hours") << 3725.125 << "01:02:05.125";
    QTest::newRow("minute boundary") << 60.0 << "00:01:00.000";
    QTest::newRow("beyond a day") << 90061.25 << "25:01:01.250";
}

void TestTranscriptNormalizer::testFormatTimestamp() {
    QFETCH(double, seconds);
    QFETCH(QString, expected);
    QCOMPARE(TranscriptNormalizer::formatTimestamp(seconds), expected);
}

void TestTranscriptNormalizer::testToMilliseconds() {
    QCOMPARE(TranscriptNormalizer::toMilliseconds(0.0), qint64(0));
    QCOMPARE(TranscriptNormalizer::toMilliseconds(1.5), qint64(1500));
    QCOMPARE(TranscriptNormalizer::toMilliseconds(3725.125), qint64(3725125));
    QCOMPARE(TranscriptNormalizer::toMilliseconds(2.0004), qint64(2000));
    QCOMPARE(TranscriptNormalizer::toMilliseconds(2.0006), qint64(2001));

    // Times whose offset cannot be represented collapse to zero
    QCOMPARE(TranscriptNormalizer::toMilliseconds(1e300), qint64(0));
    QCOMPARE(TranscriptNormalizer::formatTimestamp(1e300), QString("00:00:00.000"));
    QCOMPARE(TranscriptNormalizer::toMilliseconds(8.0e15), qint64(8000000000000000000LL));
}

void TestTranscriptNormalizer::testParseWellFormedDocument() {
    const QByteArray raw = TestUtils::engineDocument(
        "en", {{0.0, 2.5}, {2.5, 3725.125}}, {" Welcome everyone.", " Let's begin."});

    auto result = TranscriptNormalizer::parse(raw, workDir_ + "/wellformed");
    ASSERT_EXPECTED_VALUE(result);

    const Transcript& transcript = result.value();
    QCOMPARE(transcript.language, QString("en"));
    QCOMPARE(transcript.segments.size(), 2);

    const TranscriptSegment& first = transcript.segments.at(0);
    QCOMPARE(first.fromTimestamp, QString("00:00:00.000"));
    QCOMPARE(first.toTimestamp, QString("00:00:02.500"));
    QCOMPARE(first.fromOffset, qint64(0));
    QCOMPARE(first.toOffset, qint64(2500));
    QCOMPARE(first.text, QString(" Welcome everyone."));
    QVERIFY(first.speaker.isEmpty());

    const TranscriptSegment& second = transcript.segments.at(1);
    QCOMPARE(second.toTimestamp, QString("01:02:05.125"));
    QCOMPARE(second.toOffset, qint64(3725125));
    QCOMPARE(second.duration(), qint64(3725125 - 2500));

    ASSERT_FILE_NOT_EXISTS(DiagnosticDump::dumpPath(workDir_ + "/wellformed"));
}

void TestTranscriptNormalizer::testParseEmptySegments() {
    auto result = TranscriptNormalizer::parse(R"({"language": "fr", "segments": []})");
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(result.value().language, QString("fr"));
    QVERIFY(result.value().segments.isEmpty());
}

void TestTranscriptNormalizer::testSchemaViolations_data() {
    QTest::addColumn<QByteArray>("raw");

    QTest::newRow("not json") << QByteArray("Detected language: English");
    QTest::newRow("array root") << QByteArray(R"([{"start": 0, "end": 1, "text": "x"}])");
    QTest::newRow("missing language") << QByteArray(R"({"segments": []})");
    QTest::newRow("numeric language") << QByteArray(R"({"language": 1, "segments": []})");
    QTest::newRow("segments not array") << QByteArray(R"({"language": "en", "segments": {}})");
    QTest::newRow("segment not object") << QByteArray(R"({"language": "en", "segments": ["hello"]})");
    QTest::newRow("string start") << QByteArray(R"({"language": "en", "segments": [{"start": "0", "end": 1, "text": "x"}]})");
    QTest::newRow("missing end") << QByteArray(R"({"language": "en", "segments": [{"start": 0, "text": "x"}]})");
    QTest::newRow("missing text") << QByteArray(R"({"language": "en", "segments": [{"start": 0, "end": 1}]})");
    QTest::newRow("negative start") << QByteArray(R"({"language": "en", "segments": [{"start": -1, "end": 1, "text": "x"}]})");
    QTest::newRow("start beyond range") << QByteArray(R"({"language": "en", "segments": [{"start": 1e300, "end": 1e300, "text": "x"}]})");
    QTest::newRow("end beyond range") << QByteArray(R"({"language": "en", "segments": [{"start": 0, "end": 1e16, "text": "x"}]})");
    QTest::newRow("second segment bad") << QByteArray(
        R"({"language": "en", "segments": [{"start": 0, "end": 1, "text": "ok"}, {"start": 1, "end": null, "text": "x"}]})");
}

void TestTranscriptNormalizer::testSchemaViolations() {
    QFETCH(QByteArray, raw);

    const QString base = workDir_ + "/violation_" + QString::fromLatin1(QTest::currentDataTag()).replace(' ', '_');
    auto result = TranscriptNormalizer::parse(raw, base);
    ASSERT_EXPECTED_ERROR(result, PipelineErrorKind::OutputParseError);
    QCOMPARE(result.error().diagnosticPath, DiagnosticDump::dumpPath(base));
    QCOMPARE(TestUtils::readFile(DiagnosticDump::dumpPath(base)), raw);
}

void TestTranscriptNormalizer::testTruncatedOutputIsDumped() {
    const QByteArray full = TestUtils::engineDocument("en", {{0.0, 1.0}, {1.0, 2.0}}, {" One.", " Two."});
    const QByteArray truncated = full.left(full.size() - 7);
    const QString base = workDir_ + "/meeting";

    auto result = TranscriptNormalizer::parse(truncated, base);
    ASSERT_EXPECTED_ERROR(result, PipelineErrorKind::OutputParseError);

    const QString dumpPath = workDir_ + "/meeting.raw.txt";
    QCOMPARE(result.error().diagnosticPath, dumpPath);
    ASSERT_FILE_EXISTS(dumpPath);
    QCOMPARE(TestUtils::readFile(dumpPath), truncated);
    QVERIFY(result.error().userMessage().contains(dumpPath));
}

void TestTranscriptNormalizer::testParseWithoutDiagnosticBase() {
    auto result = TranscriptNormalizer::parse("{\"language\": \"en\"");
    ASSERT_EXPECTED_ERROR(result, PipelineErrorKind::OutputParseError);
    QVERIFY(result.error().diagnosticPath.isEmpty());
}

void TestTranscriptNormalizer::testUnwritableDumpKeepsParseError() {
    // A regular file where a directory is expected makes the dump impossible
    const QString blocker = TestUtils::createTestTextFile(workDir_, "not a directory", "blocker");
    const QString base = blocker + "/nested/out";

    auto result = TranscriptNormalizer::parse("garbage", base);
    ASSERT_EXPECTED_ERROR(result, PipelineErrorKind::OutputParseError);
    QVERIFY(result.error().diagnosticPath.isEmpty());
    ASSERT_FILE_NOT_EXISTS(DiagnosticDump::dumpPath(base));
}

void TestTranscriptNormalizer::testArtifactLayout() {
    Transcript transcript;
    transcript.language = "en";
    transcript.segments.append(TranscriptNormalizer::makeSegment(0.0, 1.5, " Hello"));
    TranscriptSegment labelled = TranscriptNormalizer::makeSegment(1.5, 3.0, " there");
    labelled.speaker = "SPEAKER_01";
    transcript.segments.append(labelled);

    ArtifactContext context;
    context.modelName = "base";
    context.modelPath = "/models/base.bin";
    context.translate = true;

    const QJsonObject root = TranscriptNormalizer::toJson(transcript, context);
    QVERIFY(root.contains("systeminfo"));
    QCOMPARE(root["model"].toObject()["type"].toString(), QString("base"));
    QCOMPARE(root["model"].toObject()["multilingual"].toBool(), true);
    QCOMPARE(root["params"].toObject()["model"].toString(), QString("/models/base.bin"));
    QCOMPARE(root["params"].toObject()["language"].toString(), QString("en"));
    QCOMPARE(root["params"].toObject()["translate"].toBool(), true);
    QCOMPARE(root["result"].toObject()["language"].toString(), QString("en"));

    const QJsonArray transcription = root["transcription"].toArray();
    QCOMPARE(transcription.size(), 2);

    const QJsonObject first = transcription.at(0).toObject();
    QCOMPARE(first["timestamps"].toObject()["from"].toString(), QString("00:00:00.000"));
    QCOMPARE(first["timestamps"].toObject()["to"].toString(), QString("00:00:01.500"));
    QCOMPARE(first["offsets"].toObject()["from"].toInteger(), qint64(0));
    QCOMPARE(first["offsets"].toObject()["to"].toInteger(), qint64(1500));
    QCOMPARE(first["text"].toString(), QString(" Hello"));
    QVERIFY(!first.contains("speaker"));

    QCOMPARE(transcription.at(1).toObject()["speaker"].toString(), QString("SPEAKER_01"));
}

void TestTranscriptNormalizer::testWriteArtifact() {
    Transcript transcript;
    transcript.language = "de";
    transcript.segments.append(TranscriptNormalizer::makeSegment(0.0, 2.0, " Guten Tag"));

    ArtifactContext context;
    context.modelName = "small";

    const QString path = workDir_ + "/out/interview.json";
    auto written = TranscriptNormalizer::writeArtifact(path, transcript, context);
    ASSERT_EXPECTED_VALUE(written);
    QCOMPARE(written.value(), path);

    const QJsonDocument doc = QJsonDocument::fromJson(TestUtils::readFile(path));
    QVERIFY(doc.isObject());
    QCOMPARE(doc.object()["params"].toObject()["model"].toString(), QString("small"));
    QCOMPARE(doc.object()["transcription"].toArray().at(0).toObject()["text"].toString(), QString(" Guten Tag"));
}

void TestTranscriptNormalizer::testWriteArtifactFailure() {
    const QString blocker = TestUtils::createTestTextFile(workDir_, "x", "artifact_blocker");

    auto written = TranscriptNormalizer::writeArtifact(blocker + "/transcript.json", Transcript(), ArtifactContext());
    ASSERT_EXPECTED_ERROR(written, PipelineErrorKind::StorageError);
}

int runTestTranscriptNormalizer(int argc, char** argv) {
    TestTranscriptNormalizer test;
    return QTest::qExec(&test, argc, argv);
}

#include "TestTranscriptNormalizer.moc"
