#include <QtTest>
#include "../src/media_prober.h"
#include "../src/conversion_profile.h"
#include "fake_process_runner.h"

class TestMediaProber : public QObject {
    Q_OBJECT
private slots:
    void testAudioPresent();
    void testAudioFailClosedOnEmptyOutput();
    void testAudioFailClosedOnProbeFailure();
    void testAudioBypassedWhenValidationOff();
    void testParseHeight_data();
    void testParseHeight();
    void testFourKGatedByProfile();
    void testFourKThreshold();
    void testUnknownHeightIsNotFourK();
    void testSubtitleJson();
    void testSubtitleJsonMalformed();
    void testSubtitleProbeFailureIsEmpty();
};

namespace {
ConversionProfile profile()
{
    ConversionProfile p;
    p.ffmpegPath = "ffmpeg";
    p.ffprobePath = "ffprobe";
    return p;
}
}

void TestMediaProber::testAudioPresent()
{
    const ConversionProfile p = profile();
    FakeProcessRunner runner;
    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::success("1\n2\n"); });
    MediaProber prober(p, runner);
    QVERIFY(prober.hasAudioStream("/out/a.mp4"));
    QCOMPARE(runner.calls().size(), 1);
    QCOMPARE(runner.calls().first().program, QString("ffprobe"));
    QCOMPARE(runner.calls().first().args.last(), QString("/out/a.mp4"));
}

void TestMediaProber::testAudioFailClosedOnEmptyOutput()
{
    const ConversionProfile p = profile();
    FakeProcessRunner runner;
    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::success("  \n"); });
    MediaProber prober(p, runner);
    QVERIFY(!prober.hasAudioStream("/out/a.mp4"));
}

void TestMediaProber::testAudioFailClosedOnProbeFailure()
{
    const ConversionProfile p = profile();
    FakeProcessRunner runner;
    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::notStarted(); });
    MediaProber prober(p, runner);
    QVERIFY(!prober.hasAudioStream("/out/a.mp4"));

    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::failure(1, "Invalid data"); });
    QVERIFY(!prober.hasAudioStream("/out/a.mp4"));
}

void TestMediaProber::testAudioBypassedWhenValidationOff()
{
    ConversionProfile p = profile();
    p.validateAudio = false;
    FakeProcessRunner runner;
    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::success(); });
    MediaProber prober(p, runner);
    QVERIFY(prober.hasAudioStream("/out/a.mp4"));
    QVERIFY(runner.calls().isEmpty());
}

void TestMediaProber::testParseHeight_data()
{
    QTest::addColumn<QString>("out");
    QTest::addColumn<int>("expected");   // -1 means nullopt

    QTest::newRow("plain") << "2160\n" << 2160;
    QTest::newRow("trailing separator") << "1080,\n" << 1080;
    QTest::newRow("first stream wins") << "720\n2160\n" << 720;
    QTest::newRow("crlf") << "\r\n1080\r\n" << 1080;
    QTest::newRow("empty") << "" << -1;
    QTest::newRow("not a number") << "N/A\n" << -1;
    QTest::newRow("zero") << "0\n" << -1;
}

void TestMediaProber::testParseHeight()
{
    QFETCH(QString, out);
    QFETCH(int, expected);
    const std::optional<int> h = MediaProber::parseHeight(out);
    if (expected < 0) {
        QVERIFY(!h.has_value());
    } else {
        QVERIFY(h.has_value());
        QCOMPARE(*h, expected);
    }
}

void TestMediaProber::testFourKGatedByProfile()
{
    ConversionProfile p = profile();
    p.highQuality4k = false;
    FakeProcessRunner runner;
    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::success("4320\n"); });
    MediaProber prober(p, runner);
    QVERIFY(!prober.isFourK("/in/a.mkv"));
    QVERIFY(runner.calls().isEmpty());
}

void TestMediaProber::testFourKThreshold()
{
    ConversionProfile p = profile();
    p.highQuality4k = true;
    FakeProcessRunner runner;
    QString height = "2160";
    runner.setHandler([&height](const QString&, const QStringList&) { return FakeProcessRunner::success(height + "\n"); });
    MediaProber prober(p, runner);

    QVERIFY(prober.isFourK("/in/a.mkv"));
    height = "2159";
    QVERIFY(!prober.isFourK("/in/a.mkv"));

    p.fourKHeightThreshold = 1440;
    height = "1440";
    QVERIFY(prober.isFourK("/in/a.mkv"));
}

void TestMediaProber::testUnknownHeightIsNotFourK()
{
    ConversionProfile p = profile();
    p.highQuality4k = true;
    FakeProcessRunner runner;
    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::failure(); });
    MediaProber prober(p, runner);
    QVERIFY(!prober.isFourK("/in/a.mkv"));
    QVERIFY(!prober.videoHeight("/in/a.mkv").has_value());
}

void TestMediaProber::testSubtitleJson()
{
    const QByteArray json = R"({
        "programs": [],
        "streams": [
            { "index": 2, "codec_name": "subrip", "codec_type": "subtitle",
              "tags": { "language": "eng", "title": "English SDH" } },
            { "index": 3, "codec_name": "hdmv_pgs_subtitle", "codec_type": "subtitle" }
        ]
    })";
    const QVector<MediaInfo::SubtitleTrack> tracks = MediaProber::parseSubtitleJson(json);
    QCOMPARE(tracks.size(), 2);
    QCOMPARE(tracks.at(0).index, 2);
    QCOMPARE(tracks.at(0).codec, QString("subrip"));
    QCOMPARE(tracks.at(0).language, QString("eng"));
    QCOMPARE(tracks.at(0).title, QString("English SDH"));
    QCOMPARE(tracks.at(1).language, QString("und"));
    QVERIFY(tracks.at(1).title.isEmpty());
}

void TestMediaProber::testSubtitleJsonMalformed()
{
    QVERIFY(MediaProber::parseSubtitleJson("{ not json").isEmpty());
    QVERIFY(MediaProber::parseSubtitleJson("[]").isEmpty());
    QVERIFY(MediaProber::parseSubtitleJson("{}").isEmpty());
}

void TestMediaProber::testSubtitleProbeFailureIsEmpty()
{
    const ConversionProfile p = profile();
    FakeProcessRunner runner;
    runner.setHandler([](const QString&, const QStringList&) { return FakeProcessRunner::failure(); });
    MediaProber prober(p, runner);
    QVERIFY(prober.listSubtitleTracks("/in/a.mkv").isEmpty());
}

QTEST_GUILESS_MAIN(TestMediaProber)
#include "test_media_prober.moc"
