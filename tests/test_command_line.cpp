#include <QtTest>
#include <QCommandLineParser>
#include <QDir>
#include "../src/command_line.h"
#include "../src/conversion_profile.h"

class TestCommandLine : public QObject {
    Q_OBJECT
private slots:
    void testNoOptionsKeepsProfile();
    void testBehaviourOverrides();
    void testDirectoriesAreMadeAbsolute();
    void testArchivalProfile();
    void testUnknownProfileIsError();
    void testInvalidMaxRetries_data();
    void testInvalidMaxRetries();

private:
    bool parse(QCommandLineParser& parser, const CommandLineOptions& opts, const QStringList& args);
};

bool TestCommandLine::parse(QCommandLineParser& parser, const CommandLineOptions& opts, const QStringList& args)
{
    opts.addTo(parser);
    return parser.parse(QStringList{ "vidconvert" } + args);
}

void TestCommandLine::testNoOptionsKeepsProfile()
{
    const CommandLineOptions opts;
    QCommandLineParser parser;
    QVERIFY(parse(parser, opts, {}));

    ConversionProfile p;
    p.maxRetries = 4;
    p.deleteAfterSuccess = false;
    QVERIFY(opts.applyOverrides(parser, p));
    QCOMPARE(p.maxRetries, 4);
    QCOMPARE(p.outputPlacement, OutputPlacement::MirroredTree);
    QVERIFY(p.validateAudio);
    QVERIFY(!p.deleteAfterSuccess);
    QVERIFY(!p.highQuality4k);
}

void TestCommandLine::testBehaviourOverrides()
{
    const CommandLineOptions opts;
    QCommandLineParser parser;
    QVERIFY(parse(parser, opts, { "--same-dir-output", "--delete-original", "--max-retries", "3",
                                  "--high-quality-4k", "--skip-audio-validation" }));

    ConversionProfile p;
    QString err;
    QVERIFY2(opts.applyOverrides(parser, p, &err), qPrintable(err));
    QCOMPARE(p.outputPlacement, OutputPlacement::SameDir);
    QVERIFY(p.deleteAfterSuccess);
    QCOMPARE(p.maxRetries, 3);
    QVERIFY(p.highQuality4k);
    QVERIFY(!p.validateAudio);
}

void TestCommandLine::testDirectoriesAreMadeAbsolute()
{
    const CommandLineOptions opts;
    QCommandLineParser parser;
    QVERIFY(parse(parser, opts, { "--input", "lib/in", "--output", "/srv/out" }));

    ConversionProfile p;
    QVERIFY(opts.applyOverrides(parser, p));
    QCOMPARE(p.inputRoot, QDir::current().absoluteFilePath("lib/in"));
    QCOMPARE(p.outputRoot, QString("/srv/out"));
}

void TestCommandLine::testArchivalProfile()
{
    const CommandLineOptions opts;
    QCommandLineParser parser;
    QVERIFY(parse(parser, opts, { "--profile", "archival" }));

    ConversionProfile p;
    QVERIFY(opts.applyOverrides(parser, p));
    QCOMPARE(p.videoExtensions, QStringList({ "mkv", "mov" }));
}

void TestCommandLine::testUnknownProfileIsError()
{
    const CommandLineOptions opts;
    QCommandLineParser parser;
    QVERIFY(parse(parser, opts, { "--profile", "broadcast", "--delete-original" }));

    ConversionProfile p;
    QString err;
    QVERIFY(!opts.applyOverrides(parser, p, &err));
    QVERIFY(err.contains("broadcast"));
    // Nothing applied on error
    QVERIFY(!p.deleteAfterSuccess);
    QCOMPARE(p.videoExtensions, QStringList({ "m4v", "mp4", "mov", "mkv" }));
}

void TestCommandLine::testInvalidMaxRetries_data()
{
    QTest::addColumn<QString>("value");
    QTest::newRow("negative") << "-1";
    QTest::newRow("text") << "two";
    QTest::newRow("above cap") << QString::number(ConversionProfile::kMaxRetriesCap + 1);
}

void TestCommandLine::testInvalidMaxRetries()
{
    QFETCH(QString, value);
    const CommandLineOptions opts;
    QCommandLineParser parser;
    QVERIFY(parse(parser, opts, { "--max-retries=" + value }));

    ConversionProfile p;
    QString err;
    QVERIFY(!opts.applyOverrides(parser, p, &err));
    QVERIFY(err.startsWith("--max-retries"));
    QCOMPARE(p.maxRetries, 1);
}

QTEST_APPLESS_MAIN(TestCommandLine)
#include "test_command_line.moc"
