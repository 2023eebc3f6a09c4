#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include "../src/utils.h"
#include "../src/file_utils.h"

class TestUtils : public QObject {
    Q_OBJECT
private slots:
    void testFormatDuration();
    void testHumanSize();
    void testCommandLineQuotesSpaces();
    void testUniqueNameInDir();
    void testMoveFile();
    void testRemoveIfExists();
    void testSamePathFollowsSymlinks();
};

void TestUtils::testFormatDuration()
{
    QCOMPARE(Utils::formatDuration(0), QString("0s"));
    QCOMPARE(Utils::formatDuration(45), QString("45s"));
    QCOMPARE(Utils::formatDuration(65), QString("1m 5s"));
    QCOMPARE(Utils::formatDuration(3605), QString("1h 0m 5s"));
    QCOMPARE(Utils::formatDuration(-3), QString("0s"));
}

void TestUtils::testHumanSize()
{
    QCOMPARE(Utils::humanSize(512), QString("512 B"));
    QCOMPARE(Utils::humanSize(1024), QString("1.0 KB"));
    QCOMPARE(Utils::humanSize(1536), QString("1.5 KB"));
    QCOMPARE(Utils::humanSize(1048576), QString("1.0 MB"));
}

void TestUtils::testCommandLineQuotesSpaces()
{
    const QString line = Utils::commandLine("ffmpeg", { "-i", "/media/My Show.mkv", "out.mp4" });
    QCOMPARE(line, QString("ffmpeg -i \"/media/My Show.mkv\" out.mp4"));
}

void TestUtils::testUniqueNameInDir()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QCOMPARE(FileUtils::uniqueNameInDir(dir.path(), "clip.mkv"), dir.filePath("clip.mkv"));

    QFile(dir.filePath("clip.mkv")).open(QIODevice::WriteOnly);
    QCOMPARE(FileUtils::uniqueNameInDir(dir.path(), "clip.mkv"), dir.filePath("clip (2).mkv"));

    QFile(dir.filePath("clip (2).mkv")).open(QIODevice::WriteOnly);
    QCOMPARE(FileUtils::uniqueNameInDir(dir.path(), "clip.mkv"), dir.filePath("clip (3).mkv"));
}

void TestUtils::testMoveFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString src = dir.filePath("a.mkv");
    {
        QFile f(src);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("payload");
    }
    const QString dst = dir.filePath("moved/a.mkv");
    QVERIFY(QDir().mkpath(dir.filePath("moved")));

    QString err;
    QVERIFY2(FileUtils::moveFile(src, dst, &err), qPrintable(err));
    QVERIFY(!QFileInfo::exists(src));
    QVERIFY(FileUtils::fileExists(dst));

    QVERIFY(!FileUtils::moveFile(dir.filePath("missing.mkv"), dir.filePath("x.mkv"), &err));
    QVERIFY(!err.isEmpty());
}

void TestUtils::testRemoveIfExists()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString p = dir.filePath("partial.mp4");
    QVERIFY(FileUtils::removeIfExists(p));
    QFile(p).open(QIODevice::WriteOnly);
    QVERIFY(FileUtils::removeIfExists(p));
    QVERIFY(!QFileInfo::exists(p));
}

void TestUtils::testSamePathFollowsSymlinks()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString real = dir.filePath("real.mp4");
    QFile(real).open(QIODevice::WriteOnly);
    const QString link = dir.filePath("link.mp4");
    if (!QFile::link(real, link)) QSKIP("symlinks not supported here");

    QVERIFY(FileUtils::samePath(real, link));
    QVERIFY(FileUtils::samePath(real, dir.path() + "/./real.mp4"));
    QVERIFY(!FileUtils::samePath(real, dir.filePath("other.mp4")));
}

QTEST_APPLESS_MAIN(TestUtils)
#include "test_utils.moc"
