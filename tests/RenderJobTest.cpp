#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "RenderJob.h"

namespace qrpaint {
namespace {

QJsonObject parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

TEST(RenderJob, DefaultsMatchThePainterDefaults)
{
    const RenderJob job;
    EXPECT_EQ(job.version, QrEncoder::kAutoVersion);
    EXPECT_EQ(job.level, ErrorCorrectionLevel::L);
    EXPECT_EQ(job.style.darkColor, QColor(0, 0, 0));
    EXPECT_FALSE(job.style.backgroundColor.has_value());
    EXPECT_FALSE(job.style.gapless);
}

TEST(RenderJob, AppliesEveryKey)
{
    RenderJob job;
    QString error;
    ASSERT_TRUE(job.applyJson(parse(R"({"data": "HELLO", "version": 3, "error_correction": "q",
                                         "color": "#80112233", "background": "white",
                                         "gapless": true, "size": 300})"),
                              &error))
        << error.toStdString();

    EXPECT_EQ(job.data, QStringLiteral("HELLO"));
    EXPECT_EQ(job.version, 3);
    EXPECT_EQ(job.level, ErrorCorrectionLevel::Q);
    EXPECT_EQ(job.style.darkColor, QColor(0x11, 0x22, 0x33, 0x80));
    ASSERT_TRUE(job.style.backgroundColor.has_value());
    EXPECT_EQ(*job.style.backgroundColor, QColor(Qt::white));
    EXPECT_TRUE(job.style.gapless);
    EXPECT_DOUBLE_EQ(job.size, 300.0);
}

TEST(RenderJob, MissingKeysKeepCurrentValues)
{
    RenderJob job;
    job.data = QStringLiteral("kept");
    job.style.backgroundColor = QColor(Qt::green);
    ASSERT_TRUE(job.applyJson(parse(R"({"version": 5, "unknown": 1})")));
    EXPECT_EQ(job.data, QStringLiteral("kept"));
    EXPECT_EQ(job.version, 5);
    EXPECT_TRUE(job.style.backgroundColor.has_value());

    ASSERT_TRUE(job.applyJson(parse(R"({"background": null})")));
    EXPECT_FALSE(job.style.backgroundColor.has_value());
}

TEST(RenderJob, RejectsInvalidValues)
{
    const char *cases[] = {
        R"({"color": "not-a-colour"})",
        R"({"error_correction": "X"})",
        R"({"version": 2.5})",
        R"({"gapless": "yes"})",
        R"({"size": 0})",
        R"({"data": 42})",
        R"({"size": 1e12})",
        R"({"size": 16385})",
        R"({"version": 1e10})",
        R"({"version": -1e10})",
    };
    for (const char *json : cases) {
        RenderJob job;
        QString error;
        EXPECT_FALSE(job.applyJson(parse(json), &error)) << json;
        EXPECT_FALSE(error.isEmpty()) << json;
    }
}

TEST(RenderJob, AcceptsTheLargestImageSide)
{
    RenderJob job;
    ASSERT_TRUE(job.applyJson(parse(R"({"size": 16384})")));
    EXPECT_DOUBLE_EQ(job.size, 16384.0);

    double size = 0.0;
    EXPECT_FALSE(parseImageSize(0.5, size));
    EXPECT_TRUE(parseImageSize(1.0, size));
    EXPECT_DOUBLE_EQ(size, 1.0);
}

TEST(RenderJob, SavesAndLoadsFiles)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("job.json"));

    RenderJob job;
    job.data = QStringLiteral("https://example.org/?q=1");
    job.version = 4;
    job.level = ErrorCorrectionLevel::H;
    job.style.darkColor = QColor(10, 20, 30);
    job.style.backgroundColor = QColor(250, 250, 250, 128);
    job.size = 640.0;

    QString error;
    ASSERT_TRUE(job.saveFile(path, &error)) << error.toStdString();

    RenderJob loaded;
    ASSERT_TRUE(loaded.loadFile(path, &error)) << error.toStdString();
    EXPECT_EQ(loaded.data, job.data);
    EXPECT_EQ(loaded.version, 4);
    EXPECT_EQ(loaded.level, ErrorCorrectionLevel::H);
    EXPECT_EQ(loaded.style.darkColor, job.style.darkColor);
    EXPECT_EQ(loaded.style.backgroundColor, job.style.backgroundColor);
    EXPECT_DOUBLE_EQ(loaded.size, 640.0);
}

TEST(RenderJob, ReportsUnreadableFiles)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    RenderJob job;
    QString error;
    EXPECT_FALSE(job.loadFile(dir.filePath(QStringLiteral("missing.json")), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("not found")));

    const QString broken = dir.filePath(QStringLiteral("broken.json"));
    QFile file(broken);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    EXPECT_FALSE(job.loadFile(broken, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("Invalid render job JSON")));

    const QString array = dir.filePath(QStringLiteral("array.json"));
    QFile arrayFile(array);
    ASSERT_TRUE(arrayFile.open(QIODevice::WriteOnly));
    arrayFile.write("[1, 2]");
    arrayFile.close();
    EXPECT_FALSE(job.loadFile(array, &error));
}

} // namespace
} // namespace qrpaint
