#include "BaseTestFixture.h"

#include <sys/stat.h>

namespace {

class RecordingCreationTimeSetter : public CreationTimeSetter {
public:
    explicit RecordingCreationTimeSetter(bool succeed) : m_succeed(succeed) {}

    bool setCreationTime(const fs::path& filePath, std::time_t when) override {
        calls.emplace_back(filePath, when);
        return m_succeed;
    }

    std::vector<std::pair<fs::path, std::time_t>> calls;

private:
    bool m_succeed;
};

std::time_t modificationTime(const fs::path& path) {
    struct stat info;
    if (stat(path.c_str(), &info) != 0) return -1;
    return info.st_mtime;
}

} // namespace

class BatchProcessorTest : public BaseTestFixture {
protected:
    ProcessorOptions defaults() {
        ProcessorOptions opts;
        opts.maxDimension = 1200;
        opts.quality = 85;
        return opts;
    }
};

TEST_F(BatchProcessorTest, InvalidOptionsAreRejected) {
    ProcessorOptions opts = defaults();
    opts.quality = 0;
    ASSERT_THROW(BatchProcessor processor(opts), PhotoDaterException);
}

TEST_F(BatchProcessorTest, ProcessImageWritesDatedJpeg) {
    fs::path source = inputDir / "2023.07.04_bbq.png";
    fs::path dest = outputDir / "party" / "2023.07.04_bbq.jpg";
    writePng(source, 400, 300, {200, 100, 50});

    BatchProcessor processor(defaults());
    ASSERT_EQ(processor.processImage(source, dest), BatchProcessor::FileResult::Processed);

    ASSERT_TRUE(fs::exists(dest));
    std::vector<unsigned char> jpeg = readBytes(dest);
    ASSERT_EQ(ExifMetadata::read(jpeg).dateTimeOriginal, "2023:07:04 00:00:00");

    FilenameDate expected{2023, 7, 4, DatePrecision::FullDate};
    ASSERT_EQ(modificationTime(dest), expected.toLocalTime());

    // Source untouched
    ASSERT_TRUE(fs::exists(source));
}

TEST_F(BatchProcessorTest, ProcessImageSkipsUndatedFile) {
    fs::path source = inputDir / "photo.png";
    fs::path dest = outputDir / "photo.jpg";
    writePng(source, 20, 20, {1, 2, 3});

    BatchProcessor processor(defaults());
    ASSERT_EQ(processor.processImage(source, dest), BatchProcessor::FileResult::Skipped);
    ASSERT_FALSE(fs::exists(dest));
}

TEST_F(BatchProcessorTest, ProcessImageContainsDecodeFailure) {
    fs::path source = inputDir / "2023-01-01_broken.png";
    fs::path dest = outputDir / "2023-01-01_broken.jpg";
    writeText(source, "not a png at all");

    BatchProcessor processor(defaults());
    ASSERT_EQ(processor.processImage(source, dest), BatchProcessor::FileResult::Failed);
    ASSERT_FALSE(fs::exists(dest));
}

TEST_F(BatchProcessorTest, CreationTimeSetterReceivesLocalMidnight) {
    auto recorder = std::make_unique<RecordingCreationTimeSetter>(true);
    RecordingCreationTimeSetter* calls = recorder.get();

    fs::path source = inputDir / "IMG_2022.jpg";
    fs::path dest = outputDir / "IMG_2022.jpg";
    writeJpeg(source, 40, 30);

    BatchProcessor processor(defaults(), std::move(recorder));
    ASSERT_EQ(processor.processImage(source, dest), BatchProcessor::FileResult::Processed);

    ASSERT_EQ(calls->calls.size(), 1);
    ASSERT_EQ(calls->calls[0].first, dest);
    ASSERT_EQ(calls->calls[0].second, (FilenameDate{2022, 1, 1, DatePrecision::YearOnly}).toLocalTime());
}

TEST_F(BatchProcessorTest, CreationTimeFailureStillCountsAsProcessed) {
    fs::path source = inputDir / "2021-03_trip.jpg";
    fs::path dest = outputDir / "2021-03_trip.jpg";
    writeJpeg(source, 40, 30);

    BatchProcessor processor(defaults(), std::make_unique<RecordingCreationTimeSetter>(false));
    ASSERT_EQ(processor.processImage(source, dest), BatchProcessor::FileResult::Processed);
    ASSERT_TRUE(fs::exists(dest));
}

TEST_F(BatchProcessorTest, ModificationTimeFailureIsReportedNotThrown) {
    fs::path missing = outputDir / "gone.jpg";
    const std::time_t midnight = (FilenameDate{2020, 2, 29, DatePrecision::FullDate}).toLocalTime();

    bool modified = true;
    ASSERT_NO_THROW(modified = FileTimestamps::setModificationTime(missing, midnight));
    ASSERT_FALSE(modified);

    // The creation setter is still tried and the combined result is a failure
    RecordingCreationTimeSetter setter(true);
    bool applied = true;
    ASSERT_NO_THROW(applied = FileTimestamps::apply(missing, midnight, setter));
    ASSERT_FALSE(applied);
    ASSERT_EQ(setter.calls.size(), 1);
}

TEST_F(BatchProcessorTest, ProcessDirectoryScenario) {
    fs::create_directory(inputDir / "nested");
    writePng(inputDir / "2023.07.04_bbq.png", 4000, 3000, {30, 160, 90});
    writeJpeg(inputDir / "IMG_2022.jpg", 64, 48);
    writePng(inputDir / "photo.png", 10, 10, {5, 5, 5});
    writeJpeg(inputDir / "nested" / "2021-03_trip.JPEG", 32, 32);
    writeText(inputDir / "2020_broken.png", "corrupt");
    writeText(inputDir / "2020_readme.txt", "ignored: not an image extension");

    BatchProcessor processor(defaults(), std::make_unique<NoopCreationTimeSetter>());
    BatchReport report = processor.processDirectory(inputDir, outputDir);

    ASSERT_EQ(report.found, 5);
    ASSERT_EQ(report.processed, 3);
    ASSERT_EQ(report.skipped, 1);
    ASSERT_EQ(report.failed, 1);

    fs::path bbq = outputDir / "2023.07.04_bbq.jpg";
    ASSERT_TRUE(fs::exists(bbq));
    CImg<unsigned char> img = decodeJpeg(readBytes(bbq));
    ASSERT_EQ(img.width(), 1200);
    ASSERT_EQ(img.height(), 900);
    ASSERT_EQ(ExifMetadata::read(readBytes(bbq)).dateTimeOriginal, "2023:07:04 00:00:00");
    ASSERT_EQ(modificationTime(bbq), (FilenameDate{2023, 7, 4, DatePrecision::FullDate}).toLocalTime());

    ASSERT_EQ(ExifMetadata::read(readBytes(outputDir / "IMG_2022.jpg")).dateTimeOriginal, "2022:01:01 00:00:00");
    ASSERT_TRUE(fs::exists(outputDir / "nested" / "2021-03_trip.jpg"));
    ASSERT_FALSE(fs::exists(outputDir / "photo.jpg"));
    ASSERT_FALSE(fs::exists(outputDir / "2020_broken.jpg"));
}

TEST_F(BatchProcessorTest, EmptyDirectoryIsANoOp) {
    BatchProcessor processor(defaults());
    BatchReport report = processor.processDirectory(inputDir, outputDir);
    ASSERT_EQ(report.found, 0);
    ASSERT_EQ(report.processed, 0);
    ASSERT_TRUE(fs::is_empty(outputDir));
}

TEST_F(BatchProcessorTest, InvalidSourceDirectory) {
    BatchProcessor processor(defaults());
    ASSERT_THROW(processor.processDirectory(tempDir / "does_not_exist", outputDir), PhotoDaterException);

    fs::path file = inputDir / "2023_file.png";
    writeText(file, "x");
    ASSERT_THROW(processor.processDirectory(file, outputDir), PhotoDaterException);
}
