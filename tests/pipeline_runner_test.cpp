#include <gtest/gtest.h>
#include "core/console_progress.hpp"
#include "core/file_utils.hpp"
#include "core/pipeline_runner.hpp"
#include "test_base.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <sstream>
#include <cstdio>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

class PipelineRunnerTest : public TestBase
{
protected:
    FakeMetadataSource image_source_;
    FakeMetadataSource video_source_;
    FakeGeocoder geocoder_;
    std::unique_ptr<MetadataResolver> resolver_;
    std::unique_ptr<GeocodeCache> cache_;
    std::unique_ptr<PipelineRunner> runner_;
    RunControls controls_;

    void SetUp() override
    {
        TestBase::SetUp();
        GeoAddress lincoln;
        lincoln.city = "Lincoln";
        lincoln.country = "USA";
        geocoder_.setAddress(lincoln);

        resolver_ = std::make_unique<MetadataResolver>(image_source_, video_source_);
        cache_ = std::make_unique<GeocodeCache>(&geocoder_, GeocodeCacheStore(path("geocode.json")), RetryPolicy(3, 0));
        runner_ = std::make_unique<PipelineRunner>(*resolver_, *cache_);
    }

    RunReport runDefault(const PipelineOptions &options = PipelineOptions(), const RunCallbacks &callbacks = RunCallbacks())
    {
        return runner_->run(path("input"), path("output"), path("trash"), options, callbacks, controls_);
    }

    size_t countFiles(const std::string &relative_dir)
    {
        std::error_code ec;
        if (!fs::exists(path(relative_dir), ec))
            return 0;
        size_t count = 0;
        for (const auto &entry : fs::recursive_directory_iterator(path(relative_dir)))
        {
            if (entry.is_regular_file())
                count++;
        }
        return count;
    }

    // Creates count uniquely-named files with unique content, each dated one minute apart
    void createNumberedImages(int count)
    {
        for (int i = 0; i < count; ++i)
        {
            char name[32];
            std::snprintf(name, sizeof(name), "IMG_%03d.jpg", i);
            createFile(std::string("input/") + name, "content " + std::to_string(i));
            char date[32];
            std::snprintf(date, sizeof(date), "2023:05:01 %02d:%02d:00", i / 60, i % 60);
            image_source_.setTags(name, {{"DateTimeOriginal", date}});
        }
    }

    bool waitForState(PipelineState state, int timeout_ms = 5000)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (runner_->getRunState().state == state)
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }
};

TEST_F(PipelineRunnerTest, OrganizesByDateAndPlace)
{
    createFile("input/IMG_0001.jpg", "jpeg bytes");
    image_source_.setTags("IMG_0001.jpg", {{"DateTimeOriginal", "2023:05:01 14:30:00"},
                                           {"GPSLatitude", "40.8109"},
                                           {"GPSLatitudeRef", "N"},
                                           {"GPSLongitude", "96.6901"},
                                           {"GPSLongitudeRef", "W"}});

    auto report = runDefault();

    EXPECT_EQ(report.state, PipelineState::COMPLETED);
    EXPECT_EQ(report.total, 1u);
    EXPECT_EQ(report.organized, 1u);
    EXPECT_TRUE(fs::exists(path("output/2023/2023-05/20230501_143000_Lincoln_USA.jpg")));
    EXPECT_FALSE(fs::exists(path("input/IMG_0001.jpg")));
    EXPECT_EQ(geocoder_.getCalls(), 1);
    EXPECT_NEAR(geocoder_.getLastLatitude(), 40.8109, 1e-9);
    EXPECT_NEAR(geocoder_.getLastLongitude(), -96.6901, 1e-9);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].outcome, Outcome::ORGANIZED);
    EXPECT_EQ(report.outcomes[0].final_path, path("output/2023/2023-05/20230501_143000_Lincoln_USA.jpg"));
}

TEST_F(PipelineRunnerTest, ExactDuplicateGoesToTrash)
{
    createFile("input/a/IMG_0001.jpg", "identical bytes");
    createFile("input/b/IMG_0001.jpg", "identical bytes");
    image_source_.setTags("IMG_0001.jpg", {{"DateTimeOriginal", "2023:05:01 14:30:00"}});

    PipelineOptions options;
    options.naming_convention = NamingConvention::DATE;
    auto report = runDefault(options);

    EXPECT_EQ(report.state, PipelineState::COMPLETED);
    EXPECT_EQ(report.organized, 1u);
    EXPECT_EQ(report.quarantined, 1u);
    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.outcomes[0].source_path, path("input/a/IMG_0001.jpg"));
    EXPECT_EQ(report.outcomes[0].outcome, Outcome::ORGANIZED);
    EXPECT_EQ(report.outcomes[1].outcome, Outcome::QUARANTINED);
    EXPECT_TRUE(fs::exists(path("output/2023/2023-05/20230501_143000.jpg")));
    EXPECT_TRUE(fs::exists(path("trash/IMG_0001.jpg")));
    EXPECT_EQ(image_source_.getCalls(), 1);
}

TEST_F(PipelineRunnerTest, GpsLessImageGetsUnknownLocation)
{
    createFile("input/IMG_0002.jpg", "no gps");
    image_source_.setTags("IMG_0002.jpg", {{"DateTimeOriginal", "2022:11:30 07:00:00"}});

    auto report = runDefault();

    EXPECT_EQ(report.organized, 1u);
    EXPECT_TRUE(fs::exists(path("output/2022/2022-11/20221130_070000_Unknown_Location.jpg")));
    EXPECT_EQ(geocoder_.getCalls(), 0);
}

TEST_F(PipelineRunnerTest, VideosDeduplicateExactlyUnderPerceptual)
{
    createFile("input/clip_a.mp4", "same video bytes");
    createFile("input/clip_b.mp4", "same video bytes");
    video_source_.setTags("clip_a.mp4", {{"RecordedDate", "2020-08-15 18:00:00"}});

    PipelineOptions options;
    options.duplicate_strategy = DuplicateStrategy::PERCEPTUAL;
    options.naming_convention = NamingConvention::DATE;
    auto report = runDefault(options);

    EXPECT_EQ(report.organized, 1u);
    EXPECT_EQ(report.quarantined, 1u);
    EXPECT_TRUE(fs::exists(path("output/2020/2020-08/20200815_180000.mp4")));
    EXPECT_TRUE(fs::exists(path("trash/clip_b.mp4")));
}

TEST_F(PipelineRunnerTest, SkipsUnsupportedAndFilteredFiles)
{
    createFile("input/notes.txt", "text");
    createFile("input/IMG_0003.png", "png bytes");
    createFile("input/IMG_0004.jpg", "jpg bytes");

    PipelineOptions options;
    options.included_extensions = std::set<std::string>{"jpg"};
    auto report = runDefault(options);

    EXPECT_EQ(report.state, PipelineState::COMPLETED);
    EXPECT_EQ(report.total, 3u);
    EXPECT_EQ(report.processed, 3u);
    EXPECT_EQ(report.skipped, 2u);
    EXPECT_EQ(report.organized, 1u);
    EXPECT_TRUE(fs::exists(path("input/notes.txt")));
    EXPECT_TRUE(fs::exists(path("input/IMG_0003.png")));
    for (const auto &outcome : report.outcomes)
    {
        if (outcome.outcome == Outcome::SKIPPED)
            EXPECT_EQ(outcome.error_kind, ErrorKind::UNSUPPORTED_CONTENT);
    }
}

TEST_F(PipelineRunnerTest, EmptyExtensionFilterSkipsEverything)
{
    createFile("input/IMG_0005.jpg", "jpg bytes");
    createFile("input/clip.mp4", "mp4 bytes");

    PipelineOptions options;
    options.included_extensions = std::set<std::string>();
    auto report = runDefault(options);

    EXPECT_EQ(report.state, PipelineState::COMPLETED);
    EXPECT_EQ(report.skipped, 2u);
    EXPECT_EQ(report.organized, 0u);
    EXPECT_TRUE(fs::exists(path("input/IMG_0005.jpg")));
    EXPECT_TRUE(fs::exists(path("input/clip.mp4")));
}

TEST_F(PipelineRunnerTest, DisabledCategoriesSkipEverything)
{
    createFile("input/IMG_0006.jpg", "jpg bytes");
    createFile("input/clip.mov", "mov bytes");

    PipelineOptions options;
    options.media_extensions = MediaExtensions();
    auto report = runDefault(options);

    EXPECT_EQ(report.skipped, 2u);
    EXPECT_EQ(report.organized, 0u);
    EXPECT_EQ(image_source_.getCalls(), 0);
    EXPECT_EQ(video_source_.getCalls(), 0);
    for (const auto &outcome : report.outcomes)
        EXPECT_EQ(outcome.error_kind, ErrorKind::UNSUPPORTED_CONTENT);
}

TEST_F(PipelineRunnerTest, ConfiguredExtensionIsClassified)
{
    createFile("input/IMG_0007.webp", "webp bytes");
    image_source_.setTags("IMG_0007.webp", {{"DateTimeOriginal", "2021:07:04 09:15:00"}});

    PipelineOptions options;
    options.naming_convention = NamingConvention::DATE;
    options.media_extensions.images.push_back("webp");
    auto report = runDefault(options);

    EXPECT_EQ(report.organized, 1u);
    EXPECT_EQ(image_source_.getCalls(), 1);
    EXPECT_TRUE(fs::exists(path("output/2021/2021-07/20210704_091500.webp")));
}

TEST_F(PipelineRunnerTest, ExtractionFailureLeavesFileInPlace)
{
    createFile("input/broken.jpg", "broken");
    createFile("input/fine.jpg", "fine");
    image_source_.setFailure("broken.jpg", "unreadable EXIF");

    auto report = runDefault();

    EXPECT_EQ(report.state, PipelineState::COMPLETED);
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_EQ(report.organized, 1u);
    EXPECT_TRUE(fs::exists(path("input/broken.jpg")));
    EXPECT_EQ(report.outcomes[0].error_kind, ErrorKind::EXTRACTION_FAILURE);
}

TEST_F(PipelineRunnerTest, MissingInputFailsWithoutTouchingFiles)
{
    createFile("elsewhere/IMG_0001.jpg", "bytes");

    auto report = runner_->run(path("nope"), path("output"), path("trash"), PipelineOptions(), RunCallbacks(), controls_);

    EXPECT_EQ(report.state, PipelineState::FAILED);
    EXPECT_FALSE(report.failure_message.empty());
    EXPECT_EQ(report.processed, 0u);
    EXPECT_TRUE(fs::exists(path("elsewhere/IMG_0001.jpg")));
    EXPECT_EQ(runner_->getRunState().state, PipelineState::FAILED);
}

TEST_F(PipelineRunnerTest, CallbacksReportProgressAndStatus)
{
    createNumberedImages(4);
    std::vector<int> progress;
    std::vector<std::string> statuses;
    std::vector<std::string> logs;

    RunCallbacks callbacks;
    callbacks.on_progress = [&](int percent)
    { progress.push_back(percent); };
    callbacks.on_status = [&](const std::string &status)
    { statuses.push_back(status); };
    callbacks.on_log = [&](const std::string &message)
    { logs.push_back(message); };

    auto report = runDefault(PipelineOptions(), callbacks);

    EXPECT_EQ(report.state, PipelineState::COMPLETED);
    EXPECT_EQ(progress, (std::vector<int>{25, 50, 75, 100}));
    ASSERT_GE(statuses.size(), 4u);
    EXPECT_EQ(statuses[0], "IMG_000.jpg");
    EXPECT_EQ(statuses.back(), "COMPLETED");
    EXPECT_GE(logs.size(), 4u);
}

TEST_F(PipelineRunnerTest, PauseHoldsAtFileBoundary)
{
    createNumberedImages(100);
    std::atomic<int> completed_files{0};

    RunCallbacks callbacks;
    callbacks.on_progress = [&](int)
    {
        if (++completed_files == 50)
            controls_.pause();
    };

    auto future = runner_->runAsync(path("input"), path("output"), path("trash"), PipelineOptions(), callbacks, controls_);

    ASSERT_TRUE(waitForState(PipelineState::PAUSED));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    RunState paused = runner_->getRunState();
    EXPECT_EQ(paused.processed, 50u);
    EXPECT_EQ(paused.total, 100u);
    EXPECT_TRUE(paused.paused);
    EXPECT_EQ(countFiles("output"), 50u);
    EXPECT_EQ(countFiles("input"), 50u);
    EXPECT_TRUE(fs::exists(path("input/IMG_050.jpg")));

    controls_.resume();
    auto report = future.get();

    EXPECT_EQ(report.state, PipelineState::COMPLETED);
    EXPECT_EQ(report.processed, 100u);
    EXPECT_EQ(countFiles("output"), 100u);
}

TEST_F(PipelineRunnerTest, CancelWhilePausedStops)
{
    createNumberedImages(10);
    std::atomic<int> completed_files{0};

    RunCallbacks callbacks;
    callbacks.on_progress = [&](int)
    {
        if (++completed_files == 3)
            controls_.pause();
    };

    auto future = runner_->runAsync(path("input"), path("output"), path("trash"), PipelineOptions(), callbacks, controls_);

    ASSERT_TRUE(waitForState(PipelineState::PAUSED));
    controls_.cancel();
    auto report = future.get();

    EXPECT_EQ(report.state, PipelineState::CANCELLED);
    EXPECT_EQ(report.processed, 3u);
    EXPECT_EQ(countFiles("output"), 3u);
    EXPECT_EQ(countFiles("input"), 7u);
    EXPECT_EQ(runner_->getRunState().state, PipelineState::CANCELLED);
}

TEST_F(PipelineRunnerTest, CancelBeforeStartProcessesNothing)
{
    createNumberedImages(3);
    controls_.cancel();

    auto report = runDefault();

    EXPECT_EQ(report.state, PipelineState::CANCELLED);
    EXPECT_EQ(report.processed, 0u);
    EXPECT_EQ(countFiles("input"), 3u);
}

TEST_F(PipelineRunnerTest, RerunOnOrganizedTreeLosesNothing)
{
    createNumberedImages(5);
    // Two files share a timestamp so one of them carries a collision suffix
    createFile("input/IMG_extra.jpg", "extra content");
    image_source_.setTags("IMG_extra.jpg", {{"DateTimeOriginal", "2023:05:01 00:00:00"}});

    auto first = runDefault();
    ASSERT_EQ(first.state, PipelineState::COMPLETED);
    ASSERT_EQ(countFiles("output"), 6u);

    // The organized copies keep their capture dates
    for (int i = 0; i < 5; ++i)
    {
        char name[64];
        std::snprintf(name, sizeof(name), "20230501_00%02d00_Unknown_Location.jpg", i);
        char date[32];
        std::snprintf(date, sizeof(date), "2023:05:01 00:%02d:00", i);
        image_source_.setTags(name, {{"DateTimeOriginal", date}});
    }
    image_source_.setTags("20230501_000000_Unknown_Location_1.jpg", {{"DateTimeOriginal", "2023:05:01 00:00:00"}});
    ASSERT_TRUE(fs::exists(path("output/2023/2023-05/20230501_000000_Unknown_Location_1.jpg")));

    std::vector<std::string> before = FileUtils::collectFiles(path("output"));
    auto second = runner_->run(path("output"), path("output"), path("trash"), PipelineOptions(), RunCallbacks(), controls_);
    std::vector<std::string> after = FileUtils::collectFiles(path("output"));

    EXPECT_EQ(second.state, PipelineState::COMPLETED);
    EXPECT_EQ(second.organized, 6u);
    EXPECT_EQ(before, after);
    EXPECT_EQ(countFiles("trash"), 0u);
}

TEST(ConsoleProgressTest, StatusAndPercentShareOneLine)
{
    std::ostringstream out;
    ConsoleProgress console(out);
    RunCallbacks callbacks = console.callbacks();

    callbacks.on_status("Scanning input");
    callbacks.on_progress(50);
    callbacks.on_status("Processing IMG_0001.jpg");

    EXPECT_EQ(out.str(), "\r\033[K[0%] Scanning input"
                         "\r\033[K[50%] Scanning input"
                         "\r\033[K[50%] Processing IMG_0001.jpg");
}

TEST_F(PipelineRunnerTest, RunReportsStatusToConsole)
{
    createFile("input/IMG_0008.jpg", "jpg bytes");
    image_source_.setTags("IMG_0008.jpg", {{"DateTimeOriginal", "2023:05:01 14:30:00"}});

    std::ostringstream out;
    ConsoleProgress console(out);
    auto report = runDefault(PipelineOptions(), console.callbacks());

    EXPECT_EQ(report.organized, 1u);
    EXPECT_NE(out.str().find("[100%]"), std::string::npos);
    EXPECT_NE(out.str().find("IMG_0008.jpg"), std::string::npos);
}
