#include <gtest/gtest.h>

#include <barrace/error.hpp>
#include <barrace/export.hpp>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

using namespace barrace;

namespace fs = std::filesystem;

namespace
{

bool ffmpeg_available()
{
    return std::system("ffmpeg -version >/dev/null 2>&1") == 0;
}

PixelBuffer solid_frame(uint32_t w, uint32_t h, uint8_t shade)
{
    PixelBuffer buf(w, h);
    for (size_t i = 0; i < buf.rgba.size(); i += 4)
    {
        buf.rgba[i + 0] = shade;
        buf.rgba[i + 1] = 64;
        buf.rgba[i + 2] = 32;
        buf.rgba[i + 3] = 255;
    }
    return buf;
}

class VideoExportTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path()
               / (std::string("barrace_video_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    VideoConfig small_config(const std::string& name) const
    {
        VideoConfig config;
        config.output_path = (dir_ / name).string();
        config.width       = 64;
        config.height      = 64;
        config.fps         = 10;
        return config;
    }

    fs::path dir_;
};

}  // namespace

TEST(VideoExport, PartialPathIsHiddenSibling)
{
    EXPECT_EQ(partial_output_path("/out/race.mp4"), "/out/.race.partial.mp4");
    EXPECT_EQ(partial_output_path("race.mp4"), ".race.partial.mp4");
}

TEST(VideoExport, DefaultEncoderSettings)
{
    VideoConfig config;
    EXPECT_EQ(config.codec, "libx264");
    EXPECT_EQ(config.pix_fmt, "yuv420p");
    EXPECT_EQ(config.bitrate_kbps, 8000);
    EXPECT_EQ(config.container, "mp4");
}

TEST(VideoExport, ZeroFramesIsInsufficientData)
{
    VideoConfig config;
    config.output_path = "/tmp/never_written.mp4";
    EXPECT_THROW(encode_video(config, 0, [](uint32_t) { return PixelBuffer(1080, 1080); }),
                 InsufficientDataError);
}

TEST(VideoExport, InvalidDirectoryLeavesNoFile)
{
    VideoConfig config;
    config.output_path = "/nonexistent_barrace_dir/sub/race.mp4";
    config.width       = 64;
    config.height      = 64;

    EXPECT_THROW(encode_video(config, 5, [](uint32_t) { return solid_frame(64, 64, 0); }), EncodingError);
    EXPECT_FALSE(fs::exists(config.output_path));
    EXPECT_FALSE(fs::exists(partial_output_path(config.output_path)));
}

#ifdef BARRACE_USE_FFMPEG

TEST_F(VideoExportTest, CommandCarriesEncoderSettings)
{
    fs::create_directories(dir_ / "it's here");
    VideoConfig config;
    config.output_path = (dir_ / "it's here" / "race.mp4").string();
    VideoExporter exporter(config);
    std::string   cmd = exporter.command();
    exporter.abort();

    EXPECT_NE(cmd.find("-s 1080x1080"), std::string::npos) << cmd;
    EXPECT_NE(cmd.find("-r 30"), std::string::npos) << cmd;
    EXPECT_NE(cmd.find("-c:v libx264"), std::string::npos) << cmd;
    EXPECT_NE(cmd.find("-pix_fmt yuv420p"), std::string::npos) << cmd;
    EXPECT_NE(cmd.find("-b:v 8000k"), std::string::npos) << cmd;
    EXPECT_NE(cmd.find("-f mp4"), std::string::npos) << cmd;
    EXPECT_NE(cmd.find("'\\''"), std::string::npos) << cmd;
}

TEST_F(VideoExportTest, EncodesFrames)
{
    if (!ffmpeg_available())
        GTEST_SKIP() << "ffmpeg not installed";

    VideoConfig config = small_config("race.mp4");
    std::string path =
        encode_video(config, 10, [](uint32_t i) { return solid_frame(64, 64, static_cast<uint8_t>(i * 20)); });

    EXPECT_EQ(path, config.output_path);
    ASSERT_TRUE(fs::exists(path));
    EXPECT_GT(fs::file_size(path), 0u);
    EXPECT_FALSE(fs::exists(partial_output_path(path)));
}

TEST_F(VideoExportTest, WrongFrameSizeRemovesOutput)
{
    if (!ffmpeg_available())
        GTEST_SKIP() << "ffmpeg not installed";

    VideoConfig config = small_config("bad_size.mp4");
    EXPECT_THROW(encode_video(config, 3, [](uint32_t) { return solid_frame(32, 32, 0); }), EncodingError);
    EXPECT_FALSE(fs::exists(config.output_path));
    EXPECT_FALSE(fs::exists(partial_output_path(config.output_path)));
}

TEST_F(VideoExportTest, RenderFailureRemovesOutput)
{
    if (!ffmpeg_available())
        GTEST_SKIP() << "ffmpeg not installed";

    VideoConfig config = small_config("render_fail.mp4");
    auto        render = [](uint32_t i)
    {
        if (i == 4)
            throw std::runtime_error("render failed");
        return solid_frame(64, 64, 0);
    };
    EXPECT_THROW(encode_video(config, 10, render), std::runtime_error);
    EXPECT_FALSE(fs::exists(config.output_path));
    EXPECT_FALSE(fs::exists(partial_output_path(config.output_path)));
}

TEST_F(VideoExportTest, AbortRemovesTemporaryFile)
{
    if (!ffmpeg_available())
        GTEST_SKIP() << "ffmpeg not installed";

    VideoConfig   config = small_config("aborted.mp4");
    VideoExporter exporter(config);
    ASSERT_TRUE(exporter.is_open()) << exporter.error();

    PixelBuffer frame = solid_frame(64, 64, 128);
    EXPECT_TRUE(exporter.write_frame(frame.rgba.data()));
    EXPECT_EQ(exporter.frames_written(), 1u);
    exporter.abort();

    EXPECT_FALSE(exporter.is_open());
    EXPECT_FALSE(fs::exists(exporter.temp_path()));
    EXPECT_FALSE(fs::exists(config.output_path));
}

#endif  // BARRACE_USE_FFMPEG
