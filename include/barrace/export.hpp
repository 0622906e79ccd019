#pragma once

#include <barrace/renderer.hpp>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <vector>

namespace barrace
{

// Produces the pixels of frame i.
using FrameSource = std::function<PixelBuffer(uint32_t frame_index)>;

class ImageExporter
{
   public:
    // Encode an RGBA buffer as PNG. Returns an empty vector on failure.
    static std::vector<uint8_t> encode_png(const uint8_t* rgba_data, uint32_t width, uint32_t height);

    static std::vector<uint8_t> encode_png(const PixelBuffer& buffer)
    {
        return encode_png(buffer.rgba.data(), buffer.width, buffer.height);
    }
};

struct VideoConfig
{
    std::string output_path;
    uint32_t    width        = 1080;
    uint32_t    height       = 1080;
    int         fps          = 30;
    std::string codec        = "libx264";
    std::string pix_fmt      = "yuv420p";
    int         bitrate_kbps = 8000;
    std::string container    = "mp4";
};

#ifdef BARRACE_USE_FFMPEG
// Streams raw RGBA frames into an ffmpeg child process.
//
// ffmpeg writes to a hidden temporary file next to output_path; finish() moves
// it onto output_path only after ffmpeg exits cleanly. abort(), a failed
// finish() or destruction before finish() remove the temporary file, so a
// failed export never leaves a file at output_path.
class VideoExporter
{
   public:
    explicit VideoExporter(const VideoConfig& config);
    ~VideoExporter();

    VideoExporter(const VideoExporter&)            = delete;
    VideoExporter& operator=(const VideoExporter&) = delete;

    bool write_frame(const uint8_t* rgba_data);
    bool finish();
    void abort();

    bool               is_open() const { return pipe_ != nullptr; }
    uint32_t           frames_written() const { return frames_written_; }
    const std::string& error() const { return error_; }
    const std::string& temp_path() const { return temp_path_; }

    // Shell command used to launch ffmpeg.
    std::string command() const;

   private:
    void close_pipe();
    void remove_temp();

    VideoConfig config_;
    FILE*       pipe_ = nullptr;
    std::string temp_path_;
    std::string error_;
    uint32_t    frames_written_ = 0;
};
#endif  // BARRACE_USE_FFMPEG

// Hidden sibling of output_path that keeps its extension:
// /out/race.mp4 -> /out/.race.partial.mp4
std::string partial_output_path(const std::string& output_path);

// Render frames 0..frame_count-1 in order and encode them into
// config.output_path. Returns the path; throws EncodingError (file removed) or
// InsufficientDataError when frame_count is zero.
std::string encode_video(const VideoConfig& config, uint32_t frame_count, const FrameSource& render_fn);

// Render one frame and return it PNG-encoded. Writes no file.
std::vector<uint8_t> snapshot(const FrameSource& render_fn, uint32_t frame_index);

}  // namespace barrace
