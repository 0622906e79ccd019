#include <barrace/error.hpp>
#include <barrace/export.hpp>
#include <barrace/logger.hpp>

#include <filesystem>
#include <system_error>

#ifdef BARRACE_USE_FFMPEG
    #include <csignal>
    #include <sstream>
    #include <sys/wait.h>
#endif

namespace barrace
{

namespace fs = std::filesystem;

std::string partial_output_path(const std::string& output_path)
{
    fs::path out(output_path);
    fs::path name = "." + out.stem().string() + ".partial" + out.extension().string();
    return (out.parent_path() / name).string();
}

#ifdef BARRACE_USE_FFMPEG

namespace
{

// Single-quote a path for /bin/sh.
std::string shell_quote(const std::string& s)
{
    std::string out = "'";
    for (char c : s)
    {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

// A dead ffmpeg must surface as a short write, not kill the process.
class SigpipeGuard
{
   public:
    SigpipeGuard()
    {
        struct sigaction ignore{};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }

    ~SigpipeGuard()
    {
        if (installed_)
            sigaction(SIGPIPE, &previous_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&)            = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

   private:
    struct sigaction previous_{};
    bool             installed_ = false;
};

}  // namespace

VideoExporter::VideoExporter(const VideoConfig& config) : config_(config)
{
    if (config_.output_path.empty())
    {
        error_ = "No output path given";
        return;
    }
    if (config_.width == 0 || config_.height == 0 || config_.fps <= 0)
    {
        error_ = "Invalid video geometry";
        return;
    }

    fs::path        parent = fs::path(config_.output_path).parent_path();
    std::error_code ec;
    if (!parent.empty() && !fs::is_directory(parent, ec))
    {
        error_ = "Output directory does not exist: " + parent.string();
        return;
    }

    temp_path_ = partial_output_path(config_.output_path);
    fs::remove(temp_path_, ec);

    std::string cmd = command();
    BARRACE_LOG_DEBUG("export", "Launching: {}", cmd);

    pipe_ = popen(cmd.c_str(), "w");
    if (!pipe_)
        error_ = "Failed to launch ffmpeg";
}

VideoExporter::~VideoExporter()
{
    if (pipe_)
        abort();
}

std::string VideoExporter::command() const
{
    // ffmpeg -y -f rawvideo -vcodec rawvideo -pix_fmt rgba -s WxH -r FPS -i -
    //        -c:v CODEC -pix_fmt PIX_FMT -b:v RATEk -f CONTAINER TEMP
    std::ostringstream cmd;
    cmd << "ffmpeg -y -loglevel error"
        << " -f rawvideo"
        << " -vcodec rawvideo"
        << " -pix_fmt rgba"
        << " -s " << config_.width << "x" << config_.height << " -r " << config_.fps << " -i -"
        << " -an"
        << " -c:v " << config_.codec << " -pix_fmt " << config_.pix_fmt << " -b:v "
        << config_.bitrate_kbps << "k"
        << " -f " << config_.container << " " << shell_quote(temp_path_) << " 2>/dev/null";
    return cmd.str();
}

bool VideoExporter::write_frame(const uint8_t* rgba_data)
{
    if (!pipe_ || !rgba_data)
    {
        return false;
    }

    SigpipeGuard guard;

    size_t frame_bytes = static_cast<size_t>(config_.width) * static_cast<size_t>(config_.height) * 4;
    size_t written     = std::fwrite(rgba_data, 1, frame_bytes, pipe_);
    if (written != frame_bytes)
    {
        error_ = "ffmpeg stopped accepting frames after " + std::to_string(frames_written_);
        return false;
    }
    ++frames_written_;
    return true;
}

bool VideoExporter::finish()
{
    if (!pipe_)
    {
        if (error_.empty())
            error_ = "Encoder is not running";
        return false;
    }

    int status;
    {
        SigpipeGuard guard;
        status = pclose(pipe_);
        pipe_  = nullptr;
    }

    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        error_ = "ffmpeg failed (status " + std::to_string(status == -1 ? -1 : WEXITSTATUS(status)) + ")";
        remove_temp();
        return false;
    }

    std::error_code ec;
    fs::rename(temp_path_, config_.output_path, ec);
    if (ec)
    {
        error_ = "Cannot move video into place: " + ec.message();
        remove_temp();
        return false;
    }
    return true;
}

void VideoExporter::abort()
{
    close_pipe();
    remove_temp();
}

void VideoExporter::close_pipe()
{
    if (pipe_)
    {
        SigpipeGuard guard;
        pclose(pipe_);
        pipe_ = nullptr;
    }
}

void VideoExporter::remove_temp()
{
    if (temp_path_.empty())
        return;
    std::error_code ec;
    fs::remove(temp_path_, ec);
}

#endif  // BARRACE_USE_FFMPEG

std::string encode_video(const VideoConfig& config, uint32_t frame_count, const FrameSource& render_fn)
{
    if (frame_count == 0)
        throw InsufficientDataError("No frames to encode");

#ifdef BARRACE_USE_FFMPEG
    VideoExporter exporter(config);
    if (!exporter.is_open())
        throw EncodingError(exporter.error());

    BARRACE_LOG_INFO("export",
                     "Encoding {} frames at {} fps to {}",
                     frame_count,
                     config.fps,
                     config.output_path);

    for (uint32_t i = 0; i < frame_count; ++i)
    {
        PixelBuffer frame = render_fn(i);
        if (frame.width != config.width || frame.height != config.height)
        {
            exporter.abort();
            throw EncodingError("Frame " + std::to_string(i) + " is " + std::to_string(frame.width) + "x"
                                + std::to_string(frame.height) + ", expected "
                                + std::to_string(config.width) + "x" + std::to_string(config.height));
        }
        if (!exporter.write_frame(frame.rgba.data()))
        {
            std::string reason = exporter.error();
            exporter.abort();
            BARRACE_LOG_ERROR("export", "Encoding failed at frame {}: {}", i, reason);
            throw EncodingError(reason);
        }
        if ((i + 1) % 60 == 0)
            BARRACE_LOG_DEBUG("export", "Encoded {}/{} frames", i + 1, frame_count);
    }

    if (!exporter.finish())
    {
        BARRACE_LOG_ERROR("export", "Encoding failed: {}", exporter.error());
        throw EncodingError(exporter.error());
    }

    BARRACE_LOG_INFO("export", "Wrote {}", config.output_path);
    return config.output_path;
#else
    (void)config;
    (void)render_fn;
    throw EncodingError("Video export requires a build with BARRACE_USE_FFMPEG");
#endif
}

std::vector<uint8_t> snapshot(const FrameSource& render_fn, uint32_t frame_index)
{
    PixelBuffer          frame = render_fn(frame_index);
    std::vector<uint8_t> png   = ImageExporter::encode_png(frame);
    if (png.empty())
        throw EncodingError("PNG encoding failed for frame " + std::to_string(frame_index));
    return png;
}

}  // namespace barrace
