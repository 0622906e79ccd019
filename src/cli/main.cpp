// barrace: render a bar race video or preview image from a CSV table.
//
// Usage:
//   barrace --input <file> [options]
//     --series <ticker>      Series ticker, used for the title and file name
//     --title <text>         Chart title (default: derived from --series)
//     --output <file.mp4>    Video path (default: <output_dir>/<series>_<time>.mp4)
//     --preview <file.png>   Write a single preview frame instead of a video
//     --fps <N>              Frame rate (default: 30)
//     --duration <sec>       Video length in seconds (default: 8)
//     --max-candidates <N>   Bars shown (default: 8)
//     --no-gridlines         Hide vertical gridlines
//     --font <path>          Display font (default: <assets>/DharmaGothicE-ExBold.ttf)
//     --logo <path>          Logo image (default: <assets>/novig_logo.png)
//     --log-level <level>    debug|info|warning|error (default: info)
//     --log-file <path>      Also append log lines to a file

#include <barrace/assets.hpp>
#include <barrace/bar_race.hpp>
#include <barrace/csv_table.hpp>
#include <barrace/error.hpp>
#include <barrace/logger.hpp>
#include <barrace/series_naming.hpp>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace barrace;

struct CliOptions
{
    std::string                input;
    std::string                series;
    std::optional<std::string> title;
    std::string                output;
    std::string                preview;
    int                        fps            = 30;
    double                     duration       = 8.0;
    int                        max_candidates = 8;
    bool                       show_gridlines = true;
    std::string                font;
    std::string                logo;
    std::string                log_level = "info";
    std::string                log_file;
};

static void print_usage()
{
    fprintf(stderr,
            "Usage: barrace --input <file> [options]\n"
            "  --series <ticker>      Series ticker, used for the title and file name\n"
            "  --title <text>         Chart title (default: derived from --series)\n"
            "  --output <file.mp4>    Video path (default: <output_dir>/<series>_<time>.mp4)\n"
            "  --preview <file.png>   Write a single preview frame instead of a video\n"
            "  --fps <N>              Frame rate (default: 30)\n"
            "  --duration <sec>       Video length in seconds (default: 8)\n"
            "  --max-candidates <N>   Bars shown (default: 8)\n"
            "  --no-gridlines         Hide vertical gridlines\n"
            "  --font <path>          Display font\n"
            "  --logo <path>          Logo image\n"
            "  --log-level <level>    debug|info|warning|error\n"
            "  --log-file <path>      Also append log lines to a file\n"
            "\n"
            "Environment:\n"
            "  BARRACE_OUTPUT_DIR     Default video directory (else $HOME/Downloads)\n"
            "  BARRACE_ASSETS_DIR     Font and logo directory (else ./assets)\n");
}

// Throws std::invalid_argument (or std::stoi's errors) for an unusable command line.
static void parse_args(int argc, char** argv, CliOptions& opts)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg       = argv[i];
        auto        need_next = [&]() -> const char*
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--input")
            opts.input = need_next();
        else if (arg == "--series")
            opts.series = need_next();
        else if (arg == "--title")
            opts.title = need_next();
        else if (arg == "--output")
            opts.output = need_next();
        else if (arg == "--preview")
            opts.preview = need_next();
        else if (arg == "--fps")
            opts.fps = std::stoi(need_next());
        else if (arg == "--duration")
            opts.duration = std::stod(need_next());
        else if (arg == "--max-candidates")
            opts.max_candidates = std::stoi(need_next());
        else if (arg == "--no-gridlines")
            opts.show_gridlines = false;
        else if (arg == "--font")
            opts.font = need_next();
        else if (arg == "--logo")
            opts.logo = need_next();
        else if (arg == "--log-level")
            opts.log_level = need_next();
        else if (arg == "--log-file")
            opts.log_file = need_next();
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            exit(0);
        }
        else
            throw std::invalid_argument("unknown option " + arg);
    }

    if (opts.input.empty())
        throw std::invalid_argument("--input is required");
}

static std::string env_or(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    return value && *value ? std::string(value) : fallback;
}

static std::string default_output_path(const std::string& series)
{
    const char* home = std::getenv("HOME");
    fs::path    dir  = env_or("BARRACE_OUTPUT_DIR", home ? (fs::path(home) / "Downloads").string() : ".");

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        BARRACE_LOG_WARN("cli", "Cannot create {}: {}", dir.string(), ec.message());

    std::time_t now = std::time(nullptr);
    std::tm     local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    std::string stem = series.empty() ? "bar_race" : series;
    return (dir / (stem + "_" + stamp + ".mp4")).string();
}

static std::string with_mp4_extension(const std::string& path)
{
    if (fs::path(path).extension() == ".mp4")
        return path;
    return path + ".mp4";
}

static bool write_file(const std::string& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open())
        return false;
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

static int run(const CliOptions& opts)
{
    SeriesTable table = load_series_csv(opts.input);

    ChartOptions chart;
    chart.title          = opts.title ? *opts.title : (opts.series.empty() ? "BAR RACE" : default_title(opts.series));
    chart.fps            = opts.fps;
    chart.duration       = opts.duration;
    chart.max_candidates = opts.max_candidates;
    chart.show_gridlines = opts.show_gridlines;

    AssetPaths paths = default_asset_paths(env_or("BARRACE_ASSETS_DIR", "assets"));
    if (!opts.font.empty())
        paths.font = opts.font;
    if (!opts.logo.empty())
        paths.logo = opts.logo;
    RenderAssets assets = load_render_assets(paths, format_spec(chart.format));

    if (!opts.preview.empty())
    {
        std::vector<uint8_t> png = create_preview_image(table, chart, 0.8, std::move(assets));
        if (!write_file(opts.preview, png))
        {
            BARRACE_LOG_ERROR("cli", "Cannot write {}", opts.preview);
            return 1;
        }
        BARRACE_LOG_INFO("cli", "Preview written to {}", opts.preview);
        return 0;
    }

    std::string output = opts.output.empty() ? default_output_path(opts.series) : with_mp4_extension(opts.output);
    std::string path   = create_bar_race_video(table, chart, output, std::move(assets));
    printf("%s\n", path.c_str());
    return 0;
}

int main(int argc, char** argv)
{
    auto& logger = Logger::instance();
    logger.add_sink(sinks::console_sink());

    CliOptions opts;
    try
    {
        parse_args(argc, argv, opts);
    }
    catch (const std::exception& e)
    {
        fprintf(stderr, "barrace: %s\n\n", e.what());
        print_usage();
        return 1;
    }

    LogLevel level;
    if (!Logger::parse_level(opts.log_level, level))
    {
        fprintf(stderr, "barrace: unknown log level '%s'\n", opts.log_level.c_str());
        return 1;
    }
    logger.set_level(level);
    if (!opts.log_file.empty())
    {
        try
        {
            logger.add_sink(sinks::file_sink(opts.log_file));
        }
        catch (const std::runtime_error& e)
        {
            BARRACE_LOG_ERROR("cli", "{}", e.what());
            return 1;
        }
    }

    try
    {
        return run(opts);
    }
    catch (const InvalidConfigurationError& e)
    {
        BARRACE_LOG_ERROR("cli", "Invalid configuration: {}", e.what());
    }
    catch (const InsufficientDataError& e)
    {
        BARRACE_LOG_ERROR("cli", "Not enough data: {}", e.what());
    }
    catch (const EncodingError& e)
    {
        BARRACE_LOG_ERROR("cli", "Encoding failed: {}", e.what());
    }
    catch (const std::exception& e)
    {
        BARRACE_LOG_ERROR("cli", "{}", e.what());
    }
    return 1;
}
