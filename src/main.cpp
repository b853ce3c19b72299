#include "image/image.hpp"
#include "imgconv.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define RET_OK 0
#define RET_ERROR 1

struct ConvertOptions {
    fs::path src, dst;
    std::string format = "webp";
    int quality = 80;
    int width = 0;
    int height = 0;
};

ConvertOptions to_base64_opts, to_disk_opts;

struct {
    fs::path src;
} image_check_opts;

void AddConvertOptions(CLI::App *cmd, ConvertOptions &opts) {
    cmd->add_option("-s,--src", opts.src)->required();
    cmd->add_option("-f,--format", opts.format, "Output format (jpeg, png, gif, webp, bmp, avif)");
    cmd->add_option("-q,--quality", opts.quality, "Quality (0-100)");
    cmd->add_option("-W,--width", opts.width, "Target width (0 to keep)");
    cmd->add_option("-H,--height", opts.height, "Target height (0 to keep)");
}

template <typename T>
int core(int argc, T **argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("imgconv"));

    CLI::App app{"Raster image format converter"};
    int ret = RET_OK;

    std::string log_level = "info";
    app.add_option("--loglevel", log_level, "(trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    const auto subcmd_formats = app.add_subcommand("formats", "Image::GetSupportedFormats")->fallthrough();

    const auto subcmd_image_check = app.add_subcommand("image_check", "Image::EnsureValid")->fallthrough();
    subcmd_image_check->add_option("-s,--src", image_check_opts.src)->required();

    const auto subcmd_to_base64 = app.add_subcommand("to_base64", "Image::ConvertToBase64")->fallthrough();
    AddConvertOptions(subcmd_to_base64, to_base64_opts);

    const auto subcmd_to_disk = app.add_subcommand("to_disk", "Image::ConvertToDisk")->fallthrough();
    AddConvertOptions(subcmd_to_disk, to_disk_opts);
    subcmd_to_disk->add_option("-d,--dst", to_disk_opts.dst)->required();

    try {
        app.require_subcommand(1);
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        std::cerr << app.help() << std::endl;
        return app.exit(e);
    }

    spdlog::level::level_enum lvl;
    if (log_level == "trace")    lvl = spdlog::level::trace;
    else if (log_level == "debug")   lvl = spdlog::level::debug;
    else if (log_level == "info")    lvl = spdlog::level::info;
    else if (log_level == "warn")    lvl = spdlog::level::warn;
    else if (log_level == "error")   lvl = spdlog::level::err;
    else if (log_level == "critical")lvl = spdlog::level::critical;
    else if (log_level == "off")     lvl = spdlog::level::off;
    else {
        spdlog::warn("Unknown log level '{}', defaulting to 'info'.", log_level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);

    try {
        Image::Initialize();
        if (subcmd_formats->parsed()) {
            for (const auto &mime : Image::GetSupportedFormats()) {
                std::cout << mime << '\n';
            }
        } else if (subcmd_image_check->parsed()) {
            Image::EnsureValid(image_check_opts.src);
            spdlog::info("{} is a supported image", image_check_opts.src.string());
        } else if (subcmd_to_base64->parsed()) {
            const auto &o = to_base64_opts;
            std::cout << Image::ConvertToBase64(o.src, o.format, o.quality, o.width, o.height) << std::endl;
        } else if (subcmd_to_disk->parsed()) {
            const auto &o = to_disk_opts;
            Image::ConvertToDisk(o.src, o.dst, o.format, o.quality, o.width, o.height);
            spdlog::info("Converted {} -> {}", o.src.string(), o.dst.string());
        } else {
            throw std::runtime_error("No subcommand specified.");
        }
    } catch (const imgconv::Error &e) {
        spdlog::error("{}: {}", imgconv::ErrorKindName(e.kind()), e.what());
        ret = RET_ERROR;
    } catch (const std::exception &e) {
        spdlog::error(e.what());
        ret = RET_ERROR;
    }
    return ret;
}

#ifdef _WIN32
int wmain(const int argc, wchar_t **argv) {
    return core(argc, argv);
}
#else
int main(const int argc, char **argv) {
    return core(argc, argv);
}
#endif
