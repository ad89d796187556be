// SPDX-License-Identifier: MIT
// Program entry point.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "buildconf.hpp"
#include "heifcontext.hpp"
#include "heiflibrary.hpp"
#include "imageinfo.hpp"
#include "log.hpp"

#include <getopt.h>

#include <array>
#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <optional>
#include <tuple>
#include <vector>

/** Command line arguments. */
struct cmdarg {
    const char short_opt; ///< Short option character
    const char* long_opt; ///< Long option name
    const char* format;   ///< Format description
    const char* help;     ///< Help string
};
static constexpr std::array arguments = std::to_array<cmdarg>({
    { 'j', "json",              nullptr,    "print image info in JSON format"  },
    { 'f', "format",            "hevc|av1", "output compression format"        },
    { 'q', "quality",           "N",        "lossy quality (0-100)"            },
    { 'L', "lossless",          nullptr,    "use lossless compression"         },
    { 'd', "decoder",           "ID",       "use specified decoder plugin"     },
    { 's', "strict",            nullptr,    "strict decoding"                  },
    { 't', "ignore-transforms", nullptr,    "ignore crop/rotate/mirror"        },
    { '8', "hdr-to-8bit",       nullptr,    "convert HDR images to 8 bit"      },
    { 'V', "verbose",           nullptr,    "verbose output"                   },
    { 'v', "version",           nullptr,    "print version info and exit"      },
    { 'h', "help",              nullptr,    "print this help and exit"         },
});

/** Startup parameters. */
struct Params {
    std::filesystem::path input;
    std::filesystem::path output;
    bool json = false;
    heif_compression_format format = heif_compression_HEVC;
    std::optional<int> quality;
    bool lossless = false;
    HeifDecodingOptions decoding;
};

/**
 * Get short and long options in getopt format.
 * @return short and long options in getopt format.
 */
static std::tuple<std::string, std::vector<option>> get_opts()
{
    std::string short_opts;
    short_opts.reserve(arguments.size() * 2);
    std::vector<option> long_opts;
    long_opts.reserve(arguments.size() + 1);

    // fill options
    for (auto& it : arguments) {
        short_opts += it.short_opt;
        if (it.format) {
            short_opts += ':';
        }
        long_opts.push_back({
            it.long_opt,
            it.format ? required_argument : no_argument,
            nullptr,
            it.short_opt,
        });
    }
    long_opts.push_back({});

    return std::make_tuple(short_opts, long_opts);
}

/**
 * Print usage info.
 */
static void print_help()
{
    puts("Usage: " APP_NAME " [OPTION]... INPUT [OUTPUT]");
    puts("Print info about HEIF/AVIF file INPUT.");
    puts("If OUTPUT is specified, recompress the primary image to OUTPUT.\n");
    puts("Mandatory arguments to long options are mandatory for short options "
         "too.");

    for (auto& it : arguments) {
        std::string lopt;
        if (it.format) {
            lopt = std::format("{}={}", it.long_opt, it.format);
        } else {
            lopt = it.long_opt;
        }
        printf("  -%c, --%-24s %s\n", it.short_opt, lopt.c_str(), it.help);
    }
}

/**
 * Print version info.
 */
static void print_version()
{
    puts(APP_NAME " version " APP_VERSION ".");
    printf("libheif version %s.\n", HeifLibrary::version().c_str());

    HeifLibrary::Guard guard;
    puts("Decoders:");
    for (const HeifDecoderDescriptor& desc :
         HeifLibrary::decoder_descriptors()) {
        printf("  %-12s %s\n", desc.id.c_str(), desc.name.c_str());
    }
    puts("Encoders:");
    for (const HeifEncoderDescriptor& desc :
         HeifLibrary::encoder_descriptors()) {
        printf("  %-12s %s%s%s\n", desc.id.c_str(), desc.name.c_str(),
               desc.lossy ? ", lossy" : "",
               desc.lossless ? ", lossless" : "");
    }
}

/**
 * Parse compression format name.
 * @param name format name
 * @return compression format
 */
static std::optional<heif_compression_format> parse_format(const char* name)
{
    const std::string_view fmt = name;
    if (fmt == "hevc") {
        return heif_compression_HEVC;
    }
    if (fmt == "av1") {
        return heif_compression_AV1;
    }
    return std::nullopt;
}

/**
 * Parse quality value.
 * @param value text value
 * @return quality in range [0,100]
 */
static std::optional<int> parse_quality(const char* value)
{
    char* end = nullptr;
    const long num = std::strtol(value, &end, 10);
    if (!*value || *end || num < 0 || num > 100) {
        return std::nullopt;
    }
    return static_cast<int>(num);
}

/**
 * Decode primary image and encode it to the output file.
 * @param src source context
 * @param params startup parameters
 */
static void recompress(const HeifContext& src, const Params& params)
{
    const HeifImageHandle handle = src.primary_image_handle();
    const bool alpha = handle.has_alpha();
    HeifImage image =
        handle.decode(heif_colorspace_RGB,
                      alpha ? heif_chroma_interleaved_RGBA
                            : heif_chroma_interleaved_RGB,
                      &params.decoding);

    HeifContext dst;
    HeifEncoder encoder = dst.encoder(params.format);
    Log::debug("Use encoder {}", encoder.name());
    if (params.lossless) {
        encoder.set_lossless(true);
    }
    if (params.quality) {
        encoder.set_lossy_quality(*params.quality);
    }

    HeifEncodingOptions options;
    options.save_alpha_channel = alpha;

    // keep original color profiles
    const std::vector<uint8_t> icc = handle.icc_profile();
    if (!icc.empty()) {
        image.set_icc_profile(icc);
    }
    const std::optional<HeifNclxProfile> nclx = handle.nclx_profile();
    if (nclx) {
        image.set_nclx_profile(*nclx);
        options.set_nclx_profile(true);
        if (!icc.empty() && HeifLibrary::can_write_two_color_profiles()) {
            options.set_two_color_profiles(true);
        }
    }

    const HeifImageHandle encoded = dst.encode_image(image, encoder, &options);
    dst.set_primary_image(encoded);

    const std::vector<uint8_t> exif = handle.exif();
    if (!exif.empty()) {
        dst.add_exif_metadata(encoded, exif);
    }

    dst.write_to_file(params.output);
    Log::info("Primary image saved to {}", params.output.string());
}

/**
 * Run the tool.
 * @param params startup parameters
 */
static void run(const Params& params)
{
    HeifLibrary::Guard guard;

    HeifContext ctx;
    ctx.read_from_file(params.input);

    const nlohmann::json info = ImageInfo::describe(ctx);
    if (params.json) {
        puts(info.dump(2).c_str());
    } else {
        fputs(ImageInfo::to_text(info).c_str(), stdout);
    }

    if (!params.output.empty()) {
        recompress(ctx, params);
    }
}

/**
 * Application entry point.
 */
int main(int argc, char* argv[])
{
    std::setlocale(LC_ALL, "");

    Params params;

    // parse options
    int opt;
    const auto [short_opts, long_opts] = get_opts();
    while ((opt = getopt_long(argc, argv, short_opts.c_str(), long_opts.data(),
                              nullptr)) != -1) {
        switch (opt) {
            case 'j':
                params.json = true;
                break;
            case 'f':
                if (const auto fmt = parse_format(optarg)) {
                    params.format = *fmt;
                } else {
                    Log::error("Invalid compression format: {}", optarg);
                    return EXIT_FAILURE;
                }
                break;
            case 'q':
                params.quality = parse_quality(optarg);
                if (!params.quality) {
                    Log::error("Invalid quality: {}", optarg);
                    return EXIT_FAILURE;
                }
                break;
            case 'L':
                params.lossless = true;
                break;
            case 'd':
                params.decoding.decoder_id = optarg;
                break;
            case 's':
                params.decoding.strict = true;
                break;
            case 't':
                params.decoding.ignore_transformations = true;
                break;
            case '8':
                params.decoding.convert_hdr_to_8bit = true;
                break;
            case 'V':
                Log::verbose_flag() = true;
                break;
            case 'v':
                try {
                    print_version();
                } catch (const std::exception& ex) {
                    Log::error("{}", ex.what());
                    return EXIT_FAILURE;
                }
                return EXIT_SUCCESS;
            case 'h':
                print_help();
                return EXIT_SUCCESS;
            default:
                return EXIT_FAILURE;
        }
    }

    const int positional = argc - optind;
    if (positional < 1 || positional > 2) {
        Log::error("Invalid number of arguments, see --help");
        return EXIT_FAILURE;
    }
    params.input = argv[optind];
    if (positional == 2) {
        params.output = argv[optind + 1];
    }

    try {
        run(params);
    } catch (const std::exception& ex) {
        Log::error("{}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
