/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_inspector.h"
#include "msgpack/msgpack_text_input.h"
#include "msgpack/msgpack_tree_text.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    std::optional<std::string> text;
    std::optional<fs::path> input_file;
    std::optional<fs::path> output_file;
    mpk::msgpack::InputFormat format = mpk::msgpack::InputFormat::Auto;
    int indent = 2;
    bool tree = false;
    bool show_bytes = false;
    bool debug = false;
    std::size_t max_depth = 512;
};

static void print_usage() {
    MPK_LOG_INFO(
        "Usage:\n" \
        "    msgpack_inspector <text|-> [--format <fmt>] [--tree] [--bytes] [--out <path>] [--indent <n>] [--max-depth <n>] [--debug]\n" \
        "    msgpack_inspector --file <path> [options]\n\n" \
        "Options:\n" \
        "    First argument is the encoded text, or - to read it from stdin\n" \
        "    --format      auto (default), hex, base64 or bytes (b'\\x81...' literal)\n" \
        "    --file        reads the encoded text from a file\n" \
        "    --out         writes the JSON projection to a file instead of stdout\n" \
        "    --indent      JSON indentation, -1 for a single line (default 2)\n" \
        "    --tree        prints the annotated node tree instead of JSON\n" \
        "    --bytes       prints the recovered bytes as hex first\n" \
        "    --max-depth   nesting limit for arrays and maps (default 512)\n" \
        "    --debug       enables extra logging\n"
    );
}

static bool parse_number(std::string_view s, long long& out) {
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

static std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

static int run(const Settings& settings) {
    std::string text;
    if (settings.input_file) {
        text = mpk::fs_utils::read_text_file(*settings.input_file);
    } else if (settings.text && *settings.text == "-") {
        text = read_stdin();
    } else if (settings.text) {
        text = *settings.text;
    }

    mpk::InspectOptions opt{};
    opt.max_depth = settings.max_depth;
    opt.debug = settings.debug;
    const auto res = mpk::MsgpackInspector::Inspect(text, settings.format, opt);
    if (!res.success) {
        MPK_LOG_ERROR(
            "%s: %s",
            std::string(mpk::msgpack::error_kind_name(*res.error_kind)).c_str(),
            res.error_message.c_str()
        );
        return 3;
    }

    if (settings.format == mpk::msgpack::InputFormat::Auto) {
        MPK_LOG_DEBUG(
            settings.debug, "Detected format: %s",
            std::string(mpk::msgpack::input_format_name(res.resolved_format)).c_str()
        );
    }
    if (settings.show_bytes) {
        MPK_LOG_INFO(
            "Bytes [%zu]: %s", res.original_bytes.size(),
            mpk::msgpack::bytes_to_hex(res.original_bytes, " ").c_str()
        );
    }

    std::string rendered;
    if (settings.tree) {
        rendered = mpk::msgpack::render_tree(*res.root);
    } else {
        rendered = mpk::MsgpackInspector::ToJson(*res.root).dump(settings.indent) + "\n";
    }

    if (settings.output_file) {
        mpk::fs_utils::write_text_file(*settings.output_file, rendered);
        MPK_LOG_INFO("Wrote: %s", settings.output_file->string().c_str());
    } else {
        std::fputs(rendered.c_str(), stdout);
        std::fflush(stdout);
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    Settings settings;
    int i = 1;
    const std::string_view first_arg = argv[1];
    if (first_arg == "-" || first_arg.empty() || first_arg[0] != '-') {
        settings.text = std::string(first_arg);
        i = 2;
    }

    for (; i < argc; i++) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--tree") {
            settings.tree = true;
            continue;
        }
        if (arg == "--bytes") {
            settings.show_bytes = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--format") {
            if (!has_value) {
                MPK_LOG_ERROR("Missing value for --format");
                return 2;
            }
            const auto fmt = mpk::msgpack::parse_input_format(argv[++i]);
            if (!fmt) {
                MPK_LOG_ERROR("Unknown format: %s", argv[i]);
                return 2;
            }
            settings.format = *fmt;
            continue;
        }
        if (arg == "--file") {
            if (!has_value) {
                MPK_LOG_ERROR("Missing value for --file");
                return 2;
            }
            settings.input_file = fs::path(argv[++i]);
            continue;
        }
        if (arg == "--out") {
            if (!has_value) {
                MPK_LOG_ERROR("Missing value for --out");
                return 2;
            }
            settings.output_file = fs::path(argv[++i]);
            continue;
        }
        if (arg == "--indent" || arg == "--max-depth") {
            long long v = 0;
            if (!has_value || !parse_number(argv[i + 1], v)) {
                MPK_LOG_ERROR("Missing or invalid number for %s", std::string(arg).c_str());
                return 2;
            }
            i++;
            if (arg == "--indent") {
                settings.indent = v < 0 ? -1 : static_cast<int>(v);
            } else if (v < 0) {
                MPK_LOG_ERROR("--max-depth must be >= 0");
                return 2;
            } else {
                settings.max_depth = static_cast<std::size_t>(v);
            }
            continue;
        }
        MPK_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!settings.text && !settings.input_file) {
        MPK_LOG_ERROR("No input given.");
        print_usage();
        return 1;
    }
    if (settings.text && settings.input_file) {
        MPK_LOG_ERROR("Give either input text or --file, not both.");
        return 2;
    }
    if (settings.input_file && !fs::exists(*settings.input_file)) {
        MPK_LOG_ERROR("Input does not exist: %s", settings.input_file->string().c_str());
        return 2;
    }

    try {
        return run(settings);
    } catch (const std::exception& e) {
        MPK_LOG_ERROR("Failed: %s", e.what());
        return 2;
    }
}
