/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Command-line interface for batch inspection of an annotation output
 * directory, schema upgrades of legacy files, and headless rendering of
 * the annotation view.
 */

// Must be defined before any Windows headers
#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

#include "cli/cli_app.hpp"
#include "core/annotation.hpp"
#include "core/annotation_canvas.hpp"
#include "core/annotation_store.hpp"
#include "core/errors.hpp"
#include "core/image_source.hpp"
#include "core/label_registry.hpp"
#include "core/settings.hpp"
#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"
#include "i18n/i18n.hpp"
#include "i18n/keys.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace bba::cli {

namespace {

// =============================================================================
// Option parsing helpers
// =============================================================================

/**
 * "800x600" -> cv::Size; nullopt when malformed or non-positive
 */
std::optional<cv::Size> parse_size(const std::string& text) {
    int w = 0;
    int h = 0;
    char sep = 0;
    std::istringstream in(text);
    if (!(in >> w >> sep >> h) || (sep != 'x' && sep != 'X') || w <= 0 || h <= 0) {
        return std::nullopt;
    }
    return cv::Size(w, h);
}

std::optional<cv::Point2f> parse_point(const std::string& text) {
    float x = 0.0f;
    float y = 0.0f;
    char sep = 0;
    std::istringstream in(text);
    if (!(in >> x >> sep >> y) || sep != ',') {
        return std::nullopt;
    }
    return cv::Point2f(x, y);
}

void print_error(const std::string& message) {
    fmt::print(stderr, fmt::fg(fmt::color::red), "{}\n",
               TRF(i18n::keys::STATUS_ERROR, message));
}

fs::path resolve_output_dir(const std::string& option) {
    if (!option.empty()) {
        return path_from_utf8(option);
    }
    return load_settings(default_settings_path()).output_dir;
}

// =============================================================================
// Subcommands
// =============================================================================

int cmd_list(const fs::path& dir, const fs::path& output_dir) {
    const auto images = ImageSource::list_images(dir);
    if (images.empty()) {
        fmt::print(fmt::fg(fmt::color::yellow), "{}\n",
                   TRF(i18n::keys::CLI_NO_IMAGES, dir));
        return 0;
    }

    int failed = 0;
    for (const auto& image : images) {
        const auto json_path = AnnotationStore::annotation_path_for(output_dir, image);
        std::string count = "-";
        if (fs::exists(json_path)) {
            try {
                count = std::to_string(read_annotations(json_path).size());
            } catch (const std::exception& e) {
                spdlog::warn("[CLI] {}: {}", json_path, e.what());
                count = "?";
                ++failed;
            }
        }
        fmt::print("{:>5}  {}\n", count, filename_utf8(image));
    }
    return failed > 0 ? 1 : 0;
}

int cmd_labels(const fs::path& output_dir) {
    LabelRegistry registry(output_dir);
    const auto labels = registry.all_unique_labels();
    if (labels.empty()) {
        fmt::print(fmt::fg(fmt::color::yellow), "{}\n",
                   TRF(i18n::keys::CLI_NO_LABELS, output_dir));
        return 0;
    }
    for (const auto& label : labels) {
        fmt::print("{}\n", label);
    }
    return 0;
}

int cmd_upgrade(const std::vector<std::string>& files, bool dry_run) {
    int upgraded = 0;
    int failed = 0;

    for (const auto& file : files) {
        const fs::path path = path_from_utf8(file);
        try {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                throw AnnotationFormatError(fmt::format("cannot open {}", path));
            }
            nlohmann::json doc;
            try {
                doc = nlohmann::json::parse(in);
            } catch (const nlohmann::json::exception& e) {
                throw AnnotationFormatError(fmt::format("{}: {}", path, e.what()));
            }

            if (!is_legacy_document(doc)) {
                fmt::print(fmt::fg(fmt::color::gray), "{}\n",
                           TRF(i18n::keys::CLI_CANONICAL, path));
                continue;
            }

            const Annotations annotations = annotations_from_json(doc);
            if (dry_run) {
                fmt::print(fmt::fg(fmt::color::yellow), "{}\n",
                           TRF(i18n::keys::CLI_WOULD_UPGRADE, path));
            } else {
                in.close();
                write_annotations(path, annotations);
                fmt::print(fmt::fg(fmt::color::green), "{}\n",
                           TRF(i18n::keys::CLI_UPGRADED, path));
            }
            ++upgraded;
        } catch (const std::exception& e) {
            spdlog::error("[CLI] Upgrade failed: {}", e.what());
            print_error(e.what());
            ++failed;
        }
    }

    if (files.size() > 1) {
        fmt::print("\n{}\n", TRF(i18n::keys::CLI_SUMMARY, files.size(), upgraded, failed));
    }
    return failed > 0 ? 1 : 0;
}

struct RenderOptions {
    fs::path image;
    fs::path output;
    fs::path annotations;           // Empty: none
    cv::Size size{800, 600};
    double zoom = 1.0;
    std::optional<cv::Point2f> center;  // Image coordinates
    bool edit_mode = false;
};

int cmd_render(const RenderOptions& opts) {
    const Appearance appearance = load_settings(default_settings_path()).appearance;

    DrawingController drawing;
    EditingController editing(appearance.points_size);
    AnnotationStore store;
    LabelRegistry labels;
    AnnotationCanvas canvas(appearance, drawing, editing, store, labels, opts.size);

    if (!opts.annotations.empty()) {
        if (!fs::exists(opts.annotations)) {
            throw AnnotationFormatError(
                fmt::format("Annotation file not found: {}", opts.annotations));
        }
        store.open(opts.annotations);
    }

    canvas.set_image(ImageSource::decode(opts.image));

    SceneState scene;
    scene.edit_mode = opts.edit_mode;
    canvas.set_scene_state(scene);

    Viewport& vp = canvas.viewport();
    if (opts.zoom != 1.0) {
        vp.zoom(opts.zoom);
    }
    if (opts.center) {
        vp.set_offset(*opts.center);
    }
    canvas.render();

    cv::Mat bgr;
    cv::cvtColor(canvas.displayed(), bgr, cv::COLOR_RGBA2BGR);

    if (const auto parent = opts.output.parent_path(); !parent.empty()) {
        fs::create_directories(parent);
    }
    ImageSource::encode(opts.output, bgr);

    const size_t count = store.is_loaded() ? store.annotations().size() : 0;
    fmt::print(fmt::fg(fmt::color::green), "{}\n",
               TRF(i18n::keys::CLI_RENDERED, count, opts.output));
    return 0;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    if (!i18n::is_initialized()) {
        i18n::init(i18n::find_lang_dir(), i18n::Language::English);
    }

    CLI::App app{TR(i18n::keys::CLI_DESCRIPTION)};
    app.set_version_flag("-V,--version", APP_VERSION);
    app.require_subcommand(1);

    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // list
    std::string list_dir;
    std::string list_output;
    auto* list_cmd = app.add_subcommand("list", "List images with their annotation counts");
    list_cmd->add_option("dir", list_dir, "Image directory")->required();
    list_cmd->add_option("--output-dir", list_output, "Annotation directory (default: from settings)");

    // labels
    std::string labels_output;
    auto* labels_cmd = app.add_subcommand("labels", "List every label used in the annotation directory");
    labels_cmd->add_option("--output-dir", labels_output, "Annotation directory (default: from settings)");

    // upgrade
    std::vector<std::string> upgrade_files;
    bool dry_run = false;
    auto* upgrade_cmd = app.add_subcommand("upgrade", "Rewrite legacy annotation files in the current schema");
    upgrade_cmd->add_option("files", upgrade_files, "Annotation JSON files")->required();
    upgrade_cmd->add_flag("--dry-run", dry_run, "Report files that would change without writing");

    // render
    std::string render_image;
    std::string render_output;
    std::string render_annotations;
    std::string render_size = "800x600";
    double render_zoom = 1.0;
    std::string render_center;
    bool render_edit = false;
    auto* render_cmd = app.add_subcommand("render", "Render an image with its annotations to a file");
    render_cmd->add_option("image", render_image, "Input image")->required();
    render_cmd->add_option("-o,--output", render_output, "Output image file")->required();
    render_cmd->add_option("--annotations", render_annotations, "Annotation JSON file");
    render_cmd->add_option("--size", render_size, "Viewport size WxH (default: 800x600)");
    render_cmd->add_option("--zoom", render_zoom, "Magnification relative to fit (default: 1)")
        ->check(CLI::PositiveNumber);
    render_cmd->add_option("--center", render_center, "Image point X,Y to center the view on");
    render_cmd->add_flag("--edit-mode", render_edit, "Draw edit handles");

    CLI11_PARSE(app, argc, argv);

    // Configure logging
    logging::Options log_options;
    log_options.file_sink = false;
    if (quiet) {
        log_options.console_level = spdlog::level::err;
    } else if (verbose) {
        log_options.console_level = spdlog::level::debug;
    } else {
        log_options.console_level = spdlog::level::warn;
    }
    logging::init(log_options);

    try {
        if (*list_cmd) {
            return cmd_list(path_from_utf8(list_dir), resolve_output_dir(list_output));
        }
        if (*labels_cmd) {
            return cmd_labels(resolve_output_dir(labels_output));
        }
        if (*upgrade_cmd) {
            return cmd_upgrade(upgrade_files, dry_run);
        }
        if (*render_cmd) {
            RenderOptions opts;
            opts.image = path_from_utf8(render_image);
            opts.output = path_from_utf8(render_output);
            if (!render_annotations.empty()) {
                opts.annotations = path_from_utf8(render_annotations);
            }

            const auto size = parse_size(render_size);
            if (!size) {
                print_error(fmt::format("invalid --size '{}', expected WxH", render_size));
                return 1;
            }
            opts.size = *size;
            opts.zoom = render_zoom;

            if (!render_center.empty()) {
                opts.center = parse_point(render_center);
                if (!opts.center) {
                    print_error(fmt::format("invalid --center '{}', expected X,Y", render_center));
                    return 1;
                }
            }
            opts.edit_mode = render_edit;
            return cmd_render(opts);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        print_error(e.what());
        return 1;
    }

    return 1;
}

}  // namespace bba::cli
