#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <pnr/camera/orbit_camera.hpp>
#include <pnr/core/context.hpp>
#include <pnr/core/log.hpp>
#include <pnr/core/running_average.hpp>
#include <pnr/core/time.hpp>
#include <pnr/frame/frame_inputs.hpp>
#include <pnr/frame/render_config.hpp>
#include <pnr/job/thread_pool_job_system.hpp>
#include <pnr/pipeline/paint_pipeline.hpp>
#include <pnr/platform/sdl/sdl_runtime.hpp>
#include <pnr/resources/brush_atlas.hpp>
#include <pnr/resources/loaders/mesh_loader_assimp.hpp>
#include <pnr/resources/loaders/texture_loader_sdl.hpp>
#include <pnr/stroke/paint_model.hpp>

namespace
{
    constexpr float ZOOM_SPEED = 1.5f;
    constexpr float WHEEL_STEP_RADIANS = 0.035f;
    constexpr float BRUSH_SIZE_STEP = 0.005f;
    constexpr float BRUSH_SIZE_MIN = 0.01f;
    constexpr float BRUSH_SIZE_MAX = 0.04f;
    constexpr int QUANTIZATION_MAX = 20;

    struct CaptureConfig
    {
        bool enabled = false;
        std::string path{};
        int after_frames = 8;
    };

    struct ViewerOptions
    {
        std::string obj_path{};
        std::string albedo_path{};
        std::string brushes_dir{};
        std::string canvas_path{};
        uint32_t seed = pnr::kDefaultAnchorSeed;
        int width = 1024;
        int height = 768;
        bool verbose = false;
        CaptureConfig capture{};
        pnr::RenderConfig cfg{};
    };

    void print_usage()
    {
        std::fprintf(stderr,
            "usage: pnr-viewer --obj <mesh> [--albedo <png>] [--brushes <dir>] [--canvas <png>]\n"
            "                  [--stroke-density N] [--brush-size F] [--quantization N] [--saturation F]\n"
            "                  [--background r,g,b] [--no-canvas] [--no-brush-tbn] [--seed N]\n"
            "                  [--width N] [--height N] [--capture <ppm>] [--capture-after N] [--verbose]\n");
    }

    bool parse_rgb(const std::string& s, glm::vec3& out)
    {
        float r = 0.0f, g = 0.0f, b = 0.0f;
        if (std::sscanf(s.c_str(), "%f,%f,%f", &r, &g, &b) != 3) return false;
        out = glm::vec3(r, g, b);
        return true;
    }

    bool parse_args(int argc, char* argv[], ViewerOptions& opt)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i] ? argv[i] : "";
            const bool has_value = i + 1 < argc;
            if (arg == "--obj" && has_value) opt.obj_path = argv[++i];
            else if (arg == "--albedo" && has_value) opt.albedo_path = argv[++i];
            else if (arg == "--brushes" && has_value) opt.brushes_dir = argv[++i];
            else if (arg == "--canvas" && has_value) opt.canvas_path = argv[++i];
            else if (arg == "--stroke-density" && has_value) opt.cfg.stroke_density = std::atoi(argv[++i]);
            else if (arg == "--brush-size" && has_value) opt.cfg.brush_size = (float)std::atof(argv[++i]);
            else if (arg == "--quantization" && has_value) opt.cfg.quantization = std::atoi(argv[++i]);
            else if (arg == "--saturation" && has_value) opt.cfg.saturation = (float)std::atof(argv[++i]);
            else if (arg == "--background" && has_value)
            {
                if (!parse_rgb(argv[++i], opt.cfg.background))
                {
                    pnr::log_error("--background expects r,g,b");
                    return false;
                }
            }
            else if (arg == "--no-canvas") opt.cfg.enable_canvas = false;
            else if (arg == "--no-brush-tbn") opt.cfg.enable_brush_tbn = false;
            else if (arg == "--seed" && has_value) opt.seed = (uint32_t)std::strtoul(argv[++i], nullptr, 10);
            else if (arg == "--width" && has_value) opt.width = std::max(1, std::atoi(argv[++i]));
            else if (arg == "--height" && has_value) opt.height = std::max(1, std::atoi(argv[++i]));
            else if (arg == "--capture" && has_value)
            {
                opt.capture.path = argv[++i];
                opt.capture.enabled = !opt.capture.path.empty();
            }
            else if (arg == "--capture-after" && has_value) opt.capture.after_frames = std::max(1, std::atoi(argv[++i]));
            else if (arg == "--verbose") opt.verbose = true;
            else
            {
                pnr::log_error("unknown or incomplete argument: " + arg);
                return false;
            }
        }
        if (opt.obj_path.empty())
        {
            pnr::log_error("--obj is required");
            return false;
        }
        return true;
    }

    // textures/<obj stem>.png
    std::string default_albedo_path(const std::string& obj_path)
    {
        const std::filesystem::path p(obj_path);
        return (std::filesystem::path("textures") / (p.stem().string() + ".png")).string();
    }

    void upload_ldr_to_rgba8(std::vector<uint8_t>& rgba, const pnr::RT_ColorLDR& ldr)
    {
        rgba.resize((size_t)ldr.w * (size_t)ldr.h * 4);
        for (int y_screen = 0; y_screen < ldr.h; ++y_screen)
        {
            const int y_canvas = ldr.h - 1 - y_screen;
            uint8_t* row = rgba.data() + (size_t)y_screen * (size_t)ldr.w * 4;
            for (int x = 0; x < ldr.w; ++x)
            {
                const pnr::Color c = ldr.color.at(x, y_canvas);
                const int i = x * 4;
                row[i + 0] = c.r;
                row[i + 1] = c.g;
                row[i + 2] = c.b;
                row[i + 3] = 255;
            }
        }
    }

    bool write_ldr_to_ppm(const std::string& path, const pnr::RT_ColorLDR& ldr)
    {
        std::ofstream out(path, std::ios::binary);
        if (!out) return false;
        out << "P6\n" << ldr.w << " " << ldr.h << "\n255\n";
        for (int y_screen = 0; y_screen < ldr.h; ++y_screen)
        {
            const int y_canvas = ldr.h - 1 - y_screen;
            for (int x = 0; x < ldr.w; ++x)
            {
                const pnr::Color c = ldr.color.at(x, y_canvas);
                const char rgb[3] = {(char)c.r, (char)c.g, (char)c.b};
                out.write(rgb, 3);
            }
        }
        return out.good();
    }

    std::string make_title(
        const pnr::RenderConfig& cfg,
        const pnr::FrameReport& rep,
        float fps
    )
    {
        std::string title = std::string("pnr painterly viewer | ") + pnr::view_mode_name(cfg.view_mode);
        if (!cfg.show_overlay) return title;
        char brush_buf[32];
        std::snprintf(brush_buf, sizeof(brush_buf), "%.3f", cfg.brush_size);
        title += " | fps=" + std::to_string((int)std::lround(fps))
            + " | anchors=" + std::to_string(rep.stats.anchors_input)
            + " | drawn=" + std::to_string(rep.stats.anchors_survived)
            + " | quant=" + std::to_string(cfg.quantization)
            + " | brush=" + brush_buf
            + " | tbn=" + (cfg.enable_brush_tbn ? "on" : "off")
            + " | canvas=" + (cfg.enable_canvas ? "on" : "off");
        return title;
    }
}

int main(int argc, char* argv[])
{
    ViewerOptions opt{};
    if (!parse_args(argc, argv, opt))
    {
        print_usage();
        return 1;
    }
    if (opt.verbose) pnr::set_log_level(pnr::LogLevel::Debug);

    // SDL_image нь SDL-ийг эхлүүлсний дараа л ажиллана.
    pnr::SdlRuntime runtime{pnr::WindowDesc{"pnr painterly viewer", opt.width, opt.height, true}};
    if (!runtime.valid()) return 1;

    pnr::BrushAtlas atlas{};
    if (!opt.brushes_dir.empty())
    {
        auto loaded = pnr::load_brush_atlas_dir(opt.brushes_dir);
        if (!loaded)
        {
            pnr::log_error(loaded.error);
            return 1;
        }
        atlas = std::move(loaded.value);
    }
    else
    {
        atlas = pnr::make_procedural_brush_atlas();
        pnr::log_info("no --brushes given, using " + std::to_string(atlas.brush_count) + " procedural brushes");
    }
    const pnr::BrushConfig brush_cfg{atlas.brush_count, atlas.cell_px};

    const pnr::Status cfg_ok = pnr::validate_render_config(opt.cfg, brush_cfg);
    if (!cfg_ok)
    {
        pnr::log_error("invalid configuration: " + cfg_ok.error);
        return 1;
    }

    auto meshes = pnr::load_meshes_assimp(opt.obj_path);
    if (!meshes)
    {
        pnr::log_error(meshes.error);
        return 1;
    }

    const std::string albedo_path = opt.albedo_path.empty() ? default_albedo_path(opt.obj_path) : opt.albedo_path;
    auto albedo = pnr::load_texture2d_sdl_image(albedo_path);
    if (!albedo)
    {
        pnr::log_error(albedo.error);
        return 1;
    }

    pnr::Texture2DData paper{};
    if (!opt.canvas_path.empty())
    {
        auto loaded = pnr::load_texture2d_sdl_image(opt.canvas_path);
        if (!loaded)
        {
            pnr::log_error(loaded.error);
            return 1;
        }
        paper = std::move(loaded.value);
    }

    auto models = pnr::build_paint_models(meshes.value, opt.cfg, brush_cfg, opt.seed);
    if (!models)
    {
        pnr::log_error(models.error);
        return 1;
    }

    pnr::ThreadPoolJobSystem jobs{};
    pnr::Context ctx{};
    ctx.job_system = &jobs;

    pnr::PaintScene scene{};
    scene.models = &models.value;
    scene.albedo = &albedo.value;
    scene.brushes = &atlas;
    scene.paper = paper.valid() ? &paper : nullptr;

    pnr::FrameSize size{opt.width, opt.height};
    pnr::OrbitCamera camera{
        glm::vec3(2.0f, 2.0f, 2.0f),
        glm::vec3(-10.0f, -10.0f, -10.0f),
        glm::radians(100.0f),
        (float)size.w / (float)size.h,
        0.1f,
        10.0f
    };
    float model_yaw = 0.0f;

    pnr::RenderConfig cfg = opt.cfg;
    pnr::PaintPipeline pipeline{brush_cfg};
    pnr::FrameClock clock{};
    clock.tick_hz = (double)SDL_GetPerformanceFrequency();
    pnr::RunningAverage<float, 32> frame_time{};
    std::vector<uint8_t> rgba_staging{};
    std::string last_error{};
    int frame_count = 0;
    float title_accum = 0.0f;

    bool running = true;
    while (running)
    {
        const float dt = clock.begin_frame(SDL_GetPerformanceCounter());
        if (dt > 0.0f) frame_time.add(dt);

        pnr::PlatformInputState input{};
        if (!runtime.pump_input(input)) break;

        if (input.cycle_view) cfg.view_mode = pnr::next_view_mode(cfg.view_mode);
        if (input.toggle_overlay) cfg.show_overlay = !cfg.show_overlay;
        if (input.toggle_brush_tbn) cfg.enable_brush_tbn = !cfg.enable_brush_tbn;
        if (input.toggle_canvas) cfg.enable_canvas = !cfg.enable_canvas;
        cfg.quantization = std::clamp(cfg.quantization + input.quantization_delta, 0, QUANTIZATION_MAX);
        if (input.brush_size_steps != 0)
        {
            cfg.brush_size = std::clamp(cfg.brush_size + BRUSH_SIZE_STEP * (float)input.brush_size_steps, BRUSH_SIZE_MIN, BRUSH_SIZE_MAX);
        }
        if (input.zoom_in) camera.zoom(ZOOM_SPEED * dt);
        if (input.zoom_out) camera.zoom(-ZOOM_SPEED * dt);
        if (input.wheel_y != 0.0f) camera.rotate_up(-input.wheel_y * WHEEL_STEP_RADIANS);
        model_yaw += input.wheel_x * WHEEL_STEP_RADIANS;
        if (input.resized && input.resized_w > 0 && input.resized_h > 0)
        {
            size = pnr::FrameSize{input.resized_w, input.resized_h};
            camera.set_aspect((float)size.w / (float)size.h);
        }

        const glm::mat4 model = glm::rotate(glm::mat4(1.0f), model_yaw, glm::vec3(0.0f, 1.0f, 0.0f));
        const pnr::FrameCamera frame_camera = pnr::make_frame_camera(camera, model);
        const pnr::FrameReport rep = pipeline.render_frame(ctx, scene, frame_camera, cfg, size);
        if (!rep.executed)
        {
            if (rep.error != last_error) pnr::log_warn(rep.error);
            last_error = rep.error;
            continue;
        }
        last_error.clear();

        const pnr::RT_ColorLDR* ldr = pipeline.output();
        if (!ldr) continue;
        upload_ldr_to_rgba8(rgba_staging, *ldr);
        runtime.upload_rgba8(rgba_staging.data(), ldr->w, ldr->h, ldr->w * 4);
        runtime.present();

        frame_count++;
        if (opt.capture.enabled && frame_count >= opt.capture.after_frames)
        {
            if (!write_ldr_to_ppm(opt.capture.path, *ldr))
            {
                pnr::log_error("failed to write capture: " + opt.capture.path);
                return 2;
            }
            pnr::log_info("captured frame to " + opt.capture.path);
            running = false;
        }

        title_accum += dt;
        if (title_accum >= 0.25f)
        {
            const float avg_dt = frame_time.average();
            const float fps = (avg_dt > 1e-6f) ? 1.0f / avg_dt : 0.0f;
            runtime.set_title(make_title(cfg, rep, fps));
            pnr::log_debug("frame " + std::to_string(rep.frame_index) + ": " + std::to_string(rep.total_ms()) + " ms, " +
                           std::to_string(rep.stats.strokes_expanded) + " strokes");
            title_accum = 0.0f;
        }
    }

    return 0;
}
