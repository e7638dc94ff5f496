#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/camera/orbit_camera.hpp"
#include "pnr/core/context.hpp"
#include "pnr/core/log.hpp"
#include "pnr/job/thread_pool_job_system.hpp"
#include "pnr/pipeline/paint_pipeline.hpp"
#include "pnr/resources/brush_atlas.hpp"
#include "pnr/stroke/paint_model.hpp"

#include "test_scene_utils.hpp"

namespace
{
    using pnr_test::approx_eq;

    // Камерын өмнөх quad-ын төвд ганц stroke. Гэрэл камерын чиглэлээс тусна.
    struct SingleStrokeScene
    {
        std::vector<pnr::PaintModel> models{};
        pnr::BrushAtlas atlas{};
        pnr::RenderConfig cfg{};
        pnr::FrameCamera camera{};
        pnr::BrushConfig brushes{1, 8};

        pnr::PaintScene scene() const
        {
            pnr::PaintScene s{};
            s.models = &models;
            s.brushes = &atlas;
            return s;
        }
    };

    SingleStrokeScene make_single_stroke_scene()
    {
        SingleStrokeScene s{};
        pnr::PaintModel m{};
        m.mesh = pnr::make_quad_mesh(0.5f);
        pnr::StrokeAnchor a{};
        a.position = glm::vec3(0.0f);
        a.normal = glm::vec3(0.0f, 0.0f, -1.0f);
        a.tangent = glm::vec3(1.0f, 0.0f, 0.0f);
        a.bitangent = glm::vec3(0.0f, -1.0f, 0.0f);
        a.uv = glm::vec2(0.5f);
        m.anchors.push_back(a);
        s.models.push_back(m);

        auto atlas = pnr::assemble_brush_atlas({pnr::make_solid_texture(8, 8, pnr::Color{0, 0, 0, 255})}, 8);
        s.atlas = atlas.value;

        s.cfg.brush_size = 0.04f;
        s.cfg.enable_canvas = false;
        s.cfg.lighting.light_dir_ws = glm::vec3(0.0f, 0.0f, 1.0f);
        s.cfg.lighting.ambient = 0.15f;
        s.cfg.lighting.diffuse = 0.6f;
        s.cfg.lighting.specular = 0.0f;
        s.camera = pnr_test::make_front_camera();
        return s;
    }

    bool test_single_stroke_painted()
    {
        const SingleStrokeScene s = make_single_stroke_scene();
        if (!s.atlas.valid()) return false;
        pnr::PaintPipeline pipeline{s.brushes};
        pnr::Context ctx{};
        const pnr::FrameReport rep = pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{256, 256});
        if (!rep.executed || !rep.error.empty()) return false;
        if (rep.stats.anchors_survived != 1 || rep.stats.strokes_expanded != 1) return false;
        if (rep.stats.strokes_clipped != 0 || ctx.frame_index != 1) return false;
        if (pipeline.strokes().size() != 1 || pipeline.brush_config().brush_count != 1) return false;

        // Quad-ын төв дэх гадаргуугийн гүн anchor-ын гүнтэй тэнцүү.
        const pnr::RT_ReferenceField* rf = pipeline.reference_field();
        if (!rf || rf->color.at(128, 128).a <= 0.5f || rf->color.at(128, 128).a >= 1.0f) return false;

        const pnr::RT_Canvas* canvas = pipeline.canvas();
        if (!canvas || canvas->w != 256) return false;
        int covered = 0;
        for (int y = 0; y < canvas->h; ++y)
        {
            for (int x = 0; x < canvas->w; ++x)
            {
                const pnr::ColorF c = canvas->color.at(x, y);
                if (c.a <= 0.0f) continue;
                ++covered;
                if (x < 122 || x > 133 || y < 122 || y > 133) return false;
                if (!approx_eq(c.r, 0.75f, 1e-3f) || !approx_eq(c.g, 0.75f, 1e-3f)) return false;
            }
        }
        if (covered != 100) return false;

        const pnr::RT_ColorLDR* out = pipeline.output();
        if (!out) return false;
        const pnr::Color centre = out->color.at(128, 128);
        if (centre.r < 190 || centre.r > 192 || centre.a != 255) return false;
        const pnr::Color outside = out->color.at(100, 100);
        return outside.r == 0 && outside.a == 255;
    }

    // Reference Field нь гурвалжны эргэлтийн чиглэлээс хамаарахгүй, хоёр талыг зурна.
    bool test_reference_field_ignores_winding()
    {
        SingleStrokeScene front = make_single_stroke_scene();
        SingleStrokeScene flipped = make_single_stroke_scene();
        std::vector<uint32_t>& idx = flipped.models[0].mesh.indices;
        for (size_t i = 0; i + 2 < idx.size(); i += 3) std::swap(idx[i + 1], idx[i + 2]);
        front.cfg.view_mode = pnr::ViewMode::Raster;
        flipped.cfg.view_mode = pnr::ViewMode::Raster;

        pnr::PaintPipeline a{front.brushes};
        pnr::PaintPipeline b{flipped.brushes};
        pnr::Context ctx{};
        const pnr::FrameReport ra = a.render_frame(ctx, front.scene(), front.camera, front.cfg, pnr::FrameSize{64, 64});
        const pnr::FrameReport rb = b.render_frame(ctx, flipped.scene(), flipped.camera, flipped.cfg, pnr::FrameSize{64, 64});
        if (!ra.executed || !rb.executed) return false;
        if (ra.stats.tri_raster != 2 || rb.stats.tri_raster != 2) return false;

        const auto& da = a.reference_field()->color.data;
        const auto& db = b.reference_field()->color.data;
        if (da.size() != db.size()) return false;
        for (size_t i = 0; i < da.size(); ++i)
        {
            if (!approx_eq(da[i].r, db[i].r) || !approx_eq(da[i].a, db[i].a)) return false;
        }
        return a.reference_field()->color.at(32, 32).a < 1.0f;
    }

    bool test_single_stroke_points_and_raster()
    {
        SingleStrokeScene s = make_single_stroke_scene();
        pnr::PaintPipeline pipeline{s.brushes};
        pnr::Context ctx{};

        s.cfg.view_mode = pnr::ViewMode::Points;
        const pnr::FrameReport pts = pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{256, 256});
        if (!pts.executed || pts.stats.strokes_expanded != 0 || pts.stats.anchors_survived != 1) return false;
        int drawn = 0;
        for (const pnr::ColorF& c : pipeline.canvas()->color.data)
        {
            if (c.a > 0.0f) ++drawn;
        }
        if (drawn != 1) return false;
        if (pts.total_ms() < pts.stats.ms_points) return false;
        pnr::FrameReport timed{};
        timed.stats.ms_reference = 1.0f;
        timed.stats.ms_points = 2.0f;
        if (!approx_eq(timed.total_ms(), 3.0f)) return false;

        s.cfg.view_mode = pnr::ViewMode::Raster;
        const pnr::FrameReport ras = pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{256, 256});
        if (!ras.executed || ras.stats.anchors_input != 0 || ras.stats.tri_raster == 0) return false;
        const pnr::Color centre = pipeline.output()->color.at(128, 128);
        if (centre.r < 190 || centre.r > 192) return false;
        // Raster горимд quad бүхэлдээ харагдана.
        const pnr::Color quad_corner = pipeline.output()->color.at(70, 70);
        if (quad_corner.r < 190 || quad_corner.r > 192) return false;

        // Raster горим atlas шаардахгүй.
        SingleStrokeScene no_atlas = make_single_stroke_scene();
        no_atlas.atlas = pnr::BrushAtlas{};
        no_atlas.cfg.view_mode = pnr::ViewMode::Raster;
        if (!pipeline.render_frame(ctx, no_atlas.scene(), no_atlas.camera, no_atlas.cfg, pnr::FrameSize{64, 64}).executed) return false;
        no_atlas.cfg.view_mode = pnr::ViewMode::Painted;
        return !pipeline.render_frame(ctx, no_atlas.scene(), no_atlas.camera, no_atlas.cfg, pnr::FrameSize{64, 64}).executed;
    }

    bool test_resize_recreates_targets()
    {
        const SingleStrokeScene s = make_single_stroke_scene();
        pnr::PaintPipeline pipeline{s.brushes};
        pnr::Context ctx{};

        if (!pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{64, 64}).executed) return false;
        if (pipeline.target_recreate_count() != 0) return false;
        if (!pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{64, 64}).executed) return false;
        if (pipeline.target_recreate_count() != 0) return false;

        if (!pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{32, 48}).executed) return false;
        if (pipeline.target_recreate_count() != 3) return false;
        if (pipeline.output()->w != 32 || pipeline.output()->h != 48) return false;

        const uint64_t before = ctx.frame_index;
        const pnr::FrameReport zero = pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{0, 0});
        if (zero.executed || zero.error.empty() || ctx.frame_index != before) return false;

        const pnr::FrameReport next = pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{32, 48});
        return next.executed && ctx.frame_index == before + 1 && pipeline.target_recreate_count() == 3;
    }

    bool test_invalid_inputs_abandon_frame()
    {
        SingleStrokeScene s = make_single_stroke_scene();
        pnr::PaintPipeline pipeline{s.brushes};
        pnr::Context ctx{};

        s.cfg.brush_size = -1.0f;
        const pnr::FrameReport bad_cfg = pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{32, 32});
        if (bad_cfg.executed || bad_cfg.error.find("invalid render config") == std::string::npos) return false;
        if (ctx.frame_index != 0) return false;

        // Atlas-ийн бийрийн тоо pipeline-ийн тохиргоотой таарахгүй.
        s.cfg.brush_size = 0.04f;
        pnr::PaintPipeline four{pnr::BrushConfig{4, 8}};
        const pnr::FrameReport mismatch = four.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{32, 32});
        if (mismatch.executed || mismatch.error.empty()) return false;

        pnr::PaintScene no_models = s.scene();
        no_models.models = nullptr;
        if (pipeline.render_frame(ctx, no_models, s.camera, s.cfg, pnr::FrameSize{32, 32}).executed) return false;

        return pipeline.render_frame(ctx, s.scene(), s.camera, s.cfg, pnr::FrameSize{32, 32}).executed;
    }

    bool test_threaded_frame_matches_inline()
    {
        pnr::RenderConfig cfg{};
        cfg.stroke_density = 400;
        cfg.brush_size = 0.05f;
        cfg.quantization = 4;
        cfg.saturation = 0.8f;
        const pnr::BrushConfig brushes{4, 32};

        auto model = pnr::build_paint_model(pnr_test::make_unit_box_mesh(), cfg, brushes);
        if (!model.ok) return false;
        const std::vector<pnr::PaintModel> models{model.value};
        const pnr::BrushAtlas atlas = pnr::make_procedural_brush_atlas(brushes.brush_count, brushes.cell_px);
        const pnr::Texture2DData paper = pnr::make_solid_texture(4, 4, pnr::Color{230, 230, 230, 255});

        pnr::PaintScene scene{};
        scene.models = &models;
        scene.brushes = &atlas;
        scene.paper = &paper;

        const pnr::OrbitCamera orbit{};
        const pnr::FrameCamera camera = pnr::make_frame_camera(orbit);
        const pnr::FrameSize size{96, 96};

        pnr::PaintPipeline inline_pipe{brushes};
        pnr::Context inline_ctx{};
        const pnr::FrameReport a = inline_pipe.render_frame(inline_ctx, scene, camera, cfg, size);

        pnr::ThreadPoolJobSystem jobs{4};
        pnr::PaintPipeline threaded_pipe{brushes};
        pnr::Context threaded_ctx{};
        threaded_ctx.job_system = &jobs;
        const pnr::FrameReport b = threaded_pipe.render_frame(threaded_ctx, scene, camera, cfg, size);

        if (!a.executed || !b.executed) return false;
        if (a.stats.anchors_survived == 0 || a.stats.anchors_occluded == 0) return false;
        if (a.stats.anchors_survived != b.stats.anchors_survived) return false;
        if (a.stats.anchors_input != a.stats.anchors_survived + a.stats.anchors_occluded +
                                     a.stats.anchors_behind_eye + a.stats.anchors_near_clipped +
                                     a.stats.anchors_nonfinite) return false;

        const auto& da = inline_pipe.output()->color.data;
        const auto& db = threaded_pipe.output()->color.data;
        if (da.size() != db.size()) return false;
        bool any_paint = false;
        for (size_t i = 0; i < da.size(); ++i)
        {
            if (da[i].r != db[i].r || da[i].g != db[i].g || da[i].b != db[i].b || da[i].a != db[i].a) return false;
            if (da[i].r != 0 || da[i].g != 0 || da[i].b != 0) any_paint = true;
        }
        return any_paint;
    }
}

int main()
{
    pnr::set_log_level(pnr::LogLevel::Error);

    const bool ok_painted = test_single_stroke_painted();
    const bool ok_modes = test_single_stroke_points_and_raster();
    const bool ok_winding = test_reference_field_ignores_winding();
    const bool ok_resize = test_resize_recreates_targets();
    const bool ok_invalid = test_invalid_inputs_abandon_frame();
    const bool ok_threaded = test_threaded_frame_matches_inline();

    if (!ok_painted) std::fprintf(stderr, "[pipeline-tests] single stroke painted frame failed\n");
    if (!ok_modes) std::fprintf(stderr, "[pipeline-tests] points/raster view modes failed\n");
    if (!ok_winding) std::fprintf(stderr, "[pipeline-tests] reference field depends on triangle winding\n");
    if (!ok_resize) std::fprintf(stderr, "[pipeline-tests] render target resize failed\n");
    if (!ok_invalid) std::fprintf(stderr, "[pipeline-tests] invalid inputs did not abandon frame\n");
    if (!ok_threaded) std::fprintf(stderr, "[pipeline-tests] threaded frame differs from inline frame\n");

    if (!(ok_painted && ok_modes && ok_winding && ok_resize && ok_invalid && ok_threaded)) return 1;
    std::fprintf(stderr, "[pipeline-tests] all tests passed\n");
    return 0;
}
