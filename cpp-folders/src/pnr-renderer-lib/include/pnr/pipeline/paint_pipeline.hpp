#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: paint_pipeline.hpp
    МОДУЛЬ: pipeline
    ЗОРИЛГО: Reference Field -> Stroke Projection -> Stroke Expansion -> Post дарааллыг
            нэг frame болгон ажиллуулж, render target-уудыг эзэмшинэ.
*/


#include <string>
#include <vector>

#include "pnr/core/context.hpp"
#include "pnr/core/log.hpp"
#include "pnr/frame/frame_inputs.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/gfx/rt_registry.hpp"
#include "pnr/passes/pass_paint_post.hpp"
#include "pnr/passes/pass_point_splat.hpp"
#include "pnr/passes/pass_reference_field.hpp"
#include "pnr/passes/pass_stroke_expansion.hpp"
#include "pnr/passes/pass_stroke_projection.hpp"
#include "pnr/resources/brush_atlas.hpp"
#include "pnr/stroke/paint_model.hpp"

namespace pnr
{
    // Pipeline-ийн гаднаас өгөгдөх, зөвхөн уншигдах нөөцүүд.
    struct PaintScene
    {
        const std::vector<PaintModel>* models = nullptr;
        const Texture2DData* albedo = nullptr;
        const BrushAtlas* brushes = nullptr;
        const Texture2DData* paper = nullptr;
    };

    struct FrameReport
    {
        bool executed = false;
        std::string error{};
        ViewMode view_mode = ViewMode::Painted;
        uint64_t frame_index = 0;
        RenderDebugStats stats{};

        float total_ms() const
        {
            return stats.ms_reference + stats.ms_projection + stats.ms_expansion + stats.ms_points + stats.ms_post;
        }
    };

    class PaintPipeline
    {
    public:
        explicit PaintPipeline(const BrushConfig& brushes)
            : brushes_(brushes)
            , projection_(brushes)
            , expansion_(brushes)
        {}

        const BrushConfig& brush_config() const { return brushes_; }

        // Frame бүр бүх target-ийг дахин бичнэ. Аль нэг шат бэлтгэгдэж чадахгүй бол frame-ийг
        // бүхэлд нь орхиж, дараагийн frame-д target-уудыг шинээр үүсгэнэ.
        FrameReport render_frame(
            Context& ctx,
            const PaintScene& scene,
            const FrameCamera& camera,
            const RenderConfig& cfg,
            FrameSize size
        )
        {
            FrameReport rep{};
            rep.view_mode = cfg.view_mode;
            rep.frame_index = ctx.frame_index;
            ctx.debug.reset();

            const Status valid = validate_render_config(cfg, brushes_);
            if (!valid) return abandon(rep, "invalid render config: " + valid.error);
            if (!scene.models) return abandon(rep, "no paint models");
            if (cfg.view_mode == ViewMode::Painted && (!scene.brushes || !scene.brushes->valid()))
            {
                return abandon(rep, "brush atlas is missing");
            }
            if (scene.brushes && scene.brushes->valid() && scene.brushes->brush_count != brushes_.brush_count)
            {
                return abandon(rep, "brush atlas has " + std::to_string(scene.brushes->brush_count) +
                                    " brushes, pipeline expects " + std::to_string(brushes_.brush_count));
            }

            rt_reference_ = RT_Reference{rtr_.ensure_transient<RT_ReferenceField>("reference_field", size.w, size.h)};
            rt_canvas_ = RT_CanvasHandle{rtr_.ensure_transient<RT_Canvas>("canvas", size.w, size.h)};
            rt_output_ = RT_Output{rtr_.ensure_transient<RT_ColorLDR>("output_ldr", size.w, size.h)};
            if (!rt_reference_.valid() || !rt_canvas_.valid() || !rt_output_.valid())
            {
                return abandon(rep, "render target creation failed for " + std::to_string(size.w) + "x" + std::to_string(size.h));
            }

            PassReferenceField::Inputs ref_in{};
            ref_in.models = scene.models;
            ref_in.albedo = scene.albedo;
            ref_in.camera = &camera;
            ref_in.cfg = &cfg;
            ref_in.rtr = &rtr_;
            ref_in.rt_reference = rt_reference_;
            if (!reference_.execute(ctx, ref_in)) return abandon(rep, "reference field pass failed");

            RTHandle post_source = rt_canvas_;
            if (cfg.view_mode == ViewMode::Raster)
            {
                post_source = rt_reference_;
            }
            else
            {
                PassStrokeProjection::Inputs proj_in{};
                proj_in.models = scene.models;
                proj_in.albedo = scene.albedo;
                proj_in.camera = &camera;
                proj_in.cfg = &cfg;
                proj_in.rtr = &rtr_;
                proj_in.rt_reference = rt_reference_;
                proj_in.out = &strokes_;
                if (!projection_.execute(ctx, proj_in)) return abandon(rep, "stroke projection pass failed");

                if (cfg.view_mode == ViewMode::Points)
                {
                    PassPointSplat::Inputs pts_in{};
                    pts_in.strokes = &strokes_;
                    pts_in.cfg = &cfg;
                    pts_in.rtr = &rtr_;
                    pts_in.rt_canvas = rt_canvas_;
                    if (!points_.execute(ctx, pts_in)) return abandon(rep, "point splat pass failed");
                }
                else
                {
                    PassStrokeExpansion::Inputs exp_in{};
                    exp_in.strokes = &strokes_;
                    exp_in.atlas = scene.brushes;
                    exp_in.camera = &camera;
                    exp_in.cfg = &cfg;
                    exp_in.rtr = &rtr_;
                    exp_in.rt_canvas = rt_canvas_;
                    if (!expansion_.execute(ctx, exp_in)) return abandon(rep, "stroke expansion pass failed");
                }
            }

            PassPaintPost::Inputs post_in{};
            post_in.cfg = &cfg;
            post_in.paper = scene.paper;
            post_in.rtr = &rtr_;
            post_in.rt_source = post_source;
            post_in.rt_ldr = rt_output_;
            if (!post_.execute(ctx, post_in)) return abandon(rep, "post pass failed");

            rep.executed = true;
            rep.stats = ctx.debug;
            ctx.frame_index++;
            return rep;
        }

        const RT_ColorLDR* output() const { return rtr_.get<RT_ColorLDR>(rt_output_); }
        const RT_Canvas* canvas() const { return rtr_.get<RT_Canvas>(rt_canvas_); }
        const RT_ReferenceField* reference_field() const { return rtr_.get<RT_ReferenceField>(rt_reference_); }
        const std::vector<ShadedStroke>& strokes() const { return strokes_; }
        uint64_t target_recreate_count() const { return rtr_.recreate_count(); }

    private:
        FrameReport& abandon(FrameReport& rep, const std::string& why)
        {
            rep.executed = false;
            rep.error = why;
            log_debug("frame abandoned: " + why);
            return rep;
        }

        BrushConfig brushes_{};
        RTRegistry rtr_{};
        RT_Reference rt_reference_{};
        RT_CanvasHandle rt_canvas_{};
        RT_Output rt_output_{};
        std::vector<ShadedStroke> strokes_{};

        PassReferenceField reference_{};
        PassStrokeProjection projection_;
        PassStrokeExpansion expansion_;
        PassPointSplat points_{};
        PassPaintPost post_{};
    };
}
