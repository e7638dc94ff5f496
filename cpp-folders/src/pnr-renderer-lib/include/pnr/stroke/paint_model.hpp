#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: paint_model.hpp
    МОДУЛЬ: stroke
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн stroke модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <string>
#include <vector>

#include "pnr/core/log.hpp"
#include "pnr/core/result.hpp"
#include "pnr/core/time.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/resources/mesh.hpp"
#include "pnr/stroke/anchor_builder.hpp"

namespace pnr
{
    // Нэг mesh ба түүний anchor олонлог. Үүссэний дараа өөрчлөгдөхгүй.
    struct PaintModel
    {
        MeshData mesh{};
        std::vector<StrokeAnchor> anchors{};
        AnchorBuildStats build_stats{};
        float build_ms = 0.0f;
    };

    inline Result<PaintModel> build_paint_model(
        MeshData mesh,
        const RenderConfig& cfg,
        const BrushConfig& brushes,
        uint32_t seed = kDefaultAnchorSeed
    )
    {
        const Status valid = validate_render_config(cfg, brushes);
        if (!valid) return Result<PaintModel>::forward_failure(valid, "invalid render config");

        PaintModel model{};
        Result<std::vector<StrokeAnchor>> anchors{};
        {
            ScopedTimerMs timer(&model.build_ms);
            AnchorBuildOptions opt{};
            opt.stroke_density = cfg.stroke_density;
            opt.brush_count = brushes.brush_count;
            opt.seed = seed;
            anchors = build_stroke_anchor_set(mesh, opt, &model.build_stats);
        }
        if (!anchors) return Result<PaintModel>::forward_failure(anchors, "mesh '" + mesh.name + "'");

        model.anchors = std::move(anchors.value);
        model.mesh = std::move(mesh);
        log_info("paint model '" + model.mesh.name + "': " + std::to_string(model.mesh.triangle_count()) +
                 " triangles, " + std::to_string(model.anchors.size()) + " anchors, built in " +
                 std::to_string(model.build_ms) + " ms");
        return Result<PaintModel>::success(std::move(model));
    }

    inline Result<std::vector<PaintModel>> build_paint_models(
        const std::vector<MeshData>& meshes,
        const RenderConfig& cfg,
        const BrushConfig& brushes,
        uint32_t seed = kDefaultAnchorSeed
    )
    {
        std::vector<PaintModel> out{};
        out.reserve(meshes.size());
        for (const MeshData& m : meshes)
        {
            auto model = build_paint_model(m, cfg, brushes, seed);
            if (!model) return Result<std::vector<PaintModel>>::forward_failure(model);
            out.push_back(std::move(model.value));
        }
        return Result<std::vector<PaintModel>>::success(std::move(out));
    }
}
