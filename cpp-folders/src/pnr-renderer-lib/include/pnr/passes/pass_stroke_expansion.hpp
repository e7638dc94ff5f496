#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: pass_stroke_expansion.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн passes модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/core/context.hpp"
#include "pnr/core/time.hpp"
#include "pnr/frame/frame_inputs.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/gfx/rt_handle.hpp"
#include "pnr/gfx/rt_registry.hpp"
#include "pnr/job/parallel_for.hpp"
#include "pnr/render/rasterizer.hpp"
#include "pnr/resources/brush_atlas.hpp"
#include "pnr/stroke/stroke_anchor.hpp"

namespace pnr
{
    // Cell доторх u-г atlas-ийн u' руу: u' = (u + variant) / N.
    inline float brush_atlas_u(float u, int brush_variant, int brush_count)
    {
        const float n = (float)std::max(1, brush_count);
        return (u + (float)brush_variant) / n;
    }

    // Сонгосон cell-ээс гадуур гарахгүйгээр mask-ийн R сувгийг bilinear-аар уншина.
    inline float sample_brush_mask(const BrushAtlas& atlas, float atlas_u, float v, int brush_variant)
    {
        const Texture2DData& t = atlas.texture;
        if (!t.valid() || atlas.cell_px <= 0) return 1.0f;
        const int cell_x0 = std::clamp(brush_variant, 0, atlas.brush_count - 1) * atlas.cell_px;
        const int cell_x1 = cell_x0 + atlas.cell_px - 1;

        const float fx = atlas_u * (float)t.w - 0.5f;
        const float fy = v * (float)t.h - 0.5f;
        const int bx = (int)std::floor(fx);
        const int by = (int)std::floor(fy);
        const float tx = fx - (float)bx;
        const float ty = fy - (float)by;
        const int x0 = std::clamp(bx, cell_x0, cell_x1);
        const int x1 = std::clamp(bx + 1, cell_x0, cell_x1);
        const int y0 = std::clamp(by, 0, t.h - 1);
        const int y1 = std::clamp(by + 1, 0, t.h - 1);

        const float m00 = (float)t.at(x0, y0).r;
        const float m10 = (float)t.at(x1, y0).r;
        const float m01 = (float)t.at(x0, y1).r;
        const float m11 = (float)t.at(x1, y1).r;
        const float m = (m00 + (m10 - m00) * tx) * (1.0f - ty) + (m01 + (m11 - m01) * tx) * ty;
        return m * (1.0f / 255.0f);
    }

    // Source-over: dst = src * a + dst * (1 - a).
    inline void blend_source_over(ColorF& dst, const glm::vec3& src, float alpha)
    {
        const float a = std::clamp(alpha, 0.0f, 1.0f);
        const float ia = 1.0f - a;
        dst.r = src.r * a + dst.r * ia;
        dst.g = src.g * a + dst.g * ia;
        dst.b = src.b * a + dst.b * ia;
        dst.a = a + dst.a * ia;
    }

    struct StrokeQuad
    {
        std::array<StrokeRasterVertex, 6> verts{};
        glm::vec3 color{0.0f};
        int brush_variant = 0;
    };

    // Нэг stroke-ийг хоёр гурвалжин (6 орой) болгон дэлгэнэ. Булан бүр
    // clip + (axis_u * sx + axis_v * sy) * brush_size, sx, sy in {-1, 1}.
    inline StrokeQuad expand_stroke_quad(
        const ShadedStroke& s,
        float brush_size,
        bool use_tbn,
        const glm::vec4& screen_axis_u,
        const glm::vec4& screen_axis_v
    )
    {
        const glm::vec4 au = (use_tbn ? s.axis_u : screen_axis_u) * brush_size;
        const glm::vec4 av = (use_tbn ? s.axis_v : screen_axis_v) * brush_size;

        const StrokeRasterVertex c00{s.clip - au - av, glm::vec2(0.0f, 0.0f)};
        const StrokeRasterVertex c10{s.clip + au - av, glm::vec2(1.0f, 0.0f)};
        const StrokeRasterVertex c11{s.clip + au + av, glm::vec2(1.0f, 1.0f)};
        const StrokeRasterVertex c01{s.clip - au + av, glm::vec2(0.0f, 1.0f)};

        StrokeQuad q{};
        q.verts = {c00, c10, c11, c00, c11, c01};
        q.color = glm::vec3(s.color);
        q.brush_variant = s.brush_variant;
        return q;
    }

    // Stroke бүрийг quad болгож brush mask-аар нь Canvas руу alpha blending хийнэ.
    // Эрэмбэлэлт хийхгүй: stroke-ууд ирсэн дарааллаараа зурагдана.
    class PassStrokeExpansion
    {
    public:
        struct Inputs
        {
            const std::vector<ShadedStroke>* strokes = nullptr;
            const BrushAtlas* atlas = nullptr;
            const FrameCamera* camera = nullptr;
            const RenderConfig* cfg = nullptr;
            RTRegistry* rtr = nullptr;

            RT_CanvasHandle rt_canvas{}; // output
        };

        explicit PassStrokeExpansion(const BrushConfig& brushes) : brushes_(brushes) {}

        bool execute(Context& ctx, const Inputs& in)
        {
            if (!in.strokes || !in.atlas || !in.camera || !in.cfg || !in.rtr) return false;
            if (!in.rt_canvas.valid()) return false;
            if (!in.atlas->valid() || in.atlas->brush_count != brushes_.brush_count) return false;

            auto* canvas = in.rtr->get<RT_Canvas>(in.rt_canvas);
            if (!canvas || canvas->w <= 0 || canvas->h <= 0) return false;

            ScopedTimerMs timer(&ctx.debug.ms_expansion);
            canvas->clear(in.cfg->background);

            // Камерт харсан тогтмол тэнхлэг: view орон зайн X, Y нэгж вектор проекцлогдсон хэлбэрээрээ.
            const glm::vec4 screen_u = in.camera->proj * glm::vec4(1.0f, 0.0f, 0.0f, 0.0f);
            const glm::vec4 screen_v = in.camera->proj * glm::vec4(0.0f, 1.0f, 0.0f, 0.0f);

            quads_.clear();
            quads_.reserve(in.strokes->size());
            for (const ShadedStroke& s : *in.strokes)
            {
                quads_.push_back(expand_stroke_quad(s, in.cfg->brush_size, in.cfg->enable_brush_tbn, screen_u, screen_v));
            }
            ctx.debug.strokes_expanded += quads_.size();

            const int W = canvas->w;
            const int H = canvas->h;
            const BrushAtlas& atlas = *in.atlas;
            const int n_brushes = brushes_.brush_count;
            std::atomic<uint64_t> discarded{0};
            std::atomic<uint64_t> clipped{0};

            // Мөрийн band бүрийг нэг л worker эзэмшинэ, band дотор stroke-уудын дараалал хадгалагдана.
            parallel_for_1d(ctx.job_system, 0, H, 16, [&](int yb, int ye)
            {
                uint64_t c_discarded = 0;
                uint64_t c_clipped = 0;
                for (const StrokeQuad& q : quads_)
                {
                    bool quad_clipped = false;
                    for (int t = 0; t < 2; ++t)
                    {
                        const StrokeRasterVertex& a = q.verts[(size_t)t * 3 + 0];
                        const StrokeRasterVertex& b = q.verts[(size_t)t * 3 + 1];
                        const StrokeRasterVertex& c = q.verts[(size_t)t * 3 + 2];
                        const bool drawn = raster_stroke_triangle_rows(a, b, c, W, H, yb, ye,
                            [&](int x, int y, const glm::vec2& uv)
                            {
                                const float au = brush_atlas_u(uv.x, q.brush_variant, n_brushes);
                                if (au > 1.0f)
                                {
                                    ++c_discarded;
                                    return;
                                }
                                const float mask = sample_brush_mask(atlas, au, uv.y, q.brush_variant);
                                const float alpha = 1.0f - mask;
                                if (alpha <= 0.0f) return;
                                blend_source_over(canvas->color.at(x, y), q.color, alpha);
                            });
                        if (!drawn) quad_clipped = true;
                    }
                    if (quad_clipped && yb == 0) ++c_clipped;
                }
                discarded += c_discarded;
                clipped += c_clipped;
            });

            ctx.debug.fragments_discarded += discarded.load();
            ctx.debug.strokes_clipped += clipped.load();
            return true;
        }

    private:
        BrushConfig brushes_{};
        std::vector<StrokeQuad> quads_{};
    };
}
