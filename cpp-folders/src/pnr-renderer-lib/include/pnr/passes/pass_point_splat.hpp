#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: pass_point_splat.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн passes модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>
#include <vector>

#include "pnr/camera/convention.hpp"
#include "pnr/core/context.hpp"
#include "pnr/core/time.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/gfx/rt_handle.hpp"
#include "pnr/gfx/rt_registry.hpp"
#include "pnr/render/rasterizer.hpp"
#include "pnr/stroke/stroke_anchor.hpp"

namespace pnr
{
    // Points горим: амьд үлдсэн stroke бүрийг нэг pixel-ээр Canvas руу тавина.
    class PassPointSplat
    {
    public:
        struct Inputs
        {
            const std::vector<ShadedStroke>* strokes = nullptr;
            const RenderConfig* cfg = nullptr;
            RTRegistry* rtr = nullptr;

            RT_CanvasHandle rt_canvas{}; // output
        };

        bool execute(Context& ctx, const Inputs& in)
        {
            if (!in.strokes || !in.cfg || !in.rtr || !in.rt_canvas.valid()) return false;
            auto* canvas = in.rtr->get<RT_Canvas>(in.rt_canvas);
            if (!canvas || canvas->w <= 0 || canvas->h <= 0) return false;

            ScopedTimerMs timer(&ctx.debug.ms_points);
            canvas->clear(in.cfg->background);
            for (const ShadedStroke& s : *in.strokes)
            {
                if (!(s.clip.w > 1e-6f)) continue;
                const glm::vec2 p = ndc_to_screen(glm::vec2(s.clip) / s.clip.w, canvas->w, canvas->h);
                // int руу хөрвүүлэхээс өмнө canvas-ийн хүрээгээр шүүнэ.
                if (!(p.x >= 0.0f && p.y >= 0.0f && p.x < (float)canvas->w && p.y < (float)canvas->h)) continue;
                const int x = std::min((int)p.x, canvas->w - 1);
                const int y = std::min((int)p.y, canvas->h - 1);
                canvas->color.at(x, y) = ColorF{s.color.r, s.color.g, s.color.b, 1.0f};
            }
            return true;
        }
    };
}
