#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: pass_paint_post.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн passes модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>

#include <glm/glm.hpp>

#include "pnr/core/context.hpp"
#include "pnr/core/time.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/gfx/rt_handle.hpp"
#include "pnr/gfx/rt_registry.hpp"
#include "pnr/job/parallel_for.hpp"
#include "pnr/resources/texture.hpp"
#include "pnr/shader/paint_shading.hpp"

namespace pnr
{
    // Canvas (эсвэл Raster горимд Reference Field)-ийг paper texture-ээр модуляц хийж,
    // saturation тохируулаад тунгалаг биш LDR зураг гаргана.
    class PassPaintPost
    {
    public:
        struct Inputs
        {
            const RenderConfig* cfg = nullptr;
            const Texture2DData* paper = nullptr;
            RTRegistry* rtr = nullptr;

            RTHandle rt_source{};    // input: RT_Canvas эсвэл RT_ReferenceField
            RT_Output rt_ldr{};      // output
        };

        bool execute(Context& ctx, const Inputs& in)
        {
            if (!in.cfg || !in.rtr) return false;
            if (!in.rt_source.valid() || !in.rt_ldr.valid()) return false;

            const PixelBuffer2D<ColorF>* src = nullptr;
            switch (in.rtr->kind(in.rt_source))
            {
                case RTKind::Canvas:
                {
                    const auto* c = in.rtr->get<RT_Canvas>(in.rt_source);
                    if (c) src = &c->color;
                    break;
                }
                case RTKind::ReferenceField:
                {
                    const auto* rf = in.rtr->get<RT_ReferenceField>(in.rt_source);
                    if (rf) src = &rf->color;
                    break;
                }
                default:
                    break;
            }
            auto* ldr = in.rtr->get<RT_ColorLDR>(in.rt_ldr);
            if (!src || !ldr || src->w <= 0 || src->h <= 0 || ldr->w <= 0 || ldr->h <= 0) return false;

            ScopedTimerMs timer(&ctx.debug.ms_post);
            const int w = std::min(src->w, ldr->w);
            const int h = std::min(src->h, ldr->h);
            const bool use_paper = in.cfg->enable_canvas && in.paper && in.paper->valid();
            const float saturation = in.cfg->saturation;

            parallel_for_1d(ctx.job_system, 0, h, 8, [&](int yb, int ye)
            {
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = 0; x < w; ++x)
                    {
                        const ColorF s = src->at(x, y);
                        float paper_r = 1.0f;
                        if (use_paper)
                        {
                            const glm::vec2 uv{((float)x + 0.5f) / (float)w, ((float)y + 0.5f) / (float)h};
                            paper_r = sample_texture2d_bilinear_repeat(in.paper, uv).r;
                        }
                        const glm::vec3 c = paint_post_color(rgb_of(s), paper_r, use_paper, saturation);
                        ldr->color.at(x, y) = to_color8(ColorF{c.r, c.g, c.b, 1.0f});
                    }
                }
            });
            return true;
        }
    };
}
