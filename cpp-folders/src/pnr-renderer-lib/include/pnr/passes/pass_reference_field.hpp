#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: pass_reference_field.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн passes модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <vector>

#include "pnr/core/context.hpp"
#include "pnr/core/time.hpp"
#include "pnr/frame/frame_inputs.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/gfx/rt_handle.hpp"
#include "pnr/gfx/rt_registry.hpp"
#include "pnr/render/rasterizer.hpp"
#include "pnr/shader/builtin_shaders.hpp"
#include "pnr/stroke/paint_model.hpp"

namespace pnr
{
    // Mesh-үүдийг ердийн гэрэлтүүлэгтэйгээр Reference Field руу зурна.
    class PassReferenceField
    {
    public:
        struct Inputs
        {
            const std::vector<PaintModel>* models = nullptr;
            const Texture2DData* albedo = nullptr;
            const FrameCamera* camera = nullptr;
            const RenderConfig* cfg = nullptr;
            RTRegistry* rtr = nullptr;

            RT_Reference rt_reference{}; // output
        };

        bool execute(Context& ctx, const Inputs& in)
        {
            if (!in.models || !in.camera || !in.cfg || !in.rtr) return false;
            if (!in.rt_reference.valid()) return false;

            auto* rf = in.rtr->get<RT_ReferenceField>(in.rt_reference);
            if (!rf || rf->w <= 0 || rf->h <= 0) return false;

            ScopedTimerMs timer(&ctx.debug.ms_reference);
            rf->clear(in.cfg->background);

            ShaderUniforms u{};
            u.model = in.camera->model;
            u.viewproj = in.camera->viewproj();
            u.camera_pos = in.camera->position;
            u.lighting = in.cfg->lighting;
            u.quantization = in.cfg->quantization;
            u.base_color_tex = (in.albedo && in.albedo->valid()) ? in.albedo : nullptr;

            RasterizerConfig rast_cfg{};
            rast_cfg.job_system = ctx.job_system;

            const ShaderProgram prog = make_reference_field_program();
            for (const PaintModel& m : *in.models)
            {
                const RasterizerStats st = rasterize_mesh(m.mesh, prog, u, rf, rast_cfg);
                ctx.debug.tri_input += st.tri_input;
                ctx.debug.tri_raster += st.tri_raster;
            }
            return true;
        }
    };
}
