#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: pass_stroke_projection.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн passes модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <atomic>
#include <cmath>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/camera/convention.hpp"
#include "pnr/core/context.hpp"
#include "pnr/core/time.hpp"
#include "pnr/frame/frame_inputs.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/gfx/rt_handle.hpp"
#include "pnr/gfx/rt_registry.hpp"
#include "pnr/job/parallel_for.hpp"
#include "pnr/resources/texture.hpp"
#include "pnr/shader/paint_shading.hpp"
#include "pnr/stroke/paint_model.hpp"
#include "pnr/stroke/stroke_anchor.hpp"

namespace pnr
{
    enum class AnchorVerdict
    {
        Survived = 0,
        NonFinite = 1,
        BehindEye = 2,
        NearClipped = 3,
        Occluded = 4
    };

    // own - tolerance <= reference бол anchor харагдана.
    inline bool anchor_passes_occlusion(float own_depth, float reference_depth, float tolerance)
    {
        return own_depth - tolerance <= reference_depth;
    }

    // Anchor бүрийг проекцлоод Reference Field-ийн гүнтэй харьцуулж, амьд үлдсэнийг нь будна.
    class PassStrokeProjection
    {
    public:
        struct Inputs
        {
            const std::vector<PaintModel>* models = nullptr;
            const Texture2DData* albedo = nullptr;
            const FrameCamera* camera = nullptr;
            const RenderConfig* cfg = nullptr;
            RTRegistry* rtr = nullptr;

            RT_Reference rt_reference{}; // input
            std::vector<ShadedStroke>* out = nullptr;
        };

        explicit PassStrokeProjection(const BrushConfig& brushes) : brushes_(brushes) {}

        bool execute(Context& ctx, const Inputs& in)
        {
            if (!in.models || !in.camera || !in.cfg || !in.rtr || !in.out) return false;
            if (!in.rt_reference.valid()) return false;
            const auto* rf = in.rtr->get<RT_ReferenceField>(in.rt_reference);
            if (!rf || rf->w <= 0 || rf->h <= 0) return false;

            ScopedTimerMs timer(&ctx.debug.ms_projection);
            in.out->clear();

            const glm::mat4 mvp = in.camera->model_viewproj();
            const glm::mat4 model = in.camera->model;
            glm::mat3 nrm_m = glm::mat3(model);
            if (std::abs(glm::determinant(nrm_m)) > 1e-8f) nrm_m = glm::transpose(glm::inverse(nrm_m));
            const Texture2DData* albedo = (in.albedo && in.albedo->valid()) ? in.albedo : nullptr;
            const RenderConfig& cfg = *in.cfg;

            std::atomic<uint64_t> nonfinite{0};
            std::atomic<uint64_t> behind_eye{0};
            std::atomic<uint64_t> near_clipped{0};
            std::atomic<uint64_t> occluded{0};

            for (const PaintModel& m : *in.models)
            {
                const std::vector<StrokeAnchor>& anchors = m.anchors;
                ctx.debug.anchors_input += anchors.size();

                std::vector<ShadedStroke> part = parallel_collect_1d<ShadedStroke>(
                    ctx.job_system, 0, (int)anchors.size(), 1024,
                    [&](int b, int e, std::vector<ShadedStroke>& out)
                    {
                        uint64_t c_nonfinite = 0, c_behind = 0, c_near = 0, c_occluded = 0;
                        out.reserve((size_t)(e - b));
                        for (int i = b; i < e; ++i)
                        {
                            ShadedStroke s{};
                            switch (project_anchor(anchors[(size_t)i], mvp, model, nrm_m, *rf, albedo, in.camera->position, cfg, s))
                            {
                                case AnchorVerdict::Survived: out.push_back(s); break;
                                case AnchorVerdict::NonFinite: ++c_nonfinite; break;
                                case AnchorVerdict::BehindEye: ++c_behind; break;
                                case AnchorVerdict::NearClipped: ++c_near; break;
                                case AnchorVerdict::Occluded: ++c_occluded; break;
                            }
                        }
                        nonfinite += c_nonfinite;
                        behind_eye += c_behind;
                        near_clipped += c_near;
                        occluded += c_occluded;
                    });

                in.out->insert(in.out->end(), part.begin(), part.end());
            }

            ctx.debug.anchors_nonfinite += nonfinite.load();
            ctx.debug.anchors_behind_eye += behind_eye.load();
            ctx.debug.anchors_near_clipped += near_clipped.load();
            ctx.debug.anchors_occluded += occluded.load();
            ctx.debug.anchors_survived += in.out->size();
            return true;
        }

        AnchorVerdict project_anchor(
            const StrokeAnchor& a,
            const glm::mat4& mvp,
            const glm::mat4& model,
            const glm::mat3& normal_matrix,
            const RT_ReferenceField& rf,
            const Texture2DData* albedo,
            const glm::vec3& camera_pos,
            const RenderConfig& cfg,
            ShadedStroke& out
        ) const
        {
            const glm::vec4 clip = mvp * glm::vec4(a.position, 1.0f);
            if (!std::isfinite(clip.x) || !std::isfinite(clip.y) || !std::isfinite(clip.z) || !std::isfinite(clip.w))
            {
                return AnchorVerdict::NonFinite;
            }
            if (!(clip.w > 1e-6f)) return AnchorVerdict::BehindEye;
            // Нүд ба near plane-ийн хооронд. Clamp хийсэн гүн нь occlusion шалгуурыг үргэлж давах тул энд хаяна.
            if (clip.z < -clip.w) return AnchorVerdict::NearClipped;

            const glm::vec2 uv = clip_to_screen_uv(clip);
            const ColorF ref = rf.sample_nearest(uv);
            const float own_depth = clip_depth01(clip);
            if (!anchor_passes_occlusion(own_depth, ref.a, cfg.occlusion_tolerance)) return AnchorVerdict::Occluded;

            glm::vec3 color{0.0f};
            if (cfg.color_source == ColorSource::ReferenceField)
            {
                color = rgb_of(ref);
            }
            else
            {
                // Anchor дээрх бие даасан гэрэлтүүлэг. Reference Field-ийн shader-тэй битийн түвшинд
                // таарах шаардлагагүй.
                const glm::vec3 world_pos = glm::vec3(model * glm::vec4(a.position, 1.0f));
                const glm::vec3 albedo_rgb = glm::vec3(sample_texture2d_bilinear_repeat(albedo, a.uv));
                const PaintLighting& l = cfg.lighting;
                const glm::vec3 N = glm::normalize(normal_matrix * a.normal);
                const glm::vec3 L = glm::normalize(-l.light_dir_ws);
                const glm::vec3 V = glm::normalize(camera_pos - world_pos);
                const glm::vec3 H = glm::normalize(L + V);
                const float diff = std::max(0.0f, glm::dot(N, L));
                const float spec = std::pow(std::max(0.0f, glm::dot(N, H)), l.shininess);
                const float brightness = quantize_brightness(l.ambient + l.diffuse * diff + l.specular * spec, cfg.quantization);
                color = albedo_rgb * l.light_color * brightness;
            }

            out.clip = clip;
            out.color = glm::vec4(color, 1.0f);
            out.axis_u = mvp * glm::vec4(a.tangent, 0.0f);
            out.axis_v = mvp * glm::vec4(a.bitangent, 0.0f);
            out.brush_variant = std::clamp(a.brush_variant, 0, std::max(1, brushes_.brush_count) - 1);
            return AnchorVerdict::Survived;
        }

    private:
        BrushConfig brushes_{};
    };
}
