#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: rasterizer.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн render модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/camera/convention.hpp"
#include "pnr/job/parallel_for.hpp"
#include "pnr/resources/mesh.hpp"
#include "pnr/shader/types.hpp"

namespace pnr
{
    struct RasterizerConfig
    {
        IJobSystem* job_system = nullptr;
        int parallel_min_rows = 8;
        int parallel_min_pixels = 128 * 128;
    };

    struct RasterizerStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
    };

    namespace detail
    {
        struct RasterVertex
        {
            glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};

            // Raster шатанд шууд хэрэглэгдэх world/normal/uv өгөгдөл.
            glm::vec3 world_pos{0.0f};
            glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
            glm::vec2 uv{0.0f};
        };

        inline RasterVertex lerp_rv(const RasterVertex& a, const RasterVertex& b, float t)
        {
            RasterVertex o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.world_pos = glm::mix(a.world_pos, b.world_pos, t);
            o.normal_ws = glm::normalize(glm::mix(a.normal_ws, b.normal_ws, t));
            o.uv = glm::mix(a.uv, b.uv, t);
            return o;
        }

        inline float plane_dist_left(const RasterVertex& v) { return v.clip.x + v.clip.w; }
        inline float plane_dist_right(const RasterVertex& v) { return v.clip.w - v.clip.x; }
        inline float plane_dist_bottom(const RasterVertex& v) { return v.clip.y + v.clip.w; }
        inline float plane_dist_top(const RasterVertex& v) { return v.clip.w - v.clip.y; }
        inline float plane_dist_near(const RasterVertex& v) { return v.clip.z + v.clip.w; }
        inline float plane_dist_far(const RasterVertex& v) { return v.clip.w - v.clip.z; }

        template <typename PlaneDistFn>
        inline std::vector<RasterVertex> clip_polygon_plane(const std::vector<RasterVertex>& in_poly, PlaneDistFn plane_dist_fn)
        {
            std::vector<RasterVertex> out{};
            if (in_poly.empty()) return out;

            out.reserve(in_poly.size() + 2);
            for (size_t i = 0; i < in_poly.size(); ++i)
            {
                const RasterVertex& cur = in_poly[i];
                const RasterVertex& nxt = in_poly[(i + 1) % in_poly.size()];
                const float da = plane_dist_fn(cur);
                const float db = plane_dist_fn(nxt);
                const bool cur_in = da >= 0.0f;
                const bool nxt_in = db >= 0.0f;

                if (cur_in && nxt_in)
                {
                    out.push_back(nxt);
                }
                else if (cur_in != nxt_in)
                {
                    const float denom = da - db;
                    if (std::abs(denom) > 1e-8f) out.push_back(lerp_rv(cur, nxt, da / denom));
                    if (nxt_in) out.push_back(nxt);
                }
            }
            return out;
        }

        inline std::vector<RasterVertex> clip_polygon_frustum(const std::vector<RasterVertex>& in_poly)
        {
            std::vector<RasterVertex> poly = in_poly;
            poly = clip_polygon_plane(poly, plane_dist_left);
            poly = clip_polygon_plane(poly, plane_dist_right);
            poly = clip_polygon_plane(poly, plane_dist_bottom);
            poly = clip_polygon_plane(poly, plane_dist_top);
            poly = clip_polygon_plane(poly, plane_dist_near);
            poly = clip_polygon_plane(poly, plane_dist_far);
            return poly;
        }
    }

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 v0 = b - a;
        const glm::vec2 v1 = c - a;
        const glm::vec2 v2 = p - a;
        const float den = v0.x * v1.y - v1.x * v0.y;
        if (std::abs(den) < 1e-8f) return glm::vec3(-1.0f);
        const float inv_den = 1.0f / den;
        const float v = (v2.x * v1.y - v1.x * v2.y) * inv_den;
        const float w = (v0.x * v2.y - v2.x * v0.y) * inv_den;
        const float u = 1.0f - v - w;
        return glm::vec3(u, v, w);
    }

    // Mesh-ийг Reference Field руу зурна. z-buffer нь хамгийн ойрын гадаргууг сонгоно,
    // fragment shader-ийн гаргасан өнгө (alpha = гадаргуугийн гүн) color руу бичигдэнэ.
    inline RasterizerStats rasterize_mesh(
        const MeshData& mesh,
        const ShaderProgram& program,
        const ShaderUniforms& uniforms,
        RT_ReferenceField* target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        if (!target || !program.valid()) return stats;
        if (mesh.positions.empty()) return stats;
        const int W = target->w;
        const int H = target->h;
        if (W <= 0 || H <= 0) return stats;

        auto read_v = [&](uint32_t idx) -> ShaderVertex {
            ShaderVertex v{};
            v.position = mesh.positions[(size_t)idx];
            if (idx < mesh.normals.size()) v.normal = mesh.normals[(size_t)idx];
            if (idx < mesh.uvs.size()) v.uv = mesh.uvs[(size_t)idx];
            return v;
        };

        const bool indexed = !mesh.indices.empty();
        const size_t tri_count = indexed ? (mesh.indices.size() / 3) : (mesh.positions.size() / 3);
        for (size_t ti = 0; ti < tri_count; ++ti)
        {
            stats.tri_input++;
            uint32_t i0 = 0, i1 = 0, i2 = 0;
            if (indexed)
            {
                i0 = mesh.indices[ti * 3 + 0];
                i1 = mesh.indices[ti * 3 + 1];
                i2 = mesh.indices[ti * 3 + 2];
            }
            else
            {
                i0 = (uint32_t)(ti * 3 + 0);
                i1 = (uint32_t)(ti * 3 + 1);
                i2 = (uint32_t)(ti * 3 + 2);
            }
            if (i0 >= mesh.positions.size() || i1 >= mesh.positions.size() || i2 >= mesh.positions.size()) continue;

            const VertexOut v0 = program.vs(read_v(i0), uniforms);
            const VertexOut v1 = program.vs(read_v(i1), uniforms);
            const VertexOut v2 = program.vs(read_v(i2), uniforms);

            const detail::RasterVertex rv0{v0.clip, v0.world_pos, v0.normal_ws, v0.uv};
            const detail::RasterVertex rv1{v1.clip, v1.world_pos, v1.normal_ws, v1.uv};
            const detail::RasterVertex rv2{v2.clip, v2.world_pos, v2.normal_ws, v2.uv};

            const auto fully_inside_clip = [](const detail::RasterVertex& rv) -> bool
            {
                const glm::vec4 c = rv.clip;
                if (!(c.w > 0.0f)) return false;
                return
                    (c.x >= -c.w && c.x <= c.w) &&
                    (c.y >= -c.w && c.y <= c.w) &&
                    (c.z >= -c.w && c.z <= c.w);
            };

            std::vector<detail::RasterVertex> poly = {rv0, rv1, rv2};
            // Ихэнх кадарт харагдаж буй трианглууд clip volume дотор байдаг тул clip-ийг алгасна.
            if (!(fully_inside_clip(rv0) && fully_inside_clip(rv1) && fully_inside_clip(rv2)))
            {
                poly = detail::clip_polygon_frustum(poly);
            }
            if (poly.size() < 3) continue;

            // Клип хийсний дараах олон өнцөгтийг fan аргаар гурвалжилна.
            for (size_t k = 1; k + 1 < poly.size(); ++k)
            {
                stats.tri_after_clip++;
                const detail::RasterVertex& a = poly[0];
                const detail::RasterVertex& b = poly[k];
                const detail::RasterVertex& c = poly[k + 1];

                const glm::vec3 n0 = glm::vec3(a.clip) / a.clip.w;
                const glm::vec3 n1 = glm::vec3(b.clip) / b.clip.w;
                const glm::vec3 n2 = glm::vec3(c.clip) / c.clip.w;
                if (!std::isfinite(n0.x) || !std::isfinite(n0.y) || !std::isfinite(n0.z)) continue;
                if (!std::isfinite(n1.x) || !std::isfinite(n1.y) || !std::isfinite(n1.z)) continue;
                if (!std::isfinite(n2.x) || !std::isfinite(n2.y) || !std::isfinite(n2.z)) continue;

                const glm::vec2 s0 = ndc_to_screen(glm::vec2(n0), W, H);
                const glm::vec2 s1 = ndc_to_screen(glm::vec2(n1), W, H);
                const glm::vec2 s2 = ndc_to_screen(glm::vec2(n2), W, H);

                const glm::vec2 e0 = s1 - s0;
                const glm::vec2 e1 = s2 - s0;
                const float signed_area2 = e0.x * e1.y - e0.y * e1.x;
                // Хоёр талыг хоёуланг нь зурна. Хаалттай mesh дээр z-buffer арын талыг дарна.
                if (std::abs(signed_area2) < 1e-10f) continue;

                const int minx = std::max(0, (int)std::floor(std::min({s0.x, s1.x, s2.x})));
                const int maxx = std::min(W - 1, (int)std::ceil(std::max({s0.x, s1.x, s2.x})));
                const int miny = std::max(0, (int)std::floor(std::min({s0.y, s1.y, s2.y})));
                const int maxy = std::min(H - 1, (int)std::ceil(std::max({s0.y, s1.y, s2.y})));
                if (minx > maxx || miny > maxy) continue;
                stats.tri_raster++;

                const float invw0 = 1.0f / a.clip.w;
                const float invw1 = 1.0f / b.clip.w;
                const float invw2 = 1.0f / c.clip.w;
                const glm::vec3 wpw0 = a.world_pos * invw0;
                const glm::vec3 wpw1 = b.world_pos * invw1;
                const glm::vec3 wpw2 = c.world_pos * invw2;
                const glm::vec3 npw0 = a.normal_ws * invw0;
                const glm::vec3 npw1 = b.normal_ws * invw1;
                const glm::vec3 npw2 = c.normal_ws * invw2;
                const glm::vec2 uvw0 = a.uv * invw0;
                const glm::vec2 uvw1 = b.uv * invw1;
                const glm::vec2 uvw2 = c.uv * invw2;

                auto raster_rows = [&](int yb, int ye)
                {
                    for (int y = yb; y < ye; ++y)
                    {
                        for (int x = minx; x <= maxx; ++x)
                        {
                            const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                            const glm::vec3 bc = barycentric_2d(p, s0, s1, s2);
                            if (bc.x < 0.0f || bc.y < 0.0f || bc.z < 0.0f) continue;

                            // 1/w interpolation: perspective-correct position/normal/uv тооцоо.
                            const float denom = bc.x * invw0 + bc.y * invw1 + bc.z * invw2;
                            if (denom <= 1e-10f) continue;
                            const float inv_denom = 1.0f / denom;

                            const float z_ndc = bc.x * n0.z + bc.y * n1.z + bc.z * n2.z;
                            const float z01 = glm::clamp(ndc_depth01(z_ndc), 0.0f, 1.0f);
                            float& zbuf = target->zbuffer.at(x, y);
                            if (z01 >= zbuf) continue;

                            FragmentIn fin{};
                            fin.world_pos = (bc.x * wpw0 + bc.y * wpw1 + bc.z * wpw2) * inv_denom;
                            fin.normal_ws = glm::normalize((bc.x * npw0 + bc.y * npw1 + bc.z * npw2) * inv_denom);
                            fin.uv = (bc.x * uvw0 + bc.y * uvw1 + bc.z * uvw2) * inv_denom;
                            fin.depth01 = z01;
                            fin.px = x;
                            fin.py = y;

                            const FragmentOut fout = program.fs(fin, uniforms);
                            if (fout.discard) continue;

                            zbuf = z01;
                            target->color.at(x, y) = fout.color;
                        }
                    }
                };

                const int bbox_rows = maxy - miny + 1;
                const int bbox_pixels = (maxx - minx + 1) * bbox_rows;
                // Том bbox дээр л parallel замыг асааж scheduling overhead-оос зайлсхийж байна.
                const bool use_parallel =
                    config.job_system &&
                    bbox_rows >= std::max(1, config.parallel_min_rows) &&
                    bbox_pixels >= std::max(1, config.parallel_min_pixels);
                if (use_parallel)
                {
                    parallel_for_1d(config.job_system, miny, maxy + 1, std::max(1, config.parallel_min_rows), raster_rows);
                }
                else
                {
                    raster_rows(miny, maxy + 1);
                }
            }
        }
        return stats;
    }

    // Stroke quad-ын нэг оройн өгөгдөл: clip байрлал + brush cell доторх uv.
    struct StrokeRasterVertex
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec2 uv{0.0f};
    };

    // Нэг гурвалжныг [y_begin, y_end) мөрийн хүрээнд perspective-correct uv-тэйгээр
    // хамрах pixel бүрт fn(x, y, uv)-г дуудна. Near plane-ийн өмнө (эсвэл нүдний ард) орсон
    // орой байвал гурвалжныг бүхэлд нь алгасаж false буцаана.
    template<typename Fn>
    inline bool raster_stroke_triangle_rows(
        const StrokeRasterVertex& a,
        const StrokeRasterVertex& b,
        const StrokeRasterVertex& c,
        int W,
        int H,
        int y_begin,
        int y_end,
        Fn&& fn
    )
    {
        constexpr float min_w = 1e-6f;
        if (!(a.clip.w > min_w) || !(b.clip.w > min_w) || !(c.clip.w > min_w)) return false;
        if (a.clip.z < -a.clip.w || b.clip.z < -b.clip.w || c.clip.z < -c.clip.w) return false;

        const float invw0 = 1.0f / a.clip.w;
        const float invw1 = 1.0f / b.clip.w;
        const float invw2 = 1.0f / c.clip.w;
        const glm::vec2 s0 = ndc_to_screen(glm::vec2(a.clip) * invw0, W, H);
        const glm::vec2 s1 = ndc_to_screen(glm::vec2(b.clip) * invw1, W, H);
        const glm::vec2 s2 = ndc_to_screen(glm::vec2(c.clip) * invw2, W, H);
        if (!std::isfinite(s0.x + s0.y + s1.x + s1.y + s2.x + s2.y)) return false;

        // int руу хөрвүүлэхээс өмнө [-1, W] x [-1, H]-д хавчина.
        const float fx0 = std::clamp(std::min({s0.x, s1.x, s2.x}), -1.0f, (float)W);
        const float fx1 = std::clamp(std::max({s0.x, s1.x, s2.x}), -1.0f, (float)W);
        const float fy0 = std::clamp(std::min({s0.y, s1.y, s2.y}), -1.0f, (float)H);
        const float fy1 = std::clamp(std::max({s0.y, s1.y, s2.y}), -1.0f, (float)H);
        const int minx = std::max(0, (int)std::floor(fx0));
        const int maxx = std::min(W - 1, (int)std::ceil(fx1));
        const int miny = std::max(y_begin, (int)std::floor(fy0));
        const int maxy = std::min(y_end - 1, (int)std::ceil(fy1));
        if (minx > maxx || miny > maxy) return true;

        const glm::vec2 uvw0 = a.uv * invw0;
        const glm::vec2 uvw1 = b.uv * invw1;
        const glm::vec2 uvw2 = c.uv * invw2;
        for (int y = miny; y <= maxy; ++y)
        {
            for (int x = minx; x <= maxx; ++x)
            {
                const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                const glm::vec3 bc = barycentric_2d(p, s0, s1, s2);
                if (bc.x < 0.0f || bc.y < 0.0f || bc.z < 0.0f) continue;
                const float denom = bc.x * invw0 + bc.y * invw1 + bc.z * invw2;
                if (denom <= 1e-10f) continue;
                fn(x, y, (bc.x * uvw0 + bc.y * uvw1 + bc.z * uvw2) / denom);
            }
        }
        return true;
    }
}
