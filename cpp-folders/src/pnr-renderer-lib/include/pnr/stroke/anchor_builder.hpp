#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: anchor_builder.hpp
    МОДУЛЬ: stroke
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн stroke модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/core/log.hpp"
#include "pnr/core/result.hpp"
#include "pnr/resources/mesh.hpp"
#include "pnr/stroke/stroke_anchor.hpp"

namespace pnr
{
    inline constexpr uint32_t kDefaultAnchorSeed = 0x5EEDu;

    struct AnchorBuildOptions
    {
        int stroke_density = 3000;
        int brush_count = 4;
        uint32_t seed = kDefaultAnchorSeed;
    };

    struct AnchorBuildStats
    {
        double total_area = 0.0;
        size_t triangles_used = 0;
        size_t triangles_skipped = 0;
        size_t target_count = 0;
    };

    // Нийт талбай A, нягт d үед N = max(d, round(A * d)). d-ээр хатуу өсөх функц.
    inline size_t anchor_target_count(double total_area, int stroke_density)
    {
        if (stroke_density <= 0) return 0;
        const double d = (double)stroke_density;
        const double scaled = std::round(std::max(0.0, total_area) * d);
        return (size_t)std::max(d, scaled);
    }

    namespace detail
    {
        inline bool finite3(const glm::vec3& v)
        {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        inline glm::vec3 any_perpendicular(const glm::vec3& n)
        {
            const glm::vec3 a = std::abs(n.x) < 0.9f ? glm::vec3(1.0f, 0.0f, 0.0f) : glm::vec3(0.0f, 1.0f, 0.0f);
            return glm::normalize(a - n * glm::dot(n, a));
        }

        // n-г тогтоож, t-г Gram-Schmidt-ээр ортогональ болгоно. b = n x t.
        inline void orthonormal_frame(const glm::vec3& n_in, const glm::vec3& t_in, StrokeAnchor& a)
        {
            const glm::vec3 n = glm::normalize(n_in);
            glm::vec3 t = t_in - n * glm::dot(n, t_in);
            const float len = glm::length(t);
            t = (len > 1e-6f && std::isfinite(len)) ? t / len : any_perpendicular(n);
            a.normal = n;
            a.tangent = t;
            a.bitangent = glm::cross(n, t);
        }

        struct BuildTriangle
        {
            uint32_t i0, i1, i2;
            glm::vec3 face_normal;
            glm::vec3 uv_tangent;
            bool has_uv_tangent;
        };
    }

    // Mesh-ийн гадаргуу дээр талбайд пропорциональ санамсаргүй anchor-ууд тарааж байрлуулна.
    // Ижил mesh, options-д үр дүн яг ижил байна.
    inline Result<std::vector<StrokeAnchor>> build_stroke_anchor_set(
        const MeshData& mesh,
        const AnchorBuildOptions& opt,
        AnchorBuildStats* out_stats = nullptr
    )
    {
        using R = Result<std::vector<StrokeAnchor>>;
        if (opt.stroke_density <= 0)
        {
            return R::failure("stroke_density must be positive, got " + std::to_string(opt.stroke_density));
        }
        if (opt.brush_count < 1) return R::failure("brush_count must be at least 1");
        if (mesh.empty()) return R::failure("mesh '" + mesh.name + "' has no triangles");

        const bool use_normals = mesh.has_normals();
        const bool use_tangents = mesh.has_tangents();
        const bool use_uvs = mesh.has_uvs();

        std::vector<detail::BuildTriangle> tris{};
        std::vector<double> cdf{};
        tris.reserve(mesh.triangle_count());
        cdf.reserve(mesh.triangle_count());
        AnchorBuildStats stats{};

        for (size_t ti = 0; ti < mesh.triangle_count(); ++ti)
        {
            const uint32_t i0 = mesh.indices[ti * 3 + 0];
            const uint32_t i1 = mesh.indices[ti * 3 + 1];
            const uint32_t i2 = mesh.indices[ti * 3 + 2];
            if (i0 >= mesh.positions.size() || i1 >= mesh.positions.size() || i2 >= mesh.positions.size())
            {
                stats.triangles_skipped++;
                continue;
            }
            const glm::vec3& p0 = mesh.positions[i0];
            const glm::vec3& p1 = mesh.positions[i1];
            const glm::vec3& p2 = mesh.positions[i2];
            if (!detail::finite3(p0) || !detail::finite3(p1) || !detail::finite3(p2))
            {
                stats.triangles_skipped++;
                continue;
            }

            const glm::vec3 e1 = p1 - p0;
            const glm::vec3 e2 = p2 - p0;
            const glm::vec3 c = glm::cross(e1, e2);
            const double area = 0.5 * (double)glm::length(c);
            if (!(area > 1e-12) || !std::isfinite(area))
            {
                stats.triangles_skipped++;
                continue;
            }

            detail::BuildTriangle bt{i0, i1, i2, glm::normalize(c), e1, false};
            if (use_uvs)
            {
                const glm::vec2 duv1 = mesh.uvs[i1] - mesh.uvs[i0];
                const glm::vec2 duv2 = mesh.uvs[i2] - mesh.uvs[i0];
                const float r = duv1.x * duv2.y - duv2.x * duv1.y;
                if (std::abs(r) > 1e-12f)
                {
                    const glm::vec3 t = (e1 * duv2.y - e2 * duv1.y) / r;
                    if (detail::finite3(t))
                    {
                        bt.uv_tangent = t;
                        bt.has_uv_tangent = true;
                    }
                }
            }

            stats.total_area += area;
            tris.push_back(bt);
            cdf.push_back(stats.total_area);
        }
        stats.triangles_used = tris.size();

        if (tris.empty())
        {
            return R::failure("mesh '" + mesh.name + "': all " + std::to_string(stats.triangles_skipped) +
                              " triangles are degenerate");
        }
        if (stats.triangles_skipped > 0)
        {
            log_warn("anchor builder: skipped " + std::to_string(stats.triangles_skipped) + " degenerate triangle(s)");
        }

        stats.target_count = anchor_target_count(stats.total_area, opt.stroke_density);

        std::mt19937 rng(opt.seed);
        std::uniform_real_distribution<double> pick_area(0.0, stats.total_area);
        std::uniform_real_distribution<float> unit(0.0f, 1.0f);
        std::uniform_int_distribution<int> pick_brush(0, opt.brush_count - 1);

        std::vector<StrokeAnchor> anchors{};
        anchors.reserve(stats.target_count);
        for (size_t k = 0; k < stats.target_count; ++k)
        {
            const double r = pick_area(rng);
            size_t ti = (size_t)(std::upper_bound(cdf.begin(), cdf.end(), r) - cdf.begin());
            ti = std::min(ti, tris.size() - 1);
            const detail::BuildTriangle& bt = tris[ti];

            // Гурвалжин дотор жигд тархалттай barycentric.
            const float s = std::sqrt(unit(rng));
            const float r2 = unit(rng);
            const float w0 = 1.0f - s;
            const float w1 = r2 * s;
            const float w2 = 1.0f - w0 - w1;

            StrokeAnchor a{};
            a.position = w0 * mesh.positions[bt.i0] + w1 * mesh.positions[bt.i1] + w2 * mesh.positions[bt.i2];
            if (use_uvs) a.uv = w0 * mesh.uvs[bt.i0] + w1 * mesh.uvs[bt.i1] + w2 * mesh.uvs[bt.i2];

            glm::vec3 n = bt.face_normal;
            if (use_normals)
            {
                const glm::vec3 ni = w0 * mesh.normals[bt.i0] + w1 * mesh.normals[bt.i1] + w2 * mesh.normals[bt.i2];
                const float len = glm::length(ni);
                if (len > 1e-6f && std::isfinite(len)) n = ni / len;
            }

            glm::vec3 t = bt.has_uv_tangent ? bt.uv_tangent : glm::vec3(0.0f);
            if (use_tangents)
            {
                const glm::vec3 ti_v = w0 * mesh.tangents[bt.i0] + w1 * mesh.tangents[bt.i1] + w2 * mesh.tangents[bt.i2];
                if (detail::finite3(ti_v) && glm::length(ti_v) > 1e-6f) t = ti_v;
            }
            if (!bt.has_uv_tangent && glm::length(t) <= 1e-6f)
            {
                t = mesh.positions[bt.i1] - mesh.positions[bt.i0];
            }

            detail::orthonormal_frame(n, t, a);
            a.brush_variant = pick_brush(rng);
            anchors.push_back(a);
        }

        const double expected = (double)opt.stroke_density;
        const double actual = (double)anchors.size() / stats.total_area;
        const double error_pct = 100.0 * std::abs(actual - expected) / expected;
        log_info("anchor builder: total area " + std::to_string(stats.total_area) +
                 ", expected density " + std::to_string(expected) +
                 ", actual density " + std::to_string(actual) +
                 " (" + std::to_string(error_pct) + "% error), " +
                 std::to_string(anchors.size()) + " anchors");

        if (out_stats) *out_stats = stats;
        return R::success(std::move(anchors));
    }
}
