#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/core/log.hpp"
#include "pnr/stroke/anchor_builder.hpp"
#include "pnr/stroke/paint_model.hpp"

#include "test_scene_utils.hpp"

namespace
{
    using pnr_test::approx_eq;

    size_t count_for(const pnr::MeshData& mesh, int density)
    {
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = density;
        const auto r = pnr::build_stroke_anchor_set(mesh, opt);
        return r.ok ? r.value.size() : 0;
    }

    bool frames_are_orthonormal(const std::vector<pnr::StrokeAnchor>& anchors)
    {
        for (const auto& a : anchors)
        {
            if (!approx_eq(glm::length(a.normal), 1.0f)) return false;
            if (!approx_eq(glm::length(a.tangent), 1.0f)) return false;
            if (!approx_eq(glm::length(a.bitangent), 1.0f)) return false;
            if (!approx_eq(glm::dot(a.normal, a.tangent), 0.0f)) return false;
            if (!approx_eq(glm::dot(a.normal, a.bitangent), 0.0f)) return false;
            if (!approx_eq(glm::dot(a.tangent, a.bitangent), 0.0f)) return false;
            // Баруун гарын суурь: t x b = n.
            if (!approx_eq(glm::dot(glm::cross(a.tangent, a.bitangent), a.normal), 1.0f)) return false;
        }
        return true;
    }

    bool test_anchor_count_strictly_monotone()
    {
        const pnr::MeshData box = pnr_test::make_unit_box_mesh();
        const pnr::MeshData quad = pnr::make_quad_mesh(0.5f);
        const pnr::MeshData tiny = pnr_test::make_bare_triangle_mesh(
            glm::vec3(0.0f), glm::vec3(0.1f, 0.0f, 0.0f), glm::vec3(0.0f, 0.1f, 0.0f));

        for (const pnr::MeshData* m : {&box, &quad, &tiny})
        {
            size_t prev = 0;
            for (int d = 1; d <= 60; ++d)
            {
                const size_t n = count_for(*m, d);
                if (n <= prev) return false;
                prev = n;
            }
        }
        return true;
    }

    bool test_anchor_count_scales_with_area()
    {
        const pnr::MeshData box = pnr_test::make_unit_box_mesh();
        if (count_for(box, 100) != 600) return false;
        if (pnr::anchor_target_count(6.0, 100) != 600) return false;
        if (pnr::anchor_target_count(0.005, 40) != 40) return false;
        if (pnr::anchor_target_count(1.0, 0) != 0) return false;
        return true;
    }

    bool test_anchor_frames_orthonormal()
    {
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 200;

        const auto box = pnr::build_stroke_anchor_set(pnr_test::make_unit_box_mesh(), opt);
        if (!box.ok || box.value.empty() || !frames_are_orthonormal(box.value)) return false;

        const auto quad = pnr::build_stroke_anchor_set(pnr::make_quad_mesh(0.5f), opt);
        if (!quad.ok || !frames_are_orthonormal(quad.value)) return false;

        // Normal, uv, tangent-гүй mesh дээр ч frame бүрэн байна.
        const auto bare = pnr::build_stroke_anchor_set(pnr_test::make_bare_triangle_mesh(
            glm::vec3(0.0f), glm::vec3(1.0f, 0.2f, 0.3f), glm::vec3(-0.2f, 0.9f, 0.4f)), opt);
        if (!bare.ok || !frames_are_orthonormal(bare.value)) return false;
        return true;
    }

    bool test_anchors_lie_on_surface()
    {
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 50;
        const auto r = pnr::build_stroke_anchor_set(pnr_test::make_unit_box_mesh(), opt);
        if (!r.ok) return false;
        for (const auto& a : r.value)
        {
            const glm::vec3 p = glm::abs(a.position);
            const float m = std::max(p.x, std::max(p.y, p.z));
            if (!approx_eq(m, 0.5f, 1e-4f)) return false;
            // Interpolate хийсэн normal нь тухайн талын normal-тай давхцана.
            const glm::vec3 n = glm::abs(a.normal);
            if (!approx_eq(std::max(n.x, std::max(n.y, n.z)), 1.0f, 1e-4f)) return false;
            if (a.uv.x < -1e-5f || a.uv.x > 1.0f + 1e-5f || a.uv.y < -1e-5f || a.uv.y > 1.0f + 1e-5f) return false;
        }
        return true;
    }

    bool test_anchor_build_is_deterministic()
    {
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 120;
        const pnr::MeshData box = pnr_test::make_unit_box_mesh();
        const auto a = pnr::build_stroke_anchor_set(box, opt);
        const auto b = pnr::build_stroke_anchor_set(box, opt);
        if (!a.ok || !b.ok || a.value.size() != b.value.size()) return false;
        for (size_t i = 0; i < a.value.size(); ++i)
        {
            if (a.value[i].position != b.value[i].position) return false;
            if (a.value[i].tangent != b.value[i].tangent) return false;
            if (a.value[i].brush_variant != b.value[i].brush_variant) return false;
        }

        opt.seed = 1234u;
        const auto c = pnr::build_stroke_anchor_set(box, opt);
        if (!c.ok || c.value.size() != a.value.size()) return false;
        bool any_diff = false;
        for (size_t i = 0; i < a.value.size(); ++i)
        {
            if (a.value[i].position != c.value[i].position) any_diff = true;
        }
        return any_diff;
    }

    bool test_brush_variants_cover_palette()
    {
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 500;
        opt.brush_count = 4;
        const auto r = pnr::build_stroke_anchor_set(pnr_test::make_unit_box_mesh(), opt);
        if (!r.ok) return false;
        int hist[4] = {0, 0, 0, 0};
        for (const auto& a : r.value)
        {
            if (a.brush_variant < 0 || a.brush_variant >= 4) return false;
            hist[a.brush_variant]++;
        }
        const int min_expected = (int)r.value.size() / 10;
        for (int h : hist)
        {
            if (h < min_expected) return false;
        }
        return true;
    }

    bool test_invalid_density_fails()
    {
        const pnr::MeshData quad = pnr::make_quad_mesh(0.5f);
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 0;
        const auto zero = pnr::build_stroke_anchor_set(quad, opt);
        if (zero.ok || zero.error.empty()) return false;
        opt.stroke_density = -3;
        if (pnr::build_stroke_anchor_set(quad, opt).ok) return false;
        opt.stroke_density = 10;
        opt.brush_count = 0;
        if (pnr::build_stroke_anchor_set(quad, opt).ok) return false;
        return true;
    }

    bool test_all_degenerate_triangles_fail()
    {
        pnr::MeshData m{};
        m.name = "collinear";
        m.positions = {glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f)};
        m.indices = {0, 1, 2, 1, 3, 2};
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 10;
        const auto r = pnr::build_stroke_anchor_set(m, opt);
        if (r.ok || r.error.empty()) return false;

        // Нэг эрүүл гурвалжин нэмэхэд зөвхөн түүн дээр байрлана.
        m.positions.push_back(glm::vec3(0.0f, 1.0f, 0.0f));
        m.indices.insert(m.indices.end(), {0, 1, 4});
        pnr::AnchorBuildStats stats{};
        const auto ok = pnr::build_stroke_anchor_set(m, opt, &stats);
        if (!ok.ok || stats.triangles_used != 1 || stats.triangles_skipped != 2) return false;
        for (const auto& a : ok.value)
        {
            if (!approx_eq(a.position.z, 0.0f)) return false;
            if (a.position.x < -1e-5f || a.position.y < -1e-5f || a.position.x + a.position.y > 1.0f + 1e-5f) return false;
        }
        return true;
    }

    bool test_nonfinite_triangles_skipped()
    {
        const float nan = std::numeric_limits<float>::quiet_NaN();
        pnr::MeshData m = pnr_test::make_bare_triangle_mesh(
            glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        m.positions.push_back(glm::vec3(nan, 0.0f, 0.0f));
        m.indices.insert(m.indices.end(), {0, 3, 2});
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 20;
        pnr::AnchorBuildStats stats{};
        const auto r = pnr::build_stroke_anchor_set(m, opt, &stats);
        if (!r.ok || stats.triangles_skipped != 1) return false;
        for (const auto& a : r.value)
        {
            if (!std::isfinite(a.position.x) || !std::isfinite(a.position.y)) return false;
        }
        return true;
    }

    bool test_tangent_follows_uv_direction()
    {
        pnr::MeshData quad = pnr::make_quad_mesh(0.5f);
        quad.tangents.clear();
        quad.bitangents.clear();
        pnr::AnchorBuildOptions opt{};
        opt.stroke_density = 40;
        const auto r = pnr::build_stroke_anchor_set(quad, opt);
        if (!r.ok) return false;
        for (const auto& a : r.value)
        {
            if (!approx_eq(a.tangent.x, 1.0f)) return false;
            if (!approx_eq(a.normal.z, -1.0f)) return false;
        }
        return true;
    }

    bool test_build_paint_model()
    {
        pnr::RenderConfig cfg{};
        cfg.stroke_density = 30;
        const pnr::BrushConfig brushes{4, 64};
        const auto model = pnr::build_paint_model(pnr_test::make_unit_box_mesh(), cfg, brushes);
        if (!model.ok || model.value.anchors.size() != 180) return false;
        if (model.value.mesh.triangle_count() != 12) return false;

        cfg.saturation = 2.0f;
        const auto bad = pnr::build_paint_model(pnr_test::make_unit_box_mesh(), cfg, brushes);
        if (bad.ok || bad.error.find("saturation") == std::string::npos) return false;
        return true;
    }
}

int main()
{
    pnr::set_log_level(pnr::LogLevel::Error);

    const bool ok_mono = test_anchor_count_strictly_monotone();
    const bool ok_area = test_anchor_count_scales_with_area();
    const bool ok_frames = test_anchor_frames_orthonormal();
    const bool ok_surface = test_anchors_lie_on_surface();
    const bool ok_det = test_anchor_build_is_deterministic();
    const bool ok_variants = test_brush_variants_cover_palette();
    const bool ok_density = test_invalid_density_fails();
    const bool ok_degenerate = test_all_degenerate_triangles_fail();
    const bool ok_nonfinite = test_nonfinite_triangles_skipped();
    const bool ok_tangent = test_tangent_follows_uv_direction();
    const bool ok_model = test_build_paint_model();

    if (!ok_mono) std::fprintf(stderr, "[anchor-tests] anchor count is not strictly monotone\n");
    if (!ok_area) std::fprintf(stderr, "[anchor-tests] anchor count area scaling failed\n");
    if (!ok_frames) std::fprintf(stderr, "[anchor-tests] tangent frames not orthonormal\n");
    if (!ok_surface) std::fprintf(stderr, "[anchor-tests] anchors off surface\n");
    if (!ok_det) std::fprintf(stderr, "[anchor-tests] build not deterministic\n");
    if (!ok_variants) std::fprintf(stderr, "[anchor-tests] brush variant spread failed\n");
    if (!ok_density) std::fprintf(stderr, "[anchor-tests] invalid density accepted\n");
    if (!ok_degenerate) std::fprintf(stderr, "[anchor-tests] degenerate triangle handling failed\n");
    if (!ok_nonfinite) std::fprintf(stderr, "[anchor-tests] non-finite triangle handling failed\n");
    if (!ok_tangent) std::fprintf(stderr, "[anchor-tests] uv tangent derivation failed\n");
    if (!ok_model) std::fprintf(stderr, "[anchor-tests] paint model build failed\n");

    if (!(ok_mono && ok_area && ok_frames && ok_surface && ok_det && ok_variants && ok_density &&
          ok_degenerate && ok_nonfinite && ok_tangent && ok_model)) return 1;
    std::fprintf(stderr, "[anchor-tests] all tests passed\n");
    return 0;
}
