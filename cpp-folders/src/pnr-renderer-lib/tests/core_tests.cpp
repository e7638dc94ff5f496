#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/camera/orbit_camera.hpp"
#include "pnr/core/result.hpp"
#include "pnr/core/running_average.hpp"
#include "pnr/frame/render_config.hpp"
#include "pnr/gfx/rt_registry.hpp"
#include "pnr/job/parallel_for.hpp"
#include "pnr/job/thread_pool_job_system.hpp"
#include "pnr/shader/paint_shading.hpp"

#include "test_scene_utils.hpp"

namespace
{
    using pnr_test::approx_eq;

    bool test_running_average_window()
    {
        pnr::RunningAverage<float, 4> avg{};
        avg.add(1.0f);
        avg.add(2.0f);
        avg.add(3.0f);
        avg.add(4.0f);
        if (!approx_eq(avg.average(), 2.5f)) return false;
        avg.add(5.0f);
        if (!approx_eq(avg.average(), 3.5f)) return false;
        avg.reset();
        if (!approx_eq(avg.average(), 0.0f)) return false;
        return true;
    }

    bool test_result_forwarding()
    {
        const auto failed = pnr::Result<int>::failure("broken");
        if (failed.ok || (bool)failed) return false;
        const auto fwd = pnr::Result<float>::forward_failure(failed, "loader");
        if (fwd.ok) return false;
        if (fwd.error != "loader: broken") return false;

        const auto good = pnr::Result<int>::success(7);
        if (!good || good.value != 7) return false;
        if (!pnr::status_ok()) return false;
        return true;
    }

    bool test_validate_render_config()
    {
        pnr::RenderConfig cfg{};
        if (!pnr::validate_render_config(cfg)) return false;

        pnr::RenderConfig bad = cfg;
        bad.stroke_density = 0;
        if (pnr::validate_render_config(bad)) return false;

        bad = cfg;
        bad.brush_size = -0.01f;
        if (pnr::validate_render_config(bad)) return false;

        bad = cfg;
        bad.brush_size = std::nanf("");
        if (pnr::validate_render_config(bad)) return false;

        bad = cfg;
        bad.quantization = -1;
        if (pnr::validate_render_config(bad)) return false;

        bad = cfg;
        bad.saturation = 1.5f;
        if (pnr::validate_render_config(bad)) return false;

        bad = cfg;
        bad.background = glm::vec3(0.0f, 2.0f, 0.0f);
        if (pnr::validate_render_config(bad)) return false;

        bad = cfg;
        bad.occlusion_tolerance = -0.5f;
        if (pnr::validate_render_config(bad)) return false;

        const pnr::Status no_brushes = pnr::validate_render_config(cfg, pnr::BrushConfig{0, 64});
        if (no_brushes || no_brushes.error.empty()) return false;
        return true;
    }

    bool test_registry_resize_recreates_target()
    {
        pnr::RTRegistry rtr{};
        const pnr::RTHandle h0 = rtr.ensure_transient<pnr::RT_Canvas>("canvas", 4, 4);
        if (!h0.valid()) return false;
        const pnr::RTHandle h1 = rtr.ensure_transient<pnr::RT_Canvas>("canvas", 4, 4);
        if (h1.id != h0.id || rtr.recreate_count() != 0) return false;

        const pnr::RTHandle h2 = rtr.ensure_transient<pnr::RT_Canvas>("canvas", 8, 4);
        if (h2.id != h0.id || rtr.recreate_count() != 1) return false;
        const auto e = rtr.extent(h2);
        if (e.w != 8 || e.h != 4) return false;
        const auto* canvas = rtr.get<pnr::RT_Canvas>(h2);
        if (!canvas || canvas->color.data.size() != 32) return false;

        if (rtr.ensure_transient<pnr::RT_Canvas>("canvas", 0, 4).valid()) return false;
        return true;
    }

    bool test_registry_get_is_type_checked()
    {
        pnr::RTRegistry rtr{};
        pnr::RT_ReferenceField rf{2, 2};
        const pnr::RT_Reference h = rtr.reg<pnr::RT_Reference>(&rf);
        if (rtr.kind(h) != pnr::RTKind::ReferenceField) return false;
        if (rtr.get<pnr::RT_Canvas>(h) != nullptr) return false;
        if (rtr.get<pnr::RT_ReferenceField>(h) != &rf) return false;
        if (rtr.has(pnr::RTHandle{999})) return false;
        return true;
    }

    bool test_partition_range_covers_range()
    {
        const auto chunks = pnr::partition_range(3, 1003, 7, 4);
        if (chunks.empty()) return false;
        int expect = 3;
        for (const auto& c : chunks)
        {
            if (c.begin != expect || c.end <= c.begin) return false;
            expect = c.end;
        }
        return expect == 1003;
    }

    bool test_parallel_collect_preserves_order()
    {
        pnr::ThreadPoolJobSystem jobs{4};
        const std::vector<int> out = pnr::parallel_collect_1d<int>(&jobs, 0, 1000, 7,
            [](int b, int e, std::vector<int>& part)
            {
                for (int i = b; i < e; ++i)
                {
                    if (i % 3 != 0) part.push_back(i);
                }
            });

        std::vector<int> expect{};
        for (int i = 0; i < 1000; ++i)
        {
            if (i % 3 != 0) expect.push_back(i);
        }
        return out == expect;
    }

    bool test_quantize_brightness_levels()
    {
        if (!approx_eq(pnr::quantize_brightness(0.37f, 0), 0.37f)) return false;
        if (!approx_eq(pnr::quantize_brightness(0.0f, 1), 1.0f)) return false;

        const int levels[] = {2, 3, 5, 8, 20};
        for (int q : levels)
        {
            for (int i = 0; i <= 150; ++i)
            {
                const float b = (float)i * 0.01f;
                const float out = pnr::quantize_brightness(b, q);
                const float k = out * (float)(q - 1);
                if (!approx_eq(k, std::round(k), 1e-4f)) return false;
                if (out < 1.0f / (float)q - 1e-6f) return false;
                if (out > 1.0f + 1e-6f) return false;
            }
        }
        return true;
    }

    bool test_saturation_boundaries()
    {
        const glm::vec3 c{0.8f, 0.3f, 0.1f};
        const float l = pnr::luminance(c);
        if (!approx_eq(l, 0.2126f * 0.8f + 0.7152f * 0.3f + 0.0722f * 0.1f)) return false;

        const glm::vec3 grey = pnr::apply_saturation(c, 0.0f);
        if (!approx_eq(grey.r, l) || !approx_eq(grey.g, l) || !approx_eq(grey.b, l)) return false;

        const glm::vec3 same = pnr::apply_saturation(c, 1.0f);
        if (same.r != c.r || same.g != c.g || same.b != c.b) return false;

        const glm::vec3 half = pnr::apply_saturation(c, 0.5f);
        if (!approx_eq(half.r, 0.5f * (l + c.r))) return false;
        return true;
    }

    bool test_paper_modulation()
    {
        const glm::vec3 c{0.6f, 0.4f, 0.2f};
        const glm::vec3 on = pnr::paint_post_color(c, 0.5f, true, 1.0f);
        if (!approx_eq(on.r, 0.3f) || !approx_eq(on.g, 0.2f) || !approx_eq(on.b, 0.1f)) return false;
        const glm::vec3 off = pnr::paint_post_color(c, 0.5f, false, 1.0f);
        if (!approx_eq(off.r, 0.6f) || !approx_eq(off.g, 0.4f)) return false;
        return true;
    }

    bool test_orbit_camera_pole_limits()
    {
        pnr::OrbitCamera cam{};
        const glm::vec3 up{0.0f, 1.0f, 0.0f};
        for (int i = 0; i < 200; ++i)
        {
            cam.rotate_up(-0.05f);
            const float theta = std::acos(glm::dot(glm::normalize(cam.position()), up));
            if (theta < glm::radians(5.0f) - 1e-3f) return false;
        }
        for (int i = 0; i < 400; ++i)
        {
            cam.rotate_up(0.05f);
            const float theta = std::acos(glm::dot(glm::normalize(cam.position()), up));
            if (theta > glm::radians(175.0f) + 1e-3f) return false;
        }
        // Direction нь үргэлж эх рүү харна.
        const glm::vec3 to_origin = -glm::normalize(cam.position());
        if (glm::dot(to_origin, glm::normalize(cam.direction())) < 0.9999f) return false;
        return true;
    }

    bool test_orbit_camera_zoom()
    {
        pnr::OrbitCamera cam{};
        const float before = glm::length(cam.position());
        cam.zoom(0.5f);
        if (!approx_eq(glm::length(cam.position()), before - 0.5f)) return false;
        cam.set_aspect(-1.0f);
        if (!approx_eq(cam.aspect(), 1.0f)) return false;
        return true;
    }
}

int main()
{
    const bool ok_avg = test_running_average_window();
    const bool ok_result = test_result_forwarding();
    const bool ok_cfg = test_validate_render_config();
    const bool ok_resize = test_registry_resize_recreates_target();
    const bool ok_typed = test_registry_get_is_type_checked();
    const bool ok_partition = test_partition_range_covers_range();
    const bool ok_collect = test_parallel_collect_preserves_order();
    const bool ok_quant = test_quantize_brightness_levels();
    const bool ok_sat = test_saturation_boundaries();
    const bool ok_paper = test_paper_modulation();
    const bool ok_poles = test_orbit_camera_pole_limits();
    const bool ok_zoom = test_orbit_camera_zoom();

    if (!ok_avg) std::fprintf(stderr, "[core-tests] running average failed\n");
    if (!ok_result) std::fprintf(stderr, "[core-tests] result forwarding failed\n");
    if (!ok_cfg) std::fprintf(stderr, "[core-tests] render config validation failed\n");
    if (!ok_resize) std::fprintf(stderr, "[core-tests] registry resize recreation failed\n");
    if (!ok_typed) std::fprintf(stderr, "[core-tests] registry type-checked get failed\n");
    if (!ok_partition) std::fprintf(stderr, "[core-tests] range partition failed\n");
    if (!ok_collect) std::fprintf(stderr, "[core-tests] ordered parallel collect failed\n");
    if (!ok_quant) std::fprintf(stderr, "[core-tests] brightness quantization levels failed\n");
    if (!ok_sat) std::fprintf(stderr, "[core-tests] saturation boundaries failed\n");
    if (!ok_paper) std::fprintf(stderr, "[core-tests] paper modulation failed\n");
    if (!ok_poles) std::fprintf(stderr, "[core-tests] orbit camera pole limits failed\n");
    if (!ok_zoom) std::fprintf(stderr, "[core-tests] orbit camera zoom failed\n");

    if (!(ok_avg && ok_result && ok_cfg && ok_resize && ok_typed && ok_partition && ok_collect &&
          ok_quant && ok_sat && ok_paper && ok_poles && ok_zoom)) return 1;
    std::fprintf(stderr, "[core-tests] all tests passed\n");
    return 0;
}
