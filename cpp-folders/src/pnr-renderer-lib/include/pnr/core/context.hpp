#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: context.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>

#include "pnr/job/job_system.hpp"

namespace pnr
{
    // Нэг frame-ийн гүйцэтгэл болон дебаг мэдээлэл. Pass бүр өөрийн хэсгийг бөглөнө.
    struct RenderDebugStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_raster = 0;

        uint64_t anchors_input = 0;
        uint64_t anchors_nonfinite = 0;
        uint64_t anchors_behind_eye = 0;
        uint64_t anchors_near_clipped = 0;
        uint64_t anchors_occluded = 0;
        uint64_t anchors_survived = 0;

        uint64_t strokes_expanded = 0;
        uint64_t strokes_clipped = 0;
        uint64_t fragments_discarded = 0;

        float ms_reference = 0.0f;
        float ms_projection = 0.0f;
        float ms_expansion = 0.0f;
        float ms_points = 0.0f;
        float ms_post = 0.0f;

        void reset()
        {
            *this = RenderDebugStats{};
        }
    };

    // Pipeline-ийн ерөнхий контекст. Job system болон frame тоолуурыг хадгална.
    struct Context
    {
        IJobSystem* job_system = nullptr;
        uint64_t frame_index = 0;
        RenderDebugStats debug{};
    };
}
