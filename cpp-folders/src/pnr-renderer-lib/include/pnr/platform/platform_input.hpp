#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: platform_input.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн platform модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


namespace pnr
{
    struct PlatformInputState
    {
        bool quit = false;
        bool cycle_view = false;
        bool toggle_overlay = false;
        bool toggle_brush_tbn = false;
        bool toggle_canvas = false;
        int quantization_delta = 0;
        int brush_size_steps = 0;

        bool zoom_in = false;
        bool zoom_out = false;

        // Mouse wheel: x = model yaw, y = камерыг дээш/доош эргүүлэх.
        float wheel_x = 0.0f;
        float wheel_y = 0.0f;

        bool resized = false;
        int resized_w = 0;
        int resized_h = 0;
    };
}
