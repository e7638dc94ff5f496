#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: time.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <chrono>
#include <cstdint>

namespace pnr
{
    struct FrameClock
    {
        uint64_t ticks_prev = 0;
        double tick_hz = 1.0;

        float begin_frame(uint64_t ticks_now)
        {
            if (ticks_prev == 0)
            {
                ticks_prev = ticks_now;
                return 0.0f;
            }
            const float dt = (float)((double)(ticks_now - ticks_prev) / tick_hz);
            ticks_prev = ticks_now;
            return dt;
        }
    };

    // Pass бүрийн хугацааг миллисекундээр хэмжинэ.
    class ScopedTimerMs
    {
    public:
        explicit ScopedTimerMs(float* out_ms)
            : out_ms_(out_ms), start_(std::chrono::steady_clock::now())
        {}

        ~ScopedTimerMs()
        {
            if (!out_ms_) return;
            const auto end = std::chrono::steady_clock::now();
            *out_ms_ = std::chrono::duration<float, std::milli>(end - start_).count();
        }

        ScopedTimerMs(const ScopedTimerMs&) = delete;
        ScopedTimerMs& operator=(const ScopedTimerMs&) = delete;

    private:
        float* out_ms_ = nullptr;
        std::chrono::steady_clock::time_point start_{};
    };
}
