#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: rt_handle.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО:
    - Opaque void* оронд type-safe handle ашиглах
    - Pass хоорондын өгөгдлийн хамаарлыг handle-аар илэрхийлэх
*/

#include <cstdint>

namespace pnr
{
    struct RTHandle
    {
        uint32_t id = 0; // 0 = invalid
        constexpr bool valid() const { return id != 0; }
    };

    // Small typed wrappers (compile-time type separation only)
    struct RT_Reference : RTHandle {};
    struct RT_CanvasHandle : RTHandle {};
    struct RT_Output : RTHandle {};
}
