/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: pnr_renderer_lib.cpp
    МОДУЛЬ: pnr-renderer-lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
*/

#include "pnr/pipeline/paint_pipeline.hpp"
#include "pnr/resources/loaders/mesh_loader_assimp.hpp"
#include "pnr/resources/loaders/texture_loader_sdl.hpp"

namespace pnr
{
    int pnr_renderer_compiled_target_anchor()
    {
        return 0;
    }
}
