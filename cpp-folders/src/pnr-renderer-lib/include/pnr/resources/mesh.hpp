#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: mesh.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн resources модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace pnr
{
    // Vertex бүрийн атрибутууд. normals/tangents/bitangents/uvs нь хоосон байж болно,
    // эсвэл positions-той ижил урттай байна.
    struct MeshData
    {
        std::string name{};
        std::string source_path{};
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec3> tangents{};
        std::vector<glm::vec3> bitangents{};
        std::vector<glm::vec2> uvs{};
        std::vector<uint32_t> indices{};

        bool empty() const
        {
            return positions.empty() || indices.empty();
        }

        size_t triangle_count() const
        {
            return indices.size() / 3;
        }

        bool has_normals() const { return !normals.empty() && normals.size() == positions.size(); }
        bool has_tangents() const { return !tangents.empty() && tangents.size() == positions.size(); }
        bool has_uvs() const { return !uvs.empty() && uvs.size() == positions.size(); }

        void clear()
        {
            positions.clear();
            normals.clear();
            tangents.clear();
            bitangents.clear();
            uvs.clear();
            indices.clear();
        }
    };

    // Тестүүд болон procedural сценд ашиглах XY хавтгай дээрх дөрвөлжин (normal = -Z, камер руу).
    inline MeshData make_quad_mesh(float half_extent = 0.5f, float z = 0.0f)
    {
        MeshData m{};
        m.name = "quad";
        m.positions = {
            {-half_extent, -half_extent, z},
            { half_extent, -half_extent, z},
            { half_extent,  half_extent, z},
            {-half_extent,  half_extent, z}
        };
        m.normals.assign(4, glm::vec3(0.0f, 0.0f, -1.0f));
        m.tangents.assign(4, glm::vec3(1.0f, 0.0f, 0.0f));
        m.bitangents.assign(4, glm::vec3(0.0f, 1.0f, 0.0f));
        m.uvs = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};
        m.indices = {0, 1, 2, 0, 2, 3};
        return m;
    }
}
