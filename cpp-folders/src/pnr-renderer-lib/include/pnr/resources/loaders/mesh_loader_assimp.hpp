#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: mesh_loader_assimp.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Assimp-аар mesh импортлох. aiMesh бүр тусдаа MeshData болж, дараа нь
            тус бүрдээ anchor set-тэй paint model болно.
*/


#include <string>
#include <vector>

#include <assimp/Importer.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

#include "pnr/core/log.hpp"
#include "pnr/core/result.hpp"
#include "pnr/resources/mesh.hpp"

namespace pnr
{
    struct MeshLoadOptions
    {
        bool triangulate = true;
        bool generate_normals = true;
        bool calc_tangent_space = true;
        bool join_identical_vertices = true;
        bool flip_uvs = false;
    };

    inline unsigned int to_assimp_flags(const MeshLoadOptions& opt)
    {
        unsigned int flags = 0;
        if (opt.triangulate) flags |= aiProcess_Triangulate;
        if (opt.generate_normals) flags |= aiProcess_GenSmoothNormals;
        if (opt.calc_tangent_space) flags |= aiProcess_CalcTangentSpace;
        if (opt.join_identical_vertices) flags |= aiProcess_JoinIdenticalVertices;
        if (opt.flip_uvs) flags |= aiProcess_FlipUVs;
        return flags;
    }

    inline Result<std::vector<MeshData>> load_meshes_assimp(const std::string& path, const MeshLoadOptions& opt = {})
    {
        using R = Result<std::vector<MeshData>>;
        std::vector<MeshData> out{};

        Assimp::Importer importer;
        const aiScene* scene = importer.ReadFile(path.c_str(), to_assimp_flags(opt));
        if (!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->mRootNode)
        {
            return R::failure("failed to load mesh '" + path + "': " + importer.GetErrorString());
        }

        out.reserve(scene->mNumMeshes);
        for (unsigned int mi = 0; mi < scene->mNumMeshes; ++mi)
        {
            const aiMesh* m = scene->mMeshes[mi];
            if (!m) continue;

            MeshData mesh{};
            mesh.name = m->mName.C_Str();
            mesh.source_path = path;
            mesh.positions.reserve(m->mNumVertices);

            // UV байхгүй бол assimp tangent үүсгэж чадахгүй. Тэр үед anchor builder өөрөө frame гаргана.
            const bool has_tangents = m->HasTangentsAndBitangents();
            const bool has_uvs = m->HasTextureCoords(0);
            if (m->HasNormals()) mesh.normals.reserve(m->mNumVertices);
            if (has_tangents)
            {
                mesh.tangents.reserve(m->mNumVertices);
                mesh.bitangents.reserve(m->mNumVertices);
            }
            if (has_uvs) mesh.uvs.reserve(m->mNumVertices);

            for (unsigned int vi = 0; vi < m->mNumVertices; ++vi)
            {
                const aiVector3D p = m->mVertices[vi];
                mesh.positions.push_back(glm::vec3(p.x, p.y, p.z));

                if (m->HasNormals())
                {
                    const aiVector3D n = m->mNormals[vi];
                    mesh.normals.push_back(glm::vec3(n.x, n.y, n.z));
                }
                if (has_tangents)
                {
                    const aiVector3D t = m->mTangents[vi];
                    const aiVector3D b = m->mBitangents[vi];
                    mesh.tangents.push_back(glm::vec3(t.x, t.y, t.z));
                    mesh.bitangents.push_back(glm::vec3(b.x, b.y, b.z));
                }
                if (has_uvs)
                {
                    const aiVector3D uv = m->mTextureCoords[0][vi];
                    mesh.uvs.push_back(glm::vec2(uv.x, uv.y));
                }
            }

            for (unsigned int fi = 0; fi < m->mNumFaces; ++fi)
            {
                const aiFace& face = m->mFaces[fi];
                if (face.mNumIndices != 3) continue;
                mesh.indices.push_back((uint32_t)face.mIndices[0]);
                mesh.indices.push_back((uint32_t)face.mIndices[1]);
                mesh.indices.push_back((uint32_t)face.mIndices[2]);
            }

            if (!mesh.empty()) out.push_back(std::move(mesh));
        }

        if (out.empty()) return R::failure("mesh '" + path + "' contains no triangles");

        size_t triangles = 0;
        for (const MeshData& m : out) triangles += m.triangle_count();
        log_info("loaded '" + path + "': " + std::to_string(out.size()) + " mesh(es), " + std::to_string(triangles) + " triangle(s)");
        return R::success(std::move(out));
    }
}
