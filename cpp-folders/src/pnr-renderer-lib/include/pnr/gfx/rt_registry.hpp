#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: rt_registry.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн gfx модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "pnr/gfx/rt_handle.hpp"
#include "pnr/gfx/rt_types.hpp"

namespace pnr
{
    enum class RTKind : uint8_t
    {
        Unknown = 0,
        ReferenceField = 1,
        Canvas = 2,
        ColorLDR = 3
    };

    namespace detail
    {
        template <typename T> struct rt_kind_of { static constexpr RTKind value = RTKind::Unknown; };
        template <> struct rt_kind_of<RT_ReferenceField> { static constexpr RTKind value = RTKind::ReferenceField; };
        template <> struct rt_kind_of<RT_Canvas> { static constexpr RTKind value = RTKind::Canvas; };
        template <> struct rt_kind_of<RT_ColorLDR> { static constexpr RTKind value = RTKind::ColorLDR; };
    }

    class RTRegistry
    {
    public:
        struct Extent
        {
            int w = 0;
            int h = 0;
            bool valid() const { return w > 0 && h > 0; }
        };

        // Гаднаас эзэмшдэг RT-г бүртгэнэ.
        template<typename THandle, typename TRT>
        THandle reg(TRT* ptr)
        {
            using T = typename std::remove_cv<TRT>::type;
            return reg_impl<THandle>((void*)ptr, detail::rt_kind_of<T>::value);
        }

        template<typename THandle>
        bool has(THandle h) const
        {
            return map_.find(h.id) != map_.end();
        }

        template<typename THandle>
        RTKind kind(THandle h) const
        {
            auto it = map_.find(h.id);
            return (it == map_.end()) ? RTKind::Unknown : it->second.kind;
        }

        // Төрөл таарахгүй бол nullptr буцаана.
        template<typename TRT, typename THandle>
        TRT* get(THandle h) const
        {
            auto it = map_.find(h.id);
            if (it == map_.end()) return nullptr;
            if (it->second.kind != detail::rt_kind_of<TRT>::value) return nullptr;
            return static_cast<TRT*>(it->second.ptr);
        }

        // Нэрээр нь pipeline-ийн дотоод RT үүсгэнэ. Хэмжээ өөрчлөгдвөл (resize) шинээр үүсгэнэ.
        template<typename TRT>
        RTHandle ensure_transient(const std::string& name, int w, int h)
        {
            if (w <= 0 || h <= 0) return RTHandle{};
            constexpr RTKind kind = detail::rt_kind_of<TRT>::value;
            static_assert(kind != RTKind::Unknown, "unsupported render target type");

            auto it = transient_.find(name);
            if (it != transient_.end() && it->second.kind != kind)
            {
                map_.erase(it->second.handle.id);
                transient_.erase(it);
                it = transient_.end();
            }
            if (it == transient_.end())
            {
                auto holder = std::make_unique<Holder<TRT>>(w, h);
                TRT* raw = &holder->rt;
                const RTHandle hdl = reg_impl<RTHandle>((void*)raw, kind);
                auto [ins_it, _] = transient_.emplace(name, Transient{hdl, kind, std::move(holder)});
                return ins_it->second.handle;
            }

            auto* holder = static_cast<Holder<TRT>*>(it->second.holder.get());
            if (holder->rt.w != w || holder->rt.h != h)
            {
                holder->rt = TRT(w, h);
                ++recreate_count_;
            }
            return it->second.handle;
        }

        template<typename THandle>
        Extent extent(THandle h) const
        {
            Extent e{};
            auto it = map_.find(h.id);
            if (it == map_.end() || !it->second.ptr) return e;
            switch (it->second.kind)
            {
                case RTKind::ReferenceField:
                {
                    auto* p = static_cast<const RT_ReferenceField*>(it->second.ptr);
                    e.w = p->w;
                    e.h = p->h;
                    break;
                }
                case RTKind::Canvas:
                {
                    auto* p = static_cast<const RT_Canvas*>(it->second.ptr);
                    e.w = p->w;
                    e.h = p->h;
                    break;
                }
                case RTKind::ColorLDR:
                {
                    auto* p = static_cast<const RT_ColorLDR*>(it->second.ptr);
                    e.w = p->w;
                    e.h = p->h;
                    break;
                }
                case RTKind::Unknown:
                default:
                    break;
            }
            return e;
        }

        uint64_t recreate_count() const { return recreate_count_; }

    private:
        struct Entry
        {
            void* ptr = nullptr;
            RTKind kind = RTKind::Unknown;
        };

        struct HolderBase
        {
            virtual ~HolderBase() = default;
        };

        template<typename TRT>
        struct Holder final : HolderBase
        {
            Holder(int w, int h) : rt(w, h) {}
            TRT rt;
        };

        struct Transient
        {
            RTHandle handle{};
            RTKind kind = RTKind::Unknown;
            std::unique_ptr<HolderBase> holder{};
        };

        template<typename THandle>
        THandle reg_impl(void* ptr, RTKind kind)
        {
            THandle h{};
            h.id = next_id_++;
            map_[h.id] = Entry{ptr, kind};
            return h;
        }

        uint32_t next_id_ = 1;
        uint64_t recreate_count_ = 0;
        std::unordered_map<uint32_t, Entry> map_{};
        std::unordered_map<std::string, Transient> transient_{};
    };
}
