#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: parallel_for.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн job модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

#include "pnr/job/job_system.hpp"

namespace pnr
{
    struct RangeChunk
    {
        int begin = 0;
        int end = 0;
    };

    // [begin, end) мужийг тогтмол дараалалтай chunk-уудад хуваана.
    // Хуваалт нь зөвхөн worker тоо болон grain-ээс хамаардаг тул үр дүнг
    // chunk-ийн индексээр нь нийлүүлэхэд гаралт тодорхой (deterministic) байна.
    inline std::vector<RangeChunk> partition_range(int begin, int end, int min_grain, size_t workers)
    {
        std::vector<RangeChunk> out{};
        if (end <= begin) return out;
        const int count = end - begin;
        const int grain = std::max(1, min_grain);
        const int max_chunks = (int)std::max<size_t>(1, workers) * 2;
        const int chunks = std::max(1, std::min(max_chunks, (count + grain - 1) / grain));
        const int chunk_size = (count + chunks - 1) / chunks;
        out.reserve((size_t)chunks);
        for (int i = 0; i < chunks; ++i)
        {
            const int b = begin + i * chunk_size;
            const int e = std::min(end, b + chunk_size);
            if (b >= e) break;
            out.push_back(RangeChunk{b, e});
        }
        return out;
    }

    template<typename Fn>
    inline void parallel_for_1d(
        IJobSystem* js,
        int begin,
        int end,
        int min_grain,
        Fn&& fn
    )
    {
        if (end <= begin) return;
        const int count = end - begin;
        // Ажил бага эсвэл job system байхгүй үед sync замаар ажиллуулна.
        if (!js || count <= std::max(1, min_grain))
        {
            fn(begin, end);
            return;
        }

        const std::vector<RangeChunk> chunks = partition_range(begin, end, min_grain, js->worker_count());
        WaitGroup wg{};
        for (const RangeChunk& c : chunks)
        {
            wg.add(1);
            js->enqueue([c, &fn, &wg]() {
                fn(c.begin, c.end);
                wg.done();
            });
        }
        wg.wait();
    }

    // Chunk бүр өөрийн гаралтын вектор руу бичиж, дараа нь chunk-ийн дарааллаар нийлүүлнэ.
    // Fn: void(int begin, int end, std::vector<T>& out)
    template<typename T, typename Fn>
    inline std::vector<T> parallel_collect_1d(
        IJobSystem* js,
        int begin,
        int end,
        int min_grain,
        Fn&& fn
    )
    {
        std::vector<T> merged{};
        if (end <= begin) return merged;

        const size_t workers = js ? js->worker_count() : 1;
        const std::vector<RangeChunk> chunks = partition_range(begin, end, min_grain, workers);
        std::vector<std::vector<T>> partial(chunks.size());

        parallel_for_1d(js, 0, (int)chunks.size(), 1, [&](int cb, int ce)
        {
            for (int ci = cb; ci < ce; ++ci)
            {
                fn(chunks[(size_t)ci].begin, chunks[(size_t)ci].end, partial[(size_t)ci]);
            }
        });

        size_t total = 0;
        for (const auto& p : partial) total += p.size();
        merged.reserve(total);
        for (auto& p : partial)
        {
            std::move(p.begin(), p.end(), std::back_inserter(merged));
        }
        return merged;
    }
}
