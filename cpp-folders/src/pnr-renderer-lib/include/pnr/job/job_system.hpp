#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн job модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace pnr
{
    // Pass-ууд GPU-ийн дотоод зэрэгцээ ажиллагааг энэ интерфэйсээр дуурайна.
    // Job system байхгүй (nullptr) үед бүх ажил дуудсан thread дээр шууд хийгдэнэ.
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;
        virtual void enqueue(std::function<void()> job) = 0;
        virtual size_t worker_count() const = 0;
    };

    // Нэг pass-ийн бүх chunk дуусахыг хүлээх барьер. Дараагийн pass өмнөхийнхөө
    // гаралтыг бүрэн бичигдсэн үед л уншина.
    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            pending_ += n;
        }

        void done()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (--pending_ <= 0) cv_.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() { return pending_ <= 0; });
        }

    private:
        int pending_ = 0;
        std::mutex mtx_{};
        std::condition_variable cv_{};
    };
}
