#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: thread_pool_job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн job модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pnr/core/log.hpp"
#include "pnr/job/job_system.hpp"

namespace pnr
{
    // Тогтмол тооны worker-тэй FIFO pool. worker_count = 0 бол CPU-ийн цөмийн тоог авна.
    // Хүлээх ажлыг WaitGroup хариуцна, pool өөрөө барьергүй.
    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        explicit ThreadPoolJobSystem(size_t worker_count = 0)
        {
            size_t n = worker_count;
            if (n == 0) n = (size_t)std::thread::hardware_concurrency();
            n = std::max<size_t>(1, n);
            workers_.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                workers_.emplace_back([this]() { run_worker(); });
            }
            log_debug("job system: " + std::to_string(n) + " worker thread(s)");
        }

        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                stopping_ = true;
            }
            cv_.notify_all();
            for (std::thread& w : workers_)
            {
                if (w.joinable()) w.join();
            }
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        void enqueue(std::function<void()> job) override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                queue_.push_back(std::move(job));
            }
            cv_.notify_one();
        }

        size_t worker_count() const override { return workers_.size(); }

    private:
        void run_worker()
        {
            for (;;)
            {
                std::function<void()> job{};
                {
                    std::unique_lock<std::mutex> lock(mtx_);
                    cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                    // Зогсоохоос өмнө дараалалд орсон ажлыг дуусгана.
                    if (queue_.empty()) return;
                    job = std::move(queue_.front());
                    queue_.pop_front();
                }
                job();
            }
        }

        std::vector<std::thread> workers_{};
        std::deque<std::function<void()>> queue_{};
        std::mutex mtx_{};
        std::condition_variable cv_{};
        bool stopping_ = false;
    };
}
