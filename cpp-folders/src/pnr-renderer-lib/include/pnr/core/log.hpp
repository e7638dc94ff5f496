#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

namespace pnr
{
    enum class LogLevel : uint8_t
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3
    };

    namespace detail
    {
        inline std::atomic<uint8_t>& log_level_storage()
        {
            static std::atomic<uint8_t> level{(uint8_t)LogLevel::Info};
            return level;
        }

        // Worker thread-үүдээс зэрэг бичихэд мөр холилдохоос сэргийлнэ.
        inline std::mutex& log_mutex()
        {
            static std::mutex m{};
            return m;
        }

        inline bool log_enabled(LogLevel level)
        {
            return (uint8_t)level >= log_level_storage().load(std::memory_order_relaxed);
        }
    }

    inline void set_log_level(LogLevel level)
    {
        detail::log_level_storage().store((uint8_t)level, std::memory_order_relaxed);
    }

    inline LogLevel log_level()
    {
        return (LogLevel)detail::log_level_storage().load(std::memory_order_relaxed);
    }

    inline void log_debug(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Debug)) return;
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_info(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Info)) return;
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Warn)) return;
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        std::cerr << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
