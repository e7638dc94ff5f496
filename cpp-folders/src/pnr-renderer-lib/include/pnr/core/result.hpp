#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <string>
#include <utility>

namespace pnr
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        // Өөр төрлийн Result-ийн алдааг дамжуулахад хэрэглэнэ.
        template<typename U>
        static Result<T> forward_failure(const Result<U>& other, const std::string& prefix = {})
        {
            return failure(prefix.empty() ? other.error : prefix + ": " + other.error);
        }

        explicit operator bool() const { return ok; }
    };

    struct Unit {};

    using Status = Result<Unit>;

    inline Status status_ok()
    {
        return Status::success(Unit{});
    }
}
