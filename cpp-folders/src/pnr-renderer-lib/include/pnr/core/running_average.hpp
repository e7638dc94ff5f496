#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: running_average.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Тогтмол цонхтой гулсах дундаж (frame time overlay-д ашиглана).
*/


#include <array>
#include <cstddef>

namespace pnr
{
    template<typename T, size_t N>
    class RunningAverage
    {
        static_assert(N > 0, "RunningAverage window must be non-empty");

    public:
        void add(T value)
        {
            sum_ = sum_ - values_[index_] + value;
            values_[index_] = value;
            index_ = (index_ + 1) % N;
        }

        // Цонх дүүрэхээс өмнө хоосон slot-ууд 0 гэж тооцогдоно.
        T average() const
        {
            return sum_ / (T)N;
        }

        void reset()
        {
            values_.fill(T{});
            sum_ = T{};
            index_ = 0;
        }

    private:
        std::array<T, N> values_{};
        size_t index_ = 0;
        T sum_{};
    };
}
