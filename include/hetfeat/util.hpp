#pragma once

#include <chrono>
#include <random>
#include <string>
#include <type_traits> // std::is_integral
#include <vector>

namespace hetfeat
{

//! Pseudo random number source built on std::mt19937. A seeded engine yields
//! the same sequence on every run, which the permutation engine relies on.
template <typename T> class RandomEngine
{
public:
    RandomEngine()
    : m_engine(std::random_device{}())
    {
    }

    explicit RandomEngine(std::mt19937::result_type const seed)
    : m_engine(seed)
    {
    }

    //! Use this operator to generate a pseudo random number within interval
    //! [min, max].
    T operator()(T const min, T const max)
    {
        if constexpr (std::is_integral<T>())
        {
            std::uniform_int_distribution<T> distribution{ min, max };
            return distribution(m_engine);
        }
        else
        {
            std::uniform_real_distribution<T> distribution{ min, max };
            return distribution(m_engine);
        }
    }

    void set_seed(std::mt19937::result_type seed) { m_engine.seed(seed); }

private:
    std::mt19937 m_engine;
};

// Timer is used for performance profiling
class Timer
{
public:
    void restart();

    double duration();

private:
    std::chrono::time_point<std::chrono::system_clock> m_start = std::chrono::system_clock::now();
};

std::string to_lower(std::string str);

} // namespace hetfeat
