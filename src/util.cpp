#include <hetfeat/util.hpp>

#include <algorithm>
#include <cctype>

namespace hetfeat
{

void Timer::restart() { m_start = std::chrono::system_clock::now(); }

double Timer::duration()
{
    std::chrono::duration<double> diff = std::chrono::system_clock::now() - m_start;
    return diff.count();
}

std::string to_lower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
    return str;
}

} // namespace hetfeat
