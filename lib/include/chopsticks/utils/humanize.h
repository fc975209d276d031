#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <string_view>

namespace chs
{
    template <typename Rep, typename Per>
    struct HumanizedDuration
    {
        std::chrono::duration<Rep, Per> duration;
    };

    /// \brief Wraps a duration so that it is formatted in its largest whole unit, e.g. "1.5ms".
    /// \remarks The optional format spec is the total field width, unit included (10 by default).
    template <typename Rep, typename Per>
    constexpr auto humanize(const std::chrono::duration<Rep, Per> duration) noexcept
    {
        return HumanizedDuration<Rep, Per>{duration};
    }
} // namespace chs

template <typename Rep, typename Per>
struct std::formatter<chs::HumanizedDuration<Rep, Per>> // NOLINT(cert-dcl58-cpp)
{
    constexpr auto parse(auto& ctx)
    {
        auto it = ctx.begin();
        if (it == ctx.end() || *it == '}')
        {
            width_ = default_width;
            return it;
        }
        for (; it != ctx.end() && *it != '}'; ++it)
        {
            const char ch = *it;
            if (ch < '0' || ch > '9')
                throw std::format_error("Invalid width specifier");
            width_ = width_ * 10 + (ch - '0');
        }
        return it;
    }

    auto format(const chs::HumanizedDuration<Rep, Per>& dur, auto& ctx) const
    {
        namespace chr = std::chrono;
        struct Unit
        {
            chr::duration<double, std::nano> length;
            std::string_view suffix;
        };
        constexpr Unit units[]{
            {chr::hours{1}, "h"}, //
            {chr::minutes{1}, "min"}, //
            {chr::seconds{1}, "s"}, //
            {chr::milliseconds{1}, "ms"}, //
            {chr::microseconds{1}, "us"} //
        };
        Unit unit{chr::nanoseconds{1}, "ns"};
        for (const auto& u : units)
            if (dur.duration >= u.length)
            {
                unit = u;
                break;
            }
        const int number_width = std::max(width_ - static_cast<int>(unit.suffix.size()), 0);
        return std::format_to(ctx.out(), "{:{}g}{}", dur.duration / unit.length, number_width, unit.suffix);
    }

private:
    static constexpr int default_width = 10;
    int width_ = 0;
};
