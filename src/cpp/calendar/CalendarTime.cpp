/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "nanots/calendar/CalendarTime.hpp"

#include "nanots/calendar/serialization/CalendarTime.hpp"
#include "nanots/serialization/MarshalError.hpp"
#include "nanots/serialization/json_util.hpp"
#include "nanots/serialization/msgpack_util.hpp"
#include "nanots/util/wrapping.hpp"

#include <date/tz.h>

#include <limits>
#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace nanots
{

//-------------------------------------------------------------------------

namespace
{

__extension__ typedef __int128 Int128;

inline constexpr int64_t kNanosPerSecond = 1'000'000'000;

// Leeway kept from the int64 nanosecond limits when a zone offset is applied.
inline constexpr int64_t kNanosPerDay = 86'400 * kNanosPerSecond;

// Anything outside of this window certainly renders a year outside [0,9999].
inline constexpr date::sys_seconds kMinMarshalSeconds{
    date::sys_days{date::year{-1} / date::January / 1}};
inline constexpr date::sys_seconds kMaxMarshalSeconds{
    date::sys_days{date::year{10001} / date::January / 1}};

struct Fields
{
    date::year_month_day ymd;
    date::hh_mm_ss<std::chrono::seconds> hms;
    Location::Offset offset;
};

[[nodiscard]] Fields fieldsOf(date::sys_seconds sec, const Location& loc)
{
    auto offset = loc.lookup(sec);
    const date::local_seconds local{(sec + offset.offset).time_since_epoch()};
    const auto day = date::floor<date::days>(local);
    return Fields{
        .ymd = date::year_month_day{day},
        .hms = date::hh_mm_ss<std::chrono::seconds>{local - day},
        .offset = std::move(offset)};
}

[[nodiscard]] std::string fraction(std::chrono::nanoseconds nsec)
{
    if (nsec == std::chrono::nanoseconds::zero()) return {};
    std::string digits = fmt::format("{:09}", nsec.count());
    digits.erase(digits.find_last_not_of('0') + 1);
    return "." + digits;
}

template<typename Duration>
[[nodiscard]] std::string formatIn(
    const std::string& layout, date::sys_time<Duration> tp, const Location& loc)
{
    if (loc.isUTC()) {
        return date::format(layout, tp);
    }
    return date::format(layout, date::make_zoned(loc.zone(), tp));
}

}  // namespace

//-------------------------------------------------------------------------

CalendarTime CalendarTime::now() noexcept
{
    return fromSysTime(date::floor<duration>(std::chrono::system_clock::now()));
}

//-------------------------------------------------------------------------

CalendarTime CalendarTime::fromUnix(int64_t sec, int64_t nsec) noexcept
{
    if (nsec < 0 || nsec >= kNanosPerSecond) {
        const int64_t carry = nsec / kNanosPerSecond;
        sec = util::wrappingAdd(sec, carry);
        nsec -= carry * kNanosPerSecond;
        if (nsec < 0) {
            nsec += kNanosPerSecond;
            sec = util::wrappingSub(sec, 1);
        }
    }
    return CalendarTime{date::sys_seconds{std::chrono::seconds{sec}}, duration{nsec}, Location{}};
}

//-------------------------------------------------------------------------

CalendarTime CalendarTime::fromSysTime(date::sys_time<duration> tp) noexcept
{
    const auto sec = date::floor<std::chrono::seconds>(tp);
    return CalendarTime{sec, tp - sec, Location{}};
}

//-------------------------------------------------------------------------

CalendarTime CalendarTime::fromDate(
    int year, int month, int day, int hour, int min, int sec, int nsec, const Location* loc)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (loc == nullptr) {
        throw std::invalid_argument{fmt::format("{}: missing location", ctx)};
    }

    const int64_t monthIndex = int64_t{month} - 1;
    const int64_t normYear = int64_t{year} + util::floorDiv(monthIndex, 12);
    const auto normMonth = static_cast<unsigned>(util::floorMod(monthIndex, 12) + 1);
    if (normYear < static_cast<int>(date::year::min())
        || normYear > static_cast<int>(date::year::max())) {
        throw std::out_of_range{fmt::format(
            "{}: year {} outside of supported range [{}, {}]",
            ctx,
            normYear,
            static_cast<int>(date::year::min()),
            static_cast<int>(date::year::max()))};
    }

    const date::local_seconds local =
        date::local_days{date::year{static_cast<int>(normYear)} / date::month{normMonth} / 1}
        + date::days{day - 1}
        + std::chrono::hours{hour}
        + std::chrono::minutes{min}
        + std::chrono::seconds{int64_t{sec} + util::floorDiv(nsec, kNanosPerSecond)};

    return CalendarTime{
        loc->toSys(local), duration{util::floorMod(nsec, kNanosPerSecond)}, *loc};
}

//-------------------------------------------------------------------------

bool CalendarTime::isZero() const noexcept
{
    return m_sec == kZeroSeconds && m_nsec == duration::zero();
}

//-------------------------------------------------------------------------

CalendarTime::duration CalendarTime::sub(const CalendarTime& u) const noexcept
{
    const int64_t d = util::wrappingAdd(
        util::wrappingMul(util::wrappingSub(unixSeconds(), u.unixSeconds()), kNanosPerSecond),
        (m_nsec - u.m_nsec).count());
    if (u.add(duration{d}).equal(*this)) {
        return duration{d};
    }
    return before(u) ? duration::min() : duration::max();
}

//-------------------------------------------------------------------------

CalendarTime CalendarTime::add(duration d) const noexcept
{
    int64_t dsec = d.count() / kNanosPerSecond;
    int64_t nsec = m_nsec.count() + d.count() % kNanosPerSecond;
    if (nsec >= kNanosPerSecond) {
        ++dsec;
        nsec -= kNanosPerSecond;
    } else if (nsec < 0) {
        --dsec;
        nsec += kNanosPerSecond;
    }
    return CalendarTime{
        date::sys_seconds{std::chrono::seconds{util::wrappingAdd(unixSeconds(), dsec)}},
        duration{nsec},
        m_loc};
}

//-------------------------------------------------------------------------

CalendarTime CalendarTime::utc() const noexcept
{
    return CalendarTime{m_sec, m_nsec, Location{}};
}

//-------------------------------------------------------------------------

CalendarTime CalendarTime::in(const Location& loc) const noexcept
{
    return CalendarTime{m_sec, m_nsec, loc};
}

//-------------------------------------------------------------------------

CalendarTime CalendarTime::truncate(duration d) const noexcept
{
    if (d <= duration::zero()) return *this;
    const Int128 sinceZero =
        (Int128{m_sec.time_since_epoch().count()} - kZeroSeconds.time_since_epoch().count())
            * kNanosPerSecond
        + m_nsec.count();
    Int128 rem = sinceZero % d.count();
    if (rem < 0) rem += d.count();
    return add(duration{-static_cast<int64_t>(rem)});
}

//-------------------------------------------------------------------------

bool CalendarTime::before(const CalendarTime& u) const noexcept
{
    return *this < u;
}

//-------------------------------------------------------------------------

bool CalendarTime::after(const CalendarTime& u) const noexcept
{
    return *this > u;
}

//-------------------------------------------------------------------------

bool CalendarTime::equal(const CalendarTime& u) const noexcept
{
    return m_sec == u.m_sec && m_nsec == u.m_nsec;
}

//-------------------------------------------------------------------------

int64_t CalendarTime::unixNano() const noexcept
{
    return util::wrappingAdd(util::wrappingMul(unixSeconds(), kNanosPerSecond), m_nsec.count());
}

//-------------------------------------------------------------------------

std::string CalendarTime::toString() const
{
    const auto [ymd, hms, offset] = fieldsOf(m_sec, m_loc);
    const int64_t offsetSeconds = offset.offset.count();
    const int64_t absOffset = offsetSeconds < 0 ? -offsetSeconds : offsetSeconds;
    return fmt::format(
        "{:04}-{:02}-{:02} {:02}:{:02}:{:02}{} {}{:02}{:02} {}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        hms.hours().count(),
        hms.minutes().count(),
        hms.seconds().count(),
        fraction(m_nsec),
        offsetSeconds < 0 ? '-' : '+',
        absOffset / 3600,
        absOffset % 3600 / 60,
        offset.abbrev);
}

//-------------------------------------------------------------------------

std::string CalendarTime::format(std::string_view layout) const
{
    const std::string fmtStr{layout};
    const Int128 total = Int128{unixSeconds()} * kNanosPerSecond + m_nsec.count();
    const int64_t margin = m_loc.isUTC() ? 0 : kNanosPerDay;
    if (total >= Int128{std::numeric_limits<int64_t>::min()} + margin
        && total <= Int128{std::numeric_limits<int64_t>::max()} - margin) {
        return formatIn(
            fmtStr, date::sys_time<duration>{duration{static_cast<int64_t>(total)}}, m_loc);
    }
    return formatIn(fmtStr, m_sec, m_loc);
}

//-------------------------------------------------------------------------

std::vector<uint8_t> CalendarTime::marshalBinary() const
{
    serialization::BinaryStream stream;
    msgpack::pack(stream, *this);
    return stream.bytes();
}

//-------------------------------------------------------------------------

std::string CalendarTime::marshalJSON() const
{
    const std::string text = marshalText();
    rapidjson::Document json;
    json.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), json.GetAllocator());
    return json::json2str(json);
}

//-------------------------------------------------------------------------

std::string CalendarTime::marshalText() const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_sec < kMinMarshalSeconds || m_sec >= kMaxMarshalSeconds) {
        throw MarshalError{fmt::format("{}: year outside of range [0,9999]", ctx)};
    }
    const auto [ymd, hms, offset] = fieldsOf(m_sec, m_loc);
    const int year = static_cast<int>(ymd.year());
    if (year < 0 || year > 9999) {
        throw MarshalError{fmt::format("{}: year {} outside of range [0,9999]", ctx, year)};
    }

    std::string zone = "Z";
    if (const int64_t offsetSeconds = offset.offset.count(); offsetSeconds != 0) {
        const int64_t absOffset = offsetSeconds < 0 ? -offsetSeconds : offsetSeconds;
        zone = fmt::format(
            "{}{:02}:{:02}", offsetSeconds < 0 ? '-' : '+', absOffset / 3600, absOffset % 3600 / 60);
    }

    return fmt::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}{}",
        year,
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        hms.hours().count(),
        hms.minutes().count(),
        hms.seconds().count(),
        fraction(m_nsec),
        zone);
}

//-------------------------------------------------------------------------

}  // namespace nanots

//-------------------------------------------------------------------------
