#include "stategraph/analysis/news_filter.hpp"

#include <cstdio>
#include <spdlog/spdlog.h>

namespace stategraph
{

namespace
{

struct ParsedTimestamp
{
    std::chrono::system_clock::time_point instant;
    int year;
    int month;
    int day;
};

bool read_digits(const std::string& text, size_t& pos, size_t count, int& out)
{
    if (pos + count > text.size())
    {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i)
    {
        char c = text[pos + i];
        if (c < '0' || c > '9')
        {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool read_char(const std::string& text, size_t& pos, char expected)
{
    if (pos < text.size() && text[pos] == expected)
    {
        ++pos;
        return true;
    }
    return false;
}

int days_in_month(int year, int month)
{
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : table[month - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
int64_t days_from_civil(int64_t y, int64_t m, int64_t d)
{
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::optional<ParsedTimestamp> parse_timestamp(const std::string& text)
{
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !read_char(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !read_char(text, pos, '-') ||
        !read_digits(text, pos, 2, day))
    {
        return std::nullopt;
    }
    if (!read_char(text, pos, 'T') && !read_char(text, pos, ' '))
    {
        return std::nullopt;
    }
    if (!read_digits(text, pos, 2, hour) || !read_char(text, pos, ':') ||
        !read_digits(text, pos, 2, minute))
    {
        return std::nullopt;
    }
    if (read_char(text, pos, ':') && !read_digits(text, pos, 2, second))
    {
        return std::nullopt;
    }

    std::chrono::nanoseconds fraction{0};
    if (read_char(text, pos, '.') || read_char(text, pos, ','))
    {
        int64_t scale = 100000000;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        {
            fraction += std::chrono::nanoseconds{(text[pos] - '0') * scale};
            scale /= 10;
            ++pos;
            ++digits;
        }
        if (digits == 0)
        {
            return std::nullopt;
        }
    }

    int offset_minutes = 0;
    if (read_char(text, pos, 'Z') || read_char(text, pos, 'z'))
    {
        offset_minutes = 0;
    }
    else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int offset_hour = 0, offset_minute = 0;
        if (!read_digits(text, pos, 2, offset_hour))
        {
            return std::nullopt;
        }
        read_char(text, pos, ':');
        if (!read_digits(text, pos, 2, offset_minute) || offset_hour > 23 || offset_minute > 59)
        {
            return std::nullopt;
        }
        offset_minutes = sign * (offset_hour * 60 + offset_minute);
    }
    else
    {
        // No UTC offset
        return std::nullopt;
    }

    if (pos != text.size())
    {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59)
    {
        return std::nullopt;
    }

    const int64_t seconds = days_from_civil(year, month, day) * 86400 +
                            hour * 3600 + minute * 60 + second -
                            static_cast<int64_t>(offset_minutes) * 60;
    auto since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::seconds{seconds} + fraction);

    return ParsedTimestamp{std::chrono::system_clock::time_point{since_epoch}, year, month, day};
}

std::string format_date(int year, int month, int day)
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::string content_or(const NewsItem& item, const std::string& key, const std::string& fallback)
{
    auto it = item.content.find(key);
    return it != item.content.end() ? it->second : fallback;
}

} // namespace

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text)
{
    auto parsed = parse_timestamp(text);
    if (!parsed)
    {
        return std::nullopt;
    }
    return parsed->instant;
}

std::vector<RecentNews> filter_recent_news(const std::vector<NewsItem>& items,
                                           std::chrono::system_clock::time_point now,
                                           int window_days,
                                           size_t max_items)
{
    const auto cutoff = now - std::chrono::hours{24 * window_days};

    std::vector<RecentNews> recent;
    for (size_t i = 0; i < items.size(); ++i)
    {
        const NewsItem& item = items[i];
        auto date_it = item.content.find("pubDate");
        if (date_it == item.content.end())
        {
            SPDLOG_WARN("Skipping news item {}: no publish date", i);
            continue;
        }
        auto parsed = parse_timestamp(date_it->second);
        if (!parsed)
        {
            SPDLOG_WARN("Skipping news item {}: invalid publish date '{}'", i, date_it->second);
            continue;
        }
        if (parsed->instant <= cutoff)
        {
            continue;
        }
        RecentNews news;
        news.title = content_or(item, "title", "No Title");
        news.publish_date = format_date(parsed->year, parsed->month, parsed->day);
        news.summary = content_or(item, "summary", "");
        news.published = parsed->instant;
        recent.push_back(std::move(news));
    }

    std::stable_sort(recent.begin(), recent.end(), [](const RecentNews& a, const RecentNews& b) {
        return a.publish_date > b.publish_date;
    });
    if (recent.size() > max_items)
    {
        recent.resize(max_items);
    }
    SPDLOG_DEBUG("Selected {} of {} news items", recent.size(), items.size());
    return recent;
}

} // namespace stategraph
