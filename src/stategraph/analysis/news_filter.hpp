/**
 * @file news_filter.hpp
 * @brief Selection of recent news items for the news analyst.
 */
#pragma once
#include "stategraph/analysis/market_data.hpp"

namespace stategraph
{

/**
 * @brief A news item that passed the recency filter.
 */
struct RecentNews
{
    std::string title;
    /**
     * @brief Publish date as YYYY-MM-DD, in the timestamp's own UTC offset.
     */
    std::string publish_date;
    std::string summary;
    std::chrono::system_clock::time_point published;
};

/**
 * @brief Parse an ISO 8601 timestamp with a mandatory UTC offset.
 *
 * @details
 * Accepts "YYYY-MM-DDTHH:MM[:SS[.fraction]]" followed by "Z" or "+HH:MM" /
 * "-HH:MM" ("+HHMM" also accepted). A space may replace the "T". Timestamps
 * without an offset are rejected since they cannot be placed on the UTC time
 * line.
 *
 * @return The instant, or std::nullopt if the text is not such a timestamp.
 */
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text);

/**
 * @brief Keep news published within a window, newest first.
 *
 * @param items Raw news items.
 * @param now Reference instant.
 * @param window_days Items published at or before now - window_days are dropped.
 * @param max_items Maximum number of items returned.
 * @return Items sorted by publish date (day granularity) descending, ties in
 *         input order, truncated to max_items.
 *
 * @details Items with a missing or unparsable "pubDate" are skipped with a warning.
 */
std::vector<RecentNews> filter_recent_news(const std::vector<NewsItem>& items,
                                           std::chrono::system_clock::time_point now,
                                           int window_days,
                                           size_t max_items);

} // namespace stategraph
