#include <gtest/gtest.h>
#include "stategraph/analysis/news_filter.hpp"
#include <string>
#include <vector>

using namespace stategraph;

// =============================================================================
// Test Fixture
// =============================================================================

class NewsFilterTests : public ::testing::Test
{
protected:
    static std::chrono::system_clock::time_point at(const std::string& text)
    {
        auto parsed = parse_iso8601(text);
        if (!parsed)
        {
            throw std::invalid_argument("bad test timestamp " + text);
        }
        return *parsed;
    }

    static int64_t epoch_seconds(std::chrono::system_clock::time_point tp)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    static NewsItem item(const std::string& title, const std::string& pub_date)
    {
        NewsItem news;
        news.content["title"] = title;
        news.content["pubDate"] = pub_date;
        news.content["summary"] = title + " summary";
        return news;
    }

    static std::vector<std::string> titles(const std::vector<RecentNews>& news)
    {
        std::vector<std::string> result;
        for (const auto& n : news)
        {
            result.push_back(n.title);
        }
        return result;
    }

    std::chrono::system_clock::time_point now = at("2024-03-20T00:00:00Z");
};

// =============================================================================
// parse_iso8601 Tests
// =============================================================================

TEST_F(NewsFilterTests, Parse_UtcDesignator)
{
    EXPECT_EQ(epoch_seconds(at("2024-03-01T12:00:00Z")), 1709294400);
    EXPECT_EQ(epoch_seconds(at("1970-01-01T00:00:00Z")), 0);
}

TEST_F(NewsFilterTests, Parse_OffsetsDenoteSameInstant)
{
    EXPECT_EQ(at("2024-03-01T14:00:00+02:00"), at("2024-03-01T12:00:00Z"));
    EXPECT_EQ(at("2024-03-01T07:30:00-0430"), at("2024-03-01T12:00:00Z"));
    EXPECT_EQ(at("2024-03-01 12:00Z"), at("2024-03-01T12:00:00Z"));
}

TEST_F(NewsFilterTests, Parse_FractionalSeconds)
{
    auto whole = at("2024-03-01T12:00:00Z");
    auto half = at("2024-03-01T12:00:00.5Z");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(half - whole).count(), 500);
}

TEST_F(NewsFilterTests, Parse_LeapDay)
{
    EXPECT_TRUE(parse_iso8601("2024-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2023-02-29T00:00:00Z").has_value());
}

TEST_F(NewsFilterTests, Parse_RejectsMalformed)
{
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2024-03-01").has_value());
    EXPECT_FALSE(parse_iso8601("2024-03-01T12:00:00").has_value());
    EXPECT_FALSE(parse_iso8601("2024-13-01T12:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2024-03-01T24:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2024-03-01T12:00:00Zjunk").has_value());
    EXPECT_FALSE(parse_iso8601("2024-03-01T12:00:00.Z").has_value());
}

// =============================================================================
// filter_recent_news Tests
// =============================================================================

TEST_F(NewsFilterTests, Filter_DropsItemsOutsideWindow)
{
    std::vector<NewsItem> items{
        item("fresh", "2024-03-19T08:00:00Z"),
        item("old", "2024-03-01T08:00:00Z"),
        item("boundary", "2024-03-05T00:00:00Z"),
        item("just inside", "2024-03-05T00:00:01Z"),
    };

    auto recent = filter_recent_news(items, now, 15, 25);
    EXPECT_EQ(titles(recent), (std::vector<std::string>{"fresh", "just inside"}));
}

TEST_F(NewsFilterTests, Filter_SkipsMissingAndInvalidDates)
{
    NewsItem undated;
    undated.content["title"] = "undated";
    std::vector<NewsItem> items{
        undated,
        item("garbled", "not a date"),
        item("naive", "2024-03-19T08:00:00"),
        item("valid", "2024-03-19T08:00:00Z"),
    };

    auto recent = filter_recent_news(items, now, 15, 25);
    EXPECT_EQ(titles(recent), (std::vector<std::string>{"valid"}));
}

TEST_F(NewsFilterTests, Filter_SortsNewestDayFirstKeepingInputOrderWithinDay)
{
    std::vector<NewsItem> items{
        item("mar10", "2024-03-10T09:00:00Z"),
        item("mar18 late", "2024-03-18T23:00:00Z"),
        item("mar18 early", "2024-03-18T01:00:00Z"),
        item("mar15", "2024-03-15T12:00:00Z"),
    };

    auto recent = filter_recent_news(items, now, 15, 25);
    EXPECT_EQ(titles(recent),
              (std::vector<std::string>{"mar18 late", "mar18 early", "mar15", "mar10"}));
}

TEST_F(NewsFilterTests, Filter_CapsItemCount)
{
    std::vector<NewsItem> items;
    for (int day = 10; day <= 19; ++day)
    {
        items.push_back(item("day" + std::to_string(day), "2024-03-" + std::to_string(day) + "T12:00:00Z"));
    }

    auto recent = filter_recent_news(items, now, 15, 3);
    EXPECT_EQ(titles(recent), (std::vector<std::string>{"day19", "day18", "day17"}));
}

TEST_F(NewsFilterTests, Filter_FillsDefaultsAndLocalDate)
{
    NewsItem bare;
    bare.content["pubDate"] = "2024-03-19T23:30:00-05:00";

    auto recent = filter_recent_news({bare}, now, 15, 25);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].title, "No Title");
    EXPECT_EQ(recent[0].summary, "");
    // The date is taken in the timestamp's own offset, not in UTC
    EXPECT_EQ(recent[0].publish_date, "2024-03-19");
    EXPECT_EQ(recent[0].published, at("2024-03-20T04:30:00Z"));
}
