/**
 * @file market_data.hpp
 * @brief Market data types and the IMarketDataSource collaborator interface.
 */
#pragma once
#include "stategraph/common/common.hpp"

namespace stategraph
{

/**
 * @brief One closing price.
 */
struct PriceBar
{
    std::string date;
    double close{0.0};
};

/**
 * @brief Daily closing prices, oldest first.
 */
using PriceHistory = std::vector<PriceBar>;

/**
 * @brief Financial statement rows keyed by line item, one value per reporting period.
 */
using FinancialTable = std::map<std::string, std::vector<std::string>>;

/**
 * @brief A raw news item as delivered by the data source.
 *
 * @details
 * Only the content attributes are kept. The news filter reads "title",
 * "pubDate" (ISO 8601 with a UTC offset) and "summary"; any of them may be
 * missing.
 */
struct NewsItem
{
    std::map<std::string, std::string> content;
};

/**
 * @brief Everything the data collector fetches for a symbol.
 */
struct MarketData
{
    PriceHistory history;
    FinancialTable financials;
    std::vector<NewsItem> news;
};

/**
 * @brief Source of price history, financial statements and news for a symbol.
 *
 * @details
 * Implementations may perform network requests and may throw; an exception
 * fails the data collector node.
 */
class IMarketDataSource
{
public:
    virtual ~IMarketDataSource() = default;

    /**
     * @brief Fetch one year of daily history, the latest financials and news.
     */
    virtual MarketData fetch(const std::string& symbol) = 0;
};

using MarketDataSourcePtr = std::shared_ptr<IMarketDataSource>;

} // namespace stategraph
