#include "stategraph/analysis/analysis_nodes.hpp"
#include "stategraph/analysis/news_filter.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace stategraph
{

namespace
{

const char* const ROLE_FINANCIAL_ANALYST =
    "CFA-certified financial analyst expert in fundamental analysis";
const char* const ROLE_NEWS_ANALYST =
    "Financial news analyst expert in market sentiment and NLP";
const char* const ROLE_TECHNICAL_ANALYST =
    "You are an expert technical analyst specialized in chart patterns, moving averages, "
    "and technical indicators.";
const char* const ROLE_REPORT_GENERATOR = "Senior investment analyst and report writer";

std::string format_financials(const FinancialTable& table)
{
    std::string out = "{";
    bool first_row = true;
    for (const auto& [item, values] : table)
    {
        if (!first_row)
        {
            out += ", ";
        }
        first_row = false;
        out += fmt::format("'{}': [{}]", item, fmt::join(values, ", "));
    }
    out += "}";
    return out;
}

std::string format_news(const std::vector<RecentNews>& news)
{
    std::string out = "[";
    for (size_t i = 0; i < news.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += fmt::format("{{'title': '{}', 'publish_date': '{}', 'summary': '{}'}}",
                           news[i].title, news[i].publish_date, news[i].summary);
    }
    out += "]";
    return out;
}

// Shortest round-trip form, keeping a trailing ".0" on whole numbers.
std::string format_close(double close)
{
    std::string text = fmt::format("{}", close);
    if (text.find_first_of(".einf") == std::string::npos)
    {
        text += ".0";
    }
    return text;
}

// Renders bars [first, history.size()) as a list of (date, close) pairs.
std::string format_prices(const PriceHistory& history, size_t first)
{
    std::string out = "[";
    for (size_t i = first; i < history.size(); ++i)
    {
        if (i > first)
        {
            out += ", ";
        }
        out += fmt::format("('{}', {})", history[i].date, format_close(history[i].close));
    }
    out += "]";
    return out;
}

} // namespace

StateSchema make_analysis_schema()
{
    StateSchema schema;
    schema.declare<std::string>(FIELD_STOCK_SYMBOL)
        .declare<PriceHistory>(FIELD_HISTORICAL_DATA)
        .declare<FinancialTable>(FIELD_FINANCIALS)
        .declare<std::vector<NewsItem>>(FIELD_NEWS)
        .declare<std::string>(FIELD_FINANCIAL_ANALYSIS)
        .declare<std::string>(FIELD_NEWS_ANALYSIS)
        .declare<std::string>(FIELD_TECHNICAL_ANALYSIS)
        .declare<std::string>(FIELD_REPORT);
    return schema;
}

// ============================================================================
// DataCollectorNode
// ============================================================================

DataCollectorNode::DataCollectorNode(MarketDataSourcePtr source)
    : m_source(std::move(source))
{
    if (!m_source)
    {
        throw std::invalid_argument("DataCollectorNode requires a market data source");
    }
}

const std::string& DataCollectorNode::name() const
{
    return NODE_DATA_COLLECTOR;
}

std::vector<std::string> DataCollectorNode::outputs() const
{
    return {FIELD_HISTORICAL_DATA, FIELD_FINANCIALS, FIELD_NEWS};
}

StateDelta DataCollectorNode::execute(const StateSnapshot& state)
{
    const auto& symbol = state.get<std::string>(FIELD_STOCK_SYMBOL);
    SPDLOG_INFO("Collecting data for {}", symbol);

    MarketData data = m_source->fetch(symbol);
    SPDLOG_DEBUG("Fetched {} prices, {} financial rows, {} news items",
                 data.history.size(), data.financials.size(), data.news.size());

    StateDelta delta;
    delta.set(FIELD_HISTORICAL_DATA, std::move(data.history))
        .set(FIELD_FINANCIALS, std::move(data.financials))
        .set(FIELD_NEWS, std::move(data.news));
    return delta;
}

// ============================================================================
// ModelNode
// ============================================================================

ModelNode::ModelNode(std::string name, std::string output, LanguageModelPtr model, AnalysisConfig config)
    : m_name(std::move(name))
    , m_output(std::move(output))
    , m_model(std::move(model))
    , m_config(std::move(config))
{
    if (!m_model)
    {
        throw std::invalid_argument("Node '" + m_name + "' requires a language model");
    }
}

std::string ModelNode::ask(const std::string& system_prompt, const std::string& user_prompt) const
{
    std::vector<ChatMessage> messages{
        ChatMessage{"system", system_prompt},
        ChatMessage{"user", user_prompt},
    };
    return m_model->chat(m_config.model_name, messages);
}

// ============================================================================
// Analysts
// ============================================================================

FinancialAnalystNode::FinancialAnalystNode(LanguageModelPtr model, AnalysisConfig config)
    : ModelNode(NODE_FINANCIAL_ANALYST, FIELD_FINANCIAL_ANALYSIS, std::move(model), std::move(config))
{}

StateDelta FinancialAnalystNode::execute(const StateSnapshot& state)
{
    SPDLOG_INFO("Analyzing financials");
    const auto& symbol = state.get<std::string>(FIELD_STOCK_SYMBOL);
    const auto& financials = state.get<FinancialTable>(FIELD_FINANCIALS);

    std::string prompt = fmt::format(
        "Please provide a detailed analysis of the following financial data for {}. "
        "Include an evaluation of profitability, liquidity, and solvency, and highlight "
        "any significant trends or red flags. Data: {}",
        symbol, format_financials(financials));

    StateDelta delta;
    delta.set(FIELD_FINANCIAL_ANALYSIS, ask(ROLE_FINANCIAL_ANALYST, prompt));
    return delta;
}

NewsAnalystNode::NewsAnalystNode(LanguageModelPtr model, AnalysisConfig config)
    : ModelNode(NODE_NEWS_ANALYST, FIELD_NEWS_ANALYSIS, std::move(model), std::move(config))
{}

StateDelta NewsAnalystNode::execute(const StateSnapshot& state)
{
    SPDLOG_INFO("Analyzing news");
    const auto& symbol = state.get<std::string>(FIELD_STOCK_SYMBOL);
    const auto& news = state.get<std::vector<NewsItem>>(FIELD_NEWS);

    auto now = m_config.clock ? m_config.clock() : std::chrono::system_clock::now();
    auto recent = filter_recent_news(news, now, m_config.news_window_days, m_config.max_news_items);

    std::string prompt = fmt::format(
        "Please analyze the following news articles related to {}. "
        "Provide a summary of the prevailing market sentiment, key themes, and potential "
        "impacts on the stock's performance. News Articles: {}",
        symbol, format_news(recent));

    StateDelta delta;
    delta.set(FIELD_NEWS_ANALYSIS, ask(ROLE_NEWS_ANALYST, prompt));
    return delta;
}

TechnicalAnalystNode::TechnicalAnalystNode(LanguageModelPtr model, AnalysisConfig config)
    : ModelNode(NODE_TECHNICAL_ANALYST, FIELD_TECHNICAL_ANALYSIS, std::move(model), std::move(config))
{}

StateDelta TechnicalAnalystNode::execute(const StateSnapshot& state)
{
    SPDLOG_INFO("Performing technical analysis");
    const auto& history = state.get<PriceHistory>(FIELD_HISTORICAL_DATA);

    std::string prompt = fmt::format(
        "Based on the following historical price data (date and closing price) for the stock, "
        "please perform a detailed technical analysis. Consider the following points:\n"
        "1. Identify short-term trends and patterns.\n"
        "2. Evaluate moving averages (e.g., 10-day, 30-day, 50-day, 100-day and 200-day) "
        "and their crossovers.\n"
        "3. Highlight potential support and resistance levels.\n"
        "4. Comment on any other technical indicators (e.g., RSI, MACD) if relevant.\n\n"
        "Data sample: {}",
        format_prices(history, 0));

    StateDelta delta;
    delta.set(FIELD_TECHNICAL_ANALYSIS, ask(ROLE_TECHNICAL_ANALYST, prompt));
    return delta;
}

// ============================================================================
// ReportGeneratorNode
// ============================================================================

ReportGeneratorNode::ReportGeneratorNode(LanguageModelPtr model, AnalysisConfig config)
    : ModelNode(NODE_REPORT_GENERATOR, FIELD_REPORT, std::move(model), std::move(config))
{}

std::string ReportGeneratorNode::build_prompt(const StateSnapshot& state) const
{
    const auto& history = state.get<PriceHistory>(FIELD_HISTORICAL_DATA);
    const size_t points = m_config.report_history_points;
    const size_t first = history.size() > points ? history.size() - points : 0;

    return fmt::format(
        "Stock: {}\n\n"
        "Financial Analysis Summary:\n{}\n\n"
        "News Analysis Summary:\n{}\n\n"
        "Technical Analysis Summary:\n{}\n\n"
        "Historical Price Data Snapshot (Last {} records):\n{}\n\n"
        "Based on the above information, generate a comprehensive investment report that includes:\n"
        "1. An overview of the company's financial health and performance trends.\n"
        "2. Key takeaways from recent news and market sentiment.\n"
        "3. A technical analysis of price trends, highlighting any support/resistance levels or patterns.\n"
        "4. A thorough risk assessment addressing both market-wide and company-specific risks.\n"
        "5. A clear investment recommendation supported by your analysis.\n\n"
        "Ensure the report is structured, concise, and provides actionable insights.\n",
        state.get<std::string>(FIELD_STOCK_SYMBOL),
        state.get<std::string>(FIELD_FINANCIAL_ANALYSIS),
        state.get<std::string>(FIELD_NEWS_ANALYSIS),
        state.get<std::string>(FIELD_TECHNICAL_ANALYSIS),
        points,
        format_prices(history, first));
}

StateDelta ReportGeneratorNode::execute(const StateSnapshot& state)
{
    SPDLOG_INFO("Generating report");
    std::string prompt = build_prompt(state);
    SPDLOG_DEBUG("Report prompt:\n{}", prompt);

    StateDelta delta;
    delta.set(FIELD_REPORT, ask(ROLE_REPORT_GENERATOR, prompt));
    return delta;
}

} // namespace stategraph
