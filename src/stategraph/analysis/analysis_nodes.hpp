/**
 * @file analysis_nodes.hpp
 * @brief Nodes of the stock analysis workflow, its state fields and schema.
 *
 * @details
 * The workflow is a diamond with three parallel analysts:
 *
 *   data_collector -> {financial_analyst, news_analyst, technical_analyst}
 *                  -> report_generator -> END
 *
 * Each node declares the fields it writes. The analysts only read what the
 * data collector produced; the report generator reads all of them.
 */
#pragma once
#include "stategraph/analysis/language_model.hpp"
#include "stategraph/analysis/market_data.hpp"
#include "stategraph/common/node.hpp"
#include "stategraph/common/state_schema.hpp"

namespace stategraph
{

// ============================================================================
// State fields
// ============================================================================

inline const std::string FIELD_STOCK_SYMBOL{"stock_symbol"};            ///< std::string
inline const std::string FIELD_HISTORICAL_DATA{"historical_data"};      ///< PriceHistory
inline const std::string FIELD_FINANCIALS{"financials"};                ///< FinancialTable
inline const std::string FIELD_NEWS{"news"};                            ///< std::vector<NewsItem>
inline const std::string FIELD_FINANCIAL_ANALYSIS{"financial_analysis"}; ///< std::string
inline const std::string FIELD_NEWS_ANALYSIS{"news_analysis"};          ///< std::string
inline const std::string FIELD_TECHNICAL_ANALYSIS{"technical_analysis"}; ///< std::string
inline const std::string FIELD_REPORT{"report"};                        ///< std::string

// ============================================================================
// Node names
// ============================================================================

inline const std::string NODE_DATA_COLLECTOR{"data_collector"};
inline const std::string NODE_FINANCIAL_ANALYST{"financial_analyst"};
inline const std::string NODE_NEWS_ANALYST{"news_analyst"};
inline const std::string NODE_TECHNICAL_ANALYST{"technical_analyst"};
inline const std::string NODE_REPORT_GENERATOR{"report_generator"};

/**
 * @brief Settings of the stock analysis workflow.
 */
struct AnalysisConfig
{
    /**
     * @brief Model passed to ILanguageModel::chat().
     */
    std::string model_name{"llama3.2"};

    /**
     * @brief News older than this many days is ignored.
     */
    int news_window_days{15};

    /**
     * @brief Maximum number of news items given to the news analyst.
     */
    size_t max_news_items{25};

    /**
     * @brief Number of most recent closing prices quoted in the report prompt.
     */
    size_t report_history_points{90};

    /**
     * @brief Current time for the news window; empty uses system_clock::now().
     */
    std::function<std::chrono::system_clock::time_point()> clock{};
};

/**
 * @brief Schema of the analysis state.
 */
StateSchema make_analysis_schema();

/**
 * @brief Fetches market data for the symbol in the state.
 * @details Reads stock_symbol; writes historical_data, financials and news.
 */
class DataCollectorNode : public INode
{
public:
    explicit DataCollectorNode(MarketDataSourcePtr source);

    const std::string& name() const override;
    std::vector<std::string> outputs() const override;
    StateDelta execute(const StateSnapshot& state) override;

private:
    MarketDataSourcePtr m_source;
};

/**
 * @brief Common base of nodes that ask the language model a question.
 */
class ModelNode : public INode
{
public:
    const std::string& name() const override
    {
        return m_name;
    }

    std::vector<std::string> outputs() const override
    {
        return {m_output};
    }

protected:
    ModelNode(std::string name, std::string output, LanguageModelPtr model, AnalysisConfig config);

    /**
     * @brief Send a system and a user message, return the reply.
     */
    std::string ask(const std::string& system_prompt, const std::string& user_prompt) const;

    std::string m_name;
    std::string m_output;
    LanguageModelPtr m_model;
    AnalysisConfig m_config;
};

/**
 * @brief Fundamental analysis of the financial statements.
 */
class FinancialAnalystNode : public ModelNode
{
public:
    explicit FinancialAnalystNode(LanguageModelPtr model, AnalysisConfig config = {});
    StateDelta execute(const StateSnapshot& state) override;
};

/**
 * @brief Sentiment analysis of recent news.
 */
class NewsAnalystNode : public ModelNode
{
public:
    explicit NewsAnalystNode(LanguageModelPtr model, AnalysisConfig config = {});
    StateDelta execute(const StateSnapshot& state) override;
};

/**
 * @brief Technical analysis of the full price history.
 */
class TechnicalAnalystNode : public ModelNode
{
public:
    explicit TechnicalAnalystNode(LanguageModelPtr model, AnalysisConfig config = {});
    StateDelta execute(const StateSnapshot& state) override;
};

/**
 * @brief Combines the three analyses and recent prices into the final report.
 */
class ReportGeneratorNode : public ModelNode
{
public:
    explicit ReportGeneratorNode(LanguageModelPtr model, AnalysisConfig config = {});
    StateDelta execute(const StateSnapshot& state) override;

    /**
     * @brief The user prompt sent to the model for a given state.
     * @throws MissingFieldError if an input field is absent.
     */
    std::string build_prompt(const StateSnapshot& state) const;
};

} // namespace stategraph
