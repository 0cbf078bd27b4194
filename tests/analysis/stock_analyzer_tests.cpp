#include <gtest/gtest.h>
#include "stategraph/analysis/stock_analyzer.hpp"
#include "stategraph/analysis/news_filter.hpp"
#include "stategraph/execution/workflow_error.hpp"
#include <atomic>
#include <cstdio>
#include <mutex>

using namespace stategraph;

// =============================================================================
// Test Implementations
// =============================================================================

/**
 * @brief IMarketDataSource returning canned data.
 */
class FakeMarketDataSource : public IMarketDataSource
{
public:
    MarketData fetch(const std::string& symbol) override
    {
        ++m_fetch_count;
        m_last_symbol = symbol;
        if (m_should_throw)
        {
            throw std::runtime_error("market data unavailable");
        }
        return m_data;
    }

    void set_data(MarketData data) { m_data = std::move(data); }
    void set_should_throw(bool value) { m_should_throw = value; }

    int fetch_count() const { return m_fetch_count; }
    const std::string& last_symbol() const { return m_last_symbol; }

private:
    MarketData m_data;
    bool m_should_throw{false};
    std::atomic<int> m_fetch_count{0};
    std::string m_last_symbol;
};

/**
 * @brief ILanguageModel that answers by role and records every request.
 */
class FakeLanguageModel : public ILanguageModel
{
public:
    struct Request
    {
        std::string model;
        std::string system_prompt;
        std::string user_prompt;
    };

    std::string chat(const std::string& model, const std::vector<ChatMessage>& messages) override
    {
        Request request{model, messages.at(0).content, messages.at(1).content};
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request);
        }
        if (!m_fail_on.empty() && contains(request.system_prompt, m_fail_on))
        {
            throw std::runtime_error("model unavailable");
        }
        if (contains(request.system_prompt, "CFA"))
        {
            return "FINANCIAL VIEW";
        }
        if (contains(request.system_prompt, "news analyst"))
        {
            return "NEWS VIEW";
        }
        if (contains(request.system_prompt, "technical analyst"))
        {
            return "TECHNICAL VIEW";
        }
        return "FINAL REPORT";
    }

    void fail_on(const std::string& role_fragment) { m_fail_on = role_fragment; }

    std::vector<Request> requests() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    /**
     * @brief User prompt of the request whose system prompt contains a fragment.
     */
    std::string prompt_for(const std::string& role_fragment) const
    {
        for (const auto& request : requests())
        {
            if (contains(request.system_prompt, role_fragment))
            {
                return request.user_prompt;
            }
        }
        return {};
    }

    static bool contains(const std::string& text, const std::string& fragment)
    {
        return text.find(fragment) != std::string::npos;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Request> m_requests;
    std::string m_fail_on;
};

// =============================================================================
// Test Fixture
// =============================================================================

class StockAnalyzerTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        MarketData data;
        for (int i = 0; i < 100; ++i)
        {
            char date[16];
            std::snprintf(date, sizeof(date), "day-%03d", i);
            data.history.push_back(PriceBar{date, 100.0 + i});
        }
        data.financials["Net Income"] = {"1000", "900"};
        data.financials["Total Revenue"] = {"5000", "4500"};

        NewsItem fresh;
        fresh.content = {{"title", "Record quarter"},
                         {"pubDate", "2024-03-18T10:00:00Z"},
                         {"summary", "Earnings beat"}};
        NewsItem stale;
        stale.content = {{"title", "Old rumour"}, {"pubDate", "2024-01-02T10:00:00Z"}};
        data.news = {fresh, stale};

        source->set_data(std::move(data));
        config.clock = [] { return *parse_iso8601("2024-03-20T00:00:00Z"); };
    }

    std::shared_ptr<FakeMarketDataSource> source = std::make_shared<FakeMarketDataSource>();
    std::shared_ptr<FakeLanguageModel> model = std::make_shared<FakeLanguageModel>();
    AnalysisConfig config;
};

// =============================================================================
// Workflow Shape Tests
// =============================================================================

TEST_F(StockAnalyzerTests, BuildWorkflow_HasDiamondShape)
{
    auto graph = build_analysis_workflow(source, model, config);

    ASSERT_EQ(graph->node_count(), 5u);
    EXPECT_EQ(graph->node_names[graph->entry], NODE_DATA_COLLECTOR);
    EXPECT_TRUE(graph->diagnostics->is_valid());
    EXPECT_FALSE(graph->diagnostics->has_warnings());

    auto report = graph->find_node(NODE_REPORT_GENERATOR);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(graph->predecessor_counts[*report], 3u);
    for (NodeIdx n = 0; n < graph->node_count(); ++n)
    {
        EXPECT_EQ(graph->terminal_predecessors[n], n == *report) << graph->node_names[n];
    }
    ASSERT_NE(graph->schema, nullptr);
    EXPECT_EQ(graph->schema->size(), 8u);
}

TEST_F(StockAnalyzerTests, BuildWorkflow_NullCollaborator_Throws)
{
    EXPECT_THROW(build_analysis_workflow(nullptr, model, config), std::invalid_argument);
    EXPECT_THROW(build_analysis_workflow(source, nullptr, config), std::invalid_argument);
}

// =============================================================================
// End-to-End Tests
// =============================================================================

TEST_F(StockAnalyzerTests, AnalyzeStock_ReturnsReport)
{
    auto graph = build_analysis_workflow(source, model, config);
    std::string report = analyze_stock(graph, "AAPL");

    EXPECT_EQ(report, "FINAL REPORT");
    EXPECT_EQ(source->fetch_count(), 1);
    EXPECT_EQ(source->last_symbol(), "AAPL");

    auto requests = model->requests();
    ASSERT_EQ(requests.size(), 4u);
    for (const auto& request : requests)
    {
        EXPECT_EQ(request.model, "llama3.2");
    }
    // The report generator runs last
    EXPECT_TRUE(FakeLanguageModel::contains(requests.back().system_prompt, "report writer"));
}

TEST_F(StockAnalyzerTests, AnalyzeStock_SingleThreaded_ReturnsReport)
{
    ExecutorConfig executor_config;
    executor_config.thread_count = 1;
    auto graph = build_analysis_workflow(source, model, config);
    EXPECT_EQ(analyze_stock(graph, "MSFT", executor_config), "FINAL REPORT");
}

TEST_F(StockAnalyzerTests, ReportPrompt_CombinesAnalysesAndRecentPrices)
{
    auto graph = build_analysis_workflow(source, model, config);
    analyze_stock(graph, "AAPL");

    std::string prompt = model->prompt_for("report writer");
    EXPECT_NE(prompt.find("Stock: AAPL"), std::string::npos);
    EXPECT_NE(prompt.find("FINANCIAL VIEW"), std::string::npos);
    EXPECT_NE(prompt.find("NEWS VIEW"), std::string::npos);
    EXPECT_NE(prompt.find("TECHNICAL VIEW"), std::string::npos);

    // Only the last 90 of 100 closes
    EXPECT_NE(prompt.find("('day-099', 199.0)"), std::string::npos);
    EXPECT_NE(prompt.find("day-010"), std::string::npos);
    EXPECT_EQ(prompt.find("day-009"), std::string::npos);
}

TEST_F(StockAnalyzerTests, TechnicalPrompt_UsesFullHistory)
{
    auto graph = build_analysis_workflow(source, model, config);
    analyze_stock(graph, "AAPL");

    std::string prompt = model->prompt_for("technical analyst");
    EXPECT_NE(prompt.find("('day-000', 100.0)"), std::string::npos);
    EXPECT_NE(prompt.find("day-099"), std::string::npos);
}

TEST_F(StockAnalyzerTests, TechnicalPrompt_KeepsFractionalCloses)
{
    MarketData data;
    data.history = {PriceBar{"2024-03-18", 101.25}, PriceBar{"2024-03-19", 99.5}};
    source->set_data(std::move(data));
    auto graph = build_analysis_workflow(source, model, config);
    analyze_stock(graph, "AAPL");

    std::string prompt = model->prompt_for("technical analyst");
    EXPECT_NE(prompt.find("[('2024-03-18', 101.25), ('2024-03-19', 99.5)]"), std::string::npos);
}

TEST_F(StockAnalyzerTests, FinancialPrompt_IncludesStatements)
{
    auto graph = build_analysis_workflow(source, model, config);
    analyze_stock(graph, "AAPL");

    std::string prompt = model->prompt_for("CFA");
    EXPECT_NE(prompt.find("data for AAPL"), std::string::npos);
    EXPECT_NE(prompt.find("'Net Income': [1000, 900]"), std::string::npos);
}

TEST_F(StockAnalyzerTests, NewsPrompt_OnlyRecentNews)
{
    auto graph = build_analysis_workflow(source, model, config);
    analyze_stock(graph, "AAPL");

    std::string prompt = model->prompt_for("news analyst");
    EXPECT_NE(prompt.find("Record quarter"), std::string::npos);
    EXPECT_NE(prompt.find("2024-03-18"), std::string::npos);
    EXPECT_EQ(prompt.find("Old rumour"), std::string::npos);
}

TEST_F(StockAnalyzerTests, CustomModelName_IsUsed)
{
    config.model_name = "mistral";
    auto graph = build_analysis_workflow(source, model, config);
    analyze_stock(graph, "AAPL");

    for (const auto& request : model->requests())
    {
        EXPECT_EQ(request.model, "mistral");
    }
}

// =============================================================================
// Failure Tests
// =============================================================================

TEST_F(StockAnalyzerTests, DataSourceFailure_ThrowsWorkflowError)
{
    source->set_should_throw(true);
    auto graph = build_analysis_workflow(source, model, config);

    try
    {
        analyze_stock(graph, "AAPL");
        FAIL() << "Expected WorkflowError";
    }
    catch (const WorkflowError& e)
    {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::NodeFailed);
        EXPECT_EQ(e.failed_node(), NODE_DATA_COLLECTOR);
        EXPECT_EQ(e.partial_state().get<std::string>(FIELD_STOCK_SYMBOL), "AAPL");
        EXPECT_FALSE(e.partial_state().contains(FIELD_HISTORICAL_DATA));
    }
    EXPECT_TRUE(model->requests().empty());
}

TEST_F(StockAnalyzerTests, AnalystFailure_SkipsReport)
{
    model->fail_on("news analyst");
    auto graph = build_analysis_workflow(source, model, config);

    try
    {
        analyze_stock(graph, "AAPL");
        FAIL() << "Expected WorkflowError";
    }
    catch (const WorkflowError& e)
    {
        EXPECT_EQ(e.failed_node(), NODE_NEWS_ANALYST);
        EXPECT_TRUE(e.partial_state().contains(FIELD_HISTORICAL_DATA));
        EXPECT_FALSE(e.partial_state().contains(FIELD_REPORT));
    }
    EXPECT_TRUE(model->prompt_for("report writer").empty());
}
