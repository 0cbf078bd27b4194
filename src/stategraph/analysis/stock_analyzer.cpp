#include "stategraph/analysis/stock_analyzer.hpp"
#include "stategraph/common/node_registry.hpp"
#include "stategraph/execution/run.hpp"

#include <spdlog/spdlog.h>

namespace stategraph
{

GraphPtr build_analysis_workflow(MarketDataSourcePtr source,
                                 LanguageModelPtr model,
                                 const AnalysisConfig& config)
{
    NodeRegistry registry;
    registry.set_schema(make_analysis_schema());

    registry.register_node(std::make_shared<DataCollectorNode>(std::move(source)));
    registry.register_node(std::make_shared<FinancialAnalystNode>(model, config), {NODE_DATA_COLLECTOR});
    registry.register_node(std::make_shared<NewsAnalystNode>(model, config), {NODE_DATA_COLLECTOR});
    registry.register_node(std::make_shared<TechnicalAnalystNode>(model, config), {NODE_DATA_COLLECTOR});
    registry.register_node(std::make_shared<ReportGeneratorNode>(model, config),
                           {NODE_FINANCIAL_ANALYST, NODE_NEWS_ANALYST, NODE_TECHNICAL_ANALYST});

    registry.set_entry(NODE_DATA_COLLECTOR);
    registry.add_edge(NODE_REPORT_GENERATOR, END);

    return registry.build();
}

std::string analyze_stock(const GraphPtr& workflow,
                          const std::string& symbol,
                          ExecutorConfig executor_config)
{
    SPDLOG_INFO("Analyzing {}", symbol);

    StateDelta initial_state;
    initial_state.set(FIELD_STOCK_SYMBOL, symbol);

    StateSnapshot final_state = run(workflow, initial_state, std::move(executor_config));
    return final_state.get<std::string>(FIELD_REPORT);
}

} // namespace stategraph
