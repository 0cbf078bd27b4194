/**
 * @file stock_analyzer.hpp
 * @brief Assembly and execution of the stock analysis workflow.
 */
#pragma once
#include "stategraph/analysis/analysis_nodes.hpp"
#include "stategraph/execution/executor.hpp"
#include "stategraph/execution/graph.hpp"

namespace stategraph
{

/**
 * @brief Register the analysis nodes and build the validated graph.
 *
 * @param source Market data collaborator used by the data collector.
 * @param model Language model shared by the analysts and the report generator.
 * @param config Workflow settings.
 * @return Graph with data_collector as entry and report_generator -> END,
 *         carrying the analysis schema.
 */
GraphPtr build_analysis_workflow(MarketDataSourcePtr source,
                                 LanguageModelPtr model,
                                 const AnalysisConfig& config = {});

/**
 * @brief Run the analysis for one symbol and return the report.
 *
 * @throws WorkflowError if any node fails; the partial state is attached.
 */
std::string analyze_stock(const GraphPtr& workflow,
                          const std::string& symbol,
                          ExecutorConfig executor_config = {});

} // namespace stategraph
