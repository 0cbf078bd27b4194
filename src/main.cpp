#include "stategraph/common/node_registry.hpp"
#include "stategraph/execution/run.hpp"

#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace
{

struct DemoOptions
{
    size_t thread_count{0};
    std::string log_level{"info"};
};

DemoOptions parse_options(int argc, char** argv)
{
    DemoOptions options;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--threads" && i + 1 < argc)
        {
            options.thread_count = static_cast<size_t>(std::stoul(argv[++i]));
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            options.log_level = argv[++i];
        }
        else
        {
            throw std::invalid_argument("Unknown argument '" + arg +
                                        "' (usage: stategraph_demo [--threads N] [--log-level LEVEL])");
        }
    }
    return options;
}

stategraph::GraphPtr build_demo_graph()
{
    using stategraph::StateDelta;
    using stategraph::StateSnapshot;

    stategraph::NodeRegistry registry;
    registry.register_node("A", [](const StateSnapshot&) {
        return StateDelta{}.set("x", 1);
    }, {}, {"x"});
    registry.register_node("B", [](const StateSnapshot& s) {
        return StateDelta{}.set("y", s.get<int>("x") + 1);
    }, {"A"}, {"y"});
    registry.register_node("C", [](const StateSnapshot& s) {
        return StateDelta{}.set("z", s.get<int>("x") * 2);
    }, {"A"}, {"z"});
    registry.register_node("D", [](const StateSnapshot& s) {
        return StateDelta{}.set("sum", s.get<int>("y") + s.get<int>("z"));
    }, {"B", "C"}, {"sum"});
    registry.set_entry("A");
    registry.add_edge("D", stategraph::END);
    return registry.build();
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== stategraph ======\n" << std::flush;

        DemoOptions options = parse_options(argc, argv);
        spdlog::set_level(spdlog::level::from_str(options.log_level));

        stategraph::ExecutorConfig config;
        config.thread_count = options.thread_count;
        config.collect_timing = true;

        auto graph = build_demo_graph();
        auto state = stategraph::run(graph, {}, config);

        for (const auto& name : {"x", "y", "z", "sum"})
        {
            std::cout << name << " = " << state.get<int>(name) << "\n";
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
