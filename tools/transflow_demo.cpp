/*
  transflow_demo — generate a random transportation instance and optionally
  solve it, printing the instance before and after.

    transflow_demo 6 12 42 --supply-range 5 --balance --solve
*/
#include <boost/program_options.hpp>
#include <glog/logging.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include "transflow/core/algorithms.hpp"
#include "transflow/core/backend.hpp"
#include "transflow/core/error.hpp"
#include "transflow/core/instance.hpp"

using namespace transflow::core;

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;
  namespace po = boost::program_options;

  GeneratorOptions gen;
  std::int64_t unit_cost = kDefaultCost;

  po::options_description options_desc("transflow_demo arguments");
  options_desc.add_options()
      ("help,h", "Display this help message")
      ("num_nodes", po::value<std::int32_t>(&gen.num_nodes)->required(), "Number of nodes")
      ("num_edges", po::value<std::int64_t>(&gen.num_edges)->required(), "Number of directed edges")
      ("seed", po::value<std::uint64_t>(&gen.seed)->required(), "Seed for the random generator")
      ("supply-range", po::value<std::int64_t>(&gen.supply_range)->default_value(10),
       "Supplies are drawn from [-range, range]")
      ("balance", po::bool_switch(&gen.balance_demand), "Make supplies sum to zero")
      ("solve", "Solve the generated instance with successive shortest paths")
      ("unit-cost", po::value<std::int64_t>(&unit_cost)->default_value(kDefaultCost),
       "Cost assigned to every edge when solving")
  ;

  po::positional_options_description popts_desc;
  popts_desc.add("num_nodes", 1);
  popts_desc.add("num_edges", 1);
  popts_desc.add("seed", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options_desc).positional(popts_desc).run(), vm);
    if (vm.count("help")) {
      std::cout << options_desc << '\n';
      return 0;
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "error: " << e.what() << "\n\n" << options_desc << '\n';
    return 2;
  }

  try {
    Algorithms algs(make_cpu_backend());
    auto graph = algs.generate(gen);
    std::cout << format_graph(graph.nodes, graph.edges);

    if (vm.count("solve")) {
      SolveOptions opts;
      for (auto const& e : graph.edges) opts.costs[e.key()] = unit_cost;
      auto summary = algs.solve(graph.nodes, graph.edges, opts);
      std::cout << "\nResult: flow=" << summary.flow << " cost=" << summary.cost
                << " (supply " << summary.total_supply << ", demand "
                << summary.total_demand << ", " << summary.iterations
                << " augmentations)\n\n";
      std::cout << format_graph(graph.nodes, graph.edges);
    }
  } catch (const InvalidInput& e) {
    LOG(ERROR) << e.what();
    return 1;
  } catch (const RuntimeError& e) {
    LOG(ERROR) << "solve failed: " << e.what();
    return 1;
  }
  return 0;
}
