/*
  Pybind11 module exposing TransFlow-Core C++ APIs to Python.

  Notes:
    - Node/Edge are bound as mutable classes; solve() writes `transported`
      back onto the Python Edge objects it was given.
    - Cost/capacity overrides are dicts keyed by (source, target) tuples.
    - solve_arrays() accepts NumPy arrays (C-contiguous) and returns the
      per-edge flows as an int64 array. Each (src, dst) pair may appear once.
    - InvalidInput surfaces as ValueError.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <string>
#include <span>
#include <vector>

#include "transflow/core/algorithms.hpp"
#include "transflow/core/backend.hpp"
#include "transflow/core/constants.hpp"
#include "transflow/core/error.hpp"
#include "transflow/core/generator.hpp"
#include "transflow/core/instance.hpp"
#include "transflow/core/min_cost_flow.hpp"
#include "transflow/core/types.hpp"

namespace py = pybind11;
using namespace transflow::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + " must be a 1-D array");
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

// dict[(u, v)] -> int  ==>  unordered_map<EdgeKey, T>
template <typename Map>
static Map as_edge_map(const py::object& obj, const char* name) {
  Map out;
  if (obj.is_none()) return out;
  if (!py::isinstance<py::dict>(obj)) {
    throw py::type_error(std::string(name) + ": expected dict keyed by (source, target)");
  }
  for (auto item : py::cast<py::dict>(obj)) {
    auto key = py::cast<py::tuple>(item.first);
    if (key.size() != 2) throw py::type_error(std::string(name) + ": keys must be (source, target) tuples");
    out[EdgeKey{py::cast<NodeId>(key[0]), py::cast<NodeId>(key[1])}] =
        py::cast<typename Map::mapped_type>(item.second);
  }
  return out;
}

static py::dict summary_to_dict(const TransportSummary& s) {
  py::dict out;
  out["flow"] = s.flow;
  out["cost"] = s.cost;
  out["total_supply"] = s.total_supply;
  out["total_demand"] = s.total_demand;
  out["iterations"] = s.iterations;
  out["costs"] = s.costs;
  out["flows"] = s.flows;
  return out;
}

PYBIND11_MODULE(_transflow_core, m) {
  m.doc() = "TransFlow-Core C++ bindings";

  py::register_exception<InvalidInput>(m, "InvalidInput", PyExc_ValueError);

  m.attr("UNLIMITED_CAPACITY") = kUnlimitedCap;
  m.attr("DEFAULT_COST") = kDefaultCost;
  m.attr("UNASSIGNED") = kUnassigned;

  py::enum_<NodeKind>(m, "NodeKind")
      .value("PRODUCER", NodeKind::Producer)
      .value("CONSUMER", NodeKind::Consumer)
      .value("INTERMEDIATE", NodeKind::Intermediate);

  py::class_<Node>(m, "Node")
      .def(py::init([](NodeId id, Supply supply){ return Node{id, supply}; }),
           py::arg("id"), py::arg("supply"))
      .def_readwrite("id", &Node::id)
      .def_readwrite("supply", &Node::supply)
      .def("is_producer", &Node::is_producer)
      .def("is_consumer", &Node::is_consumer)
      .def("is_intermediate", &Node::is_intermediate)
      .def_property_readonly("kind", [](const Node& n){ return node_kind(n); })
      .def("__repr__", [](const Node& n){
        return "Node(id=" + std::to_string(n.id) + ", supply=" + std::to_string(n.supply) + ")";
      });

  py::class_<Edge>(m, "Edge")
      .def(py::init([](NodeId source, NodeId target, Flow transported){ return Edge{source, target, transported}; }),
           py::arg("source"), py::arg("target"), py::arg("transported") = kUnassigned)
      .def_readwrite("source", &Edge::source)
      .def_readwrite("target", &Edge::target)
      .def_readwrite("transported", &Edge::transported)
      .def("is_assigned", &Edge::is_assigned)
      .def("__repr__", [](const Edge& e){
        return "Edge(source=" + std::to_string(e.source) + ", target=" + std::to_string(e.target) +
               ", transported=" + std::to_string(e.transported) + ")";
      });

  m.def("generate_random_directed_graph",
        [](std::int32_t num_nodes, std::int64_t num_edges, std::uint64_t seed,
           std::int64_t supply_range, bool balance_demand) {
          auto g = generate_random_directed_graph(num_nodes, num_edges, seed, supply_range, balance_demand);
          return py::make_tuple(std::move(g.nodes), std::move(g.edges), g.imbalance);
        },
        py::arg("num_nodes"), py::arg("num_edges"), py::arg("seed"),
        py::arg("supply_range") = 10, py::arg("balance_demand") = false);

  m.def("solve",
        [](const std::vector<Node>& nodes, py::list edges, py::object costs, py::object capacities) {
          SolveOptions opts;
          opts.costs = as_edge_map<CostMap>(costs, "costs");
          opts.capacities = as_edge_map<CapacityMap>(capacities, "capacities");
          // Work on a copy, then write transported back onto the caller's objects.
          std::vector<Edge*> handles;
          handles.reserve(edges.size());
          std::vector<Edge> work;
          work.reserve(edges.size());
          for (auto item : edges) {
            Edge& e = py::cast<Edge&>(item);
            handles.push_back(&e);
            work.push_back(e);
          }
          TransportSummary summary;
          {
            py::gil_scoped_release rel;
            Algorithms algs(make_cpu_backend());
            summary = algs.solve(nodes, work, opts);
          }
          for (std::size_t i = 0; i < work.size(); ++i) handles[i]->transported = work[i].transported;
          return summary_to_dict(summary);
        },
        py::arg("nodes"), py::arg("edges"), py::kw_only(),
        py::arg("costs") = py::none(), py::arg("capacities") = py::none());

  m.def("solve_arrays",
        [](py::array ids, py::array supplies, py::array src, py::array dst,
           py::array cost, py::array capacity) {
          auto id_s = as_span<std::int32_t>(ids, "ids");
          auto sup_s = as_span<std::int64_t>(supplies, "supplies");
          auto src_s = as_span<std::int32_t>(src, "src");
          auto dst_s = as_span<std::int32_t>(dst, "dst");
          auto cost_s = as_span<std::int64_t>(cost, "cost");
          auto cap_s = as_span<std::int64_t>(capacity, "capacity");
          if (id_s.size() != sup_s.size()) throw py::type_error("ids and supplies must have the same length");
          if (src_s.size() != dst_s.size() || src_s.size() != cost_s.size() || src_s.size() != cap_s.size()) {
            throw py::type_error("src, dst, cost, and capacity must have the same length");
          }
          std::vector<Node> nodes(id_s.size());
          for (std::size_t i = 0; i < nodes.size(); ++i) nodes[i] = Node{id_s[i], sup_s[i]};
          std::vector<Edge> edges(src_s.size());
          SolveOptions opts;
          for (std::size_t i = 0; i < edges.size(); ++i) {
            edges[i] = Edge{src_s[i], dst_s[i], kUnassigned};
            // Each row carries its own cost and capacity; a repeated pair would
            // silently overwrite the earlier row's values.
            if (!opts.costs.emplace(edges[i].key(), cost_s[i]).second) {
              throw InvalidInput("solve_arrays: duplicate edge " + std::to_string(src_s[i]) +
                                 "->" + std::to_string(dst_s[i]) + " at row " + std::to_string(i));
            }
            opts.capacities.emplace(edges[i].key(), cap_s[i]);
          }
          TransportSummary summary;
          {
            py::gil_scoped_release rel;
            summary = solve_transport(nodes, edges, opts);
          }
          py::array_t<std::int64_t> flows(static_cast<py::ssize_t>(edges.size()));
          auto* out = flows.mutable_data();
          for (std::size_t i = 0; i < edges.size(); ++i) out[i] = edges[i].transported;
          return py::make_tuple(summary_to_dict(summary), flows);
        },
        py::arg("ids"), py::arg("supplies"), py::arg("src"), py::arg("dst"),
        py::arg("cost"), py::arg("capacity"));

  m.def("format_graph",
        [](const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
          return format_graph(nodes, edges);
        },
        py::arg("nodes"), py::arg("edges"));
}
