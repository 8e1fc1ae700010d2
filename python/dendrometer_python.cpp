#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <Dendrometer.h>

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

using IndexArray =
    py::array_t<int64_t, py::array::c_style | py::array::forcecast>;
using PointArray = py::array_t<float, py::array::c_style | py::array::forcecast>;
using WeightArray =
    py::array_t<double, py::array::c_style | py::array::forcecast>;

Dendrometer::MorphologySamples make_samples(const IndexArray &parents,
                                            const PointArray &points) {
  const auto parents_info = parents.request();
  const auto points_info = points.request();

  if (parents_info.ndim != 1)
    throw py::value_error("parents must be a 1-D array");

  if (points_info.ndim != 2 || points_info.shape[1] != 3)
    throw py::value_error("points must be an (N, 3) array");

  if (points_info.shape[0] != parents_info.shape[0])
    throw py::value_error("parents and points must have the same length");

  const auto parents_view = parents.unchecked<1>();
  const auto points_view = points.unchecked<2>();

  Dendrometer::MorphologySamples samples;
  samples.reserve(static_cast<size_t>(parents_info.shape[0]));
  for (py::ssize_t i = 0; i < parents_info.shape[0]; ++i) {
    const Dendrometer::Vector3f point(points_view(i, 0), points_view(i, 1),
                                      points_view(i, 2));
    samples.emplace_back(static_cast<int64_t>(i), parents_view(i), point);
  }

  return samples;
}

void assign_weights(Dendrometer::DirectedWeightedGraph &graph,
                    const WeightArray &weights) {
  const auto info = weights.request();
  if (info.ndim != 1 ||
      static_cast<size_t>(info.shape[0]) != graph.getNumberNodes())
    throw py::value_error("weights must be a 1-D array with one weight per node");

  // The weight of a node is the weight of the edge from its parent
  const auto view = weights.unchecked<1>();
  for (auto edge : graph.getEdges()) {
    const double weight = view(static_cast<py::ssize_t>(edge->target->graphIndex));
    if (!(weight >= 0.0))
      throw py::value_error("weights must be non-negative");
    edge->weight = weight;
  }
}

std::unique_ptr<Dendrometer::DirectedWeightedGraph>
make_graph(const IndexArray &parents, const PointArray &points,
           std::optional<bool> euclidean,
           const std::optional<WeightArray> &weights) {
  // Explicit weights replace the euclidean ones unless asked otherwise
  const bool use_euclidean = euclidean.value_or(!weights);
  if (weights && use_euclidean)
    throw py::value_error("weights cannot be combined with euclidean=True");

  auto graph = std::make_unique<Dendrometer::DirectedWeightedGraph>(
      make_samples(parents, points), use_euclidean);

  if (weights)
    assign_weights(*graph, *weights);

  return graph;
}

const Dendrometer::GraphNode *
find_node(const Dendrometer::DirectedWeightedGraph &graph, int64_t index) {
  if (index < 0 || static_cast<size_t>(index) >= graph.getNumberNodes())
    throw py::index_error("node index " + std::to_string(index) +
                          " is out of range");
  return graph.getNodes()[static_cast<size_t>(index)];
}

py::list tips_to_list(const Dendrometer::DirectedWeightedGraph &graph) {
  py::list tips;
  for (const auto tip : graph.getTips())
    tips.append(tip->index);
  return tips;
}

} // namespace

py::dict compute_diameter(const IndexArray &parents, const PointArray &points,
                          const std::string &algorithm, bool directed,
                          std::optional<bool> euclidean,
                          const std::optional<WeightArray> &weights) {
  const auto graph = make_graph(parents, points, euclidean, weights);

  Dendrometer::DiameterOptions options;
  options.algorithm = Dendrometer::GraphDiameterAnalyzer::getAlgorithm(algorithm);
  options.mode = directed ? Dendrometer::DIAMETER_MODE::DIRECTED
                          : Dendrometer::DIAMETER_MODE::UNDIRECTED;

  if (!directed && options.algorithm == Dendrometer::DIAMETER_ALGORITHM::DIJKSTRA)
    throw py::value_error("the undirected diameter only supports algorithm='tree'");

  Dendrometer::GraphPath path;
  {
    py::gil_scoped_release release;
    path = Dendrometer::GraphDiameterAnalyzer::compute(*graph, options);
  }

  py::dict result;
  result["length"] = path.getLength();
  result["path"] = path.getSampleIndices();
  result["root"] = graph->getRoot()->index;
  result["tips"] = tips_to_list(*graph);

  return result;
}

py::dict shortest_path(const IndexArray &parents, const PointArray &points,
                       int64_t source, int64_t target) {
  const auto graph = make_graph(parents, points, true, std::nullopt);
  graph->verifyTree();

  const auto path = graph->getShortestPath(find_node(*graph, source),
                                           find_node(*graph, target));

  py::dict result;
  result["length"] = path.getLength();
  result["path"] = path.getSampleIndices();

  return result;
}

PYBIND11_MODULE(_core, m) {
  m.doc() = "Python bindings for Dendrometer tree diameter analysis";

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p)
        std::rethrow_exception(p);
    } catch (const Dendrometer::InvalidGraphError &e) {
      PyErr_SetString(PyExc_ValueError, e.what());
    }
  });

  m.def("compute_diameter", &compute_diameter, py::arg("parents"),
        py::arg("points"), py::arg("algorithm") = "tree",
        py::arg("directed") = true, py::arg("euclidean") = py::none(),
        py::arg("weights") = py::none(),
        R"pbdoc(
Compute the diameter of a rooted tree given as a parent array.

Parameters
----------
parents : numpy.ndarray
    1-D integer array, parents[i] is the index of the parent of node i, -1 for the root.
points : numpy.ndarray
    (N, 3) array of node positions.
algorithm : str, optional
    "tree" (default) for the single traversal, or "dijkstra" for the baseline.
directed : bool, optional
    If True (default), the longest root-to-tip path. Otherwise the longest path
    between any two of the tips and the root, ignoring the edge directions.
euclidean : bool, optional
    Use the distances between the points as edge weights. Otherwise all the
    edges weigh 1, unless weights are given. Defaults to True without weights
    and to False with weights.
weights : numpy.ndarray, optional
    1-D array, weights[i] is the weight of the edge from the parent of node i.
    Cannot be combined with euclidean=True. The weight of the root is ignored.

Returns
-------
Dict with:
    length : float, the length of the diameter.
    path : list of the node indices along the diameter.
    root : int, the index of the root.
    tips : list of the indices of the tips.

Raises
------
ValueError
    If the parent array does not describe a single rooted tree, or if weights
    are given with euclidean=True.
)pbdoc");

  m.def("shortest_path", &shortest_path, py::arg("parents"), py::arg("points"),
        py::arg("source"), py::arg("target"),
        R"pbdoc(
Shortest path between two nodes of a rooted tree, through their lowest common ancestor.

Returns
-------
Dict with the Euclidean length of the path and the list of node indices, from source
to target. The path is empty if source and target are the same node.
)pbdoc");
}
