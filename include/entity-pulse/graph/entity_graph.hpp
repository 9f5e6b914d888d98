#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace entitypulse::graph {

/**
 * @struct Edge
 * @brief A weighted relation between two nodes, referenced by node index.
 */
struct Edge {
	std::size_t source = 0;
	std::size_t target = 0;
	double weight = 0.0;
	/// Lead of source over target in days, for lagged relations.
	std::optional<int> lag;
	double p_value = 1.0;
};

/**
 * @class EntityGraph
 * @brief Entity nodes plus a flat edge list.
 *
 * Nodes are stored in insertion order and referenced by index; the graph keeps no pointers
 * between nodes. Algorithms over the graph are free functions.
 */
class EntityGraph {
public:
	explicit EntityGraph(bool directed = false) : directed_(directed) {
	}

	/// Adds a node or returns the index of the existing node with that name.
	std::size_t addNode(const std::string &name);

	std::optional<std::size_t> nodeIndex(const std::string &name) const;

	void addEdge(std::size_t source, std::size_t target, double weight, std::optional<int> lag = std::nullopt,
	             double p_value = 1.0);
	void addEdge(const std::string &source, const std::string &target, double weight,
	             std::optional<int> lag = std::nullopt, double p_value = 1.0);

	/// True when an edge source -> target exists (either direction for undirected graphs).
	bool hasEdge(const std::string &source, const std::string &target) const;

	/// The edge between two named nodes, respecting direction for directed graphs.
	const Edge *findEdge(const std::string &source, const std::string &target) const;

	const std::vector<std::string> &nodes() const {
		return nodes_;
	}
	const std::vector<Edge> &edges() const {
		return edges_;
	}
	const std::string &nodeName(std::size_t index) const {
		return nodes_.at(index);
	}
	std::size_t nodeCount() const {
		return nodes_.size();
	}
	std::size_t edgeCount() const {
		return edges_.size();
	}
	bool isDirected() const {
		return directed_;
	}

private:
	bool directed_;
	std::vector<std::string> nodes_;
	std::unordered_map<std::string, std::size_t> index_;
	std::vector<Edge> edges_;
};

/// Adjacent node indices: successors for directed graphs, all incident nodes otherwise.
std::vector<std::size_t> neighbours(const EntityGraph &graph, std::size_t node);

/// Node degree counted on the undirected view of the graph.
std::size_t degree(const EntityGraph &graph, std::size_t node);

} // namespace entitypulse::graph
