#include "entity-pulse/graph/entity_graph.hpp"
#include "entity-pulse/core/errors.hpp"

#include <algorithm>

namespace entitypulse::graph {

std::size_t EntityGraph::addNode(const std::string &name) {
	const auto it = index_.find(name);
	if (it != index_.end()) {
		return it->second;
	}
	nodes_.push_back(name);
	index_.emplace(name, nodes_.size() - 1);
	return nodes_.size() - 1;
}

std::optional<std::size_t> EntityGraph::nodeIndex(const std::string &name) const {
	const auto it = index_.find(name);
	if (it == index_.end()) {
		return std::nullopt;
	}
	return it->second;
}

void EntityGraph::addEdge(std::size_t source, std::size_t target, double weight, std::optional<int> lag,
                          double p_value) {
	if (source >= nodes_.size() || target >= nodes_.size()) {
		throw core::InvalidParameter("Edge refers to an unknown node.");
	}
	if (source == target) {
		throw core::InvalidParameter("Self loops are not supported: " + nodes_[source]);
	}
	edges_.push_back(Edge{source, target, weight, lag, p_value});
}

void EntityGraph::addEdge(const std::string &source, const std::string &target, double weight,
                          std::optional<int> lag, double p_value) {
	const std::size_t s = addNode(source);
	const std::size_t t = addNode(target);
	addEdge(s, t, weight, lag, p_value);
}

const Edge *EntityGraph::findEdge(const std::string &source, const std::string &target) const {
	const auto s = nodeIndex(source);
	const auto t = nodeIndex(target);
	if (!s || !t) {
		return nullptr;
	}
	for (const auto &edge : edges_) {
		if (edge.source == *s && edge.target == *t) {
			return &edge;
		}
		if (!directed_ && edge.source == *t && edge.target == *s) {
			return &edge;
		}
	}
	return nullptr;
}

bool EntityGraph::hasEdge(const std::string &source, const std::string &target) const {
	return findEdge(source, target) != nullptr;
}

std::vector<std::size_t> neighbours(const EntityGraph &graph, std::size_t node) {
	std::vector<std::size_t> result;
	for (const auto &edge : graph.edges()) {
		if (edge.source == node) {
			result.push_back(edge.target);
		} else if (!graph.isDirected() && edge.target == node) {
			result.push_back(edge.source);
		}
	}
	std::sort(result.begin(), result.end());
	result.erase(std::unique(result.begin(), result.end()), result.end());
	return result;
}

std::size_t degree(const EntityGraph &graph, std::size_t node) {
	return static_cast<std::size_t>(std::count_if(graph.edges().begin(), graph.edges().end(), [node](const Edge &e) {
		return e.source == node || e.target == node;
	}));
}

} // namespace entitypulse::graph
