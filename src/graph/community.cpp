#include "entity-pulse/graph/community.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <Eigen/Dense>
#include <algorithm>

namespace entitypulse::graph {

namespace {

// Symmetric 0/1 adjacency of the undirected view; parallel and reverse edges collapse.
Eigen::MatrixXd adjacency(const EntityGraph &graph) {
	const auto n = static_cast<Eigen::Index>(graph.nodeCount());
	Eigen::MatrixXd a = Eigen::MatrixXd::Zero(n, n);
	for (const auto &edge : graph.edges()) {
		const auto s = static_cast<Eigen::Index>(edge.source);
		const auto t = static_cast<Eigen::Index>(edge.target);
		a(s, t) = 1.0;
		a(t, s) = 1.0;
	}
	return a;
}

Eigen::MatrixXd indicator(const std::vector<std::vector<std::size_t>> &groups, Eigen::Index n) {
	Eigen::MatrixXd m = Eigen::MatrixXd::Zero(n, static_cast<Eigen::Index>(groups.size()));
	for (std::size_t c = 0; c < groups.size(); ++c) {
		for (std::size_t node : groups[c]) {
			m(static_cast<Eigen::Index>(node), static_cast<Eigen::Index>(c)) = 1.0;
		}
	}
	return m;
}

} // namespace

std::vector<Community> greedyModularityCommunities(const EntityGraph &graph) {
	const auto n = static_cast<Eigen::Index>(graph.nodeCount());
	std::vector<std::vector<std::size_t>> groups(graph.nodeCount());
	for (std::size_t i = 0; i < groups.size(); ++i) {
		groups[i].push_back(i);
	}

	const Eigen::MatrixXd a = adjacency(graph);
	const double two_m = a.sum();
	if (two_m > 0.0) {
		while (groups.size() > 1) {
			// e(i, j): share of edge ends joining community i to j; a_i: share of ends in i.
			const Eigen::MatrixXd m = indicator(groups, n);
			const Eigen::MatrixXd e = m.transpose() * a * m / two_m;
			const Eigen::VectorXd share = e.rowwise().sum();

			double best_gain = 0.0;
			std::size_t best_i = 0;
			std::size_t best_j = 0;
			for (Eigen::Index i = 0; i < e.rows(); ++i) {
				for (Eigen::Index j = i + 1; j < e.cols(); ++j) {
					if (e(i, j) <= 0.0) {
						continue;
					}
					const double gain = 2.0 * (e(i, j) - share(i) * share(j));
					if (gain > best_gain) {
						best_gain = gain;
						best_i = static_cast<std::size_t>(i);
						best_j = static_cast<std::size_t>(j);
					}
				}
			}
			if (best_gain <= 0.0) {
				break;
			}
			groups[best_i].insert(groups[best_i].end(), groups[best_j].begin(), groups[best_j].end());
			groups.erase(groups.begin() + static_cast<std::ptrdiff_t>(best_j));
		}
	}

	std::vector<Community> communities;
	communities.reserve(groups.size());
	for (const auto &group : groups) {
		Community community;
		for (std::size_t node : group) {
			community.push_back(graph.nodeName(node));
		}
		std::sort(community.begin(), community.end());
		communities.push_back(std::move(community));
	}
	std::sort(communities.begin(), communities.end(), [](const Community &lhs, const Community &rhs) {
		if (lhs.size() != rhs.size()) {
			return lhs.size() > rhs.size();
		}
		return lhs.front() < rhs.front();
	});
	ENTITYPULSE_DEBUG("Greedy modularity found {} communities over {} nodes.", communities.size(), graph.nodeCount());
	return communities;
}

double modularity(const EntityGraph &graph, const std::vector<Community> &communities) {
	const Eigen::MatrixXd a = adjacency(graph);
	const double two_m = a.sum();
	if (two_m == 0.0) {
		return 0.0;
	}
	std::vector<std::vector<std::size_t>> groups;
	groups.reserve(communities.size());
	for (const auto &community : communities) {
		std::vector<std::size_t> group;
		for (const auto &name : community) {
			const auto index = graph.nodeIndex(name);
			if (!index) {
				throw core::InvalidParameter("Community member is not a graph node: " + name);
			}
			group.push_back(*index);
		}
		groups.push_back(std::move(group));
	}
	const Eigen::MatrixXd m = indicator(groups, static_cast<Eigen::Index>(graph.nodeCount()));
	const Eigen::MatrixXd e = m.transpose() * a * m / two_m;
	const Eigen::VectorXd share = e.rowwise().sum();
	return e.trace() - share.squaredNorm();
}

} // namespace entitypulse::graph
