#include "entity-pulse/detectors/isolation_forest.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace entitypulse::detectors {

namespace {
constexpr double euler_gamma = 0.5772156649015329;
} // namespace

IsolationForest::IsolationForest() : IsolationForest(Options{}) {
}

IsolationForest::IsolationForest(Options options) : options_(options) {
	if (options_.n_estimators == 0) {
		throw core::InvalidParameter("IsolationForest needs at least one tree.");
	}
	if (options_.max_samples < 2) {
		throw core::InvalidParameter("IsolationForest max_samples must be at least 2.");
	}
}

double IsolationForest::averagePathLength(std::size_t n) {
	if (n <= 1) {
		return 0.0;
	}
	if (n == 2) {
		return 1.0;
	}
	const double m = static_cast<double>(n - 1);
	return 2.0 * (std::log(m) + euler_gamma) - 2.0 * m / static_cast<double>(n);
}

void IsolationForest::fit(const Eigen::MatrixXd &x, const utils::CancellationToken &token) {
	trees_.clear();
	const auto n = static_cast<std::size_t>(x.rows());
	if (n == 0) {
		throw core::InvalidParameter("IsolationForest cannot be fitted on an empty matrix.");
	}
	sample_size_ = std::min(options_.max_samples, n);
	const auto limit = static_cast<std::size_t>(std::ceil(std::log2(static_cast<double>(std::max<std::size_t>(2, sample_size_)))));

	std::mt19937 rng(options_.seed);
	std::vector<Eigen::Index> all(n);
	std::iota(all.begin(), all.end(), 0);

	trees_.reserve(options_.n_estimators);
	for (std::size_t t = 0; t < options_.n_estimators; ++t) {
		token.throwIfCancelled("IsolationForest::fit");
		std::vector<Eigen::Index> rows = all;
		std::shuffle(rows.begin(), rows.end(), rng);
		rows.resize(sample_size_);

		Tree tree;
		grow(tree, x, rows, 0, rows.size(), 0, limit, rng);
		trees_.push_back(std::move(tree));
	}
	ENTITYPULSE_DEBUG("IsolationForest fitted {} trees on {} samples each.", trees_.size(), sample_size_);
}

int IsolationForest::grow(Tree &tree, const Eigen::MatrixXd &x, std::vector<Eigen::Index> &rows, std::size_t begin,
                          std::size_t end, std::size_t depth, std::size_t limit, std::mt19937 &rng) const {
	const int id = static_cast<int>(tree.size());
	tree.push_back(Node{});
	tree[id].size = end - begin;
	if (end - begin <= 1 || depth >= limit) {
		return id;
	}

	// Only features that still vary inside this node can split it.
	std::vector<int> candidates;
	std::vector<std::pair<double, double>> ranges(static_cast<std::size_t>(x.cols()));
	for (Eigen::Index c = 0; c < x.cols(); ++c) {
		double lo = x(rows[begin], c);
		double hi = lo;
		for (std::size_t i = begin + 1; i < end; ++i) {
			lo = std::min(lo, x(rows[i], c));
			hi = std::max(hi, x(rows[i], c));
		}
		ranges[static_cast<std::size_t>(c)] = {lo, hi};
		if (hi > lo) {
			candidates.push_back(static_cast<int>(c));
		}
	}
	if (candidates.empty()) {
		return id;
	}

	std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
	const int feature = candidates[pick(rng)];
	const auto range = ranges[static_cast<std::size_t>(feature)];
	std::uniform_real_distribution<double> uniform(range.first, range.second);
	const double split = uniform(rng);

	const auto middle = std::partition(rows.begin() + static_cast<std::ptrdiff_t>(begin),
	                                   rows.begin() + static_cast<std::ptrdiff_t>(end),
	                                   [&](Eigen::Index r) { return x(r, feature) < split; });
	const auto mid = static_cast<std::size_t>(middle - rows.begin());

	const int left = grow(tree, x, rows, begin, mid, depth + 1, limit, rng);
	const int right = grow(tree, x, rows, mid, end, depth + 1, limit, rng);
	tree[id].feature = feature;
	tree[id].split = split;
	tree[id].left = left;
	tree[id].right = right;
	return id;
}

double IsolationForest::pathLength(const Tree &tree, const Eigen::Ref<const Eigen::RowVectorXd> &row) const {
	int node = 0;
	double depth = 0.0;
	while (tree[node].feature >= 0) {
		node = row(tree[node].feature) < tree[node].split ? tree[node].left : tree[node].right;
		depth += 1.0;
	}
	return depth + averagePathLength(tree[node].size);
}

Eigen::VectorXd IsolationForest::anomalyScores(const Eigen::MatrixXd &x) const {
	if (!isFitted()) {
		throw std::runtime_error("IsolationForest::anomalyScores called before fit.");
	}
	const double normaliser = std::max(averagePathLength(sample_size_), 1e-12);
	Eigen::VectorXd scores(x.rows());
	for (Eigen::Index r = 0; r < x.rows(); ++r) {
		double total = 0.0;
		for (const auto &tree : trees_) {
			total += pathLength(tree, x.row(r));
		}
		const double mean_depth = total / static_cast<double>(trees_.size());
		scores(r) = std::pow(2.0, -mean_depth / normaliser);
	}
	return scores;
}

} // namespace entitypulse::detectors
