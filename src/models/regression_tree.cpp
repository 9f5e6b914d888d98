#include "entity-pulse/models/regression_tree.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace entitypulse::models {

namespace {

struct Split {
	int feature = -1;
	double threshold = 0.0;
	double impurity = 0.0;
};

} // namespace

RegressionTree::RegressionTree() : RegressionTree(Options{}) {
}

RegressionTree::RegressionTree(Options options) : options_(options) {
	if (options_.max_depth == 0) {
		throw std::invalid_argument("RegressionTree max_depth must be at least 1.");
	}
	if (options_.min_samples_split < 2 || options_.min_samples_leaf == 0) {
		throw std::invalid_argument("RegressionTree needs min_samples_split >= 2 and min_samples_leaf >= 1.");
	}
}

void RegressionTree::fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, const utils::CancellationToken &token) {
	token.throwIfCancelled("RegressionTree::fit");
	std::vector<Eigen::Index> rows(static_cast<std::size_t>(x.rows()));
	std::iota(rows.begin(), rows.end(), 0);
	fit(x, y, std::move(rows));
}

void RegressionTree::fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, std::vector<Eigen::Index> rows) {
	if (x.rows() == 0 || x.rows() != y.size() || rows.empty()) {
		throw std::invalid_argument("RegressionTree needs a non-empty design matrix matching the target.");
	}
	nodes_.clear();
	depth_ = 0;
	n_features_ = x.cols();
	grow(x, y, rows, 0, rows.size(), 0);
}

int RegressionTree::grow(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, std::vector<Eigen::Index> &rows,
                         std::size_t begin, std::size_t end, std::size_t depth) {
	const int id = static_cast<int>(nodes_.size());
	nodes_.push_back(Node{});
	depth_ = std::max(depth_, depth);

	const std::size_t count = end - begin;
	double sum = 0.0;
	double sum_sq = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		sum += y[rows[i]];
		sum_sq += y[rows[i]] * y[rows[i]];
	}
	nodes_[id].value = sum / static_cast<double>(count);
	const double parent_impurity = sum_sq - sum * sum / static_cast<double>(count);
	if (depth >= options_.max_depth || count < options_.min_samples_split || parent_impurity <= 1e-12) {
		return id;
	}

	// Sorting each feature's rows lets one sweep evaluate every threshold with running sums.
	Split best;
	best.impurity = parent_impurity;
	std::vector<Eigen::Index> order(rows.begin() + static_cast<std::ptrdiff_t>(begin),
	                                rows.begin() + static_cast<std::ptrdiff_t>(end));
	for (Eigen::Index f = 0; f < x.cols(); ++f) {
		std::sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) { return x(a, f) < x(b, f); });
		double left_sum = 0.0;
		double left_sq = 0.0;
		for (std::size_t i = 0; i + 1 < count; ++i) {
			const double v = y[order[i]];
			left_sum += v;
			left_sq += v * v;
			const double here = x(order[i], f);
			const double next = x(order[i + 1], f);
			const std::size_t left_count = i + 1;
			const std::size_t right_count = count - left_count;
			if (here == next || left_count < options_.min_samples_leaf || right_count < options_.min_samples_leaf) {
				continue;
			}
			const double right_sum = sum - left_sum;
			const double right_sq = sum_sq - left_sq;
			const double impurity = (left_sq - left_sum * left_sum / static_cast<double>(left_count)) +
			                        (right_sq - right_sum * right_sum / static_cast<double>(right_count));
			if (impurity < best.impurity - 1e-12) {
				best.feature = static_cast<int>(f);
				best.threshold = 0.5 * (here + next);
				best.impurity = impurity;
			}
		}
	}
	if (best.feature < 0) {
		return id;
	}

	const auto middle = std::partition(rows.begin() + static_cast<std::ptrdiff_t>(begin),
	                                   rows.begin() + static_cast<std::ptrdiff_t>(end),
	                                   [&](Eigen::Index r) { return x(r, best.feature) <= best.threshold; });
	const auto split = static_cast<std::size_t>(middle - rows.begin());
	nodes_[id].feature = best.feature;
	nodes_[id].threshold = best.threshold;
	const int left = grow(x, y, rows, begin, split, depth + 1);
	const int right = grow(x, y, rows, split, end, depth + 1);
	nodes_[id].left = left;
	nodes_[id].right = right;
	return id;
}

double RegressionTree::predictRow(const Eigen::Ref<const Eigen::RowVectorXd> &row) const {
	if (nodes_.empty()) {
		throw std::runtime_error("RegressionTree::predict called before fit.");
	}
	int node = 0;
	while (nodes_[node].feature >= 0) {
		node = row[nodes_[node].feature] <= nodes_[node].threshold ? nodes_[node].left : nodes_[node].right;
	}
	return nodes_[node].value;
}

Eigen::VectorXd RegressionTree::predict(const Eigen::MatrixXd &x) const {
	if (nodes_.empty()) {
		throw std::runtime_error("RegressionTree::predict called before fit.");
	}
	if (x.cols() != n_features_) {
		throw std::invalid_argument("Feature count differs from the fitted tree.");
	}
	Eigen::VectorXd result(x.rows());
	for (Eigen::Index i = 0; i < x.rows(); ++i) {
		result[i] = predictRow(x.row(i));
	}
	return result;
}

} // namespace entitypulse::models
