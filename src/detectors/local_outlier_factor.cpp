#include "entity-pulse/detectors/local_outlier_factor.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/detectors/feature_matrix.hpp"

#include <algorithm>
#include <numeric>

namespace entitypulse::detectors {

namespace {
constexpr double density_epsilon = 1e-10;
} // namespace

LocalOutlierFactor::LocalOutlierFactor(std::size_t n_neighbors) : n_neighbors_(n_neighbors) {
	if (n_neighbors_ == 0) {
		throw core::InvalidParameter("LocalOutlierFactor needs at least one neighbour.");
	}
}

std::vector<std::size_t> LocalOutlierFactor::nearest(const Eigen::VectorXd &distances, std::size_t k,
                                                     std::ptrdiff_t exclude) const {
	std::vector<std::size_t> order;
	order.reserve(static_cast<std::size_t>(distances.size()));
	for (Eigen::Index i = 0; i < distances.size(); ++i) {
		if (i != exclude) {
			order.push_back(static_cast<std::size_t>(i));
		}
	}
	k = std::min(k, order.size());
	std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
	                  [&](std::size_t a, std::size_t b) {
		                  const double da = distances(static_cast<Eigen::Index>(a));
		                  const double db = distances(static_cast<Eigen::Index>(b));
		                  return da < db || (da == db && a < b);
	                  });
	order.resize(k);
	return order;
}

void LocalOutlierFactor::fit(const Eigen::MatrixXd &x) {
	train_ = x;
	const auto n = static_cast<std::size_t>(x.rows());
	training_scores_ = Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n));
	k_distance_ = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
	lrd_ = Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n));
	if (n < 2) {
		k_ = 0;
		return;
	}
	k_ = std::min(n_neighbors_, n - 1);

	const Eigen::MatrixXd dist = squaredDistances(x, x).cwiseSqrt();
	std::vector<std::vector<std::size_t>> neighbours(n);
	for (std::size_t i = 0; i < n; ++i) {
		neighbours[i] = nearest(dist.row(static_cast<Eigen::Index>(i)).transpose(), k_, static_cast<std::ptrdiff_t>(i));
		k_distance_(static_cast<Eigen::Index>(i)) =
		    dist(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(neighbours[i].back()));
	}

	for (std::size_t i = 0; i < n; ++i) {
		double reach = 0.0;
		for (std::size_t o : neighbours[i]) {
			reach += std::max(k_distance_(static_cast<Eigen::Index>(o)),
			                  dist(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(o)));
		}
		lrd_(static_cast<Eigen::Index>(i)) = 1.0 / (reach / static_cast<double>(k_) + density_epsilon);
	}

	for (std::size_t i = 0; i < n; ++i) {
		double neighbour_density = 0.0;
		for (std::size_t o : neighbours[i]) {
			neighbour_density += lrd_(static_cast<Eigen::Index>(o));
		}
		training_scores_(static_cast<Eigen::Index>(i)) =
		    (neighbour_density / static_cast<double>(k_)) / lrd_(static_cast<Eigen::Index>(i));
	}
}

Eigen::VectorXd LocalOutlierFactor::score(const Eigen::MatrixXd &queries) const {
	if (train_.rows() == 0) {
		throw std::runtime_error("LocalOutlierFactor::score called before fit.");
	}
	Eigen::VectorXd scores = Eigen::VectorXd::Ones(queries.rows());
	if (k_ == 0) {
		return scores;
	}
	const Eigen::MatrixXd dist = squaredDistances(queries, train_).cwiseSqrt();
	for (Eigen::Index q = 0; q < queries.rows(); ++q) {
		const auto neighbours = nearest(dist.row(q).transpose(), k_, -1);
		double reach = 0.0;
		double neighbour_density = 0.0;
		for (std::size_t o : neighbours) {
			const auto oi = static_cast<Eigen::Index>(o);
			reach += std::max(k_distance_(oi), dist(q, oi));
			neighbour_density += lrd_(oi);
		}
		const double lrd = 1.0 / (reach / static_cast<double>(k_) + density_epsilon);
		scores(q) = (neighbour_density / static_cast<double>(k_)) / lrd;
	}
	return scores;
}

} // namespace entitypulse::detectors
