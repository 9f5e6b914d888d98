#include "entity-pulse/correlation/correlation_analyzer.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <utility>

namespace entitypulse::correlation {

namespace {

using Aligned = std::pair<std::vector<double>, std::vector<double>>;

// Pairs series1[t] with series2[t + lag].
Aligned align(const core::TimeSeries &series1, const core::TimeSeries &series2, int lag) {
	Aligned aligned;
	if (series1.isEmpty() || series2.isEmpty()) {
		return aligned;
	}
	if (series1.hasCalendar() != series2.hasCalendar()) {
		throw core::InvalidParameter("Cannot correlate a calendar series with a positional one.");
	}
	for (std::size_t t = 0; t < series1.size(); ++t) {
		std::optional<std::size_t> other;
		if (series1.hasCalendar()) {
			other = series2.indexOf(series1.dateAt(t) + lag);
		} else {
			const auto shifted = static_cast<std::int64_t>(t) + lag;
			if (shifted >= 0 && shifted < static_cast<std::int64_t>(series2.size())) {
				other = static_cast<std::size_t>(shifted);
			}
		}
		if (other) {
			aligned.first.push_back(series1[t]);
			aligned.second.push_back(series2[*other]);
		}
	}
	return aligned;
}

// Every non-empty series must be indexed the same way before pairs are dispatched.
void require_uniform_index(const SeriesMap &series) {
	const core::TimeSeries *reference = nullptr;
	for (const auto &entry : series) {
		if (entry.second.isEmpty()) {
			continue;
		}
		if (reference && reference->hasCalendar() != entry.second.hasCalendar()) {
			throw core::InvalidParameter("Cannot correlate a calendar series with a positional one: " + entry.first);
		}
		reference = &entry.second;
	}
}

LagDirection direction_of(int lag) {
	if (lag > 0) {
		return LagDirection::FirstLeads;
	}
	return lag < 0 ? LagDirection::SecondLeads : LagDirection::Simultaneous;
}

} // namespace

std::string toString(LagDirection direction) {
	switch (direction) {
	case LagDirection::FirstLeads:
		return "series1 leads";
	case LagDirection::SecondLeads:
		return "series2 leads";
	case LagDirection::Simultaneous:
		return "simultaneous";
	}
	return "unknown";
}

void CorrelationConfig::validate() const {
	if (min_correlation < 0.0 || min_correlation > 1.0) {
		throw core::InvalidParameter("min_correlation must lie in [0, 1].");
	}
	if (min_data_points < 3) {
		throw core::InvalidParameter("min_data_points must be at least 3.");
	}
	if (p_threshold <= 0.0 || p_threshold > 1.0) {
		throw core::InvalidParameter("p_threshold must lie in (0, 1].");
	}
	if (max_lag < 0) {
		throw core::InvalidParameter("max_lag must not be negative.");
	}
	if (task_budget.count() < 0) {
		throw core::InvalidParameter("Task budget must not be negative.");
	}
}

Eigen::Index CorrelationMatrix::position(const std::string &entity) const {
	const auto it = std::find(entities.begin(), entities.end(), entity);
	if (it == entities.end()) {
		throw core::EntityNotFound(entity);
	}
	return static_cast<Eigen::Index>(it - entities.begin());
}

double CorrelationMatrix::coefficient(const std::string &a, const std::string &b) const {
	return coefficients(position(a), position(b));
}

double CorrelationMatrix::pValue(const std::string &a, const std::string &b) const {
	return p_values(position(a), position(b));
}

CorrelationAnalyzer::CorrelationAnalyzer(CorrelationConfig config, std::shared_ptr<utils::WorkerPool> pool)
    : config_(config), pool_(std::move(pool)) {
	config_.validate();
}

CorrelationResult CorrelationAnalyzer::calculateCorrelation(const core::TimeSeries &series1,
                                                            const core::TimeSeries &series2) const {
	CorrelationResult result;
	result.entity1 = series1.entity();
	result.entity2 = series2.entity();

	const auto aligned = align(series1, series2, 0);
	result.n = aligned.first.size();
	if (result.n < config_.min_data_points) {
		return result;
	}
	const auto computed = stats::correlate(aligned.first, aligned.second, config_.method);
	result.coefficient = computed.coefficient;
	result.p_value = computed.p_value;
	return result;
}

LaggedCorrelation CorrelationAnalyzer::calculateLaggedCorrelation(const core::TimeSeries &series1,
                                                                  const core::TimeSeries &series2) const {
	return calculateLaggedCorrelation(series1, series2, config_.max_lag);
}

LaggedCorrelation CorrelationAnalyzer::calculateLaggedCorrelation(const core::TimeSeries &series1,
                                                                  const core::TimeSeries &series2,
                                                                  int max_lag) const {
	if (max_lag < 0) {
		throw core::InvalidParameter("max_lag must not be negative.");
	}
	LaggedCorrelation lagged;
	lagged.curve.reserve(static_cast<std::size_t>(2 * max_lag + 1));
	for (int lag = -max_lag; lag <= max_lag; ++lag) {
		LagPoint point;
		point.lag = lag;
		point.direction = direction_of(lag);
		const auto aligned = align(series1, series2, lag);
		point.n = aligned.first.size();
		if (point.n >= config_.min_data_points) {
			const auto computed = stats::correlate(aligned.first, aligned.second, config_.method);
			point.coefficient = computed.coefficient;
			point.p_value = computed.p_value;
		}
		lagged.curve.push_back(point);
	}

	// Visit 0, -1, 1, -2, 2, ... so that only a strictly larger |r| displaces the incumbent.
	const auto at = [&](int lag) -> const LagPoint & { return lagged.curve[static_cast<std::size_t>(lag + max_lag)]; };
	lagged.best = at(0);
	for (int step = 1; step <= max_lag; ++step) {
		for (const int lag : {-step, step}) {
			if (std::abs(at(lag).coefficient) > std::abs(lagged.best.coefficient)) {
				lagged.best = at(lag);
			}
		}
	}
	return lagged;
}

CorrelationMatrix CorrelationAnalyzer::calculateEntityCorrelations(const SeriesMap &series) const {
	CorrelationMatrix matrix;
	const auto n = static_cast<Eigen::Index>(series.size());
	matrix.coefficients = Eigen::MatrixXd::Identity(n, n);
	matrix.p_values = Eigen::MatrixXd::Ones(n, n);
	matrix.p_values.diagonal().setZero();
	require_uniform_index(series);

	std::vector<const core::TimeSeries *> ordered;
	for (const auto &entry : series) {
		matrix.entities.push_back(entry.first);
		ordered.push_back(&entry.second);
	}

	std::vector<std::pair<std::pair<Eigen::Index, Eigen::Index>, std::future<CorrelationResult>>> pending;
	for (Eigen::Index i = 0; i < n; ++i) {
		for (Eigen::Index j = i + 1; j < n; ++j) {
			const auto *a = ordered[static_cast<std::size_t>(i)];
			const auto *b = ordered[static_cast<std::size_t>(j)];
			pending.emplace_back(std::make_pair(i, j),
			                     utils::dispatch(
			                         pool_,
			                         [this, a, b](const utils::CancellationToken &token) {
				                         token.throwIfCancelled("calculateCorrelation");
				                         return calculateCorrelation(*a, *b);
			                         },
			                         config_.task_budget));
		}
	}
	utils::waitAll(pending);
	for (auto &job : pending) {
		const auto result = job.second.get();
		const auto i = job.first.first;
		const auto j = job.first.second;
		matrix.coefficients(i, j) = matrix.coefficients(j, i) = result.coefficient;
		matrix.p_values(i, j) = matrix.p_values(j, i) = result.p_value;
	}
	ENTITYPULSE_DEBUG("Computed {} pairwise {} correlations.", pending.size(), stats::toString(config_.method));
	return matrix;
}

bool CorrelationAnalyzer::passesFilter(double coefficient, double p_value, bool require_significance) const {
	if (std::abs(coefficient) < config_.min_correlation) {
		return false;
	}
	return !require_significance || p_value <= config_.p_threshold;
}

graph::EntityGraph CorrelationAnalyzer::createCorrelationNetwork(const SeriesMap &series) const {
	const auto matrix = calculateEntityCorrelations(series);
	graph::EntityGraph network(false);
	for (const auto &entity : matrix.entities) {
		network.addNode(entity);
	}
	for (Eigen::Index i = 0; i < matrix.coefficients.rows(); ++i) {
		for (Eigen::Index j = i + 1; j < matrix.coefficients.cols(); ++j) {
			const double r = matrix.coefficients(i, j);
			const double p = matrix.p_values(i, j);
			if (passesFilter(r, p, config_.significant_only)) {
				network.addEdge(static_cast<std::size_t>(i), static_cast<std::size_t>(j), r, std::nullopt, p);
			}
		}
	}
	ENTITYPULSE_INFO("Correlation network: {} entities, {} edges.", network.nodeCount(), network.edgeCount());
	return network;
}

std::vector<CorrelationAnalyzer::PairLag> CorrelationAnalyzer::bestLags(const SeriesMap &series) const {
	require_uniform_index(series);
	std::vector<const core::TimeSeries *> ordered;
	for (const auto &entry : series) {
		ordered.push_back(&entry.second);
	}

	std::vector<std::pair<PairLag, std::future<LaggedCorrelation>>> pending;
	for (std::size_t i = 0; i < ordered.size(); ++i) {
		for (std::size_t j = i + 1; j < ordered.size(); ++j) {
			const auto *a = ordered[i];
			const auto *b = ordered[j];
			PairLag pair;
			pair.first = i;
			pair.second = j;
			pending.emplace_back(pair, utils::dispatch(
			                               pool_,
			                               [this, a, b](const utils::CancellationToken &token) {
				                               token.throwIfCancelled("calculateLaggedCorrelation");
				                               return calculateLaggedCorrelation(*a, *b);
			                               },
			                               config_.task_budget));
		}
	}

	std::vector<PairLag> result;
	result.reserve(pending.size());
	utils::waitAll(pending);
	for (auto &job : pending) {
		job.first.best = job.second.get().best;
		result.push_back(job.first);
	}
	return result;
}

graph::EntityGraph CorrelationAnalyzer::createLaggedCorrelationNetwork(const SeriesMap &series) const {
	graph::EntityGraph network(true);
	for (const auto &entry : series) {
		network.addNode(entry.first);
	}
	for (const auto &pair : bestLags(series)) {
		const auto &best = pair.best;
		if (best.lag == 0 || !passesFilter(best.coefficient, best.p_value, config_.significant_only)) {
			continue;
		}
		if (best.lag > 0) {
			network.addEdge(pair.first, pair.second, best.coefficient, best.lag, best.p_value);
		} else {
			network.addEdge(pair.second, pair.first, best.coefficient, -best.lag, best.p_value);
		}
	}
	ENTITYPULSE_INFO("Lagged correlation network: {} entities, {} directed edges (max lag {}).",
	                 network.nodeCount(), network.edgeCount(), config_.max_lag);
	return network;
}

std::vector<graph::Community> CorrelationAnalyzer::findEntityCommunities(const SeriesMap &series) const {
	const auto communities = graph::greedyModularityCommunities(createCorrelationNetwork(series));
	ENTITYPULSE_INFO("Found {} entity communities.", communities.size());
	return communities;
}

std::vector<CausalRelationship> CorrelationAnalyzer::findCausalRelationships(const SeriesMap &series) const {
	const auto network = createLaggedCorrelationNetwork(series);
	std::vector<CausalRelationship> relationships;
	for (const auto &edge : network.edges()) {
		if (!passesFilter(edge.weight, edge.p_value, true)) {
			continue;
		}
		CausalRelationship relationship;
		relationship.cause = network.nodeName(edge.source);
		relationship.effect = network.nodeName(edge.target);
		relationship.lag = edge.lag.value_or(0);
		relationship.correlation = edge.weight;
		relationship.p_value = edge.p_value;
		relationships.push_back(std::move(relationship));
	}
	std::stable_sort(relationships.begin(), relationships.end(),
	                 [](const CausalRelationship &a, const CausalRelationship &b) {
		                 return std::abs(a.correlation) > std::abs(b.correlation);
	                 });
	ENTITYPULSE_INFO("Found {} causal relationships.", relationships.size());
	return relationships;
}

} // namespace entitypulse::correlation
