#pragma once

#include "entity-pulse/core/time_series.hpp"
#include "entity-pulse/graph/community.hpp"
#include "entity-pulse/graph/entity_graph.hpp"
#include "entity-pulse/stats/correlation.hpp"
#include "entity-pulse/utils/worker_pool.hpp"

#include <Eigen/Dense>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entitypulse::correlation {

using SeriesMap = std::map<std::string, core::TimeSeries>;

struct CorrelationConfig {
	stats::CorrelationMethod method = stats::CorrelationMethod::Pearson;
	/// Smallest |correlation| that creates an edge.
	double min_correlation = 0.5;
	/// Aligned observations needed before a correlation is computed at all.
	std::size_t min_data_points = 10;
	double p_threshold = 0.05;
	/// Require p <= p_threshold for edges of the correlation networks.
	bool significant_only = true;
	int max_lag = 7;
	/// Budget per pairwise task when a worker pool is used; zero disables it.
	std::chrono::milliseconds task_budget{0};

	void validate() const;
};

struct CorrelationResult {
	std::string entity1;
	std::string entity2;
	double coefficient = 0.0;
	double p_value = 1.0;
	/// Number of aligned observations.
	std::size_t n = 0;
	/// Lead of entity1 over entity2 in days, for lagged results.
	std::optional<int> lag;
};

enum class LagDirection { FirstLeads, SecondLeads, Simultaneous };

std::string toString(LagDirection direction);

struct LagPoint {
	/// lag k pairs series1[t] with series2[t + k]; k > 0 means series1 leads.
	int lag = 0;
	LagDirection direction = LagDirection::Simultaneous;
	double coefficient = 0.0;
	double p_value = 1.0;
	std::size_t n = 0;
};

struct LaggedCorrelation {
	/// One point per lag from -max_lag to max_lag.
	std::vector<LagPoint> curve;
	/// Lag with the largest |correlation|; ties go to the smallest |lag|, then the negative lag.
	LagPoint best;
};

/**
 * @struct CorrelationMatrix
 * @brief Symmetric pairwise coefficients and p-values; the diagonal is (1, 0).
 */
struct CorrelationMatrix {
	std::vector<std::string> entities;
	Eigen::MatrixXd coefficients;
	Eigen::MatrixXd p_values;

	double coefficient(const std::string &a, const std::string &b) const;
	double pValue(const std::string &a, const std::string &b) const;

private:
	Eigen::Index position(const std::string &entity) const;
};

struct CausalRelationship {
	std::string cause;
	std::string effect;
	/// Days by which the cause leads the effect, always > 0.
	int lag = 0;
	double correlation = 0.0;
	double p_value = 1.0;
};

/**
 * @class CorrelationAnalyzer
 * @brief Static and lagged correlation between entity series, and the graphs built from them.
 *
 * Two calendar series are aligned on shared dates; positional series on shared positions.
 * A pair with fewer than min_data_points aligned observations has correlation 0 and p-value 1:
 * there is no evidence either way, which is not an error.
 */
class CorrelationAnalyzer {
public:
	explicit CorrelationAnalyzer(CorrelationConfig config = {}, std::shared_ptr<utils::WorkerPool> pool = nullptr);

	CorrelationResult calculateCorrelation(const core::TimeSeries &series1, const core::TimeSeries &series2) const;

	LaggedCorrelation calculateLaggedCorrelation(const core::TimeSeries &series1,
	                                             const core::TimeSeries &series2) const;
	LaggedCorrelation calculateLaggedCorrelation(const core::TimeSeries &series1, const core::TimeSeries &series2,
	                                             int max_lag) const;

	CorrelationMatrix calculateEntityCorrelations(const SeriesMap &series) const;

	/// Undirected graph; edge weight is the correlation coefficient.
	graph::EntityGraph createCorrelationNetwork(const SeriesMap &series) const;

	/**
	 * @brief Directed graph from leading to lagging entity, using each pair's best lag.
	 *
	 * Pairs whose best lag is 0 have no direction and produce no edge. Edges pass the same
	 * |correlation| and significance filter as the undirected network.
	 */
	graph::EntityGraph createLaggedCorrelationNetwork(const SeriesMap &series) const;

	/// Greedy modularity communities of the undirected correlation network.
	std::vector<graph::Community> findEntityCommunities(const SeriesMap &series) const;

	/**
	 * @brief Edges of the lagged network as cause/effect pairs, strongest |correlation| first.
	 *
	 * Only relations with |correlation| >= min_correlation and p <= p_threshold are reported,
	 * whatever significant_only says.
	 */
	std::vector<CausalRelationship> findCausalRelationships(const SeriesMap &series) const;

	const CorrelationConfig &config() const {
		return config_;
	}

private:
	struct PairLag {
		std::size_t first = 0;
		std::size_t second = 0;
		LagPoint best;
	};

	std::vector<PairLag> bestLags(const SeriesMap &series) const;
	bool passesFilter(double coefficient, double p_value, bool require_significance) const;

	CorrelationConfig config_;
	std::shared_ptr<utils::WorkerPool> pool_;
};

} // namespace entitypulse::correlation
