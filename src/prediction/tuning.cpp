#include "entity-pulse/prediction/tuning.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/models/kernel_svr.hpp"
#include "entity-pulse/models/random_forest.hpp"

namespace entitypulse::prediction {

std::unique_ptr<models::IRegressor> ForestParameters::build() const {
	return models::RandomForestBuilder().withEstimators(n_estimators).withMaxDepth(max_depth).build();
}

std::unique_ptr<models::IRegressor> SVRParameters::build() const {
	models::KernelSVRBuilder builder;
	builder.withC(c).withEpsilon(epsilon);
	if (gamma) {
		builder.withGamma(*gamma);
	}
	return builder.build();
}

std::vector<ForestParameters> TuningGrid::forestCandidates() const {
	std::vector<ForestParameters> candidates;
	for (const auto estimators : forest_estimators) {
		for (const auto depth : forest_max_depth) {
			candidates.push_back(ForestParameters{estimators, depth});
		}
	}
	return candidates;
}

std::vector<SVRParameters> TuningGrid::svrCandidates() const {
	std::vector<SVRParameters> candidates;
	for (const auto c : svr_c) {
		for (const auto epsilon : svr_epsilon) {
			for (const auto &gamma : svr_gamma) {
				candidates.push_back(SVRParameters{c, epsilon, gamma});
			}
		}
	}
	return candidates;
}

void TuningGrid::validate() const {
	if (forest_estimators.empty() || forest_max_depth.empty() || svr_c.empty() || svr_epsilon.empty() ||
	    svr_gamma.empty()) {
		throw core::InvalidParameter("Every tuning grid dimension needs at least one value.");
	}
	for (const auto estimators : forest_estimators) {
		if (estimators == 0) {
			throw core::InvalidParameter("Forest candidates need at least one tree.");
		}
	}
	for (const auto depth : forest_max_depth) {
		if (depth == 0) {
			throw core::InvalidParameter("Forest candidates need a depth of at least 1.");
		}
	}
	for (const auto c : svr_c) {
		if (!(c > 0.0)) {
			throw core::InvalidParameter("SVR candidates need a positive C.");
		}
	}
	for (const auto epsilon : svr_epsilon) {
		if (!(epsilon >= 0.0)) {
			throw core::InvalidParameter("SVR candidates need a non-negative epsilon.");
		}
	}
	for (const auto &gamma : svr_gamma) {
		if (gamma && !(*gamma > 0.0)) {
			throw core::InvalidParameter("SVR candidates need a positive gamma.");
		}
	}
}

std::string TuningReport::bestModel() const {
	const bool forest = random_forest && random_forest->succeeded();
	const bool svr = kernel_svr && kernel_svr->succeeded();
	if (forest && (!svr || random_forest->metrics.mse <= kernel_svr->metrics.mse)) {
		return "RandomForest";
	}
	return svr ? "KernelSVR" : std::string();
}

} // namespace entitypulse::prediction
