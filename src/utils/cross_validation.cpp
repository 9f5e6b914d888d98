#include "entity-pulse/utils/cross_validation.hpp"

#include <stdexcept>

namespace entitypulse::utils {

std::vector<CVFold> CrossValidation::generateFolds(int n_samples, int n_splits) {
	if (n_splits < 2) {
		throw std::invalid_argument("Cross-validation needs at least two folds.");
	}
	if (n_samples < n_splits + 1) {
		throw std::invalid_argument("Too few samples for the requested number of folds.");
	}

	const int test_size = n_samples / (n_splits + 1);
	std::vector<CVFold> folds;
	folds.reserve(static_cast<std::size_t>(n_splits));
	for (int i = 0; i < n_splits; ++i) {
		CVFold fold;
		fold.fold_id = i;
		fold.test_start = n_samples - (n_splits - i) * test_size;
		fold.test_end = fold.test_start + test_size;
		fold.train_end = fold.test_start;
		folds.push_back(std::move(fold));
	}
	return folds;
}

CVResults CrossValidation::evaluate(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                    const std::function<std::unique_ptr<models::IRegressor>()> &factory,
                                    int n_splits, const CancellationToken &token) {
	if (x.rows() != y.size()) {
		throw std::invalid_argument("Feature rows and targets must have the same length.");
	}

	CVResults results;
	results.folds = generateFolds(static_cast<int>(x.rows()), n_splits);

	std::vector<AccuracyMetrics> fold_metrics;
	fold_metrics.reserve(results.folds.size());
	for (auto &fold : results.folds) {
		token.throwIfCancelled("CrossValidation::evaluate");
		const int test_rows = fold.test_end - fold.test_start;

		auto model = factory();
		model->fit(x.topRows(fold.train_end), y.head(fold.train_end), token);
		const Eigen::VectorXd predicted = model->predict(x.middleRows(fold.test_start, test_rows));

		fold.predictions.assign(predicted.data(), predicted.data() + predicted.size());
		fold.actuals.assign(y.data() + fold.test_start, y.data() + fold.test_end);
		fold.metrics = Metrics::evaluate(fold.actuals, fold.predictions);
		fold_metrics.push_back(fold.metrics);
	}
	results.average = Metrics::average(fold_metrics);
	return results;
}

} // namespace entitypulse::utils
