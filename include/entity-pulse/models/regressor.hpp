#pragma once

#include "entity-pulse/utils/cancellation.hpp"

#include <Eigen/Dense>
#include <string>

namespace entitypulse::models {

/**
 * @class IRegressor
 * @brief A supervised model mapping feature rows to one target value.
 *
 * The lag-feature forecaster drives any regressor through this interface.
 */
class IRegressor {
public:
	virtual ~IRegressor() = default;

	/**
	 * @throws std::invalid_argument when @p x and @p y disagree in rows or are empty.
	 */
	virtual void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	                 const utils::CancellationToken &token = utils::CancellationToken()) = 0;

	/// One prediction per row of @p x; throws std::runtime_error before fit().
	virtual Eigen::VectorXd predict(const Eigen::MatrixXd &x) const = 0;

	virtual std::string getName() const = 0;
};

} // namespace entitypulse::models
