#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace entitypulse::core {

/**
 * @class EntityNotFound
 * @brief Raised when an entity has no stored mentions at all.
 *
 * This is the only hard failure of the analysis layer: it signals a caller-side reference
 * to an unknown entity rather than a statistical edge case.
 */
class EntityNotFound : public std::runtime_error {
public:
	explicit EntityNotFound(std::string entity)
	    : std::runtime_error("Entity not found: " + entity), entity_(std::move(entity)) {
	}

	const std::string &entity() const {
		return entity_;
	}

private:
	std::string entity_;
};

/**
 * @class InvalidParameter
 * @brief Raised when a structural parameter (window, threshold, count) is out of range.
 */
class InvalidParameter : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

} // namespace entitypulse::core
