#pragma once

#include "entity-pulse/detectors/detection.hpp"

namespace entitypulse::detectors {

/**
 * @class BurstSignalDetector
 * @brief Trailing-baseline burst scoring exposed through IDetector.
 */
class BurstSignalDetector final : public IDetector {
public:
	BurstSignalDetector(std::size_t window, double sensitivity);

	DetectionSeries detect(const core::TimeSeries &ts) override;
	DetectionKind kind() const override {
		return DetectionKind::Burst;
	}
	std::string getName() const override {
		return "BurstSignalDetector";
	}

private:
	std::size_t window_;
	double sensitivity_;
};

/**
 * @class ChangePointDetector
 * @brief Flags level shifts between two adjacent sliding windows.
 */
class ChangePointDetector final : public IDetector {
public:
	ChangePointDetector(std::size_t window = 7, double threshold = 2.0);

	DetectionSeries detect(const core::TimeSeries &ts) override;
	DetectionKind kind() const override {
		return DetectionKind::ChangePoint;
	}
	std::string getName() const override {
		return "ChangePointDetector";
	}

private:
	std::size_t window_;
	double threshold_;
};

/**
 * @class SeasonalDetector
 * @brief Flags observations far from the baseline of their weekday (or period slot).
 */
class SeasonalDetector final : public IDetector {
public:
	SeasonalDetector(std::size_t period = 7, double threshold = 3.0);

	DetectionSeries detect(const core::TimeSeries &ts) override;
	DetectionKind kind() const override {
		return DetectionKind::Seasonal;
	}
	std::string getName() const override {
		return "SeasonalDetector";
	}

private:
	std::size_t period_;
	double threshold_;
};

} // namespace entitypulse::detectors
