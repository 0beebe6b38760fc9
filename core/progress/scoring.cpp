#include "progress/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace keydr {

double computeScore(const SessionSummary& summary, double complexity) {
    double errors = static_cast<double>(summary.incorrect);
    double length = static_cast<double>(summary.total_chars);
    return (summary.cpm * complexity) / (errors + 1.0) * (length / 50.0);
}

uint32_t levelFromScore(double total_score) {
    uint32_t level = static_cast<uint32_t>(std::sqrt(std::max(total_score, 0.0) / 100.0));
    return std::max<uint32_t>(level, 1);
}

double scoreToNextLevel(double total_score) {
    double next = static_cast<double>(levelFromScore(total_score) + 1);
    return next * next * 100.0 - total_score;
}

std::optional<double> predictNextTime(const std::vector<double>& times) {
    if (times.size() < 3) return std::nullopt;

    const double n = static_cast<double>(times.size());
    double x_mean = (n - 1.0) / 2.0;
    double y_mean = 0.0;
    for (double t : times) y_mean += t;
    y_mean /= n;

    double ss_xy = 0.0, ss_xx = 0.0, ss_yy = 0.0;
    for (size_t i = 0; i < times.size(); i++) {
        double dx = static_cast<double>(i) - x_mean;
        double dy = times[i] - y_mean;
        ss_xy += dx * dy;
        ss_xx += dx * dx;
        ss_yy += dy * dy;
    }
    if (ss_xx < 1e-10 || ss_yy < 1e-10) return std::nullopt;

    double slope = ss_xy / ss_xx;
    double r_squared = (ss_xy * ss_xy) / (ss_xx * ss_yy);
    if (r_squared < 0.5) return std::nullopt;

    return std::max(y_mean + slope * (n - x_mean), 0.0);
}

std::string trendLabel(const std::vector<double>& times) {
    std::optional<double> predicted = predictNextTime(times);
    if (!predicted.has_value()) return "Not enough data";

    double current = times.back();
    if (current <= 0.0) return "Not enough data";
    double improvement = (current - *predicted) / current * 100.0;
    if (improvement > 5.0) return "Improving";
    if (improvement < -5.0) return "Slowing down";
    return "Steady";
}

} // namespace keydr
