#ifndef MEDIAFORGE_PROGRESS_HPP
#define MEDIAFORGE_PROGRESS_HPP

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>


struct ProgressSnapshot
{
	double percentage = 0.0;
	std::optional<double> rate;
	std::optional<double> eta_seconds;
	std::string status;
	std::optional<std::string> label;
};

using ProgressSink = std::function<void(const ProgressSnapshot&)>;

void to_json(nlohmann::json& json, const ProgressSnapshot& snapshot);
void from_json(const nlohmann::json& json, ProgressSnapshot& snapshot);

#endif //MEDIAFORGE_PROGRESS_HPP
