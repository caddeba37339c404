#include "model/progress.hpp"


void to_json(nlohmann::json& json, const ProgressSnapshot& snapshot)
{
	json = nlohmann::json{
		{"percentage", snapshot.percentage},
		{"status", snapshot.status}
	};

	if(snapshot.rate.has_value())
	{
		json["rate"] = snapshot.rate.value();
	}
	if(snapshot.eta_seconds.has_value())
	{
		json["etaSeconds"] = snapshot.eta_seconds.value();
	}
	if(snapshot.label.has_value())
	{
		json["label"] = snapshot.label.value();
	}
}

void from_json(const nlohmann::json& json, ProgressSnapshot& snapshot)
{
	snapshot.percentage = json.value("percentage", 0.0);
	snapshot.status = json.value("status", std::string());

	snapshot.rate = json.contains("rate") ? std::optional<double>(json.at("rate").get<double>()) : std::nullopt;
	snapshot.eta_seconds = json.contains("etaSeconds") ? std::optional<double>(json.at("etaSeconds").get<double>()) : std::nullopt;
	snapshot.label = json.contains("label") ? std::optional<std::string>(json.at("label").get<std::string>()) : std::nullopt;
}
