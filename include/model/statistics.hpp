#ifndef MEDIAFORGE_STATISTICS_HPP
#define MEDIAFORGE_STATISTICS_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>


struct Statistics
{
	std::size_t submitted = 0;
	std::size_t completed = 0;
	std::size_t failed = 0;
	std::size_t cancelled = 0;
	std::size_t running = 0;
	std::size_t pending = 0;

	std::size_t active_workers = 0;
	std::size_t max_workers = 0;
	std::string executor_kind;
};

void to_json(nlohmann::json& json, const Statistics& statistics);

#endif //MEDIAFORGE_STATISTICS_HPP
