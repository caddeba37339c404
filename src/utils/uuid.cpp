#include "utils/uuid.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <random>

#include <uuid.h>


namespace
{
	std::mt19937 make_seeded_generator()
	{
		std::random_device random_device;
		std::array<int, std::mt19937::state_size> seed_data{};
		std::ranges::generate(seed_data, std::ref(random_device));
		std::seed_seq seed_sequence(std::begin(seed_data), std::end(seed_data));
		return std::mt19937(seed_sequence);
	}
}

std::string generate_uuid()
{
	thread_local std::mt19937 generator = make_seeded_generator();
	thread_local uuids::uuid_random_generator uuid_generator{generator};

	return uuids::to_string(uuid_generator());
}
