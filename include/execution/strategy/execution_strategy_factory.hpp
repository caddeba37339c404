#ifndef MEDIAFORGE_EXECUTION_STRATEGY_FACTORY_HPP
#define MEDIAFORGE_EXECUTION_STRATEGY_FACTORY_HPP

#include <memory>
#include <string_view>

#include "execution/strategy/i_execution_strategy.hpp"


enum class ExecutorKind
{
	THREADS,
	PROCESSES
};

[[nodiscard]] std::string_view to_string(ExecutorKind kind) noexcept;

[[nodiscard]] std::unique_ptr<IExecutionStrategy> make_execution_strategy(ExecutorKind kind, std::size_t max_workers);

#endif //MEDIAFORGE_EXECUTION_STRATEGY_FACTORY_HPP
