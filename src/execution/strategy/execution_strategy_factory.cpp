#include "execution/strategy/execution_strategy_factory.hpp"

#include "execution/strategy/process_pool_strategy.hpp"
#include "execution/strategy/thread_pool_strategy.hpp"


std::string_view to_string(ExecutorKind kind) noexcept
{
	switch(kind)
	{
		case ExecutorKind::THREADS:
			return "ThreadPool";
		case ExecutorKind::PROCESSES:
			return "ProcessPool";
	}

	return "Unknown";
}

std::unique_ptr<IExecutionStrategy> make_execution_strategy(ExecutorKind kind, std::size_t max_workers)
{
	switch(kind)
	{
		case ExecutorKind::THREADS:
			return std::make_unique<ThreadPoolStrategy>(max_workers);
		case ExecutorKind::PROCESSES:
			return std::make_unique<ProcessPoolStrategy>(max_workers);
	}

	throw std::invalid_argument("Unsupported executor kind");
}
