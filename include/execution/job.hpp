#ifndef MEDIAFORGE_JOB_HPP
#define MEDIAFORGE_JOB_HPP

#include <concepts>
#include <memory>
#include <stop_token>
#include <string>
#include <type_traits>

#include "model/progress.hpp"
#include "model/task.hpp"


class JobContext
{
public:
	JobContext() = default;
	JobContext(std::stop_token stop_token, ProgressSink progress_sink);

	void report_progress(const ProgressSnapshot& snapshot) const;

	[[nodiscard]] bool stop_requested() const noexcept;
	[[nodiscard]] std::stop_token stop_token() const noexcept;

private:
	std::stop_token stop_token_;
	ProgressSink progress_sink_;
};

/// Unit of work executed by an execution strategy. A job reports failure by throwing;
/// the exception message becomes the task error.
class Job
{
public:
	virtual ~Job() = default;

	[[nodiscard]] virtual std::string name() const = 0;

	virtual JobResult run(JobContext& context) = 0;
};

template<typename Callable>
concept PlainJobCallable = std::invocable<Callable&>;

template<typename Callable>
concept ProgressReportingJobCallable = std::invocable<Callable&, JobContext&>;

template<typename Callable>
requires PlainJobCallable<Callable> || ProgressReportingJobCallable<Callable>
class FunctionJob final: public Job
{
public:
	FunctionJob(std::string name, Callable callable)
	:	name_(std::move(name)), callable_(std::move(callable))
	{}

	[[nodiscard]] std::string name() const override
	{
		return name_;
	}

	JobResult run(JobContext& context) override
	{
		if constexpr(ProgressReportingJobCallable<Callable>)
		{
			return invoke_and_wrap([this, &context]() { return callable_(context); });
		}
		else
		{
			return invoke_and_wrap([this]() { return callable_(); });
		}
	}

private:
	std::string name_;
	Callable callable_;

	template<typename Invoker>
	static JobResult invoke_and_wrap(Invoker invoker)
	{
		if constexpr(std::is_void_v<std::invoke_result_t<Invoker>>)
		{
			invoker();
			return JobResult();
		}
		else
		{
			return JobResult(invoker());
		}
	}
};

/// Wraps a callable as a job. Callables taking a JobContext& receive progress
/// reporting and the stop token, others run as plain jobs.
template<typename Callable>
requires PlainJobCallable<Callable> || ProgressReportingJobCallable<Callable>
std::shared_ptr<Job> make_job(std::string name, Callable callable)
{
	return std::make_shared<FunctionJob<Callable>>(std::move(name), std::move(callable));
}

#endif //MEDIAFORGE_JOB_HPP
