#include "execution/job.hpp"


JobContext::JobContext(std::stop_token stop_token, ProgressSink progress_sink)
	: stop_token_(std::move(stop_token)), progress_sink_(std::move(progress_sink))
{
}

void JobContext::report_progress(const ProgressSnapshot& snapshot) const
{
	if(progress_sink_)
	{
		progress_sink_(snapshot);
	}
}

bool JobContext::stop_requested() const noexcept
{
	return stop_token_.stop_requested();
}

std::stop_token JobContext::stop_token() const noexcept
{
	return stop_token_;
}
