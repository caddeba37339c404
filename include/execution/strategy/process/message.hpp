#ifndef MEDIAFORGE_PROCESS_MESSAGE_HPP
#define MEDIAFORGE_PROCESS_MESSAGE_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "model/progress.hpp"
#include "model/task.hpp"


namespace process::message
{
	struct Progress
	{
		ProgressSnapshot snapshot;
	};

	struct Result
	{
		JobResult value;
	};

	struct Failure
	{
		std::string error;
	};
}

namespace process
{
	/// One JSON document per line on the pipe from a worker process to its dispatcher.
	using ProcessMessage = std::variant<message::Progress, message::Result, message::Failure>;

	struct MalformedMessageException: public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	[[nodiscard]] std::string encode_message(const ProcessMessage& message);
	[[nodiscard]] ProcessMessage decode_message(std::string_view line);
}

#endif //MEDIAFORGE_PROCESS_MESSAGE_HPP
