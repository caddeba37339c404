#include "execution/strategy/process/message.hpp"


namespace
{
	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

namespace process
{
	std::string encode_message(const ProcessMessage& message)
	{
		const auto json = std::visit(
			overloaded{
				[](const message::Progress& progress) { return nlohmann::json{{"type", "progress"}, {"snapshot", progress.snapshot}}; },
				[](const message::Result& result) { return nlohmann::json{{"type", "result"}, {"value", result.value}}; },
				[](const message::Failure& failure) { return nlohmann::json{{"type", "failure"}, {"error", failure.error}}; }
			},
			message
		);

		return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
	}

	ProcessMessage decode_message(std::string_view line)
	{
		const auto json = nlohmann::json::parse(line, nullptr, false);
		if(json.is_discarded() || !json.is_object() || !json.contains("type"))
		{
			throw MalformedMessageException("Malformed worker message: " + std::string(line));
		}

		const auto type = json.at("type").get<std::string>();
		if(type == "progress")
		{
			return message::Progress{json.at("snapshot").get<ProgressSnapshot>()};
		}
		else if(type == "result")
		{
			return message::Result{json.contains("value") ? json.at("value") : JobResult()};
		}
		else if(type == "failure")
		{
			return message::Failure{json.value("error", std::string("unknown error"))};
		}

		throw MalformedMessageException("Unknown worker message type: " + type);
	}
}
