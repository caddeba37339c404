#ifndef MEDIAFORGE_SUBPROCESS_HPP
#define MEDIAFORGE_SUBPROCESS_HPP

#include <functional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>


struct ProcessError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

struct ProcessCancelledError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

using OutputLineCallback = std::function<void(std::string_view)>;

/// Runs argv[0] (looked up in PATH) without a shell. Merged stdout and stderr are
/// split on '\n' and '\r' and passed line by line to on_line. A stop request sends
/// SIGTERM to the child and ends with ProcessCancelledError.
/// Returns the exit code of the child.
int run_process(const std::vector<std::string>& argv, const OutputLineCallback& on_line, std::stop_token stop_token = {});

#endif //MEDIAFORGE_SUBPROCESS_HPP
