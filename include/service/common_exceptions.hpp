#ifndef MEDIAFORGE_COMMON_EXCEPTIONS_HPP
#define MEDIAFORGE_COMMON_EXCEPTIONS_HPP

#include <stdexcept>

struct SubmissionError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

#endif //MEDIAFORGE_COMMON_EXCEPTIONS_HPP
