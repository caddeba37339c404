#include "utils/line_buffer.hpp"


LineBuffer::LineBuffer(std::string delimiters)
	: delimiters_(std::move(delimiters))
{
}

void LineBuffer::append(std::string_view data, const LineCallback& on_line)
{
	pending_.append(data);

	std::size_t line_start = 0;
	std::size_t delimiter_pos = pending_.find_first_of(delimiters_);
	while(delimiter_pos != std::string::npos)
	{
		if(delimiter_pos > line_start)
		{
			on_line(std::string_view(pending_).substr(line_start, delimiter_pos - line_start));
		}

		line_start = delimiter_pos + 1;
		delimiter_pos = pending_.find_first_of(delimiters_, line_start);
	}

	pending_.erase(0, line_start);
}

void LineBuffer::flush(const LineCallback& on_line)
{
	if(!pending_.empty())
	{
		on_line(pending_);
		pending_.clear();
	}
}
