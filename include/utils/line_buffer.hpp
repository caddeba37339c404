#ifndef MEDIAFORGE_LINE_BUFFER_HPP
#define MEDIAFORGE_LINE_BUFFER_HPP

#include <functional>
#include <string>
#include <string_view>


/// Accumulates raw output chunks and emits complete, non-empty lines.
class LineBuffer
{
public:
	using LineCallback = std::function<void(std::string_view)>;

	explicit LineBuffer(std::string delimiters = "\n");

	void append(std::string_view data, const LineCallback& on_line);
	void flush(const LineCallback& on_line);

private:
	std::string delimiters_;
	std::string pending_;
};

#endif //MEDIAFORGE_LINE_BUFFER_HPP
