#include "utils/file_utils.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

#include "utils/string_utils.hpp"


namespace fs = std::filesystem;

std::string read_file(const std::filesystem::path &filepath)
{
	if(!fs::exists(filepath))
	{
		throw FileReadError("File " + filepath.string() + " not found");
	}

	if(!fs::is_regular_file(filepath))
	{
		throw FileReadError(filepath.string() + " is not a regular file");
	}

	std::ifstream file(filepath, std::ios::binary);
	if(!file)
	{
		throw FileReadError("Failed to open file " + filepath.string());
	}

	std::string string_data;
	string_data.reserve(fs::file_size(filepath));
	string_data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

	if(file.bad())
	{
		throw FileReadError("Failed to read data from file " + filepath.string());
	}

	return string_data;
}

std::vector<std::string> parse_url_list_file(const std::filesystem::path& filepath)
{
	std::istringstream content(read_file(filepath));

	std::vector<std::string> urls;
	std::string line;
	while(std::getline(content, line))
	{
		auto url = trim(line);
		if(url.empty() || url.starts_with('#'))
		{
			continue;
		}
		urls.push_back(std::move(url));
	}

	return urls;
}

bool file_exist(const std::filesystem::path& file_path)
{
	const auto file_status = fs::status(file_path);
	return fs::is_regular_file(file_status);
}
