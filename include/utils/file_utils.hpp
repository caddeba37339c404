#ifndef MEDIAFORGE_FILE_UTILS_HPP
#define MEDIAFORGE_FILE_UTILS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>


struct FileReadError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};


[[nodiscard]] std::string read_file(const std::filesystem::path& filepath);

/// One URL per line. Blank lines and lines starting with '#' are skipped.
[[nodiscard]] std::vector<std::string> parse_url_list_file(const std::filesystem::path& filepath);

bool file_exist(const std::filesystem::path& file_path);

#endif //MEDIAFORGE_FILE_UTILS_HPP
