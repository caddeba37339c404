#ifndef MEDIAFORGE_HARDWARE_ENCODERS_HPP
#define MEDIAFORGE_HARDWARE_ENCODERS_HPP

#include <string>
#include <string_view>
#include <unordered_set>


/// Video encoders an ffmpeg build offers, used to prefer NVENC or Quick Sync over
/// the software encoders.
class HardwareEncoders
{
public:
	/// Runs "ffmpeg -encoders". An ffmpeg that cannot be queried offers no hardware
	/// encoders.
	static HardwareEncoders detect(const std::string& ffmpeg_executable = "ffmpeg");

	static HardwareEncoders from_encoder_list(std::string_view encoder_list);

	[[nodiscard]] bool has_nvenc() const;
	[[nodiscard]] bool has_qsv() const;
	[[nodiscard]] bool offers(const std::string& encoder) const;

	/// Fastest available encoder for codec; software encoders are the fallback.
	[[nodiscard]] std::string best_encoder(const std::string& codec) const;

private:
	std::unordered_set<std::string> encoders_;

	void add_encoder_line(std::string_view line);
};

#endif //MEDIAFORGE_HARDWARE_ENCODERS_HPP
