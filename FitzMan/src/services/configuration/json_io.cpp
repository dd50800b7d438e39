#include "json_io.h"
#include "services/logger/LogManager.h"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fitz::jsonio {

std::optional<nlohmann::json> readJson(const std::string& path) {
	std::error_code ec;
	const auto size = std::filesystem::file_size(path, ec);
	if (ec) return std::nullopt;
	if (size > kMaxConfigBytes) {
		logging::LogManager::warn("Config file '{}' is {} bytes, over the {} byte limit", path, size, kMaxConfigBytes);
		return std::nullopt;
	}
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) return std::nullopt;
	try {
		nlohmann::json j;
		ifs >> j;
		return j;
	} catch (const nlohmann::json::exception& e) {
		logging::LogManager::warn("Config file '{}' is not valid JSON: {}", path, e.what());
		return std::nullopt;
	}
}

bool writeJsonAtomic(const std::string& path, const nlohmann::json& j) {
	namespace fs = std::filesystem;
	fs::path target(path);
	fs::path dir = target.parent_path();
	if (!dir.empty()) {
		std::error_code ec;
		fs::create_directories(dir, ec);
	}
	fs::path tmp = target;
	tmp += ".tmp";
	tmp += std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
	{
		std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
		if (!ofs) return false;
		ofs << j.dump(2);
		ofs.flush();
		if (!ofs) return false;
	}
	std::error_code ec;
	fs::rename(tmp, target, ec);
	if (ec) {
		// Some platforms refuse to rename over an existing file
		ec.clear();
		fs::remove(target, ec);
		ec.clear();
		fs::rename(tmp, target, ec);
	}
	if (ec) {
		std::error_code ec2;
		fs::remove(tmp, ec2);
		logging::LogManager::error("Failed to write config '{}': {}", path, ec.message());
		return false;
	}
	return true;
}

} // namespace fitz::jsonio
