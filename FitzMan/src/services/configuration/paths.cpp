#include "paths.h"
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace fitz::paths {

// $FITZ_CONFIG_DIR/config.json, else the first config.json in the working
// directory or up to five parents, else ./config.json.
std::string configFilePath() {
	if (const char* dir = std::getenv("FITZ_CONFIG_DIR"); dir && *dir) {
		std::filesystem::path p(dir);
		std::error_code ec; std::filesystem::create_directories(p, ec);
		return (p / "config.json").string();
	}

	std::vector<std::filesystem::path> candidates;
	std::unordered_set<std::string> seen;
	auto addCandidate = [&](const std::filesystem::path& base) {
		if (base.empty()) return;
		std::filesystem::path candidate = base / "config.json";
		std::error_code canonEc;
		std::filesystem::path canonical = std::filesystem::weakly_canonical(candidate, canonEc);
		std::string key = !canonEc ? canonical.lexically_normal().string() : candidate.lexically_normal().string();
		if (seen.insert(key).second) {
			candidates.push_back(candidate);
		}
	};

	std::error_code ec;
	std::filesystem::path cwd = std::filesystem::current_path(ec);
	if (ec) {
		cwd = std::filesystem::path(".");
	}

	std::filesystem::path cur = cwd;
	for (int depth = 0; depth < 6; ++depth) {
		addCandidate(cur);
		if (!cur.has_parent_path() || cur.parent_path() == cur) break;
		cur = cur.parent_path();
	}

	for (const auto& candidate : candidates) {
		std::error_code existsEc;
		if (std::filesystem::is_regular_file(candidate, existsEc) && !existsEc) {
			std::error_code absEc;
			std::filesystem::path absPath = std::filesystem::absolute(candidate, absEc);
			return (!absEc ? absPath : candidate).string();
		}
	}

	return (cwd / "config.json").string();
}

} // namespace fitz::paths
