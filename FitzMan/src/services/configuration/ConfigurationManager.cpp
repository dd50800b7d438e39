#include "ConfigurationManager.h"
#include "json_io.h"
#include "paths.h"
#include "validate.h"
#include "services/logger/LogManager.h"
#include <nlohmann/json.hpp>
using nlohmann::json;
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <mutex>
#include <string_view>
#include <utility>

#if !defined(_WIN32)
extern "C" char **environ;
#endif

namespace fitz {
namespace {
	constexpr int kCurrentConfigVersion = 1;

	using logging::LogManager;

	json& cfg() {
		static json c = json::object();
		return c;
	}

	std::mutex& mtx() {
		static std::mutex m;
		return m;
	}

	std::map<int, std::function<void()>>& subscribers() {
		static std::map<int, std::function<void()>> subs;
		return subs;
	}

	int& next_sub_id() {
		static int id = 1;
		return id;
	}

	// Navigate JSON by dotted path; returns pointer if found else nullptr
	const json* get_by_path(const json& j, const std::string& path) {
		const json* cur = &j;
		size_t start = 0;
		while (start <= path.size()) {
			size_t dot = path.find('.', start);
			std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
			if (!cur->is_object()) return nullptr;
			auto it = cur->find(key);
			if (it == cur->end()) return nullptr;
			if (dot == std::string::npos) {
				return &(*it);
			}
			cur = &(*it);
			start = dot + 1;
		}
		return nullptr;
	}

	// Ensure objects exist along path and return reference to leaf slot
	json& ensure_json_path(json& j, const std::string& path) {
		json* cur = &j;
		size_t start = 0;
		while (start <= path.size()) {
			size_t dot = path.find('.', start);
			std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
			if (!cur->is_object()) {
				*cur = json::object();
			}
			cur = &((*cur)[key]);
			if (dot == std::string::npos) break;
			start = dot + 1;
		}
		return *cur;
	}

	bool starts_with(std::string_view s, std::string_view pfx) {
		return s.size() >= pfx.size() && 0 == s.compare(0, pfx.size(), pfx);
	}

	std::string to_lower(std::string s) {
		for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
		return s;
	}

	bool parse_bool(std::string v, bool& out) {
		v = to_lower(std::move(v));
		if (v == "true" || v == "yes" || v == "on") { out = true; return true; }
		if (v == "false" || v == "no" || v == "off") { out = false; return true; }
		return false;
	}

	// Environment values: bool words, then integers, then floats, else the raw string.
	json parse_env_value(const std::string& v) {
		bool b = false;
		if (parse_bool(v, b)) return json(b);
		const char* first = v.data();
		const char* last = v.data() + v.size();
		if (!v.empty() && *first == '+') ++first;
		int64_t i = 0;
		if (auto [p, ec] = std::from_chars(first, last, i); ec == std::errc() && p == last && first != last) {
			return json(i);
		}
		if (!v.empty()) {
			char* end = nullptr;
			const double d = std::strtod(v.c_str(), &end);
			if (end == v.c_str() + v.size()) return json(d);
		}
		return json(v);
	}

	std::string map_env_key_to_config_key(std::string key) {
		// Replace double underscores with '.' and lowercase
		std::string out;
		out.reserve(key.size());
		for (size_t i = 0; i < key.size(); ++i) {
			if (key[i] == '_' && i + 1 < key.size() && key[i + 1] == '_') {
				out.push_back('.');
				++i;
			} else {
				out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(key[i]))));
			}
		}
		return out;
	}

	size_t apply_env_overrides(json& j) {
#if defined(_WIN32)
		char** envp = _environ;
#else
		char** envp = environ;
#endif
		if (!envp) return 0;
		const std::string prefix = "FITZ_";
		size_t count = 0;
		for (char** e = envp; *e; ++e) {
			std::string_view entry(*e);
			size_t eq = entry.find('=');
			if (eq == std::string_view::npos) continue;
			std::string_view name = entry.substr(0, eq);
			std::string_view value = entry.substr(eq + 1);
			if (!starts_with(name, prefix)) continue;
			std::string_view suffix = name.substr(prefix.size());
			// Only hierarchical names; FITZ_CONFIG_DIR and friends are control variables.
			if (suffix.find("__") == std::string_view::npos) continue;
			std::string key = map_env_key_to_config_key(std::string(suffix));
			if (!cfgvalidate::isValidKey(key)) {
				LogManager::warn("Ignoring environment override {}: invalid key '{}'", name, key);
				continue;
			}
			ensure_json_path(j, key) = parse_env_value(std::string(value));
			++count;
		}
		return count;
	}

	void move_aside(const std::string& path) {
		std::error_code ec;
		std::filesystem::path p(path);
		if (!std::filesystem::exists(p, ec)) return;
		std::filesystem::path bak = p;
		bak += ".bak";
		std::filesystem::remove(bak, ec);
		ec.clear();
		std::filesystem::rename(p, bak, ec);
		if (ec) {
			LogManager::warn("Could not back up config '{}': {}", path, ec.message());
		}
	}

	enum class MigrateResult { Ok, Migrated, Fallback };

	MigrateResult migrate_if_needed(const std::string& path, json& j, int* fromVersion = nullptr) {
		int version = 0;
		if (const auto it = j.find("version"); it != j.end()) {
			if (it->is_number_integer()) {
				version = it->get<int>();
			} else if (it->is_string()) {
				const std::string s = it->get<std::string>();
				std::from_chars(s.data(), s.data() + s.size(), version);
			}
		}
		if (fromVersion) *fromVersion = version;

		if (version > kCurrentConfigVersion) {
			// Unknown newer version: fallback to defaults without modifying file
			return MigrateResult::Fallback;
		}
		if (version < kCurrentConfigVersion) {
			move_aside(path);
			j["version"] = kCurrentConfigVersion;
			jsonio::writeJsonAtomic(path, j);
			return MigrateResult::Migrated;
		}
		return MigrateResult::Ok;
	}

	json defaults() {
		json c = json::object();
		ensure_json_path(c, "version") = kCurrentConfigVersion;
		ensure_json_path(c, "sim.tick_hz") = 10;
		ensure_json_path(c, "sim.max_ticks_per_frame") = 5;
		ensure_json_path(c, "sim.collision_threshold") = 3;
		ensure_json_path(c, "game.starting_lives") = 2;
		ensure_json_path(c, "game.pellet_score") = 10;
		auto& levelSearch = ensure_json_path(c, "level.search_paths");
		levelSearch = json::array();
		levelSearch.push_back("resource");
		levelSearch.push_back("levels");
		ensure_json_path(c, "level.pursuer_release_ticks") = 20;
		ensure_json_path(c, "window.width") = 540;
		ensure_json_path(c, "window.height") = 820;
		ensure_json_path(c, "window.fps") = 60;
		ensure_json_path(c, "window.tile_px") = 24;
		ensure_json_path(c, "log.level") = "info";
		ensure_json_path(c, "log.buffer_lines") = 2000;
		return c;
	}

	// Fill keys the file does not carry so partial documents still read fully.
	void merge_missing(json& target, const json& fallback) {
		for (auto it = fallback.begin(); it != fallback.end(); ++it) {
			auto found = target.find(it.key());
			if (found == target.end()) {
				target[it.key()] = it.value();
			} else if (found->is_object() && it.value().is_object()) {
				merge_missing(*found, it.value());
			}
		}
	}
}

void ConfigurationManager::loadOrDefault() {
	json& c = cfg();
	c = defaults();
	const size_t overrides = apply_env_overrides(c);
	if (overrides > 0) {
		LogManager::debug("Applied {} environment override(s) to config defaults", overrides);
	}
}

bool ConfigurationManager::load() {
	const auto path = paths::configFilePath();
	auto j = jsonio::readJson(path);
	if (!j || !j->is_object()) {
		std::error_code ec;
		if (std::filesystem::exists(path, ec)) {
			LogManager::warn("Config '{}' unreadable; moved to .bak, using defaults", path);
			move_aside(path);
		}
		loadOrDefault();
		return false;
	}
	int fromVer = 0;
	const MigrateResult mr = migrate_if_needed(path, *j, &fromVer);
	if (mr == MigrateResult::Fallback) {
		LogManager::warn("Config '{}' has version {} (newer than {}); using defaults", path, fromVer, kCurrentConfigVersion);
		loadOrDefault();
		return false;
	}
	if (mr == MigrateResult::Migrated) {
		LogManager::info("Config '{}' migrated from version {} to {}", path, fromVer, kCurrentConfigVersion);
	}
	merge_missing(*j, defaults());
	cfg() = std::move(*j);
	apply_env_overrides(cfg());
	LogManager::info("Config loaded from '{}'", path);
	return true;
}

bool ConfigurationManager::save() {
	const auto path = paths::configFilePath();
	const bool ok = jsonio::writeJsonAtomic(path, cfg());
	if (ok) {
		// Fire callbacks on caller thread
		std::map<int, std::function<void()>> copy;
		{
			std::lock_guard<std::mutex> lock(mtx());
			copy = subscribers();
		}
		for (auto& [id, cb] : copy) {
			if (cb) cb();
		}
	}
	return ok;
}

bool ConfigurationManager::getBool(const std::string& key, bool defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && v->is_boolean()) return v->get<bool>();
	return defaultValue;
}

int64_t ConfigurationManager::getInt(const std::string& key, int64_t defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && (v->is_number_integer() || v->is_number_unsigned())) return v->get<int64_t>();
	return defaultValue;
}

double ConfigurationManager::getDouble(const std::string& key, double defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && v->is_number()) return v->get<double>();
	return defaultValue;
}

std::string ConfigurationManager::getString(const std::string& key, const std::string& defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && v->is_string()) return v->get<std::string>();
	return defaultValue;
}

std::vector<std::string> ConfigurationManager::getStringList(const std::string& key, const std::vector<std::string>& defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && v->is_array()) {
		std::vector<std::string> out;
		out.reserve(v->size());
		for (const auto& e : *v) {
			if (e.is_string()) out.push_back(e.get<std::string>());
		}
		return out;
	}
	return defaultValue;
}

void ConfigurationManager::set(const std::string& key, bool value) { ensure_json_path(cfg(), key) = value; }
void ConfigurationManager::set(const std::string& key, int64_t value) { ensure_json_path(cfg(), key) = value; }
void ConfigurationManager::set(const std::string& key, double value) { ensure_json_path(cfg(), key) = value; }
void ConfigurationManager::set(const std::string& key, const std::string& value) { ensure_json_path(cfg(), key) = value; }
void ConfigurationManager::set(const std::string& key, const std::vector<std::string>& value) {
	ensure_json_path(cfg(), key) = cfgvalidate::toJson(value);
}

int ConfigurationManager::subscribeOnChange(const std::function<void()>& cb) {
	std::lock_guard<std::mutex> lock(mtx());
	int id = next_sub_id()++;
	subscribers()[id] = cb;
	return id;
}

void ConfigurationManager::unsubscribe(int id) {
	std::lock_guard<std::mutex> lock(mtx());
	subscribers().erase(id);
}

std::string ConfigurationManager::exportCompact() {
	return cfg().dump();
}

const json& ConfigurationManager::raw() {
	return cfg();
}

std::string ConfigurationManager::filePath() {
	return paths::configFilePath();
}

} // namespace fitz
