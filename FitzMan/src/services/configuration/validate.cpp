#include "validate.h"
using nlohmann::json;

namespace fitz::cfgvalidate {
bool isValidKey(const std::string& key) {
	if (key.empty()) return false;
	if (key.front() == '.' || key.back() == '.') return false;
	bool prevDot = false;
	for (char c : key) {
		if (c == '.') {
			if (prevDot) return false;
			prevDot = true;
			continue;
		}
		prevDot = false;
		if (!(c == '_' || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))) return false;
	}
	return true;
}

json toJson(const Value& v) {
	return std::visit([](auto&& val) -> json {
		using T = std::decay_t<decltype(val)>;
		if constexpr (std::is_same_v<T, std::vector<std::string>>) {
			json arr = json::array();
			for (const auto& s : val) arr.push_back(s);
			return arr;
		} else {
			return json(val);
		}
	}, v);
}
}
