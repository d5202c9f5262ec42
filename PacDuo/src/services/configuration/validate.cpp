#include "validate.h"

namespace pacduo::cfgvalidate {
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
}
