#include "ConfigurationManager.h"
#include "paths.h"
#include "json_io.h"
#include "validate.h"
#include "services/logger/LogManager.h"
#include <nlohmann/json.hpp>
using nlohmann::json;
#include <filesystem>
#include <cstdlib>
#include <string_view>
#include <cctype>
#include <mutex>
#include <map>
#include <utility>
#include <algorithm>

#if !defined(_WIN32)
extern "C" char **environ;
#endif

namespace pacduo {
namespace {
	static constexpr int kCurrentConfigVersion = 1;

	using logging::LogManager;

	json& cfg() {
		static json c;
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

	std::vector<ConfigurationManager::OnConfigReloadedHook>& reload_hooks() {
		static std::vector<ConfigurationManager::OnConfigReloadedHook> hooks;
		return hooks;
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

	json string_list(std::initializer_list<const char*> items) {
		json arr = json::array();
		for (const char* s : items) arr.push_back(s);
		return arr;
	}

	void apply_defaults(json& c) {
		ensure_json_path(c, "version") = kCurrentConfigVersion;
		ensure_json_path(c, "logging.level") = "info";
		ensure_json_path(c, "logging.pattern") = "[%H:%M:%S] [%l] %v";
		ensure_json_path(c, "window.width") = 960;
		ensure_json_path(c, "window.height") = 900;
		ensure_json_path(c, "window.target_fps") = 60;
		ensure_json_path(c, "maze.path") = "";
		ensure_json_path(c, "grid.cell_size") = 1.0;

		ensure_json_path(c, "player.move_speed") = 5.0;
		ensure_json_path(c, "spawn.player1") = "15,7";
		ensure_json_path(c, "spawn.player2") = "16,7";
		ensure_json_path(c, "spawn.pursuers") = string_list({"14,16", "15,16", "16,16", "17,16"});

		ensure_json_path(c, "pursuer.base_speed") = 3.0;
		ensure_json_path(c, "pursuer.scared_speed") = 2.5;
		ensure_json_path(c, "pursuer.path_recalculate_interval") = 0.3;
		ensure_json_path(c, "pursuer.max_search_iterations") = 100;
		ensure_json_path(c, "pursuer.random_decision_interval") = 3.0;
		ensure_json_path(c, "pursuer.random_decision_chance") = 0.5;
		ensure_json_path(c, "pursuer.respawn_delay") = 6.0;
		ensure_json_path(c, "pursuer.home_min_x") = 13;
		ensure_json_path(c, "pursuer.home_max_x") = 18;
		ensure_json_path(c, "pursuer.home_min_y") = 15;
		ensure_json_path(c, "pursuer.home_max_y") = 17;
		ensure_json_path(c, "pursuer.home_exit") = "16,19";

		ensure_json_path(c, "match.starting_lives") = 3;
		ensure_json_path(c, "match.max_lives") = 5;
		ensure_json_path(c, "match.power_up_duration") = 10.0;
		ensure_json_path(c, "match.swap_window_duration") = 3.0;
		ensure_json_path(c, "match.swap_cooldown") = 10.0;
		ensure_json_path(c, "match.speed_increase_per_level") = 0.4;
		ensure_json_path(c, "match.level_transition_delay") = 2.0;
		ensure_json_path(c, "match.pursuer_eaten_points") = 200;
		ensure_json_path(c, "match.random_seed") = 0;

		ensure_json_path(c, "pellets.regular_points") = 10;
		ensure_json_path(c, "pellets.power_points") = 50;
		ensure_json_path(c, "pellets.regular_per_player") = 122;
		ensure_json_path(c, "pellets.min_spawn_x") = 2;
		ensure_json_path(c, "pellets.max_spawn_x") = 29;
		ensure_json_path(c, "pellets.exclusion_center") = "16,16";
		ensure_json_path(c, "pellets.exclusion_radius") = 4;
		ensure_json_path(c, "pellets.power_corners") = string_list({"3,29", "28,29", "3,1", "28,1"});
		ensure_json_path(c, "pellets.corner_search_radius") = 5;

		ensure_json_path(c, "tunnels.pairs") = string_list({"0,16:31,16"});
		ensure_json_path(c, "tunnels.cooldown") = 0.5;

		ensure_json_path(c, "input.player1.up") = "W";
		ensure_json_path(c, "input.player1.down") = "S";
		ensure_json_path(c, "input.player1.left") = "A";
		ensure_json_path(c, "input.player1.right") = "D";
		ensure_json_path(c, "input.player1.swap") = "E";
		ensure_json_path(c, "input.player2.up") = "Up";
		ensure_json_path(c, "input.player2.down") = "Down";
		ensure_json_path(c, "input.player2.left") = "Left";
		ensure_json_path(c, "input.player2.right") = "Right";
		ensure_json_path(c, "input.player2.swap") = "Slash";

		ensure_json_path(c, "persistence.high_score_file") = "highscore.json";
	}

	// Fill keys missing from a loaded document without touching present ones
	void merge_missing(json& target, const json& defaults) {
		if (!target.is_object() || !defaults.is_object()) return;
		for (auto it = defaults.begin(); it != defaults.end(); ++it) {
			auto found = target.find(it.key());
			if (found == target.end()) {
				target[it.key()] = it.value();
			} else if (found->is_object() && it.value().is_object()) {
				merge_missing(*found, it.value());
			}
		}
	}

	bool starts_with(std::string_view s, std::string_view pfx) {
		return s.size() >= pfx.size() && 0 == s.compare(0, pfx.size(), pfx);
	}

	std::string to_lower(std::string s) {
		for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
		return s;
	}

	bool is_integer(const std::string& v) {
		if (v.empty()) return false;
		size_t i = (v[0] == '-' || v[0] == '+') ? 1 : 0;
		if (i >= v.size()) return false;
		for (; i < v.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(v[i]))) return false;
		return true;
	}

	bool parse_bool(std::string v, bool& out) {
		v = to_lower(std::move(v));
		if (v == "true" || v == "yes" || v == "on") { out = true; return true; }
		if (v == "false" || v == "no" || v == "off") { out = false; return true; }
		return false;
	}

	json parse_env_value(const std::string& v) {
		bool b;
		if (parse_bool(v, b)) return json(b);
		if (is_integer(v)) {
			try { return json(std::stoll(v)); } catch (const std::out_of_range&) { return json(v); }
		}
		try {
			size_t idx = 0;
			double d = std::stod(v, &idx);
			if (idx == v.size()) return json(d);
		} catch (const std::logic_error&) {
			// not a number, keep as text
		}
		return json(v);
	}

	std::string map_env_key_to_config_key(std::string key) {
		// Double underscores become '.', everything lowercased
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
		const std::string prefix = "PACDUO_";
		size_t count = 0;
		for (char** e = envp; *e; ++e) {
			std::string_view entry(*e);
			size_t eq = entry.find('=');
			if (eq == std::string_view::npos) continue;
			std::string_view name = entry.substr(0, eq);
			std::string_view value = entry.substr(eq + 1);
			if (!starts_with(name, prefix)) continue;
			std::string_view suffix = name.substr(prefix.size());
			// Require a double underscore so control vars like PACDUO_CONFIG_DIR are skipped
			if (suffix.find("__") == std::string_view::npos) continue;
			std::string key = map_env_key_to_config_key(std::string(suffix));
			if (!cfgvalidate::isValidKey(key)) continue;
			ensure_json_path(j, key) = parse_env_value(std::string(value));
			++count;
		}
		return count;
	}

	enum class MigrateResult { Ok, Migrated, Fallback };

	MigrateResult migrate_if_needed(const std::string& path, json& j, int* fromVersion = nullptr) {
		int version = 0;
		if (j.contains("version")) {
			const auto& v = j["version"];
			if (v.is_number_integer()) version = v.get<int>();
			else if (v.is_string()) {
				try { version = std::stoi(v.get<std::string>()); } catch (const std::logic_error&) { version = 0; }
			}
		}
		if (fromVersion) *fromVersion = version;

		if (version > kCurrentConfigVersion) {
			// Unknown newer version: fallback to defaults without modifying file
			return MigrateResult::Fallback;
		}
		if (version < kCurrentConfigVersion) {
			std::error_code ec;
			std::filesystem::path p(path);
			std::filesystem::path bak = p; bak += ".bak";
			std::filesystem::remove(bak, ec);
			ec.clear();
			std::filesystem::copy_file(p, bak, ec);
			j["version"] = kCurrentConfigVersion;
			if (!jsonio::writeJsonAtomic(path, j)) {
				LogManager::warn("Config: migrated document could not be written to {}", path);
			}
			return MigrateResult::Migrated;
		}
		return MigrateResult::Ok;
	}

	void notify_reload_hooks() {
		for (const auto& hook : reload_hooks()) {
			if (hook.callback) {
				hook.callback();
			}
		}
	}

	template <typename T>
	bool set_value(const std::string& key, T&& value) {
		if (!cfgvalidate::isValidKey(key)) {
			LogManager::warn("Config: rejected invalid key '{}'", key);
			return false;
		}
		ensure_json_path(cfg(), key) = std::forward<T>(value);
		return true;
	}
}

void ConfigurationManager::loadOrDefault() {
	json& c = cfg();
	c = json::object();
	apply_defaults(c);
	size_t overrides = apply_env_overrides(c);
	if (overrides > 0) {
		LogManager::debug("Config: {} environment override(s) applied", overrides);
	}
}

bool ConfigurationManager::load() {
	auto path = paths::configFilePath();
	auto j = jsonio::readJson(path);
	if (!j || !j->is_object()) {
		std::error_code ec;
		std::filesystem::path p(path);
		if (std::filesystem::exists(p, ec)) {
			std::filesystem::path bak = p;
			bak += ".bak";
			std::filesystem::remove(bak, ec);
			std::filesystem::rename(p, bak, ec);
			LogManager::warn("Config: {} unreadable, moved to {} and using defaults", path, bak.string());
		} else {
			LogManager::info("Config: no file at {}, using defaults", path);
		}
		loadOrDefault();
		return false;
	}
	int fromVer = 0;
	MigrateResult mr = migrate_if_needed(path, *j, &fromVer);
	if (mr == MigrateResult::Fallback) {
		LogManager::warn("Config: version {} is newer than supported {}, using defaults", fromVer, kCurrentConfigVersion);
		loadOrDefault();
		return false;
	}
	if (mr == MigrateResult::Migrated) {
		LogManager::info("Config: migrated from version {} to {}", fromVer, kCurrentConfigVersion);
	}
	json defaults = json::object();
	apply_defaults(defaults);
	merge_missing(*j, defaults);
	cfg() = std::move(*j);
	apply_env_overrides(cfg());

	notify_reload_hooks();
	return true;
}

bool ConfigurationManager::save() {
	auto path = paths::configFilePath();
	bool ok = jsonio::writeJsonAtomic(path, cfg());
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
	} else {
		LogManager::error("Config: failed to write {}", path);
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

bool ConfigurationManager::set(const std::string& key, bool value) { return set_value(key, value); }
bool ConfigurationManager::set(const std::string& key, int64_t value) { return set_value(key, value); }
bool ConfigurationManager::set(const std::string& key, double value) { return set_value(key, value); }
bool ConfigurationManager::set(const std::string& key, const std::string& value) { return set_value(key, value); }
bool ConfigurationManager::set(const std::string& key, const std::vector<std::string>& value) {
	json arr = json::array();
	for (const auto& s : value) arr.push_back(s);
	return set_value(key, std::move(arr));
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

void ConfigurationManager::pushReloadHook(const OnConfigReloadedHook& hook) {
	if (!hook.callback) {
		return;
	}

	auto& hooks = reload_hooks();
	const bool exists = std::any_of(hooks.begin(), hooks.end(), [&](const OnConfigReloadedHook& existing) {
		return !existing.name.empty() && existing.name == hook.name;
	});
	if (exists) {
		return;
	}
	hooks.push_back(hook);
}
}
