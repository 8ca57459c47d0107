#include "ConfigurationManager.h"
#include "paths.h"
#include "json_io.h"
#include "services/logger/LogManager.h"
#include <nlohmann/json.hpp>
using nlohmann::json;
#include <filesystem>
#include <cstdlib>
#include <string_view>
#include <cctype>
#include <charconv>

#if !defined(_WIN32)
extern "C" char **environ;
#endif

namespace pm2d {
namespace {
	constexpr int kCurrentConfigVersion = 1;

	using logging::LogManager;

	json& cfg() {
		static json c;
		return c;
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

	std::string normalize_key(std::string key) {
		if (key.find("::") == std::string::npos) return key;
		std::string out; out.reserve(key.size());
		for (size_t i = 0; i < key.size(); ++i) {
			if (key[i] == ':' && i + 1 < key.size() && key[i + 1] == ':') {
				out.push_back('.');
				++i;
			} else {
				out.push_back(key[i]);
			}
		}
		return out;
	}

	std::string to_lower(std::string s) {
		for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		return s;
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
		const char* first = v.data();
		const char* last = v.data() + v.size();
		long long i = 0;
		if (auto [p, ec] = std::from_chars(first, last, i); ec == std::errc() && p == last) return json(i);
		// strtod keeps this working on standard libraries without floating from_chars
		char* end = nullptr;
		double d = std::strtod(v.c_str(), &end);
		if (!v.empty() && end == v.c_str() + v.size()) return json(d);
		return json(v);
	}

	std::string map_env_key_to_config_key(std::string_view key) {
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
		constexpr std::string_view prefix = "PM2D_";
		size_t count = 0;
		for (char** e = envp; *e; ++e) {
			std::string_view entry(*e);
			size_t eq = entry.find('=');
			if (eq == std::string_view::npos) continue;
			std::string_view name = entry.substr(0, eq);
			std::string_view value = entry.substr(eq + 1);
			if (name.substr(0, prefix.size()) != prefix) continue;
			std::string_view suffix = name.substr(prefix.size());
			// Only hierarchical names; PM2D_CONFIG_DIR and friends are control variables.
			if (suffix.find("__") == std::string_view::npos) continue;
			ensure_json_path(j, map_env_key_to_config_key(suffix)) = parse_env_value(std::string(value));
			++count;
		}
		return count;
	}

	void backup_file(const std::string& path) {
		std::error_code ec;
		std::filesystem::path p(path);
		std::filesystem::path bak = p; bak += ".bak";
		std::filesystem::remove(bak, ec);
		ec.clear();
		std::filesystem::rename(p, bak, ec);
		if (ec) {
			LogManager::warn("Could not back up '{}': {}", path, ec.message());
		}
	}

	enum class MigrateResult { Ok, Migrated, Fallback };

	MigrateResult migrate_if_needed(const std::string& path, json& j) {
		int version = 0;
		if (auto it = j.find("version"); it != j.end()) {
			if (it->is_number_integer()) {
				version = it->get<int>();
			} else if (it->is_string()) {
				const auto& s = it->get_ref<const std::string&>();
				std::from_chars(s.data(), s.data() + s.size(), version);
			}
		}
		if (version > kCurrentConfigVersion) {
			LogManager::warn("Config '{}' has newer version {}; using defaults", path, version);
			return MigrateResult::Fallback;
		}
		if (version < kCurrentConfigVersion) {
			// No key renames yet: back up, stamp the version, rewrite.
			backup_file(path);
			j["version"] = kCurrentConfigVersion;
			if (!jsonio::writeJsonAtomic(path, j)) {
				LogManager::warn("Could not write migrated config '{}'", path);
			}
			LogManager::info("Config '{}' migrated from version {} to {}", path, version, kCurrentConfigVersion);
			return MigrateResult::Migrated;
		}
		return MigrateResult::Ok;
	}

	void fill_defaults(json& c) {
		ensure_json_path(c, "version") = kCurrentConfigVersion;
		ensure_json_path(c, "window.width") = 672;
		ensure_json_path(c, "window.height") = 864;
		ensure_json_path(c, "window.target_fps") = 60;
		ensure_json_path(c, "window.title") = "Pac-Man";
		ensure_json_path(c, "stage.path") = "assets/stages/classic.json";
		ensure_json_path(c, "stage.cols") = 28;
		ensure_json_path(c, "stage.rows") = 31;
		ensure_json_path(c, "stage.cell_size") = 24;
		ensure_json_path(c, "stage.origin_x") = 0;
		ensure_json_path(c, "stage.origin_y") = 48;
		ensure_json_path(c, "gameplay.starting_lives") = 3;
		ensure_json_path(c, "gameplay.player_speed") = 180.0;
		ensure_json_path(c, "gameplay.ghost_speed") = 180.0;
		ensure_json_path(c, "gameplay.frightened_seconds") = 10.0;
		ensure_json_path(c, "gameplay.extra_life_score") = 10000;
		ensure_json_path(c, "logging.level") = "info";
	}

	// Keys present in the defaults but absent from a loaded file are filled in.
	void merge_missing(json& target, const json& defaults) {
		for (auto it = defaults.begin(); it != defaults.end(); ++it) {
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
	c = json::object();
	fill_defaults(c);
	size_t overrides = apply_env_overrides(c);
	if (overrides > 0) LogManager::debug("Applied {} environment override(s) to defaults", overrides);
}

bool ConfigurationManager::load() {
	auto path = paths::configFilePath();
	auto j = jsonio::readJson(path);
	if (!j || !j->is_object()) {
		std::error_code ec;
		if (std::filesystem::exists(path, ec)) {
			LogManager::warn("Config '{}' is unreadable; moved to .bak and using defaults", path);
			backup_file(path);
		}
		loadOrDefault();
		return false;
	}
	if (migrate_if_needed(path, *j) == MigrateResult::Fallback) {
		loadOrDefault();
		return false;
	}
	json defaults = json::object();
	fill_defaults(defaults);
	merge_missing(*j, defaults);
	cfg() = std::move(*j);
	size_t overrides = apply_env_overrides(cfg());
	LogManager::info("Loaded config '{}' ({} environment override(s))", path, overrides);
	return true;
}

bool ConfigurationManager::save() {
	auto path = paths::configFilePath();
	bool ok = jsonio::writeJsonAtomic(path, cfg());
	if (!ok) {
		LogManager::error("Failed to save config '{}'", path);
		return false;
	}
	return true;
}

bool ConfigurationManager::getBool(const std::string& key, bool defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && v->is_boolean()) return v->get<bool>();
	return defaultValue;
}

int64_t ConfigurationManager::getInt(const std::string& key, int64_t defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && (v->is_number_integer() || v->is_number_unsigned())) return v->get<int64_t>();
	return defaultValue;
}

double ConfigurationManager::getDouble(const std::string& key, double defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && v->is_number()) return v->get<double>();
	return defaultValue;
}

std::string ConfigurationManager::getString(const std::string& key, const std::string& defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && v->is_string()) return v->get<std::string>();
	return defaultValue;
}

void ConfigurationManager::set(const std::string& key, bool value) { ensure_json_path(cfg(), normalize_key(key)) = value; }
void ConfigurationManager::set(const std::string& key, int64_t value) { ensure_json_path(cfg(), normalize_key(key)) = value; }
void ConfigurationManager::set(const std::string& key, double value) { ensure_json_path(cfg(), normalize_key(key)) = value; }
void ConfigurationManager::set(const std::string& key, const std::string& value) { ensure_json_path(cfg(), normalize_key(key)) = value; }
}
