#pragma once
#include <string>
#include <cstdint>

namespace pm2d {
// Process-wide settings document. Keys are dotted ("stage.cols"); "::" is
// accepted as a separator too. PM2D_SECTION__KEY environment variables
// override file values on every load.
class ConfigurationManager {
public:
	static void loadOrDefault();
	static bool load();
	// Writes the current document atomically to the resolved config path.
	static bool save();

	static bool getBool(const std::string& key, bool defaultValue);
	static int64_t getInt(const std::string& key, int64_t defaultValue);
	static double getDouble(const std::string& key, double defaultValue);
	static std::string getString(const std::string& key, const std::string& defaultValue);

	static void set(const std::string& key, bool value);
	static void set(const std::string& key, int64_t value);
	static void set(const std::string& key, double value);
	static void set(const std::string& key, const std::string& value);
};
}
