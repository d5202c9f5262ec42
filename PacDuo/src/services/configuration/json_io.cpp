#include "json_io.h"
#include <filesystem>
#include <fstream>
#include <chrono>

namespace pacduo::jsonio {
std::optional<nlohmann::json> readJson(const std::string& path) {
	std::error_code ec;
	auto size = std::filesystem::file_size(path, ec);
	if (ec || size > kMaxJsonBytes) return std::nullopt;
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) return std::nullopt;
	try {
		nlohmann::json j;
		ifs >> j;
		return j;
	} catch (const nlohmann::json::exception&) {
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
	// Unique temp name next to the target so the rename stays on one volume
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
		return false;
	}
	return true;
}
}
