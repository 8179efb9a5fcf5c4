#include "backsim/core/config_base.hpp"
#include <filesystem>
#include <iomanip>

namespace backsim {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath, "ConfigBase");
        }
        file << std::setw(4) << j << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving config: ") + e.what(), "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for reading: " + filepath, "ConfigBase");
        }
        nlohmann::json j;
        file >> j;
        from_json(j);
        return Result<void>();
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Malformed config JSON: ") + e.what(), "ConfigBase");
    } catch (const BacksimError& e) {
        return make_error<void>(e.code(), e.what(), "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    }
}

}  // namespace backsim
