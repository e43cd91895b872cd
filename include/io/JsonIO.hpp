#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsonio {

// Reads and parses a JSON file. Throws std::runtime_error naming the path on
// open or parse failure.
nlohmann::json read_json_file(const std::filesystem::path& path);

// Pretty-prints j (2-space indent) to path, creating parent directories.
void write_json_file(const std::filesystem::path& path, const nlohmann::json& j);

// Field accessors. `where` is the JSON path of j, used in error messages
// ("root.trees[3] missing required field: nodes").
void require_object(const nlohmann::json& j, const std::string& where);
void require_array(const nlohmann::json& j, const std::string& where);

const nlohmann::json& require_field(const nlohmann::json& j, const char* key, const std::string& where);
std::string require_string(const nlohmann::json& j, const char* key, const std::string& where);
double require_number(const nlohmann::json& j, const char* key, const std::string& where);
int64_t require_integer(const nlohmann::json& j, const char* key, const std::string& where);
std::vector<std::string> require_string_array(const nlohmann::json& j, const char* key, const std::string& where);
std::vector<double> require_number_array(const nlohmann::json& j, const char* key, const std::string& where);

std::string index_path(const std::string& where, size_t i);

}  // namespace jsonio
