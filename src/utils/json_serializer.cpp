/*
 * Copyright (c) 2025 Li Chaoyu
 * 
 * This file is part of Lattice.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 *
 * For commercial licensing, please contact: 2052046346@qq.com
 */
#include "lattice/json_serializer.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "lattice/error.h"
#include "lattice/logger.h"

namespace Lattice {

bool JsonSerializer::LoadFromFile(const std::string& filepath, nlohmann::json& outJson) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath, ec)) {
        HANDLE_ERROR(LATTICE_WARNING(ErrorCode::FileNotFound, "JSON file not found: " + filepath));
        return false;
    }

    std::ifstream file(filepath, std::ios::in | std::ios::binary);
    std::ostringstream contents;
    contents << file.rdbuf();
    if (!file.good() && !file.eof()) {
        HANDLE_ERROR(LATTICE_ERROR(ErrorCode::FileReadFailed, "Failed to read JSON file: " + filepath));
        return false;
    }

    if (!ParseFromString(contents.str(), outJson, filepath)) {
        return false;
    }

    Logger::GetInstance().DebugFormat("[JsonSerializer] Loaded JSON from '%s'", filepath.c_str());
    return true;
}

bool JsonSerializer::SaveToFile(const nlohmann::json& json, const std::string& filepath, int indent) {
    const std::string text = ToString(json, indent);

    const std::filesystem::path target(filepath);
    std::filesystem::path temp = target;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc | std::ios::binary);
        file << text << '\n';
        if (!file) {
            HANDLE_ERROR(LATTICE_ERROR(ErrorCode::FileWriteFailed, "Failed to write JSON file: " + temp.string()));
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        HANDLE_ERROR(LATTICE_ERROR(ErrorCode::FileWriteFailed, "Failed to replace JSON file: " + filepath));
        return false;
    }

    Logger::GetInstance().DebugFormat("[JsonSerializer] Saved JSON to '%s'", filepath.c_str());
    return true;
}

bool JsonSerializer::ParseFromString(std::string_view text, nlohmann::json& outJson, std::string_view source) {
    try {
        outJson = nlohmann::json::parse(text.begin(), text.end(), nullptr, true, true);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        HANDLE_ERROR(LATTICE_ERROR(ErrorCode::ConfigurationParseFailed,
                                   "JSON syntax error in " + std::string(source) + " at byte " +
                                   std::to_string(e.byte) + ": " + e.what()));
        return false;
    }
}

std::string JsonSerializer::ToString(const nlohmann::json& json, int indent) {
    // 非法 UTF-8 字符替换为 U+FFFD，而不是抛出
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace Lattice
