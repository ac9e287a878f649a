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
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lattice/types.h"

/**
 * @file json_serializer.h
 * @brief JSON 文件读写与基础几何类型的序列化
 *
 * 布局配置通过它读写文件：
 * @code
 * nlohmann::json j = UILayoutConfigManager::GetInstance().GetConfig();
 * JsonSerializer::SaveToFile(j, "layout.json");
 * @endcode
 */

namespace Lattice {

class JsonSerializer {
public:
    /**
     * @brief 读取并解析 JSON 文件（允许 // 与 块注释）
     *
     * 文件不存在上报 FileNotFound（Warning）；读失败上报 FileReadFailed；
     * 语法错误上报 ConfigurationParseFailed。失败时 outJson 不变。
     */
    static bool LoadFromFile(const std::string& filepath, nlohmann::json& outJson);

    /**
     * @brief 写入 JSON 文件
     *
     * 先写到同目录的临时文件再替换目标，写失败时原文件保持不变。
     */
    static bool SaveToFile(const nlohmann::json& json, const std::string& filepath, int indent = 4);

    /**
     * @param source 出错时消息里使用的来源名称
     */
    static bool ParseFromString(std::string_view text, nlohmann::json& outJson, std::string_view source = "<string>");

    static std::string ToString(const nlohmann::json& json, int indent = 4);

    /**
     * @brief 键存在时读取到 out，否则保持 out 原值
     *
     * 类型不符时抛出 nlohmann::json::type_error，由调用方决定如何上报。
     */
    template <typename T>
    static void ReadIfPresent(const nlohmann::json& j, const char* key, T& out) {
        const auto it = j.find(key);
        if (it != j.end()) {
            it->get_to(out);
        }
    }
};

// ============================================================================
// 基础类型
// ============================================================================

inline void to_json(nlohmann::json& j, const Color& color) {
    j = nlohmann::json::array({color.r, color.g, color.b, color.a});
}

/**
 * @brief 支持 [r, g, b(, a)] 与 {"r":..,"g":..,"b":..,"a":..}
 */
inline void from_json(const nlohmann::json& j, Color& color) {
    if (j.is_array()) {
        j.at(0).get_to(color.r);
        j.at(1).get_to(color.g);
        j.at(2).get_to(color.b);
        color.a = j.size() > 3 ? j[3].get<float>() : 1.0f;
        return;
    }
    JsonSerializer::ReadIfPresent(j, "r", color.r);
    JsonSerializer::ReadIfPresent(j, "g", color.g);
    JsonSerializer::ReadIfPresent(j, "b", color.b);
    JsonSerializer::ReadIfPresent(j, "a", color.a);
}

inline void to_json(nlohmann::json& j, const Size& size) {
    j = nlohmann::json::array({size.width, size.height});
}

/**
 * @brief 支持 [w, h] 与 {"width": w, "height": h}，对象中缺失的键保持原值
 */
inline void from_json(const nlohmann::json& j, Size& size) {
    if (j.is_array()) {
        j.at(0).get_to(size.width);
        j.at(1).get_to(size.height);
        return;
    }
    JsonSerializer::ReadIfPresent(j, "width", size.width);
    JsonSerializer::ReadIfPresent(j, "height", size.height);
}

inline void to_json(nlohmann::json& j, const Rect& rect) {
    j = {{"x", rect.x}, {"y", rect.y}, {"width", rect.width}, {"height", rect.height}};
}

inline void from_json(const nlohmann::json& j, Rect& rect) {
    if (j.is_array()) {
        j.at(0).get_to(rect.x);
        j.at(1).get_to(rect.y);
        j.at(2).get_to(rect.width);
        j.at(3).get_to(rect.height);
        return;
    }
    JsonSerializer::ReadIfPresent(j, "x", rect.x);
    JsonSerializer::ReadIfPresent(j, "y", rect.y);
    JsonSerializer::ReadIfPresent(j, "width", rect.width);
    JsonSerializer::ReadIfPresent(j, "height", rect.height);
}

} // namespace Lattice

// Eigen 类型不在 Lattice 命名空间内，通过 adl_serializer 特化提供支持
namespace nlohmann {

template <>
struct adl_serializer<Lattice::Vector2> {
    static void to_json(json& j, const Lattice::Vector2& vec) {
        j = json::array({vec.x(), vec.y()});
    }

    static void from_json(const json& j, Lattice::Vector2& vec) {
        if (j.is_array()) {
            vec = Lattice::Vector2(j.at(0).get<float>(), j.at(1).get<float>());
            return;
        }
        vec = Lattice::Vector2(j.value("x", vec.x()), j.value("y", vec.y()));
    }
};

} // namespace nlohmann
