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

#include <algorithm>
#include <memory>
#include <utility>

#include <Eigen/Core>

/**
 * @file types.h
 * @brief 布局引擎使用的基础值类型
 *
 * 坐标系与宿主屏幕一致：原点在左上角，x 向右、y 向下，单位为像素。
 */

namespace Lattice {

using Vector2 = Eigen::Vector2f;

/**
 * @brief RGBA 颜色，分量范围 [0, 1]
 */
struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;

    Color() = default;
    Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    static Color White() { return {}; }
    static Color Transparent() { return Color(0.0f, 0.0f, 0.0f, 0.0f); }

    bool operator==(const Color& other) const = default;
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    Size() = default;
    Size(float width, float height) : width(width), height(height) {}

    bool operator==(const Size& other) const = default;
};

/**
 * @brief 轴对齐矩形，(x, y) 为左上角
 */
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    Rect() = default;
    Rect(float x, float y, float width, float height) : x(x), y(y), width(width), height(height) {}

    float GetRight() const { return x + width; }
    float GetBottom() const { return y + height; }

    // other 完全落在本矩形内（含边界）
    bool Contains(const Rect& other) const {
        return other.x >= x && other.y >= y && other.GetRight() <= GetRight() && other.GetBottom() <= GetBottom();
    }

    // 同时包住两个矩形的最小矩形
    Rect Union(const Rect& other) const {
        const float left = std::min(x, other.x);
        const float top = std::min(y, other.y);
        return Rect(left, top,
                    std::max(GetRight(), other.GetRight()) - left,
                    std::max(GetBottom(), other.GetBottom()) - top);
    }

    bool operator==(const Rect& other) const = default;
};

template <typename T>
using Ref = std::shared_ptr<T>;

template <typename T>
using Scope = std::unique_ptr<T>;

template <typename T, typename... Args>
Ref<T> CreateRef(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args>
Scope<T> CreateScope(Args&&... args) {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace Lattice
