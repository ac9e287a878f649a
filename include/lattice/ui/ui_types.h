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

#include <cstdint>

namespace Lattice::UI {

/**
 * @brief 单轴尺寸策略
 *
 * Fixed   - 显式设定的值
 * Content - 由自身内容（文本度量、子元素并集、固定常量）推导
 * Fill    - 跟随父元素同轴的解析尺寸，无父元素时为 0
 */
enum class SizeMode : uint8_t {
    Fixed,
    Content,
    Fill
};

enum class UIAxis : uint8_t {
    Horizontal = 0,
    Vertical = 1
};

enum class UIAxisMask : uint8_t {
    None = 0,
    Horizontal = 1u << 0,
    Vertical = 1u << 1,
    Both = Horizontal | Vertical
};

constexpr UIAxisMask operator|(UIAxisMask lhs, UIAxisMask rhs) noexcept {
    return static_cast<UIAxisMask>(static_cast<uint8_t>(lhs) | static_cast<uint8_t>(rhs));
}

constexpr UIAxisMask operator&(UIAxisMask lhs, UIAxisMask rhs) noexcept {
    return static_cast<UIAxisMask>(static_cast<uint8_t>(lhs) & static_cast<uint8_t>(rhs));
}

constexpr UIAxisMask ToMask(UIAxis axis) noexcept {
    return axis == UIAxis::Horizontal ? UIAxisMask::Horizontal : UIAxisMask::Vertical;
}

constexpr bool HasAxis(UIAxisMask mask, UIAxis axis) noexcept {
    return (mask & ToMask(axis)) != UIAxisMask::None;
}

/**
 * @brief 3x3 锚点对齐，用于在单元格/矩形内放置子元素
 */
enum class UIAlignment : uint8_t {
    UpperLeft,
    UpperCenter,
    UpperRight,
    MiddleLeft,
    MiddleCenter,
    MiddleRight,
    LowerLeft,
    LowerCenter,
    LowerRight
};

/**
 * @brief 对齐在水平方向上的锚点比例 {0, 0.5, 1}
 */
constexpr float GetHorizontalAnchor(UIAlignment alignment) noexcept {
    switch (alignment) {
        case UIAlignment::UpperCenter:
        case UIAlignment::MiddleCenter:
        case UIAlignment::LowerCenter:
            return 0.5f;
        case UIAlignment::UpperRight:
        case UIAlignment::MiddleRight:
        case UIAlignment::LowerRight:
            return 1.0f;
        default:
            return 0.0f;
    }
}

/**
 * @brief 对齐在垂直方向上的锚点比例 {0, 0.5, 1}
 */
constexpr float GetVerticalAnchor(UIAlignment alignment) noexcept {
    switch (alignment) {
        case UIAlignment::MiddleLeft:
        case UIAlignment::MiddleCenter:
        case UIAlignment::MiddleRight:
            return 0.5f;
        case UIAlignment::LowerLeft:
        case UIAlignment::LowerCenter:
        case UIAlignment::LowerRight:
            return 1.0f;
        default:
            return 0.0f;
    }
}

constexpr float GetAnchor(UIAlignment alignment, UIAxis axis) noexcept {
    return axis == UIAxis::Horizontal ? GetHorizontalAnchor(alignment) : GetVerticalAnchor(alignment);
}

/**
 * @brief 元素种类标签
 */
enum class UIElementType : uint8_t {
    Element,
    Stack,
    Row,
    Grid,
    FillGrid,
    Canvas,
    ScrollCanvas,
    ScrollContainer,
    Button,
    Checkbox,
    RadioButton,
    Slider,
    Dropdown,
    TextEntry,
    NumericField,
    IntSlider,
    RangeSlider,
    ImageButton,
    ColorPicker,
    Label,
    Line,
    Empty
};

const char* ToString(UIElementType type) noexcept;
const char* ToString(SizeMode mode) noexcept;
const char* ToString(UIAxis axis) noexcept;

/**
 * @brief 闭区间 [lower, upper]，用于范围滑块
 */
template <typename T>
struct UIValueRange {
    T lower{};
    T upper{};

    [[nodiscard]] constexpr T Span() const noexcept { return upper - lower; }
    [[nodiscard]] constexpr bool IsValid() const noexcept { return lower <= upper; }

    bool operator==(const UIValueRange& other) const = default;
};

enum class UIDirtyFlag : uint32_t {
    None = 0,
    Layout = 1u << 0,
    Visual = 1u << 1,
    Children = 1u << 2,
    All = 0xFFFFFFFFu
};

constexpr UIDirtyFlag operator|(UIDirtyFlag lhs, UIDirtyFlag rhs) noexcept {
    return static_cast<UIDirtyFlag>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

constexpr UIDirtyFlag operator&(UIDirtyFlag lhs, UIDirtyFlag rhs) noexcept {
    return static_cast<UIDirtyFlag>(static_cast<uint32_t>(lhs) & static_cast<uint32_t>(rhs));
}

constexpr UIDirtyFlag operator~(UIDirtyFlag flags) noexcept {
    return static_cast<UIDirtyFlag>(~static_cast<uint32_t>(flags));
}

constexpr UIDirtyFlag& operator|=(UIDirtyFlag& lhs, UIDirtyFlag rhs) noexcept {
    lhs = lhs | rhs;
    return lhs;
}

constexpr UIDirtyFlag& operator&=(UIDirtyFlag& lhs, UIDirtyFlag rhs) noexcept {
    lhs = lhs & rhs;
    return lhs;
}

} // namespace Lattice::UI
