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

#include "lattice/ui/ui_element.h"
#include "lattice/ui/ui_element_kind.h"

namespace Lattice::UI {

/**
 * @brief 一维打包容器（Stack / Row 的共同实现）
 *
 * 子元素沿打包轴依次排列，每个前进自身尺寸加间距；交叉轴坐标保持为容器坐标。
 * 固有尺寸：打包轴求和加 spacing x (n-1)，交叉轴取最大值；无子元素时为默认元素尺寸。
 */
class UILinearLayout : public UIElementKind {
public:
    UILinearLayout(UIAxis packAxis, float spacing);

    [[nodiscard]] SizeMode GetDefaultSizeMode(UIAxis axis) const noexcept override;
    [[nodiscard]] float ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const override;
    void Arrange(UIElement& self) override;

    [[nodiscard]] UIAxis GetPackAxis() const noexcept { return m_packAxis; }

    [[nodiscard]] float GetSpacing() const noexcept { return m_spacing; }
    void SetSpacing(float spacing);

private:
    UIAxis m_packAxis;
    float m_spacing;
};

} // namespace Lattice::UI
