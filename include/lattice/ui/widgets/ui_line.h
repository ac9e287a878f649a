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

#include "lattice/types.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

enum class UILineOrientation : uint8_t {
    Horizontal,
    Vertical
};

/**
 * @brief 分隔线
 *
 * 水平线 100 x 粗细，垂直线 粗细 x 100；粗细至少 0.1。
 * 线在自身矩形内的位置由元素对齐方式决定（水平线取垂直锚点，垂直线取水平锚点）。
 */
class UILine final : public UIWidgetKind {
public:
    UILine(UILineOrientation orientation, float thickness, const Color& color);

    static UIElementPtr Create(UILineOrientation orientation, float thickness = 1.0f,
                               const Color& color = Color::White(), UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Line; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] UILineOrientation GetOrientation() const noexcept { return m_orientation; }

    [[nodiscard]] float GetThickness() const noexcept { return m_thickness; }
    void SetThickness(float thickness);

    [[nodiscard]] const Color& GetColor() const noexcept { return m_color; }
    void SetColor(const Color& color) { m_color = color; }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    [[nodiscard]] static float ClampThickness(float thickness);

    UILineOrientation m_orientation;
    float m_thickness;
    Color m_color;
};

} // namespace Lattice::UI
