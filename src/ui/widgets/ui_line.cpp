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
#include "lattice/ui/widgets/ui_line.h"

#include <algorithm>

#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

UILine::UILine(UILineOrientation orientation, float thickness, const Color& color)
    : m_orientation(orientation)
    , m_thickness(ClampThickness(thickness))
    , m_color(color) {
}

UIElementPtr UILine::Create(UILineOrientation orientation, float thickness, const Color& color,
                            UIElementOptions options) {
    return UIElement::CreateWithKind<UILine>(std::move(options), orientation, thickness, color);
}

float UILine::ClampThickness(float thickness) {
    return std::max(GetLayoutConfig().widgets.lineMinThickness, thickness);
}

Size UILine::Measure(const UIElement& /*self*/) const {
    const float length = GetLayoutConfig().widgets.lineLength;
    return m_orientation == UILineOrientation::Horizontal ? Size(length, m_thickness) : Size(m_thickness, length);
}

void UILine::Paint(const UIElement& self, UIPainter& painter) {
    const Rect rect = self.GetRect();
    const float half = m_thickness * 0.5f;

    if (m_orientation == UILineOrientation::Horizontal) {
        // 锚点 0 / 0.5 / 1 分别对应 上 / 中 / 下，线宽不越出矩形
        const float anchor = GetVerticalAnchor(self.GetAlignment());
        const float y = rect.y + half + (rect.height - m_thickness) * anchor;
        painter.DrawLine(Vector2(rect.x, y), Vector2(rect.GetRight(), y), m_thickness, m_color);
    } else {
        const float anchor = GetHorizontalAnchor(self.GetAlignment());
        const float x = rect.x + half + (rect.width - m_thickness) * anchor;
        painter.DrawLine(Vector2(x, rect.y), Vector2(x, rect.GetBottom()), m_thickness, m_color);
    }

    PaintTooltip(self, painter);
}

void UILine::SetThickness(float thickness) {
    thickness = ClampThickness(thickness);
    if (m_thickness == thickness) {
        return;
    }
    m_thickness = thickness;
    InvalidateOwnerSize();
}

} // namespace Lattice::UI
