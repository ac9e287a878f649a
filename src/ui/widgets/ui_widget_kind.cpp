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
#include "lattice/ui/widgets/ui_widget_kind.h"

#include <algorithm>

#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

SizeMode UIWidgetKind::GetDefaultSizeMode(UIAxis /*axis*/) const noexcept {
    return SizeMode::Content;
}

float UIWidgetKind::ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const {
    const Size size = Measure(self);
    return axis == UIAxis::Horizontal ? size.width : size.height;
}

void UIWidgetKind::PaintTooltip(const UIElement& self, UIPainter& painter) const {
    if (!m_tooltip.empty()) {
        painter.ShowTooltip(self.GetRect(), m_tooltip);
    }
}

const UITextMetrics& UIWidgetKind::GetTextMetrics() {
    return UITextMetrics::GetDefault();
}

Size UIWidgetKind::MeasureLabelAbove(std::string_view label, const Size& control) {
    if (label.empty()) {
        return control;
    }
    const UITextMetrics& text = GetTextMetrics();
    return Size(std::max(control.width, text.MeasureWidth(label)), text.GetLineHeight() + control.height);
}

Rect UIWidgetKind::PaintLabelAbove(const Rect& rect, std::string_view label, UIAlignment anchor, UIPainter& painter) {
    if (label.empty()) {
        return rect;
    }
    const float labelHeight = GetTextMetrics().GetLineHeight();
    painter.DrawLabel(Rect(rect.x, rect.y, rect.width, labelHeight), label, false, anchor);
    return Rect(rect.x, rect.y + labelHeight, rect.width, rect.height - labelHeight);
}

} // namespace Lattice::UI
