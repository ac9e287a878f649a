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
#include "lattice/ui/widgets/ui_radio_button.h"

#include <algorithm>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

UIRadioButton::UIRadioButton(std::string label, UISharedValuePtr<int> selected, int index)
    : m_label(std::move(label))
    , m_selected(std::move(selected))
    , m_index(index) {
    if (!m_selected) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "RadioButton '" + m_label + "' requires a selection cell");
    }
}

UIElementPtr UIRadioButton::Create(std::string label, UISharedValuePtr<int> selected, int index,
                                   UIElementOptions options) {
    return UIElement::CreateWithKind<UIRadioButton>(std::move(options), std::move(label), std::move(selected), index);
}

Size UIRadioButton::Measure(const UIElement& /*self*/) const {
    const UIWidgetMetrics& metrics = GetLayoutConfig().widgets;
    const UITextMetrics& text = GetTextMetrics();
    return Size(metrics.checkboxSize + metrics.labeledControlSpacing + text.MeasureWidth(m_label),
                std::max(metrics.labeledControlMinHeight, text.GetLineHeight()));
}

void UIRadioButton::Paint(const UIElement& self, UIPainter& painter) {
    if (painter.DrawRadioButton(self.GetRect(), m_label, IsSelected())) {
        m_selected->Set(m_index);
    }
    PaintTooltip(self, painter);
}

void UIRadioButton::SetLabel(std::string label) {
    if (m_label == label) {
        return;
    }
    m_label = std::move(label);
    InvalidateOwnerSize();
}

} // namespace Lattice::UI
