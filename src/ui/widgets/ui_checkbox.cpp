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
#include "lattice/ui/widgets/ui_checkbox.h"

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

UICheckbox::UICheckbox(std::string label, UISharedValuePtr<bool> checked)
    : m_label(std::move(label))
    , m_checked(std::move(checked)) {
    if (!m_checked) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "Checkbox '" + m_label + "' requires a checked state cell");
    }
}

UIElementPtr UICheckbox::Create(std::string label, UISharedValuePtr<bool> checked, UIElementOptions options) {
    return UIElement::CreateWithKind<UICheckbox>(std::move(options), std::move(label), std::move(checked));
}

Size UICheckbox::Measure(const UIElement& /*self*/) const {
    const UIWidgetMetrics& metrics = GetLayoutConfig().widgets;
    if (m_label.empty()) {
        return Size(metrics.checkboxSize, metrics.checkboxSize);
    }
    const float textWidth = GetTextMetrics().MeasureWidth(m_label);
    return Size(metrics.checkboxSize + metrics.checkboxLabelGap + textWidth, metrics.checkboxSize);
}

void UICheckbox::Paint(const UIElement& self, UIPainter& painter) {
    const bool before = m_checked->Get();
    const bool after = painter.DrawCheckbox(self.GetRect(), m_label, before);
    m_changed = after != before;
    if (m_changed) {
        m_checked->Set(after);
    }
    PaintTooltip(self, painter);
}

void UICheckbox::SetLabel(std::string label) {
    if (m_label == label) {
        return;
    }
    m_label = std::move(label);
    InvalidateOwnerSize();
}

} // namespace Lattice::UI
