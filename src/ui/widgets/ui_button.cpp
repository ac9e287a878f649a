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
#include "lattice/ui/widgets/ui_button.h"

#include <algorithm>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

UIButton::UIButton(std::string text, UISharedValuePtr<bool> clicked)
    : m_text(std::move(text))
    , m_clicked(std::move(clicked)) {
    if (!m_clicked) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "Button '" + m_text + "' requires a clicked state cell");
    }
}

UIElementPtr UIButton::Create(std::string text, UISharedValuePtr<bool> clicked, UIElementOptions options) {
    return UIElement::CreateWithKind<UIButton>(std::move(options), std::move(text), std::move(clicked));
}

Size UIButton::Measure(const UIElement& /*self*/) const {
    const UIWidgetMetrics& metrics = GetLayoutConfig().widgets;
    if (m_text.empty()) {
        return metrics.emptyButtonSize;
    }

    const Size text = GetTextMetrics().MeasureText(m_text);
    return Size(text.width + metrics.buttonPaddingX,
                std::max(text.height + metrics.buttonPaddingY, metrics.buttonMinHeight));
}

void UIButton::Paint(const UIElement& self, UIPainter& painter) {
    const bool pressed = painter.DrawButton(self.GetRect(), m_text, !m_disabled);

    if (pressed && !m_disabled) {
        m_clicked->Set(true);
        if (m_onClick) {
            m_onClick();
        }
    } else if (!pressed && m_clicked->Get()) {
        m_clicked->Set(false);
    }

    PaintTooltip(self, painter);
}

void UIButton::SetText(std::string text) {
    if (m_text == text) {
        return;
    }
    m_text = std::move(text);
    InvalidateOwnerSize();
}

void UIButton::SetDisabled(bool disabled) {
    if (m_disabled == disabled) {
        return;
    }
    m_disabled = disabled;
    if (UIElement* owner = GetOwner()) {
        owner->MarkDirty(UIDirtyFlag::Visual);
    }
}

} // namespace Lattice::UI
