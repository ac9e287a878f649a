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
#include "lattice/ui/widgets/ui_label.h"

#include <algorithm>

#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

UILabel::UILabel(std::string text, bool wordWrap, std::optional<float> maxWidth)
    : m_text(std::move(text))
    , m_wordWrap(wordWrap)
    , m_maxWidth(maxWidth) {
}

UIElementPtr UILabel::Create(std::string text, bool wordWrap, std::optional<float> maxWidth,
                             UIElementOptions options) {
    return UIElement::CreateWithKind<UILabel>(std::move(options), std::move(text), wordWrap, maxWidth);
}

Size UILabel::Measure(const UIElement& self) const {
    const UITextMetrics& text = GetTextMetrics();
    if (m_text.empty()) {
        return Size(1.0f, text.GetLineHeight());
    }

    const float textWidth = text.MeasureWidth(m_text);
    if (!m_wordWrap) {
        return Size(textWidth, text.GetLineHeight());
    }

    const float width = m_maxWidth ? *m_maxWidth : std::min(textWidth, GetLayoutConfig().labelMaxWrapWidth);
    return Size(width, text.MeasureWrappedHeight(m_text, GetWrapWidth(self, width)));
}

float UILabel::GetWrapWidth(const UIElement& self, float intrinsicWidth) const {
    // 宽度由外部决定（Fixed / Fill）时按实际宽度换行；正在解析宽度时不能再读取
    if (m_maxWidth || self.GetWidthMode() == SizeMode::Content || self.IsResolving(UIAxis::Horizontal)) {
        return intrinsicWidth;
    }
    return self.GetWidth();
}

void UILabel::OnSizeInvalidated(UIElement& self, UIAxisMask axes) {
    UIWidgetKind::OnSizeInvalidated(self, axes);
    if (m_wordWrap && !m_maxWidth && HasAxis(axes, UIAxis::Horizontal) && self.GetWidthMode() != SizeMode::Content) {
        self.InvalidateSize(UIAxisMask::Vertical);
    }
}

void UILabel::Paint(const UIElement& self, UIPainter& painter) {
    painter.DrawLabel(self.GetRect(), m_text, m_wordWrap, self.GetAlignment());
    PaintTooltip(self, painter);
}

void UILabel::SetText(std::string text) {
    if (m_text == text) {
        return;
    }
    m_text = std::move(text);
    InvalidateOwnerSize();
}

void UILabel::SetWordWrap(bool wordWrap) {
    if (m_wordWrap == wordWrap) {
        return;
    }
    m_wordWrap = wordWrap;
    InvalidateOwnerSize();
}

void UILabel::SetMaxWidth(std::optional<float> maxWidth) {
    if (m_maxWidth == maxWidth) {
        return;
    }
    m_maxWidth = maxWidth;
    InvalidateOwnerSize();
}

} // namespace Lattice::UI
