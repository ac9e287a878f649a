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
#include "lattice/ui/widgets/ui_text_entry.h"

#include <algorithm>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

UITextEntry::UITextEntry(UITextEntryOptions entry)
    : m_label(std::move(entry.label))
    , m_text(std::move(entry.text))
    , m_lineCount(std::max(1, entry.lineCount))
    , m_maxLength(entry.maxLength) {
    if (!m_text) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "TextEntry '" + m_label + "' requires a text cell");
    }
}

UIElementPtr UITextEntry::Create(UITextEntryOptions entry, UIElementOptions options) {
    return UIElement::CreateWithKind<UITextEntry>(std::move(options), std::move(entry));
}

Size UITextEntry::Measure(const UIElement& /*self*/) const {
    const float fieldHeight = GetTextMetrics().GetLineHeight() * static_cast<float>(m_lineCount);
    return MeasureLabelAbove(m_label, Size(GetLayoutConfig().widgets.textEntryWidth, fieldHeight));
}

void UITextEntry::Paint(const UIElement& self, UIPainter& painter) {
    const Rect fieldRect = PaintLabelAbove(self.GetRect(), m_label, UIAlignment::UpperLeft, painter);
    std::string edited = painter.DrawTextField(fieldRect, m_text->Get(), IsMultiLine());
    if (m_maxLength) {
        edited.resize(TruncateCodePoints(edited, *m_maxLength).size());
    }

    m_changed = edited != m_text->Get();
    if (m_changed) {
        m_text->Set(std::move(edited));
    }

    PaintTooltip(self, painter);
}

void UITextEntry::SetLabel(std::string label) {
    if (m_label == label) {
        return;
    }
    m_label = std::move(label);
    InvalidateOwnerSize();
}

void UITextEntry::SetLineCount(int lineCount) {
    lineCount = std::max(1, lineCount);
    if (m_lineCount == lineCount) {
        return;
    }
    m_lineCount = lineCount;
    InvalidateOwnerSize(UIAxisMask::Vertical);
}

} // namespace Lattice::UI
