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
#include "lattice/ui/widgets/ui_dropdown.h"

#include <algorithm>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

UIDropdown::UIDropdown(std::vector<std::string> items, UISharedValuePtr<int> selected, std::string placeholder)
    : m_items(std::move(items))
    , m_selected(std::move(selected))
    , m_placeholder(std::move(placeholder)) {
    if (!m_selected) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "Dropdown requires a selected index cell");
    }
}

UIElementPtr UIDropdown::Create(std::vector<std::string> items, UISharedValuePtr<int> selected,
                                std::string placeholder, UIElementOptions options) {
    return UIElement::CreateWithKind<UIDropdown>(std::move(options), std::move(items), std::move(selected),
                                                 std::move(placeholder));
}

Size UIDropdown::Measure(const UIElement& /*self*/) const {
    const UIWidgetMetrics& metrics = GetLayoutConfig().widgets;
    const UITextMetrics& text = GetTextMetrics();

    float width = metrics.dropdownWidth;
    for (const auto& item : m_items) {
        width = std::max(width, text.MeasureWidth(item) + metrics.dropdownArrowAllowance);
    }
    if (!m_placeholder.empty()) {
        width = std::max(width, text.MeasureWidth(m_placeholder) + metrics.dropdownArrowAllowance);
    }
    return Size(width, metrics.dropdownHeight);
}

bool UIDropdown::HasSelection() const noexcept {
    const int index = m_selected->Get();
    return index >= 0 && index < static_cast<int>(m_items.size());
}

const std::string& UIDropdown::GetDisplayText() const noexcept {
    return HasSelection() ? m_items[static_cast<size_t>(m_selected->Get())] : m_placeholder;
}

void UIDropdown::Paint(const UIElement& self, UIPainter& painter) {
    const int chosen = painter.DrawDropdown(self.GetRect(), GetDisplayText(), m_items);

    m_changed = chosen >= 0 && chosen < static_cast<int>(m_items.size()) && chosen != m_selected->Get();
    if (m_changed) {
        m_selected->Set(chosen);
    }

    PaintTooltip(self, painter);
}

void UIDropdown::SetItems(std::vector<std::string> items) {
    m_items = std::move(items);
    InvalidateOwnerSize(UIAxisMask::Horizontal);
}

void UIDropdown::SetPlaceholder(std::string placeholder) {
    if (m_placeholder == placeholder) {
        return;
    }
    m_placeholder = std::move(placeholder);
    InvalidateOwnerSize(UIAxisMask::Horizontal);
}

} // namespace Lattice::UI
