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
#include "lattice/ui/widgets/ui_color_picker.h"

#include <algorithm>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

UIColorPicker::UIColorPicker(UIColorPickerOptions picker)
    : m_text(std::move(picker.text))
    , m_color(std::move(picker.color))
    , m_mode(picker.mode)
    , m_palette(std::move(picker.palette))
    , m_showSwatch(picker.showSwatch) {
    if (!m_color) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "ColorPicker '" + m_text + "' requires a color cell");
    }
}

UIElementPtr UIColorPicker::Create(UIColorPickerOptions picker, UIElementOptions options) {
    return UIElement::CreateWithKind<UIColorPicker>(std::move(options), std::move(picker));
}

const std::vector<Color>& UIColorPicker::GetDefaultPalette() {
    static const std::vector<Color> palette = {
        Color(0.0f, 0.0f, 0.0f),  Color(0.25f, 0.25f, 0.25f), Color(0.5f, 0.5f, 0.5f),  Color(0.75f, 0.75f, 0.75f),
        Color(1.0f, 1.0f, 1.0f),  Color(1.0f, 0.0f, 0.0f),    Color(1.0f, 0.5f, 0.0f),  Color(1.0f, 1.0f, 0.0f),
        Color(0.5f, 1.0f, 0.0f),  Color(0.0f, 1.0f, 0.0f),    Color(0.0f, 1.0f, 1.0f),  Color(0.0f, 0.5f, 1.0f),
        Color(0.0f, 0.0f, 1.0f),  Color(0.5f, 0.0f, 1.0f),    Color(1.0f, 0.0f, 1.0f),  Color(1.0f, 0.0f, 0.5f),
    };
    return palette;
}

const std::vector<Color>& UIColorPicker::GetPalette() const noexcept {
    return m_palette.empty() ? GetDefaultPalette() : m_palette;
}

float UIColorPicker::GetSwatchSize() const {
    return m_swatchSize.value_or(GetLayoutConfig().widgets.colorSwatchSize);
}

void UIColorPicker::SetSwatchSize(float size) {
    const float clamped = std::max(size, GetLayoutConfig().widgets.colorSwatchMinSize);
    if (m_swatchSize == clamped) {
        return;
    }
    m_swatchSize = clamped;
    if (m_showSwatch) {
        InvalidateOwnerSize();
    }
}

void UIColorPicker::SetShowSwatch(bool show) {
    if (m_showSwatch == show) {
        return;
    }
    m_showSwatch = show;
    InvalidateOwnerSize();
}

void UIColorPicker::SetText(std::string text) {
    if (m_text == text) {
        return;
    }
    m_text = std::move(text);
    InvalidateOwnerSize();
}

Size UIColorPicker::Measure(const UIElement& /*self*/) const {
    const UIWidgetMetrics& metrics = GetLayoutConfig().widgets;
    const Size text = GetTextMetrics().MeasureText(m_text);

    Size size(text.width + metrics.buttonPaddingX,
              std::max(text.height + metrics.buttonPaddingY, metrics.buttonMinHeight));
    if (m_showSwatch) {
        const float swatch = GetSwatchSize();
        size.width += swatch + metrics.colorSwatchGap;
        size.height = std::max(size.height, swatch + metrics.buttonPaddingY);
    }
    return size;
}

void UIColorPicker::Paint(const UIElement& self, UIPainter& painter) {
    const Rect rect = self.GetRect();
    const bool pressed = painter.DrawButton(rect, "", true);

    Rect textRect = rect;
    if (m_showSwatch) {
        const float swatch = GetSwatchSize();
        const float gap = GetLayoutConfig().widgets.colorSwatchGap;
        painter.FillRect(Rect(rect.x + gap, rect.y + (rect.height - swatch) * 0.5f, swatch, swatch), m_color->Get());
        textRect.x += swatch + gap * 2.0f;
        textRect.width = std::max(0.0f, textRect.width - (swatch + gap * 2.0f));
    }
    if (!m_text.empty()) {
        painter.DrawLabel(textRect, m_text, false, UIAlignment::MiddleCenter);
    }

    if (pressed) {
        painter.OpenColorPicker(m_color, m_mode, GetPalette());
    }

    PaintTooltip(self, painter);
}

} // namespace Lattice::UI
