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
#include "lattice/ui/widgets/ui_int_slider.h"

#include <algorithm>
#include <cmath>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

UIIntSlider::UIIntSlider(UIIntSliderOptions slider)
    : m_label(std::move(slider.label))
    , m_value(slider.value ? std::move(slider.value) : MakeSharedValue<int>(slider.min))
    , m_min(slider.min)
    , m_max(slider.max) {
    if (m_min > m_max) {
        throw LATTICE_ERROR(ErrorCode::InvalidArgument,
                            "IntSlider '" + m_label + "' has min " + std::to_string(m_min) +
                            " greater than max " + std::to_string(m_max));
    }
    SetValue(m_value->Get());
}

UIElementPtr UIIntSlider::Create(UIIntSliderOptions slider, UIElementOptions options) {
    return UIElement::CreateWithKind<UIIntSlider>(std::move(options), std::move(slider));
}

Size UIIntSlider::Measure(const UIElement& /*self*/) const {
    return MeasureLabelAbove(m_label, GetLayoutConfig().widgets.sliderSize);
}

void UIIntSlider::Paint(const UIElement& self, UIPainter& painter) {
    const Rect sliderRect = PaintLabelAbove(self.GetRect(), m_label, UIAlignment::UpperCenter, painter);

    const int before = m_value->Get();
    const float dragged = painter.DrawSlider(sliderRect, static_cast<float>(before),
                                             static_cast<float>(m_min), static_cast<float>(m_max));
    SetValue(static_cast<int>(std::lround(dragged)));

    m_changed = m_value->Get() != before;
    PaintTooltip(self, painter);
}

void UIIntSlider::SetValue(int value) {
    m_value->Set(std::clamp(value, m_min, m_max));
}

void UIIntSlider::SetRange(int min, int max) {
    if (min > max) {
        throw LATTICE_ERROR(ErrorCode::InvalidArgument,
                            "IntSlider '" + m_label + "' range [" + std::to_string(min) + ", " +
                            std::to_string(max) + "] is inverted");
    }
    m_min = min;
    m_max = max;
    SetValue(m_value->Get());
}

float UIIntSlider::GetPercentage() const noexcept {
    if (GetSpan() == 0) {
        return 0.0f;
    }
    return static_cast<float>(m_value->Get() - m_min) / static_cast<float>(GetSpan());
}

void UIIntSlider::SetToPercentage(float percentage) {
    const float clamped = std::clamp(percentage, 0.0f, 1.0f);
    SetValue(m_min + static_cast<int>(std::lround(static_cast<float>(GetSpan()) * clamped)));
}

void UIIntSlider::SetLabel(std::string label) {
    if (m_label == label) {
        return;
    }
    m_label = std::move(label);
    InvalidateOwnerSize();
}

} // namespace Lattice::UI
