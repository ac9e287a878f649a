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
#include "lattice/ui/widgets/ui_slider.h"

#include <algorithm>
#include <cmath>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

namespace {

constexpr float kValueEpsilon = 1e-5f;

} // namespace

UISlider::UISlider(UISliderOptions slider)
    : m_label(std::move(slider.label))
    , m_value(slider.value ? std::move(slider.value) : MakeSharedValue<float>(slider.min))
    , m_min(slider.min)
    , m_max(slider.max)
    , m_roundTo(slider.roundTo) {
    if (m_min > m_max) {
        throw LATTICE_ERROR(ErrorCode::InvalidArgument,
                            "Slider '" + m_label + "' has min " + std::to_string(m_min) +
                            " greater than max " + std::to_string(m_max));
    }
    m_value->Set(Normalize(m_value->Get()));
}

UIElementPtr UISlider::Create(UISliderOptions slider, UIElementOptions options) {
    return UIElement::CreateWithKind<UISlider>(std::move(options), std::move(slider));
}

Size UISlider::Measure(const UIElement& /*self*/) const {
    return MeasureLabelAbove(m_label, GetLayoutConfig().widgets.sliderSize);
}

float UISlider::Normalize(float value) const {
    float result = std::clamp(value, m_min, m_max);
    if (m_roundTo > 0.0f) {
        result = std::clamp(std::round(result / m_roundTo) * m_roundTo, m_min, m_max);
    }
    return result;
}

void UISlider::Paint(const UIElement& self, UIPainter& painter) {
    const Rect sliderRect = PaintLabelAbove(self.GetRect(), m_label, UIAlignment::UpperCenter, painter);
    const float before = m_value->Get();
    const float after = Normalize(painter.DrawSlider(sliderRect, before, m_min, m_max));

    m_changed = std::fabs(after - before) > kValueEpsilon;
    m_value->Set(after);

    PaintTooltip(self, painter);
}

void UISlider::SetValue(float value) {
    m_value->Set(Normalize(value));
}

void UISlider::SetLabel(std::string label) {
    if (m_label == label) {
        return;
    }
    m_label = std::move(label);
    InvalidateOwnerSize();
}

} // namespace Lattice::UI
