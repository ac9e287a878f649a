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
#include "lattice/ui/widgets/ui_range_slider.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

template <typename T>
UIRangeSlider<T>::UIRangeSlider(UIRangeSliderOptions<T> slider)
    : m_range(std::move(slider.range))
    , m_min(slider.min)
    , m_max(slider.max)
    , m_gap(slider.gap)
    , m_roundTo(slider.roundTo) {
    if (!m_range) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "RangeSlider requires a range cell");
    }
    if (m_min > m_max || m_gap < T{} || m_gap > m_max - m_min) {
        throw LATTICE_ERROR(ErrorCode::InvalidArgument,
                            "RangeSlider bounds [" + std::to_string(m_min) + ", " + std::to_string(m_max) +
                            "] cannot hold gap " + std::to_string(m_gap));
    }
    SetValues(GetLower(), GetUpper());
}

template <typename T>
UIElementPtr UIRangeSlider<T>::Create(UIRangeSliderOptions<T> slider, UIElementOptions options) {
    return UIElement::CreateWithKind<UIRangeSlider<T>>(std::move(options), std::move(slider));
}

template <typename T>
Size UIRangeSlider<T>::Measure(const UIElement& /*self*/) const {
    return GetLayoutConfig().widgets.rangeSliderSize;
}

template <typename T>
void UIRangeSlider<T>::Paint(const UIElement& self, UIPainter& painter) {
    const UIValueRange<T> before = GetRange();
    const UIValueRange<float> dragged = painter.DrawRangeSlider(
        self.GetRect(),
        UIValueRange<float>{static_cast<float>(before.lower), static_cast<float>(before.upper)},
        static_cast<float>(m_min), static_cast<float>(m_max));

    SetValues(FromPainter(dragged.lower), FromPainter(dragged.upper));

    m_changed = GetRange() != before;
    PaintTooltip(self, painter);
}

template <typename T>
T UIRangeSlider<T>::Clamp(T value) const {
    return std::clamp(value, m_min, m_max);
}

template <typename T>
T UIRangeSlider<T>::FromPainter(float value) const {
    if constexpr (std::is_integral_v<T>) {
        return static_cast<T>(std::lround(value));
    } else {
        T result = static_cast<T>(value);
        if (m_roundTo > 0.0f) {
            result = static_cast<T>(std::round(value / m_roundTo) * m_roundTo);
        }
        return result;
    }
}

template <typename T>
void UIRangeSlider<T>::SetLower(T value) {
    UIValueRange<T> range = GetRange();
    range.lower = std::min(Clamp(value), range.upper - m_gap);
    m_range->Set(range);
}

template <typename T>
void UIRangeSlider<T>::SetUpper(T value) {
    UIValueRange<T> range = GetRange();
    range.upper = std::max(Clamp(value), range.lower + m_gap);
    m_range->Set(range);
}

template <typename T>
void UIRangeSlider<T>::SetValues(T lower, T upper) {
    lower = Clamp(lower);
    upper = Clamp(upper);

    if (m_gap == T{}) {
        if (lower > upper) {
            lower = upper;
        }
    } else if (upper - lower < m_gap) {
        // 围绕中点展开到 gap，再整体推回边界之内
        const T mid = static_cast<T>((lower + upper) / 2);
        lower = std::clamp(static_cast<T>(mid - m_gap / 2), m_min, static_cast<T>(m_max - m_gap));
        upper = lower + m_gap;
    }

    m_range->Set(UIValueRange<T>{lower, upper});
}

template <typename T>
void UIRangeSlider<T>::SetToSingleValue(T value) {
    const T clamped = Clamp(value);
    m_range->Set(UIValueRange<T>{clamped, clamped});
}

template class UIRangeSlider<int>;
template class UIRangeSlider<float>;

} // namespace Lattice::UI
