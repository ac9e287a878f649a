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
#include "lattice/ui/widgets/ui_numeric_field.h"

#include <algorithm>
#include <array>
#include <charconv>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_text_metrics.h"

namespace Lattice::UI {

namespace {

std::string_view Trim(std::string_view text) {
    const size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    const size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

} // namespace

template <typename T>
UINumericField<T>::UINumericField(UINumericFieldOptions<T> field)
    : m_label(std::move(field.label))
    , m_value(field.value ? std::move(field.value) : MakeSharedValue<T>(field.min.value_or(kDefaultMin)))
    , m_min(field.min.value_or(kDefaultMin))
    , m_max(field.max.value_or(kDefaultMax))
    , m_placement(field.placement) {
    if (m_min > m_max) {
        throw LATTICE_ERROR(ErrorCode::InvalidArgument,
                            "NumericField '" + m_label + "' has min " + Format(m_min) +
                            " greater than max " + Format(m_max));
    }
    m_value->Set(std::clamp(m_value->Get(), m_min, m_max));
    SyncBuffer();
}

template <typename T>
UIElementPtr UINumericField<T>::Create(UINumericFieldOptions<T> field, UIElementOptions options) {
    return UIElement::CreateWithKind<UINumericField<T>>(std::move(options), std::move(field));
}

template <typename T>
Size UINumericField<T>::Measure(const UIElement& /*self*/) const {
    const UITextMetrics& text = GetTextMetrics();
    const UIWidgetMetrics& metrics = GetLayoutConfig().widgets;
    const Size field(metrics.numericFieldWidth, text.GetLineHeight());

    if (m_placement == UINumericLabelPlacement::Above || m_label.empty()) {
        return MeasureLabelAbove(m_label, field);
    }
    return Size(text.MeasureWidth(m_label) + metrics.labeledControlSpacing + field.width, field.height);
}

template <typename T>
void UINumericField<T>::Paint(const UIElement& self, UIPainter& painter) {
    const Rect rect = self.GetRect();

    Rect fieldRect = rect;
    if (m_placement == UINumericLabelPlacement::Above) {
        fieldRect = PaintLabelAbove(rect, m_label, UIAlignment::UpperLeft, painter);
    } else if (!m_label.empty()) {
        const float labelWidth = GetTextMetrics().MeasureWidth(m_label);
        const float offset = labelWidth + GetLayoutConfig().widgets.labeledControlSpacing;
        painter.DrawLabel(Rect(rect.x, rect.y, labelWidth, rect.height), m_label, false, UIAlignment::UpperLeft);
        fieldRect = Rect(rect.x + offset, rect.y, std::max(0.0f, rect.width - offset), rect.height);
    }

    SyncBuffer();
    const T before = m_value->Get();

    std::string edited = painter.DrawTextField(fieldRect, m_buffer, false);
    if (edited != m_buffer) {
        m_buffer = std::move(edited);
        if (const std::optional<T> parsed = Parse(m_buffer)) {
            const T clamped = std::clamp(*parsed, m_min, m_max);
            if (clamped != *parsed) {
                m_buffer = Format(clamped);
            }
            m_value->Set(clamped);
            m_bufferValue = clamped;
        }
    }

    m_changed = m_value->Get() != before;
    PaintTooltip(self, painter);
}

template <typename T>
void UINumericField<T>::SyncBuffer() {
    const T value = m_value->Get();
    if (!m_bufferValue || *m_bufferValue != value) {
        m_buffer = Format(value);
        m_bufferValue = value;
    }
}

template <typename T>
void UINumericField<T>::SetValue(T value) {
    m_value->Set(std::clamp(value, m_min, m_max));
}

template <typename T>
void UINumericField<T>::SetRange(T min, T max) {
    if (min > max) {
        throw LATTICE_ERROR(ErrorCode::InvalidArgument,
                            "NumericField '" + m_label + "' range [" + Format(min) + ", " + Format(max) + "] is inverted");
    }
    m_min = min;
    m_max = max;
    SetValue(m_value->Get());
}

template <typename T>
void UINumericField<T>::SetLabel(std::string label) {
    if (m_label == label) {
        return;
    }
    m_label = std::move(label);
    InvalidateOwnerSize();
}

template <typename T>
void UINumericField<T>::SetPlacement(UINumericLabelPlacement placement) {
    if (m_placement == placement) {
        return;
    }
    m_placement = placement;
    InvalidateOwnerSize();
}

template <typename T>
std::optional<T> UINumericField<T>::Parse(std::string_view text) {
    text = Trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    T value{};
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

template <typename T>
std::string UINumericField<T>::Format(T value) {
    std::array<char, 64> buffer{};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), ptr);
}

template class UINumericField<int>;
template class UINumericField<float>;
template class UINumericField<double>;

} // namespace Lattice::UI
