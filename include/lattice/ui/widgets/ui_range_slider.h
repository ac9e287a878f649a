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
#pragma once

#include <type_traits>

#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

template <typename T>
struct UIRangeSliderOptions {
    UISharedValuePtr<UIValueRange<T>> range;    // 必需
    T min{};
    T max{};
    T gap{};                                    // 两个手柄之间的最小距离
    float roundTo = -1.0f;                      // 仅浮点：> 0 时取整到该值的倍数
};

/**
 * @brief 双手柄范围滑块
 *
 * 区间始终满足 min <= lower、upper <= max 且 upper - lower >= gap。
 * 尺寸：200 x 31。
 */
template <typename T>
class UIRangeSlider final : public UIWidgetKind {
    static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, "UIRangeSlider requires a numeric type");

public:
    explicit UIRangeSlider(UIRangeSliderOptions<T> slider);

    /**
     * @throws LatticeError NullPointer range 为空
     * @throws LatticeError InvalidArgument min > max、gap < 0 或 gap 超过 max - min
     */
    static UIElementPtr Create(UIRangeSliderOptions<T> slider, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::RangeSlider; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const UIValueRange<T>& GetRange() const noexcept { return m_range->Get(); }
    [[nodiscard]] T GetLower() const noexcept { return GetRange().lower; }
    [[nodiscard]] T GetUpper() const noexcept { return GetRange().upper; }

    /// 夹紧到 [min, upper - gap]
    void SetLower(T value);
    /// 夹紧到 [lower + gap, max]
    void SetUpper(T value);

    /**
     * @brief 同时设置两端
     *
     * 两端先各自夹紧到 [min, max]；间距不足 gap 时围绕中点展开到 gap，
     * gap 为 0 且 lower > upper 时 lower 取 upper。
     */
    void SetValues(T lower, T upper);
    void SetToFullRange() { SetValues(m_min, m_max); }
    /// 两端都设为同一个值（忽略 gap）
    void SetToSingleValue(T value);

    [[nodiscard]] T GetMin() const noexcept { return m_min; }
    [[nodiscard]] T GetMax() const noexcept { return m_max; }
    [[nodiscard]] T GetGap() const noexcept { return m_gap; }
    [[nodiscard]] T GetTotalSpan() const noexcept { return m_max - m_min; }

    [[nodiscard]] bool HasChanged() const noexcept { return m_changed; }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    [[nodiscard]] T Clamp(T value) const;
    [[nodiscard]] T FromPainter(float value) const;

    UISharedValuePtr<UIValueRange<T>> m_range;
    T m_min;
    T m_max;
    T m_gap;
    float m_roundTo;
    bool m_changed = false;
};

using UIIntRangeSlider = UIRangeSlider<int>;
using UIFloatRangeSlider = UIRangeSlider<float>;

extern template class UIRangeSlider<int>;
extern template class UIRangeSlider<float>;

} // namespace Lattice::UI
