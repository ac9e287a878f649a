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

#include <string>

#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

struct UIIntSliderOptions {
    std::string label;
    UISharedValuePtr<int> value;     // 为空时内部创建
    int min = 0;
    int max = 100;
};

/**
 * @brief 整数滑块，标签在上方居中
 *
 * 尺寸与 UISlider 相同：无标签 120x22；有标签 max(120, 文本宽) x (行高 + 22)。
 */
class UIIntSlider final : public UIWidgetKind {
public:
    explicit UIIntSlider(UIIntSliderOptions slider);

    /**
     * @throws LatticeError InvalidArgument min > max
     */
    static UIElementPtr Create(UIIntSliderOptions slider, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::IntSlider; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetLabel() const noexcept { return m_label; }
    void SetLabel(std::string label);

    [[nodiscard]] int GetValue() const noexcept { return m_value->Get(); }
    void SetValue(int value);

    [[nodiscard]] int GetMin() const noexcept { return m_min; }
    [[nodiscard]] int GetMax() const noexcept { return m_max; }

    /**
     * @brief 修改取值范围，当前值随之夹紧
     * @throws LatticeError InvalidArgument min > max
     */
    void SetRange(int min, int max);

    [[nodiscard]] int GetSpan() const noexcept { return m_max - m_min; }

    /// 当前值在范围内的比例，范围为空时为 0
    [[nodiscard]] float GetPercentage() const noexcept;
    /// 按比例（先夹紧到 [0, 1]）设置并四舍五入
    void SetToPercentage(float percentage);

    [[nodiscard]] bool HasChanged() const noexcept { return m_changed; }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::string m_label;
    UISharedValuePtr<int> m_value;
    int m_min;
    int m_max;
    bool m_changed = false;
};

} // namespace Lattice::UI
