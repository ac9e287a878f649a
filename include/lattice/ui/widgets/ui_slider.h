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

struct UISliderOptions {
    std::string label;
    UISharedValuePtr<float> value;   // 为空时内部创建
    float min = 0.0f;
    float max = 100.0f;
    float roundTo = -1.0f;           // > 0 时取整到该值的倍数
};

/**
 * @brief 水平滑块，标签在上方居中
 *
 * 尺寸：无标签 120x22；有标签 max(120, 文本宽) x (行高 + 22)。
 */
class UISlider final : public UIWidgetKind {
public:
    explicit UISlider(UISliderOptions slider);

    /**
     * @throws LatticeError InvalidArgument min > max
     */
    static UIElementPtr Create(UISliderOptions slider, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Slider; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetLabel() const noexcept { return m_label; }
    void SetLabel(std::string label);

    [[nodiscard]] float GetValue() const noexcept { return m_value->Get(); }
    /// 写入前夹紧并取整
    void SetValue(float value);

    [[nodiscard]] float GetMin() const noexcept { return m_min; }
    [[nodiscard]] float GetMax() const noexcept { return m_max; }
    [[nodiscard]] float GetRoundTo() const noexcept { return m_roundTo; }
    void SetRoundTo(float roundTo) { m_roundTo = roundTo; }

    [[nodiscard]] bool HasChanged() const noexcept { return m_changed; }

    /**
     * @brief 夹紧到 [min, max]，roundTo > 0 时取整到其倍数
     */
    [[nodiscard]] float Normalize(float value) const;

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::string m_label;
    UISharedValuePtr<float> m_value;
    float m_min;
    float m_max;
    float m_roundTo;
    bool m_changed = false;
};

} // namespace Lattice::UI
