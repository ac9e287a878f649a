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
#include <string_view>

#include "lattice/types.h"
#include "lattice/ui/ui_element.h"
#include "lattice/ui/ui_element_kind.h"

namespace Lattice::UI {

class UITextMetrics;

/**
 * @brief 叶子控件的公共部分
 *
 * 默认 Content/Content；固有尺寸由 Measure 一次给出两个轴。
 */
class UIWidgetKind : public UIElementKind {
public:
    [[nodiscard]] SizeMode GetDefaultSizeMode(UIAxis axis) const noexcept override;
    [[nodiscard]] float ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const final;

    [[nodiscard]] const std::string& GetTooltip() const noexcept { return m_tooltip; }
    void SetTooltip(std::string tooltip) { m_tooltip = std::move(tooltip); }

protected:
    [[nodiscard]] virtual Size Measure(const UIElement& self) const = 0;

    /// 提示文本非空时在控件矩形上注册提示
    void PaintTooltip(const UIElement& self, UIPainter& painter) const;

    [[nodiscard]] static const UITextMetrics& GetTextMetrics();

    /**
     * @brief 标签在上方的控件尺寸
     *
     * 无标签时为 control；否则 max(control.width, 标签宽) x (行高 + control.height)。
     */
    [[nodiscard]] static Size MeasureLabelAbove(std::string_view label, const Size& control);

    /**
     * @brief 在矩形顶部绘制一行标签
     * @return 标签下方留给控件的矩形；无标签时为整个矩形
     */
    static Rect PaintLabelAbove(const Rect& rect, std::string_view label, UIAlignment anchor, UIPainter& painter);

private:
    std::string m_tooltip;
};

} // namespace Lattice::UI
