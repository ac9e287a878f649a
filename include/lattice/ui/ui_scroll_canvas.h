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

#include "lattice/types.h"
#include "lattice/ui/ui_element.h"
#include "lattice/ui/ui_element_kind.h"
#include "lattice/ui/ui_shared_value.h"

namespace Lattice::UI {

struct UIScrollCanvasOptions {
    UISharedValuePtr<Vector2> scrollPosition;   // 为空时内部创建
    bool showScrollbars = true;
    float padding = 0.0f;
};

/**
 * @brief 可滚动的根画布
 *
 * 子元素使用绝对坐标，画布不重新排列它们。渲染时先绘制外框，
 * 再在内缩 padding 的滚动矩形内以全部子元素的包围盒为内容区开启滚动视图。
 */
class UIScrollCanvas final : public UIElementKind {
public:
    UIScrollCanvas(const Rect& rect, UIScrollCanvasOptions scroll);

    static UIElementPtr Create(const Rect& rect, UIScrollCanvasOptions scroll = {}, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::ScrollCanvas; }
    [[nodiscard]] bool AcceptsSizeMode(UIAxis axis, SizeMode mode) const noexcept override;

    /**
     * @brief Fill 子元素得到 max(1, 尺寸 - 2p - 滚动条)，滚动条只在显示时扣除
     */
    [[nodiscard]] float ComputeFillExtent(const UIElement& self, const UIElement& child, UIAxis axis) const override;

    void Arrange(UIElement& self) override;
    void Paint(const UIElement& self, UIPainter& painter) override;
    void RenderChildren(UIElement& self, UIPainter& painter) override;
    void OnAttached(UIElement& self) override;

    [[nodiscard]] Rect GetRect() const;
    void UpdateRect(const Rect& rect);

    /// 外框按 padding 内缩，宽高至少为 1
    [[nodiscard]] Rect CalculateScrollRect() const;

    /**
     * @brief 可滚动内容区域
     *
     * 无子元素时为画布矩形；否则为子元素包围盒。只有当包围盒完全落在画布内
     * 且某一维小于画布时，才扩展到画布原点与尺寸。
     */
    [[nodiscard]] Rect CalculateViewRect() const;

    [[nodiscard]] const Vector2& GetScrollPosition() const noexcept { return m_scrollPosition->Get(); }
    void SetScrollPosition(const Vector2& position) { m_scrollPosition->Set(position); }
    [[nodiscard]] const UISharedValuePtr<Vector2>& GetScrollCell() const noexcept { return m_scrollPosition; }

    [[nodiscard]] bool GetShowScrollbars() const noexcept { return m_showScrollbars; }
    void SetShowScrollbars(bool show);

    [[nodiscard]] float GetPadding() const noexcept { return m_padding; }
    void SetPadding(float padding);

private:
    void NotifyViewportChanged();

    Rect m_initialRect;
    UISharedValuePtr<Vector2> m_scrollPosition;
    bool m_showScrollbars;
    float m_padding;
};

} // namespace Lattice::UI
