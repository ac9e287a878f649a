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

#include <optional>

#include "lattice/types.h"
#include "lattice/ui/ui_element.h"
#include "lattice/ui/ui_element_kind.h"
#include "lattice/ui/ui_shared_value.h"

namespace Lattice::UI {

struct UIScrollContainerOptions {
    float padding = 0.0f;
    std::optional<float> spacing;               // 未给出时使用布局配置
    UISharedValuePtr<Vector2> scrollPosition;   // 为空时内部创建
    bool showScrollbars = true;
};

/**
 * @brief 纵向排列子元素的滚动容器，默认 Content/Content
 *
 * 子元素在内容区 (x+p, y+p, max(1, w-2p), max(1, h-2p)) 内依次向下排列；
 * 内容边界为子元素包围盒并至少与内容区一样大。
 */
class UIScrollContainer final : public UIElementKind {
public:
    explicit UIScrollContainer(UIScrollContainerOptions scroll);

    static UIElementPtr Create(UIScrollContainerOptions scroll = {}, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::ScrollContainer; }
    [[nodiscard]] SizeMode GetDefaultSizeMode(UIAxis axis) const noexcept override;
    [[nodiscard]] float ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const override;
    [[nodiscard]] float ComputeFillExtent(const UIElement& self, const UIElement& child, UIAxis axis) const override;
    void Arrange(UIElement& self) override;
    void Paint(const UIElement& self, UIPainter& painter) override;
    void RenderChildren(UIElement& self, UIPainter& painter) override;

    [[nodiscard]] Rect GetContentArea() const;
    [[nodiscard]] Rect GetContentBounds() const;
    [[nodiscard]] bool ContentOverflows() const;

    [[nodiscard]] float GetPadding() const noexcept { return m_padding; }
    void SetPadding(float padding);
    [[nodiscard]] float GetSpacing() const noexcept { return m_spacing; }
    void SetSpacing(float spacing);

    [[nodiscard]] const Vector2& GetScrollPosition() const noexcept { return m_scrollPosition->Get(); }
    void SetScrollPosition(const Vector2& position) { m_scrollPosition->Set(position); }
    [[nodiscard]] const UISharedValuePtr<Vector2>& GetScrollCell() const noexcept { return m_scrollPosition; }

    [[nodiscard]] bool GetShowScrollbars() const noexcept { return m_showScrollbars; }
    void SetShowScrollbars(bool show);

private:
    [[nodiscard]] static Rect ComputeContentArea(const UIElement& self, float padding);
    [[nodiscard]] Rect ComputeContentBounds(const UIElement& self) const;

    float m_padding;
    float m_spacing;
    UISharedValuePtr<Vector2> m_scrollPosition;
    bool m_showScrollbars;
};

} // namespace Lattice::UI
