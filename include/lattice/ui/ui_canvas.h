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

namespace Lattice::UI {

/**
 * @brief 根适配器：把宿主提供的矩形绑定到元素树
 *
 * 两个轴恒为 Fixed，位置与尺寸来自绑定矩形；子元素按基础纵向行布局排列。
 */
class UICanvas final : public UIElementKind {
public:
    explicit UICanvas(const Rect& rect);

    static UIElementPtr Create(const Rect& rect, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Canvas; }
    [[nodiscard]] bool AcceptsSizeMode(UIAxis axis, SizeMode mode) const noexcept override;

    void Paint(const UIElement& self, UIPainter& painter) override;
    void OnAttached(UIElement& self) override;

    [[nodiscard]] Rect GetRect() const;

    /**
     * @brief 替换绑定矩形，尺寸变化时 Fill 子孙随之重新推导
     */
    void UpdateRect(const Rect& rect);

    [[nodiscard]] bool GetDrawFrame() const noexcept { return m_drawFrame; }
    void SetDrawFrame(bool drawFrame);

private:
    Rect m_initialRect;
    bool m_drawFrame = false;
};

} // namespace Lattice::UI
