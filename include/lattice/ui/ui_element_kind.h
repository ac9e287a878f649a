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
#include "lattice/ui/ui_types.h"

namespace Lattice::UI {

class UIElement;
class UIPainter;

/**
 * @brief 固有尺寸计算的重入保护
 *
 * 构造时置位，析构时复位；计算中抛出异常也会复位。
 */
class UIResolveGuard {
public:
    explicit UIResolveGuard(bool& flag) noexcept : m_flag(flag) { m_flag = true; }
    ~UIResolveGuard() { m_flag = false; }

    UIResolveGuard(const UIResolveGuard&) = delete;
    UIResolveGuard& operator=(const UIResolveGuard&) = delete;

private:
    bool& m_flag;
};

/**
 * @brief 元素种类接口
 *
 * UIElement 本身不被继承；容器与控件的差异全部放在种类对象里：
 * 固有尺寸、为 Fill 子元素提供的参考尺寸、子元素排列、绘制。
 * 默认实现即裸元素的行为（50x30，子元素纵向行布局）。
 */
class UIElementKind {
public:
    UIElementKind() = default;
    virtual ~UIElementKind() = default;

    UIElementKind(const UIElementKind&) = delete;
    UIElementKind& operator=(const UIElementKind&) = delete;

    [[nodiscard]] virtual UIElementType GetType() const noexcept { return UIElementType::Element; }

    /**
     * @brief 未在选项中指定模式时使用的默认尺寸模式
     */
    [[nodiscard]] virtual SizeMode GetDefaultSizeMode(UIAxis axis) const noexcept;

    /**
     * @brief 种类能否在某个轴上采用给定模式（Canvas 只接受 Fixed 等）
     */
    [[nodiscard]] virtual bool AcceptsSizeMode(UIAxis axis, SizeMode mode) const noexcept;

    /**
     * @brief 计算单轴固有尺寸
     *
     * 由尺寸引擎在循环保护之内调用，不负责缓存。
     */
    [[nodiscard]] virtual float ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const;

    [[nodiscard]] Size ComputeIntrinsicSize(const UIElement& self) const;

    /**
     * @brief Fill 子元素在该轴上得到的尺寸，默认为自身的解析尺寸
     */
    [[nodiscard]] virtual float ComputeFillExtent(const UIElement& self, const UIElement& child, UIAxis axis) const;

    /// 排列直接子元素（只写入位置）
    virtual void Arrange(UIElement& self);

    virtual void Paint(const UIElement& self, UIPainter& painter);

    virtual void RenderChildren(UIElement& self, UIPainter& painter);

    /**
     * @brief 自身或子元素尺寸失效时的回调，用于清除种类内部的派生缓存
     */
    virtual void OnSizeInvalidated(UIElement& self, UIAxisMask axes);

    /// 构造完成、绑定到元素之后调用
    virtual void OnAttached(UIElement& self);

protected:
    [[nodiscard]] UIElement* GetOwner() noexcept { return m_owner; }
    [[nodiscard]] const UIElement* GetOwner() const noexcept { return m_owner; }

    /// 内容（文本、条目、参数）变化后使所属元素尺寸失效
    void InvalidateOwnerSize(UIAxisMask axes = UIAxisMask::Both);
    void InvalidateOwnerLayout();

    /**
     * @brief 一维打包的固有尺寸
     * @param packAxis 子元素依次排列的轴；该轴上求和加间距，另一轴取最大值
     */
    [[nodiscard]] static float ComputePackedExtent(const UIElement& self, UIAxis packAxis, UIAxis axis, float spacing);

    /**
     * @brief 从 origin 开始沿 packAxis 依次放置子元素，交叉轴坐标保持不变
     */
    static void PackChildren(UIElement& self, UIAxis packAxis, float spacing, const Vector2& origin);

private:
    friend class UIElement;

    UIElement* m_owner = nullptr;
};

} // namespace Lattice::UI
