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

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lattice/types.h"
#include "lattice/ui/ui_element_kind.h"
#include "lattice/ui/ui_types.h"

namespace Lattice::UI {

class UIElement;
class UIPainter;

using UIElementPtr = std::unique_ptr<UIElement>;

/**
 * @brief 元素的公共构造参数
 *
 * 给出 width/height 时该轴被强制为 Fixed；否则使用 widthMode/heightMode，
 * 再否则使用种类的默认模式。
 */
struct UIElementOptions {
    std::string id;
    float x = 0.0f;
    float y = 0.0f;
    std::optional<float> width;
    std::optional<float> height;
    std::optional<SizeMode> widthMode;
    std::optional<SizeMode> heightMode;
    UIAlignment alignment = UIAlignment::UpperLeft;
    bool showBorders = false;
    Color borderColor = Color::White();
    int borderThickness = 1;
};

/**
 * @brief 元素树节点与尺寸引擎
 *
 * 每个轴独立解析：
 * - Fixed   返回显式值；从未设置时计算一次固有尺寸并当作显式值保存
 * - Content 返回缓存；缓存失效时在循环保护下重新计算固有尺寸
 * - Fill    返回父元素为该子元素提供的尺寸，没有父元素时为 0
 *
 * 父元素独占子元素（unique_ptr），子元素只保存非拥有的父指针。
 * 位置总是绝对坐标，由父元素在排列时写入。
 */
class UIElement {
public:
    explicit UIElement(Scope<UIElementKind> kind, UIElementOptions options = {});
    ~UIElement();

    UIElement(const UIElement&) = delete;
    UIElement& operator=(const UIElement&) = delete;

    /**
     * @brief 创建没有种类数据的裸元素（纵向行布局，空时 50x30）
     */
    static UIElementPtr Create(UIElementOptions options = {});

    template <typename Kind, typename... Args>
    static UIElementPtr CreateWithKind(UIElementOptions options, Args&&... args) {
        return std::make_unique<UIElement>(CreateScope<Kind>(std::forward<Args>(args)...), std::move(options));
    }

    [[nodiscard]] const std::string& GetId() const noexcept { return m_id; }
    void SetId(std::string id) { m_id = std::move(id); }

    [[nodiscard]] UIElementType GetType() const noexcept { return m_kind->GetType(); }
    [[nodiscard]] UIElementKind& GetKind() noexcept { return *m_kind; }
    [[nodiscard]] const UIElementKind& GetKind() const noexcept { return *m_kind; }

    /**
     * @brief 访问种类数据
     * @return 种类不匹配时返回 nullptr
     */
    template <typename Kind>
    [[nodiscard]] Kind* As() noexcept {
        return dynamic_cast<Kind*>(m_kind.get());
    }

    template <typename Kind>
    [[nodiscard]] const Kind* As() const noexcept {
        return dynamic_cast<const Kind*>(m_kind.get());
    }

    // ------------------------------------------------------------------
    // 层级
    // ------------------------------------------------------------------

    [[nodiscard]] UIElement* GetParent() noexcept { return m_parent; }
    [[nodiscard]] const UIElement* GetParent() const noexcept { return m_parent; }
    [[nodiscard]] bool IsRoot() const noexcept { return m_parent == nullptr; }

    [[nodiscard]] const std::vector<UIElementPtr>& GetChildren() const noexcept { return m_children; }
    [[nodiscard]] size_t GetChildCount() const noexcept { return m_children.size(); }
    [[nodiscard]] UIElement* GetChild(size_t index) noexcept;
    [[nodiscard]] const UIElement* GetChild(size_t index) const noexcept;
    [[nodiscard]] int IndexOfChild(const UIElement* child) const noexcept;

    /**
     * @brief 追加子元素
     *
     * 空指针为无操作并返回 nullptr。把元素插入自身或自己的子孙时抛出
     * InvalidHierarchy，此时 child 的所有权仍留在调用方。
     */
    UIElement* AddChild(UIElementPtr&& child);

    /// index 超出范围时被截断到 [0, 子元素数量]
    UIElement* InsertChild(size_t index, UIElementPtr&& child);

    /**
     * @brief 移除子元素并交还所有权
     * @return child 为空或不是直接子元素时返回 nullptr
     */
    UIElementPtr RemoveChild(UIElement* child);

    void ClearChildren();

    [[nodiscard]] bool IsAncestorOf(const UIElement* element) const noexcept;

    UIElement* FindById(std::string_view id) noexcept;
    const UIElement* FindById(std::string_view id) const noexcept;

    template <typename Visitor>
    void ForEachChild(Visitor&& visitor) {
        for (auto& child : m_children) {
            visitor(*child);
        }
    }

    template <typename Visitor>
    void ForEachChild(Visitor&& visitor) const {
        for (const auto& child : m_children) {
            visitor(*child);
        }
    }

    // ------------------------------------------------------------------
    // 位置
    // ------------------------------------------------------------------

    [[nodiscard]] float GetX() const noexcept { return m_position.x(); }
    [[nodiscard]] float GetY() const noexcept { return m_position.y(); }
    [[nodiscard]] const Vector2& GetPosition() const noexcept { return m_position; }
    void SetX(float x) noexcept;
    void SetY(float y) noexcept;
    void SetPosition(float x, float y) noexcept;
    void SetPosition(const Vector2& position) noexcept { SetPosition(position.x(), position.y()); }

    // ------------------------------------------------------------------
    // 尺寸
    // ------------------------------------------------------------------

    [[nodiscard]] SizeMode GetWidthMode() const noexcept { return m_axes[0].mode; }
    [[nodiscard]] SizeMode GetHeightMode() const noexcept { return m_axes[1].mode; }
    [[nodiscard]] SizeMode GetSizeMode(UIAxis axis) const noexcept { return State(axis).mode; }

    void SetWidthMode(SizeMode mode) { SetSizeMode(UIAxis::Horizontal, mode); }
    void SetHeightMode(SizeMode mode) { SetSizeMode(UIAxis::Vertical, mode); }

    /**
     * @brief 切换尺寸模式；种类不接受该模式时记录警告并保持原模式
     * @return 是否生效
     */
    bool SetSizeMode(UIAxis axis, SizeMode mode);

    [[nodiscard]] float GetWidth() const { return GetExtent(UIAxis::Horizontal); }
    [[nodiscard]] float GetHeight() const { return GetExtent(UIAxis::Vertical); }
    [[nodiscard]] float GetExtent(UIAxis axis) const;
    [[nodiscard]] Size GetSize() const { return Size(GetWidth(), GetHeight()); }
    [[nodiscard]] Rect GetRect() const { return Rect(GetX(), GetY(), GetWidth(), GetHeight()); }

    /**
     * @brief 写入尺寸值，不改变模式
     *
     * Fixed 轴上即为权威值；Content 轴上只作为下次计算前的回退值。
     * 值变化时通知该轴上的 Fill 子元素，并使 Content 父元素失效。
     */
    void SetWidth(float width) { SetExtent(UIAxis::Horizontal, width); }
    void SetHeight(float height) { SetExtent(UIAxis::Vertical, height); }
    void SetExtent(UIAxis axis, float value);
    void SetSize(float width, float height);

    [[nodiscard]] bool HasExplicitExtent(UIAxis axis) const noexcept { return State(axis).hasExplicitValue; }

    /// Content 轴上的缓存是否有效（Fixed / Fill 轴恒为 false）
    [[nodiscard]] bool IsWidthCached() const noexcept { return IsExtentCached(UIAxis::Horizontal); }
    [[nodiscard]] bool IsHeightCached() const noexcept { return IsExtentCached(UIAxis::Vertical); }
    [[nodiscard]] bool IsExtentCached(UIAxis axis) const noexcept;

    /// 该轴是否正处于固有尺寸计算中（循环保护标志）
    [[nodiscard]] bool IsResolving(UIAxis axis) const noexcept { return State(axis).resolving; }

    [[nodiscard]] Size ComputeIntrinsicSize() const { return m_kind->ComputeIntrinsicSize(*this); }

    /**
     * @brief 使尺寸缓存失效
     *
     * 清除 Content 轴缓存；若父元素在同轴上为 Content，则递归使父元素失效。
     */
    void InvalidateSize(UIAxisMask axes = UIAxisMask::Both);

    /// 使尺寸失效并要求重新排列
    void InvalidateLayout();

    /**
     * @brief 通知在给定轴上为 Fill 的子元素（及其 Fill 子孙）参考尺寸已变化
     */
    void NotifyFillDependents(UIAxisMask axes);

    // ------------------------------------------------------------------
    // 对齐与边框
    // ------------------------------------------------------------------

    [[nodiscard]] UIAlignment GetAlignment() const noexcept { return m_alignment; }
    void SetAlignment(UIAlignment alignment) noexcept;

    [[nodiscard]] bool GetShowBorders() const noexcept { return m_showBorders; }
    void SetShowBorders(bool show) noexcept;
    [[nodiscard]] const Color& GetBorderColor() const noexcept { return m_borderColor; }
    void SetBorderColor(const Color& color) noexcept;
    [[nodiscard]] int GetBorderThickness() const noexcept { return m_borderThickness; }
    void SetBorderThickness(int thickness) noexcept;

    // ------------------------------------------------------------------
    // 脏标记
    // ------------------------------------------------------------------

    void MarkDirty(UIDirtyFlag flags = UIDirtyFlag::All) noexcept;
    [[nodiscard]] UIDirtyFlag GetDirtyFlags() const noexcept { return m_dirtyFlags; }
    [[nodiscard]] bool IsDirty(UIDirtyFlag flags) const noexcept { return (m_dirtyFlags & flags) != UIDirtyFlag::None; }
    void ClearDirty(UIDirtyFlag flags = UIDirtyFlag::All) noexcept;

    // ------------------------------------------------------------------
    // 排列与渲染
    // ------------------------------------------------------------------

    /**
     * @brief 只计算几何，不绘制：排列子元素并递归
     */
    void UpdateLayout();

    /**
     * @brief 渲染：解析尺寸 -> 绘制自身 -> 排列子元素 -> 渲染子元素 -> 边框
     */
    void Render(UIPainter& painter);

    void DrawBorders(UIPainter& painter) const;

private:
    struct AxisState {
        SizeMode mode = SizeMode::Fixed;
        float value = 0.0f;             // 显式值或最近一次解析的缓存
        bool hasExplicitValue = false;
        bool cacheValid = false;
        bool resolving = false;         // 循环保护
    };

    [[nodiscard]] AxisState& State(UIAxis axis) noexcept { return m_axes[static_cast<size_t>(axis)]; }
    [[nodiscard]] const AxisState& State(UIAxis axis) const noexcept { return m_axes[static_cast<size_t>(axis)]; }

    float ResolveIntrinsicExtent(UIAxis axis) const;
    float GetFallbackExtent(UIAxis axis) const;

    UIAxisMask GetAxesInMode(SizeMode mode, UIAxisMask axes) const noexcept;

    void InvalidateParentSize(UIAxisMask axes);

    void AttachChild(UIElement& child);
    void CheckInsertable(const UIElementPtr& child) const;

    std::string m_id;
    Scope<UIElementKind> m_kind;
    UIElement* m_parent = nullptr;
    std::vector<UIElementPtr> m_children;

    Vector2 m_position{0.0f, 0.0f};
    mutable std::array<AxisState, 2> m_axes{};

    UIAlignment m_alignment = UIAlignment::UpperLeft;
    bool m_showBorders = false;
    Color m_borderColor = Color::White();
    int m_borderThickness = 1;

    UIDirtyFlag m_dirtyFlags = UIDirtyFlag::All;
};

} // namespace Lattice::UI
