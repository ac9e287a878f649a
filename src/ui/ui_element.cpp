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
#include "lattice/ui/ui_element.h"

#include <algorithm>

#include "lattice/error.h"
#include "lattice/logger.h"
#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

namespace {

constexpr UIAxis kAxes[] = {UIAxis::Horizontal, UIAxis::Vertical};

} // namespace

UIElement::UIElement(Scope<UIElementKind> kind, UIElementOptions options)
    : m_id(std::move(options.id))
    , m_kind(kind ? std::move(kind) : CreateScope<UIElementKind>())
    , m_position(options.x, options.y)
    , m_alignment(options.alignment)
    , m_showBorders(options.showBorders)
    , m_borderColor(options.borderColor)
    , m_borderThickness(std::max(0, options.borderThickness)) {
    m_kind->m_owner = this;

    auto initAxis = [this](UIAxis axis, std::optional<SizeMode> mode, std::optional<float> value) {
        AxisState& state = State(axis);
        SizeMode resolved = value ? SizeMode::Fixed : mode.value_or(m_kind->GetDefaultSizeMode(axis));
        if (!m_kind->AcceptsSizeMode(axis, resolved)) {
            const SizeMode fallback = m_kind->GetDefaultSizeMode(axis);
            Logger::GetInstance().WarningFormat("[UIElement] %s does not support %s sizing on the %s axis, using %s",
                                                ToString(GetType()), ToString(resolved), ToString(axis),
                                                ToString(fallback));
            resolved = fallback;
        }
        state.mode = resolved;
        if (value) {
            state.value = *value;
            state.hasExplicitValue = true;
        }
    };
    initAxis(UIAxis::Horizontal, options.widthMode, options.width);
    initAxis(UIAxis::Vertical, options.heightMode, options.height);

    m_kind->OnAttached(*this);
}

UIElement::~UIElement() = default;

UIElementPtr UIElement::Create(UIElementOptions options) {
    return std::make_unique<UIElement>(nullptr, std::move(options));
}

// ============================================================================
// 层级
// ============================================================================

UIElement* UIElement::GetChild(size_t index) noexcept {
    return index < m_children.size() ? m_children[index].get() : nullptr;
}

const UIElement* UIElement::GetChild(size_t index) const noexcept {
    return index < m_children.size() ? m_children[index].get() : nullptr;
}

int UIElement::IndexOfChild(const UIElement* child) const noexcept {
    if (!child) {
        return -1;
    }
    for (size_t i = 0; i < m_children.size(); ++i) {
        if (m_children[i].get() == child) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

UIElement* UIElement::AddChild(UIElementPtr&& child) {
    return InsertChild(m_children.size(), std::move(child));
}

UIElement* UIElement::InsertChild(size_t index, UIElementPtr&& child) {
    if (!child) {
        return nullptr;
    }
    CheckInsertable(child);

    index = std::min(index, m_children.size());
    UIElement* raw = child.get();
    m_children.insert(m_children.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    AttachChild(*raw);
    return raw;
}

UIElementPtr UIElement::RemoveChild(UIElement* child) {
    if (!child) {
        return nullptr;
    }

    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [child](const UIElementPtr& element) { return element.get() == child; });
    if (it == m_children.end()) {
        return nullptr;
    }

    UIElementPtr removed = std::move(*it);
    m_children.erase(it);
    removed->m_parent = nullptr;

    // 脱离父元素后 Fill 轴解析为 0
    const UIAxisMask fillAxes = removed->GetAxesInMode(SizeMode::Fill, UIAxisMask::Both);
    if (fillAxes != UIAxisMask::None) {
        removed->m_kind->OnSizeInvalidated(*removed, fillAxes);
        removed->NotifyFillDependents(fillAxes);
    }
    removed->MarkDirty(UIDirtyFlag::Layout);

    InvalidateSize(UIAxisMask::Both);
    return removed;
}

void UIElement::ClearChildren() {
    if (m_children.empty()) {
        return;
    }
    m_children.clear();
    InvalidateSize(UIAxisMask::Both);
}

bool UIElement::IsAncestorOf(const UIElement* element) const noexcept {
    for (const UIElement* current = element ? element->m_parent : nullptr; current; current = current->m_parent) {
        if (current == this) {
            return true;
        }
    }
    return false;
}

UIElement* UIElement::FindById(std::string_view id) noexcept {
    if (m_id == id) {
        return this;
    }
    for (auto& child : m_children) {
        if (auto* found = child->FindById(id)) {
            return found;
        }
    }
    return nullptr;
}

const UIElement* UIElement::FindById(std::string_view id) const noexcept {
    if (m_id == id) {
        return this;
    }
    for (const auto& child : m_children) {
        if (const auto* found = child->FindById(id)) {
            return found;
        }
    }
    return nullptr;
}

void UIElement::CheckInsertable(const UIElementPtr& child) const {
    if (child.get() == this || child->IsAncestorOf(this)) {
        throw LATTICE_ERROR(ErrorCode::InvalidHierarchy,
                            "Cannot insert element '" + child->GetId() + "' into itself or one of its descendants");
    }
}

void UIElement::AttachChild(UIElement& child) {
    child.m_parent = this;

    // Fill 轴立即改为跟随新的父元素
    const UIAxisMask fillAxes = child.GetAxesInMode(SizeMode::Fill, UIAxisMask::Both);
    if (fillAxes != UIAxisMask::None) {
        child.m_kind->OnSizeInvalidated(child, fillAxes);
        child.NotifyFillDependents(fillAxes);
    }
    child.MarkDirty(UIDirtyFlag::Layout);

    InvalidateSize(UIAxisMask::Both);
}

// ============================================================================
// 位置
// ============================================================================

void UIElement::SetX(float x) noexcept {
    SetPosition(x, m_position.y());
}

void UIElement::SetY(float y) noexcept {
    SetPosition(m_position.x(), y);
}

void UIElement::SetPosition(float x, float y) noexcept {
    if (m_position.x() == x && m_position.y() == y) {
        return;
    }
    m_position = Vector2(x, y);
    MarkDirty(UIDirtyFlag::Visual);
}

// ============================================================================
// 尺寸引擎
// ============================================================================

float UIElement::GetExtent(UIAxis axis) const {
    AxisState& state = m_axes[static_cast<size_t>(axis)];

    switch (state.mode) {
        case SizeMode::Fixed: {
            if (state.hasExplicitValue) {
                return state.value;
            }
            if (state.resolving) {
                return GetFallbackExtent(axis);
            }
            // 从未设置过：计算一次固有尺寸，之后按 Fixed 值对待
            const float value = ResolveIntrinsicExtent(axis);
            state.value = value;
            state.hasExplicitValue = true;
            return value;
        }

        case SizeMode::Content: {
            if (state.cacheValid) {
                return state.value;
            }
            if (state.resolving) {
                return GetFallbackExtent(axis);
            }
            const float value = ResolveIntrinsicExtent(axis);
            state.value = value;
            state.cacheValid = true;
            return value;
        }

        case SizeMode::Fill:
            if (!m_parent) {
                return 0.0f;
            }
            return m_parent->m_kind->ComputeFillExtent(*m_parent, *this, axis);
    }

    return 0.0f;
}

float UIElement::ResolveIntrinsicExtent(UIAxis axis) const {
    UIResolveGuard guard(m_axes[static_cast<size_t>(axis)].resolving);
    return m_kind->ComputeIntrinsicExtent(*this, axis);
}

float UIElement::GetFallbackExtent(UIAxis axis) const {
    const AxisState& state = State(axis);
    const float fallback = state.value > 0.0f ? state.value : GetLayoutConfig().minimumFallbackSize;
    Logger::GetInstance().DebugFormat("[UIElement] Sizing cycle on %s '%s' (%s axis), falling back to %.2f",
                                      ToString(GetType()), m_id.c_str(), ToString(axis), fallback);
    return fallback;
}

UIAxisMask UIElement::GetAxesInMode(SizeMode mode, UIAxisMask axes) const noexcept {
    UIAxisMask result = UIAxisMask::None;
    for (UIAxis axis : kAxes) {
        if (HasAxis(axes, axis) && State(axis).mode == mode) {
            result = result | ToMask(axis);
        }
    }
    return result;
}

bool UIElement::SetSizeMode(UIAxis axis, SizeMode mode) {
    AxisState& state = State(axis);
    if (state.mode == mode) {
        return true;
    }
    if (!m_kind->AcceptsSizeMode(axis, mode)) {
        Logger::GetInstance().WarningFormat("[UIElement] %s '%s' does not support %s sizing on the %s axis, keeping %s",
                                            ToString(GetType()), m_id.c_str(), ToString(mode), ToString(axis),
                                            ToString(state.mode));
        return false;
    }

    state.mode = mode;
    state.cacheValid = false;

    const UIAxisMask mask = ToMask(axis);
    m_kind->OnSizeInvalidated(*this, mask);
    MarkDirty(UIDirtyFlag::Layout);
    NotifyFillDependents(mask);
    InvalidateParentSize(mask);
    return true;
}

void UIElement::SetExtent(UIAxis axis, float value) {
    AxisState& state = State(axis);
    if (state.mode != SizeMode::Content && state.hasExplicitValue && state.value == value) {
        return;
    }

    state.value = value;
    state.hasExplicitValue = true;
    if (state.mode == SizeMode::Content) {
        state.cacheValid = false;
    }

    const UIAxisMask mask = ToMask(axis);
    m_kind->OnSizeInvalidated(*this, mask);
    MarkDirty(UIDirtyFlag::Layout);
    NotifyFillDependents(mask);
    InvalidateParentSize(mask);
}

void UIElement::SetSize(float width, float height) {
    SetExtent(UIAxis::Horizontal, width);
    SetExtent(UIAxis::Vertical, height);
}

bool UIElement::IsExtentCached(UIAxis axis) const noexcept {
    const AxisState& state = State(axis);
    return state.mode == SizeMode::Content && state.cacheValid;
}

void UIElement::InvalidateSize(UIAxisMask axes) {
    const UIAxisMask contentAxes = GetAxesInMode(SizeMode::Content, axes);
    for (UIAxis axis : kAxes) {
        if (HasAxis(contentAxes, axis)) {
            State(axis).cacheValid = false;
        }
    }

    m_kind->OnSizeInvalidated(*this, axes);
    MarkDirty(UIDirtyFlag::Layout);

    if (contentAxes != UIAxisMask::None) {
        NotifyFillDependents(contentAxes);
    }

    // Fixed 轴的尺寸不随内容变化，不必惊动父元素
    InvalidateParentSize(contentAxes | GetAxesInMode(SizeMode::Fill, axes));
}

void UIElement::InvalidateLayout() {
    InvalidateSize(UIAxisMask::Both);
    MarkDirty(UIDirtyFlag::Layout | UIDirtyFlag::Children);
}

void UIElement::NotifyFillDependents(UIAxisMask axes) {
    for (auto& child : m_children) {
        const UIAxisMask fillAxes = child->GetAxesInMode(SizeMode::Fill, axes);
        if (fillAxes == UIAxisMask::None) {
            continue;
        }
        child->m_kind->OnSizeInvalidated(*child, fillAxes);
        child->MarkDirty(UIDirtyFlag::Layout);
        child->NotifyFillDependents(fillAxes);
    }
}

void UIElement::InvalidateParentSize(UIAxisMask axes) {
    if (!m_parent || axes == UIAxisMask::None) {
        return;
    }

    const UIAxisMask parentContent = m_parent->GetAxesInMode(SizeMode::Content, axes);
    if (parentContent != UIAxisMask::None) {
        m_parent->InvalidateSize(parentContent);
        return;
    }

    // 父元素尺寸不依赖子元素，但种类内部可能缓存了派生值（网格自动单元格）
    m_parent->m_kind->OnSizeInvalidated(*m_parent, axes);
    m_parent->MarkDirty(UIDirtyFlag::Layout);
}

// ============================================================================
// 对齐与边框
// ============================================================================

void UIElement::SetAlignment(UIAlignment alignment) noexcept {
    if (m_alignment == alignment) {
        return;
    }
    m_alignment = alignment;
    MarkDirty(UIDirtyFlag::Layout);
}

void UIElement::SetShowBorders(bool show) noexcept {
    if (m_showBorders == show) {
        return;
    }
    m_showBorders = show;
    MarkDirty(UIDirtyFlag::Visual);
}

void UIElement::SetBorderColor(const Color& color) noexcept {
    m_borderColor = color;
    MarkDirty(UIDirtyFlag::Visual);
}

void UIElement::SetBorderThickness(int thickness) noexcept {
    m_borderThickness = std::max(0, thickness);
    MarkDirty(UIDirtyFlag::Visual);
}

// ============================================================================
// 脏标记
// ============================================================================

void UIElement::MarkDirty(UIDirtyFlag flags) noexcept {
    m_dirtyFlags |= flags;
    if (m_parent) {
        m_parent->MarkDirty(UIDirtyFlag::Children);
    }
}

void UIElement::ClearDirty(UIDirtyFlag flags) noexcept {
    if (flags == UIDirtyFlag::All) {
        m_dirtyFlags = UIDirtyFlag::None;
        return;
    }
    m_dirtyFlags &= ~flags;
}

// ============================================================================
// 排列与渲染
// ============================================================================

void UIElement::UpdateLayout() {
    m_kind->Arrange(*this);
    for (auto& child : m_children) {
        child->UpdateLayout();
    }
    ClearDirty(UIDirtyFlag::Layout);
}

void UIElement::Render(UIPainter& painter) {
    // 先解析尺寸，绘制与排列读取同一组缓存值
    [[maybe_unused]] const Size size = GetSize();

    m_kind->Paint(*this, painter);
    m_kind->Arrange(*this);
    m_kind->RenderChildren(*this, painter);

    if (m_showBorders) {
        DrawBorders(painter);
    }

    ClearDirty();
}

void UIElement::DrawBorders(UIPainter& painter) const {
    const Rect rect = GetRect();
    if (m_borderThickness <= 0 || rect.width <= 0.0f || rect.height <= 0.0f) {
        return;
    }

    const float t = static_cast<float>(m_borderThickness);
    painter.FillRect(Rect(rect.x, rect.y, rect.width, t), m_borderColor);
    painter.FillRect(Rect(rect.x, rect.y + rect.height - t, rect.width, t), m_borderColor);
    painter.FillRect(Rect(rect.x, rect.y, t, rect.height), m_borderColor);
    painter.FillRect(Rect(rect.x + rect.width - t, rect.y, t, rect.height), m_borderColor);
}

} // namespace Lattice::UI
