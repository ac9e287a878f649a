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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lattice/types.h"
#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/ui_types.h"

namespace Lattice::UI {

/**
 * @brief 宿主纹理的不透明句柄，尺寸以像素计
 */
struct UITexture {
    uint64_t handle = 0;
    float width = 0.0f;
    float height = 0.0f;

    [[nodiscard]] bool IsValid() const noexcept { return handle != 0; }
};

enum class UIColorPickerMode : uint8_t {
    HSVWheel,
    Palette,
    Temperature,
    Combined
};

/**
 * @brief 立即模式绘制原语集合
 *
 * 宿主 GUI 框架的适配层。每个叶子控件在每次渲染中以最终解析的矩形调用一次；
 * 返回值只回馈控件本地的交互状态（点击、勾选、数值变化），不参与布局。
 */
class UIPainter {
public:
    virtual ~UIPainter() = default;

    /// @return 本帧是否被点击
    virtual bool DrawButton(const Rect& rect, std::string_view text, bool enabled) = 0;

    /// @return 绘制后的勾选状态
    virtual bool DrawCheckbox(const Rect& rect, std::string_view label, bool checked) = 0;

    /// @return 本帧是否被点击
    virtual bool DrawRadioButton(const Rect& rect, std::string_view label, bool selected) = 0;

    /// @return 本帧是否被点击
    virtual bool DrawImageButton(const Rect& rect, const UITexture& texture, bool enabled) = 0;

    /// @return 交互后的数值
    virtual float DrawSlider(const Rect& rect, float value, float min, float max) = 0;

    /// @return 拖动两个手柄后的区间
    virtual UIValueRange<float> DrawRangeSlider(const Rect& rect, UIValueRange<float> range, float min, float max) = 0;

    /// @return 编辑后的文本
    virtual std::string DrawTextField(const Rect& rect, std::string_view text, bool multiline) = 0;

    /// @return 本帧选中的条目索引，未选择时为 -1
    virtual int DrawDropdown(const Rect& rect, std::string_view displayText,
                             const std::vector<std::string>& items) = 0;

    virtual void DrawLabel(const Rect& rect, std::string_view text, bool wordWrap, UIAlignment anchor) = 0;
    virtual void DrawLine(const Vector2& from, const Vector2& to, float thickness, const Color& color) = 0;
    virtual void FillRect(const Rect& rect, const Color& color) = 0;
    virtual void DrawMenuSection(const Rect& rect) = 0;
    virtual void ShowTooltip(const Rect& rect, std::string_view text) = 0;

    /**
     * @brief 打开宿主的取色窗口
     *
     * 窗口由宿主管理，选中的颜色直接写入 color 单元。
     */
    virtual void OpenColorPicker(const UISharedValuePtr<Color>& color, UIColorPickerMode mode,
                                 const std::vector<Color>& palette) = 0;

    /**
     * @brief 开始滚动视图
     * @param outRect 可见视口
     * @param scrollPosition 滚动偏移（输入输出）
     * @param viewRect 全部可滚动内容
     */
    virtual void BeginScrollView(const Rect& outRect, Vector2& scrollPosition,
                                 const Rect& viewRect, bool showScrollbars) = 0;
    virtual void EndScrollView() = 0;
};

/**
 * @brief 成对调用 Begin/EndScrollView，子元素渲染抛出异常时也会结束滚动视图
 */
class UIScrollViewScope {
public:
    UIScrollViewScope(UIPainter& painter, const Rect& outRect, Vector2& scrollPosition,
                      const Rect& viewRect, bool showScrollbars)
        : m_painter(painter) {
        m_painter.BeginScrollView(outRect, scrollPosition, viewRect, showScrollbars);
    }

    ~UIScrollViewScope() {
        m_painter.EndScrollView();
    }

    UIScrollViewScope(const UIScrollViewScope&) = delete;
    UIScrollViewScope& operator=(const UIScrollViewScope&) = delete;

private:
    UIPainter& m_painter;
};

} // namespace Lattice::UI
