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
#include <string>
#include <vector>

#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

struct UIColorPickerOptions {
    std::string text;
    UISharedValuePtr<Color> color;              // 必需
    UIColorPickerMode mode = UIColorPickerMode::Combined;
    std::vector<Color> palette;                 // 为空时使用 GetDefaultPalette()
    bool showSwatch = true;
};

/**
 * @brief 取色按钮
 *
 * 按钮左侧绘制当前颜色的色块，点击后请求宿主打开取色窗口，
 * 取色结果由宿主直接写入颜色单元。
 */
class UIColorPicker final : public UIWidgetKind {
public:
    explicit UIColorPicker(UIColorPickerOptions picker);

    /**
     * @throws LatticeError NullPointer color 为空
     */
    static UIElementPtr Create(UIColorPickerOptions picker, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::ColorPicker; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetText() const noexcept { return m_text; }
    void SetText(std::string text);

    [[nodiscard]] const Color& GetColor() const noexcept { return m_color->Get(); }
    void SetColor(const Color& color) { m_color->Set(color); }

    [[nodiscard]] UIColorPickerMode GetMode() const noexcept { return m_mode; }
    void SetMode(UIColorPickerMode mode) { m_mode = mode; }

    [[nodiscard]] const std::vector<Color>& GetPalette() const noexcept;
    void SetPalette(std::vector<Color> palette) { m_palette = std::move(palette); }

    [[nodiscard]] bool IsSwatchShown() const noexcept { return m_showSwatch; }
    void SetShowSwatch(bool show);

    /// 未设置时取配置中的 colorSwatchSize
    [[nodiscard]] float GetSwatchSize() const;
    /// 不小于配置中的 colorSwatchMinSize
    void SetSwatchSize(float size);

    /// 十六色基础调色板
    [[nodiscard]] static const std::vector<Color>& GetDefaultPalette();

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::string m_text;
    UISharedValuePtr<Color> m_color;
    UIColorPickerMode m_mode;
    std::vector<Color> m_palette;
    std::optional<float> m_swatchSize;
    bool m_showSwatch;
};

} // namespace Lattice::UI
