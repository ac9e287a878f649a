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

#include "lattice/types.h"

namespace Lattice::UI {

/**
 * @brief 叶子控件的固定尺寸常量
 */
struct UIWidgetMetrics {
    float buttonPaddingX = 20.0f;          // 文本左右内边距之和
    float buttonPaddingY = 10.0f;          // 文本上下内边距之和
    float buttonMinHeight = 30.0f;
    Size emptyButtonSize{60.0f, 30.0f};

    float checkboxSize = 24.0f;            // 勾选框边长
    float checkboxLabelGap = 4.0f;

    float labeledControlSpacing = 6.0f;    // 单选按钮等带标签控件的间距
    float labeledControlMinHeight = 24.0f;

    Size sliderSize{120.0f, 22.0f};

    float textEntryWidth = 150.0f;
    float numericFieldWidth = 120.0f;

    Size rangeSliderSize{200.0f, 31.0f};

    float imageButtonFallbackSize = 32.0f; // 没有纹理时的边长

    float colorSwatchSize = 20.0f;
    float colorSwatchMinSize = 10.0f;
    float colorSwatchGap = 8.0f;           // 色块与按钮左边缘、色块与文本之间的距离

    float dropdownWidth = 150.0f;
    float dropdownHeight = 30.0f;
    float dropdownArrowAllowance = 30.0f;  // 文本宽度之外为下拉箭头预留

    float lineLength = 100.0f;
    float lineMinThickness = 0.1f;

    Size emptySize{10.0f, 10.0f};
};

/**
 * @brief 布局引擎的全局默认值
 *
 * 元素上显式给出的参数总是优先；只有未给出时才读取这里的默认值。
 */
struct UILayoutConfig {
    Size defaultElementSize{50.0f, 30.0f};   // 无子元素的裸元素固有尺寸
    float minimumFallbackSize = 1.0f;        // 尺寸循环且没有历史值时的回退值

    float lineSpacing = 2.0f;                // 基础纵向行布局
    float stackSpacing = 2.0f;
    float rowSpacing = 2.0f;
    float scrollContainerSpacing = 2.0f;

    float scrollbarSize = 16.0f;

    Size defaultCellSize{50.0f, 30.0f};      // 网格无子元素时的自动单元格尺寸

    float labelMaxWrapWidth = 300.0f;        // 自动换行标签未给出最大宽度时的上限

    UIWidgetMetrics widgets;

    /**
     * @brief 创建默认配置
     */
    static UILayoutConfig CreateDefault();

    /**
     * @brief 检查数值是否合法（非负，回退值为正）
     */
    [[nodiscard]] bool Validate(std::string* reason = nullptr) const;

    /**
     * @brief 从 JSON 加载配置，缺失的键保留默认值
     */
    static bool LoadFromJSON(const std::string& jsonPath, UILayoutConfig& config);

    /**
     * @brief 保存配置到 JSON
     */
    static bool SaveToJSON(const UILayoutConfig& config, const std::string& jsonPath);
};

/**
 * @brief 布局配置管理器
 * 单例模式，持有当前生效的布局配置
 */
class UILayoutConfigManager {
public:
    static UILayoutConfigManager& GetInstance();

    [[nodiscard]] const UILayoutConfig& GetConfig() const noexcept { return m_config; }

    /**
     * @brief 替换当前配置（非法配置被拒绝）
     */
    bool SetConfig(const UILayoutConfig& config);

    /**
     * @brief 从文件加载并应用配置
     */
    bool LoadConfig(const std::string& path);

    void ResetToDefaults();

private:
    UILayoutConfigManager() = default;
    ~UILayoutConfigManager() = default;

    UILayoutConfigManager(const UILayoutConfigManager&) = delete;
    UILayoutConfigManager& operator=(const UILayoutConfigManager&) = delete;

    UILayoutConfig m_config = UILayoutConfig::CreateDefault();
};

/**
 * @brief 读取当前生效配置的便捷函数
 */
inline const UILayoutConfig& GetLayoutConfig() {
    return UILayoutConfigManager::GetInstance().GetConfig();
}

} // namespace Lattice::UI
