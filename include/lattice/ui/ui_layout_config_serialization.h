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

#include <nlohmann/json.hpp>

#include "lattice/json_serializer.h"
#include "lattice/ui/ui_layout_config.h"

namespace Lattice::UI {

// ============================================================================
// UIWidgetMetrics 序列化
// ============================================================================

inline void to_json(nlohmann::json& j, const UIWidgetMetrics& metrics) {
    j = {
        {"buttonPaddingX", metrics.buttonPaddingX},
        {"buttonPaddingY", metrics.buttonPaddingY},
        {"buttonMinHeight", metrics.buttonMinHeight},
        {"emptyButtonSize", metrics.emptyButtonSize},
        {"checkboxSize", metrics.checkboxSize},
        {"checkboxLabelGap", metrics.checkboxLabelGap},
        {"labeledControlSpacing", metrics.labeledControlSpacing},
        {"labeledControlMinHeight", metrics.labeledControlMinHeight},
        {"sliderSize", metrics.sliderSize},
        {"textEntryWidth", metrics.textEntryWidth},
        {"numericFieldWidth", metrics.numericFieldWidth},
        {"rangeSliderSize", metrics.rangeSliderSize},
        {"imageButtonFallbackSize", metrics.imageButtonFallbackSize},
        {"colorSwatchSize", metrics.colorSwatchSize},
        {"colorSwatchMinSize", metrics.colorSwatchMinSize},
        {"colorSwatchGap", metrics.colorSwatchGap},
        {"dropdownWidth", metrics.dropdownWidth},
        {"dropdownHeight", metrics.dropdownHeight},
        {"dropdownArrowAllowance", metrics.dropdownArrowAllowance},
        {"lineLength", metrics.lineLength},
        {"lineMinThickness", metrics.lineMinThickness},
        {"emptySize", metrics.emptySize}
    };
}

inline void from_json(const nlohmann::json& j, UIWidgetMetrics& metrics) {
    JsonSerializer::ReadIfPresent(j, "buttonPaddingX", metrics.buttonPaddingX);
    JsonSerializer::ReadIfPresent(j, "buttonPaddingY", metrics.buttonPaddingY);
    JsonSerializer::ReadIfPresent(j, "buttonMinHeight", metrics.buttonMinHeight);
    JsonSerializer::ReadIfPresent(j, "emptyButtonSize", metrics.emptyButtonSize);
    JsonSerializer::ReadIfPresent(j, "checkboxSize", metrics.checkboxSize);
    JsonSerializer::ReadIfPresent(j, "checkboxLabelGap", metrics.checkboxLabelGap);
    JsonSerializer::ReadIfPresent(j, "labeledControlSpacing", metrics.labeledControlSpacing);
    JsonSerializer::ReadIfPresent(j, "labeledControlMinHeight", metrics.labeledControlMinHeight);
    JsonSerializer::ReadIfPresent(j, "sliderSize", metrics.sliderSize);
    JsonSerializer::ReadIfPresent(j, "textEntryWidth", metrics.textEntryWidth);
    JsonSerializer::ReadIfPresent(j, "numericFieldWidth", metrics.numericFieldWidth);
    JsonSerializer::ReadIfPresent(j, "rangeSliderSize", metrics.rangeSliderSize);
    JsonSerializer::ReadIfPresent(j, "imageButtonFallbackSize", metrics.imageButtonFallbackSize);
    JsonSerializer::ReadIfPresent(j, "colorSwatchSize", metrics.colorSwatchSize);
    JsonSerializer::ReadIfPresent(j, "colorSwatchMinSize", metrics.colorSwatchMinSize);
    JsonSerializer::ReadIfPresent(j, "colorSwatchGap", metrics.colorSwatchGap);
    JsonSerializer::ReadIfPresent(j, "dropdownWidth", metrics.dropdownWidth);
    JsonSerializer::ReadIfPresent(j, "dropdownHeight", metrics.dropdownHeight);
    JsonSerializer::ReadIfPresent(j, "dropdownArrowAllowance", metrics.dropdownArrowAllowance);
    JsonSerializer::ReadIfPresent(j, "lineLength", metrics.lineLength);
    JsonSerializer::ReadIfPresent(j, "lineMinThickness", metrics.lineMinThickness);
    JsonSerializer::ReadIfPresent(j, "emptySize", metrics.emptySize);
}

// ============================================================================
// UILayoutConfig 序列化
// ============================================================================

inline void to_json(nlohmann::json& j, const UILayoutConfig& config) {
    j = {
        {"version", "1.0"},
        {"element", {
            {"defaultSize", config.defaultElementSize},
            {"minimumFallbackSize", config.minimumFallbackSize}
        }},
        {"spacing", {
            {"line", config.lineSpacing},
            {"stack", config.stackSpacing},
            {"row", config.rowSpacing},
            {"scrollContainer", config.scrollContainerSpacing}
        }},
        {"scrollbarSize", config.scrollbarSize},
        {"defaultCellSize", config.defaultCellSize},
        {"labelMaxWrapWidth", config.labelMaxWrapWidth},
        {"widgets", config.widgets}
    };
}

inline void from_json(const nlohmann::json& j, UILayoutConfig& config) {
    if (j.contains("element")) {
        const auto& element = j.at("element");
        JsonSerializer::ReadIfPresent(element, "defaultSize", config.defaultElementSize);
        JsonSerializer::ReadIfPresent(element, "minimumFallbackSize", config.minimumFallbackSize);
    }

    if (j.contains("spacing")) {
        const auto& spacing = j.at("spacing");
        JsonSerializer::ReadIfPresent(spacing, "line", config.lineSpacing);
        JsonSerializer::ReadIfPresent(spacing, "stack", config.stackSpacing);
        JsonSerializer::ReadIfPresent(spacing, "row", config.rowSpacing);
        JsonSerializer::ReadIfPresent(spacing, "scrollContainer", config.scrollContainerSpacing);
    }

    JsonSerializer::ReadIfPresent(j, "scrollbarSize", config.scrollbarSize);
    JsonSerializer::ReadIfPresent(j, "defaultCellSize", config.defaultCellSize);
    JsonSerializer::ReadIfPresent(j, "labelMaxWrapWidth", config.labelMaxWrapWidth);
    JsonSerializer::ReadIfPresent(j, "widgets", config.widgets);
}

} // namespace Lattice::UI
