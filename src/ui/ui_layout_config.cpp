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
#include "lattice/ui/ui_layout_config.h"

#include "lattice/error.h"
#include "lattice/json_serializer.h"
#include "lattice/logger.h"
#include "lattice/ui/ui_layout_config_serialization.h"

namespace Lattice::UI {

UILayoutConfig UILayoutConfig::CreateDefault() {
    return UILayoutConfig{};
}

bool UILayoutConfig::Validate(std::string* reason) const {
    auto fail = [reason](const char* what) {
        if (reason) {
            *reason = what;
        }
        return false;
    };

    if (minimumFallbackSize <= 0.0f) {
        return fail("minimumFallbackSize must be positive");
    }
    if (defaultElementSize.width < 0.0f || defaultElementSize.height < 0.0f) {
        return fail("defaultElementSize must not be negative");
    }
    if (defaultCellSize.width <= 0.0f || defaultCellSize.height <= 0.0f) {
        return fail("defaultCellSize must be positive");
    }
    if (lineSpacing < 0.0f || stackSpacing < 0.0f || rowSpacing < 0.0f || scrollContainerSpacing < 0.0f) {
        return fail("spacing values must not be negative");
    }
    if (scrollbarSize < 0.0f) {
        return fail("scrollbarSize must not be negative");
    }
    if (labelMaxWrapWidth <= 0.0f) {
        return fail("labelMaxWrapWidth must be positive");
    }
    if (widgets.lineMinThickness <= 0.0f) {
        return fail("widgets.lineMinThickness must be positive");
    }
    if (widgets.imageButtonFallbackSize <= 0.0f || widgets.colorSwatchMinSize <= 0.0f) {
        return fail("widgets.imageButtonFallbackSize and widgets.colorSwatchMinSize must be positive");
    }
    if (widgets.numericFieldWidth < 0.0f || widgets.colorSwatchGap < 0.0f ||
        widgets.rangeSliderSize.width < 0.0f || widgets.rangeSliderSize.height < 0.0f) {
        return fail("widget sizes must not be negative");
    }
    return true;
}

bool UILayoutConfig::LoadFromJSON(const std::string& jsonPath, UILayoutConfig& config) {
    nlohmann::json j;
    if (!JsonSerializer::LoadFromFile(jsonPath, j)) {
        Logger::GetInstance().ErrorFormat("[UILayoutConfig] Failed to load JSON from '%s'", jsonPath.c_str());
        return false;
    }

    UILayoutConfig loaded = CreateDefault();
    try {
        loaded = j.get<UILayoutConfig>();
    } catch (const nlohmann::json::exception& e) {
        HANDLE_ERROR(LATTICE_ERROR(ErrorCode::ConfigurationParseFailed,
                                   "Failed to parse layout config '" + jsonPath + "': " + e.what()));
        return false;
    }

    std::string reason;
    if (!loaded.Validate(&reason)) {
        HANDLE_ERROR(LATTICE_ERROR(ErrorCode::ConfigurationInvalid,
                                   "Invalid layout config '" + jsonPath + "': " + reason));
        return false;
    }

    config = loaded;
    Logger::GetInstance().InfoFormat("[UILayoutConfig] Successfully loaded layout config from '%s'", jsonPath.c_str());
    return true;
}

bool UILayoutConfig::SaveToJSON(const UILayoutConfig& config, const std::string& jsonPath) {
    nlohmann::json j = config;
    if (!JsonSerializer::SaveToFile(j, jsonPath)) {
        Logger::GetInstance().ErrorFormat("[UILayoutConfig] Failed to save JSON to '%s'", jsonPath.c_str());
        return false;
    }

    Logger::GetInstance().InfoFormat("[UILayoutConfig] Successfully saved layout config to '%s'", jsonPath.c_str());
    return true;
}

// UILayoutConfigManager 实现

UILayoutConfigManager& UILayoutConfigManager::GetInstance() {
    static UILayoutConfigManager instance;
    return instance;
}

bool UILayoutConfigManager::SetConfig(const UILayoutConfig& config) {
    std::string reason;
    if (!config.Validate(&reason)) {
        HANDLE_ERROR(LATTICE_WARNING(ErrorCode::ConfigurationInvalid, "Rejected layout config: " + reason));
        return false;
    }

    m_config = config;
    return true;
}

bool UILayoutConfigManager::LoadConfig(const std::string& path) {
    UILayoutConfig config = m_config;
    if (!UILayoutConfig::LoadFromJSON(path, config)) {
        Logger::GetInstance().ErrorFormat("[UILayoutConfigManager] Keeping current layout config, '%s' could not be applied",
                                          path.c_str());
        return false;
    }

    m_config = config;
    Logger::GetInstance().InfoFormat("[UILayoutConfigManager] Applied layout config from '%s'", path.c_str());
    return true;
}

void UILayoutConfigManager::ResetToDefaults() {
    m_config = UILayoutConfig::CreateDefault();
}

} // namespace Lattice::UI
