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

#include "lattice/ui/layout/ui_linear_layout.h"

namespace Lattice::UI {

/**
 * @brief 纵向堆叠容器，默认 Content/Content
 */
class UIStack final : public UILinearLayout {
public:
    explicit UIStack(std::optional<float> spacing = std::nullopt);

    /**
     * @param spacing 未给出时使用布局配置中的默认间距
     */
    static UIElementPtr Create(UIElementOptions options = {}, std::optional<float> spacing = std::nullopt);

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Stack; }
};

} // namespace Lattice::UI
