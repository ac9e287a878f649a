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
#include "lattice/ui/ui_types.h"

namespace Lattice::UI {

const char* ToString(UIElementType type) noexcept {
    switch (type) {
        case UIElementType::Element: return "Element";
        case UIElementType::Stack: return "Stack";
        case UIElementType::Row: return "Row";
        case UIElementType::Grid: return "Grid";
        case UIElementType::FillGrid: return "FillGrid";
        case UIElementType::Canvas: return "Canvas";
        case UIElementType::ScrollCanvas: return "ScrollCanvas";
        case UIElementType::ScrollContainer: return "ScrollContainer";
        case UIElementType::Button: return "Button";
        case UIElementType::Checkbox: return "Checkbox";
        case UIElementType::RadioButton: return "RadioButton";
        case UIElementType::Slider: return "Slider";
        case UIElementType::Dropdown: return "Dropdown";
        case UIElementType::TextEntry: return "TextEntry";
        case UIElementType::NumericField: return "NumericField";
        case UIElementType::IntSlider: return "IntSlider";
        case UIElementType::RangeSlider: return "RangeSlider";
        case UIElementType::ImageButton: return "ImageButton";
        case UIElementType::ColorPicker: return "ColorPicker";
        case UIElementType::Label: return "Label";
        case UIElementType::Line: return "Line";
        case UIElementType::Empty: return "Empty";
        default: return "Unknown";
    }
}

const char* ToString(SizeMode mode) noexcept {
    switch (mode) {
        case SizeMode::Fixed: return "Fixed";
        case SizeMode::Content: return "Content";
        case SizeMode::Fill: return "Fill";
        default: return "Unknown";
    }
}

const char* ToString(UIAxis axis) noexcept {
    return axis == UIAxis::Horizontal ? "horizontal" : "vertical";
}

} // namespace Lattice::UI
