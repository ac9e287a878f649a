/**
 * @file ui_widgets_test.cpp
 * @brief 叶子控件尺寸与交互状态测试（CTest 兼容版本）
 *
 * 文本尺寸使用默认等宽度量：字宽 8，行高 20
 */

#include "lattice/error.h"
#include "lattice/logger.h"
#include "lattice/ui/layout/ui_stack.h"
#include "lattice/ui/ui_text_metrics.h"
#include "lattice/ui/widgets/ui_button.h"
#include "lattice/ui/widgets/ui_checkbox.h"
#include "lattice/ui/widgets/ui_color_picker.h"
#include "lattice/ui/widgets/ui_dropdown.h"
#include "lattice/ui/widgets/ui_empty.h"
#include "lattice/ui/widgets/ui_image_button.h"
#include "lattice/ui/widgets/ui_int_slider.h"
#include "lattice/ui/widgets/ui_label.h"
#include "lattice/ui/widgets/ui_line.h"
#include "lattice/ui/widgets/ui_numeric_field.h"
#include "lattice/ui/widgets/ui_radio_button.h"
#include "lattice/ui/widgets/ui_range_slider.h"
#include "lattice/ui/widgets/ui_slider.h"
#include "lattice/ui/widgets/ui_text_entry.h"
#include "ui_test_painter.h"

#include <cmath>
#include <iostream>

using namespace Lattice;
using namespace Lattice::UI;

// ============================================================================
// 简单的测试框架（CTest 兼容）
// ============================================================================

static int g_testCount = 0;
static int g_passedCount = 0;
static int g_failedCount = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        g_testCount++; \
        if (!(condition)) { \
            std::cerr << "❌ 测试失败: " << message << std::endl; \
            std::cerr << "   位置: " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::cerr << "   条件: " << #condition << std::endl; \
            g_failedCount++; \
            return false; \
        } \
        g_passedCount++; \
    } while(0)

#define TEST_ASSERT_NEAR(actual, expected, tolerance, message) \
    do { \
        g_testCount++; \
        float diff = std::abs((actual) - (expected)); \
        if (diff > (tolerance)) { \
            std::cerr << "❌ 测试失败: " << message << std::endl; \
            std::cerr << "   位置: " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::cerr << "   实际值: " << (actual) << std::endl; \
            std::cerr << "   期望值: " << (expected) << std::endl; \
            std::cerr << "   差值: " << diff << " (容忍度: " << (tolerance) << ")" << std::endl; \
            g_failedCount++; \
            return false; \
        } \
        g_passedCount++; \
    } while(0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "运行测试: " << #test_func << "..." << std::endl; \
        if (test_func()) { \
            std::cout << "✓ " << #test_func << " 通过" << std::endl; \
        } else { \
            std::cout << "✗ " << #test_func << " 失败" << std::endl; \
        } \
    } while(0)

// ============================================================================
// UIButton
// ============================================================================

bool Test_Button_Size() {
    auto button = UIButton::Create("OK", MakeSharedValue<bool>(false));
    TEST_ASSERT(button->GetType() == UIElementType::Button, "类型为 Button");
    TEST_ASSERT(button->GetWidthMode() == SizeMode::Content, "控件默认 Content");
    TEST_ASSERT(button->GetWidth() == 36.0f, "文本宽 16 + 20");
    TEST_ASSERT(button->GetHeight() == 30.0f, "max(20 + 10, 30)");

    auto empty = UIButton::Create("", MakeSharedValue<bool>(false));
    TEST_ASSERT(empty->GetSize() == Size(60.0f, 30.0f), "空文本按钮 60x30");

    auto fixed = UIButton::Create("OK", MakeSharedValue<bool>(false), {.width = 200.0f});
    TEST_ASSERT(fixed->GetWidth() == 200.0f, "显式宽度优先");
    TEST_ASSERT(fixed->GetHeight() == 30.0f, "高度仍由内容决定");
    return true;
}

bool Test_Button_RequiresCell() {
    bool threw = false;
    try {
        auto button = UIButton::Create("OK", nullptr);
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::NullPointer;
    }
    TEST_ASSERT(threw, "空状态单元格应抛出 NullPointer");
    return true;
}

bool Test_Button_ClickLifecycle() {
    auto clicked = MakeSharedValue<bool>(false);
    auto button = UIButton::Create("Apply", clicked);
    auto* kind = button->As<UIButton>();
    int handlerCalls = 0;
    kind->SetClickHandler([&handlerCalls]() { ++handlerCalls; });

    LatticeTest::RecordingPainter painter;
    painter.nextButtonClick = true;
    button->Render(painter);
    TEST_ASSERT(clicked->Get(), "点击后单元格为 true");
    TEST_ASSERT(kind->WasClicked(), "WasClicked 读取同一单元格");
    TEST_ASSERT(handlerCalls == 1, "回调被调用一次");

    button->Render(painter);
    TEST_ASSERT(!clicked->Get(), "下一帧未点击时复位");
    TEST_ASSERT(handlerCalls == 1, "未点击不触发回调");
    return true;
}

bool Test_Button_DisabledIgnoresClicks() {
    auto clicked = MakeSharedValue<bool>(false);
    auto button = UIButton::Create("Apply", clicked);
    button->As<UIButton>()->SetDisabled(true);

    LatticeTest::RecordingPainter painter;
    painter.nextButtonClick = true;
    button->Render(painter);
    TEST_ASSERT(painter.Count("ButtonDisabled") == 1, "以禁用状态绘制");
    TEST_ASSERT(!clicked->Get(), "禁用时点击无效");
    return true;
}

bool Test_Button_SetTextResizes() {
    auto stack = UIStack::Create();
    auto* button = stack->AddChild(UIButton::Create("OK", MakeSharedValue<bool>(false)));
    TEST_ASSERT(stack->GetWidth() == 36.0f, "初始宽度");

    button->As<UIButton>()->SetText("Cancel");
    TEST_ASSERT(button->GetWidth() == 68.0f, "文本宽 48 + 20");
    TEST_ASSERT(stack->GetWidth() == 68.0f, "父元素随之更新");
    return true;
}

bool Test_Button_Tooltip() {
    auto button = UIButton::Create("OK", MakeSharedValue<bool>(false));
    button->As<UIButton>()->SetTooltip("Confirm the dialog");

    LatticeTest::RecordingPainter painter;
    button->Render(painter);
    const auto* tooltip = painter.Find("Tooltip");
    TEST_ASSERT(tooltip != nullptr, "注册了提示");
    TEST_ASSERT(tooltip->text == "Confirm the dialog", "提示文本");
    TEST_ASSERT(tooltip->rect == button->GetRect(), "提示矩形为控件矩形");
    return true;
}

// ============================================================================
// UICheckbox / UIRadioButton
// ============================================================================

bool Test_Checkbox_SizeAndToggle() {
    auto checked = MakeSharedValue<bool>(false);
    auto checkbox = UICheckbox::Create("Agree", checked);
    TEST_ASSERT(checkbox->GetSize() == Size(68.0f, 24.0f), "24 + 4 + 40 x 24");

    auto bare = UICheckbox::Create("", MakeSharedValue<bool>(true));
    TEST_ASSERT(bare->GetSize() == Size(24.0f, 24.0f), "无标签 24x24");

    LatticeTest::RecordingPainter painter;
    painter.nextCheckbox = true;
    checkbox->Render(painter);
    TEST_ASSERT(checked->Get(), "勾选写回单元格");
    TEST_ASSERT(checkbox->As<UICheckbox>()->HasChanged(), "本帧发生变化");

    checkbox->Render(painter);
    TEST_ASSERT(checked->Get(), "保持勾选");
    TEST_ASSERT(!checkbox->As<UICheckbox>()->HasChanged(), "下一帧无变化");
    return true;
}

bool Test_RadioButton_SharedSelection() {
    auto selected = MakeSharedValue<int>(0);
    auto first = UIRadioButton::Create("A", selected, 0);
    auto second = UIRadioButton::Create("B", selected, 1);
    TEST_ASSERT(first->GetSize() == Size(38.0f, 24.0f), "24 + 6 + 8 x max(24, 20)");

    TEST_ASSERT(first->As<UIRadioButton>()->IsSelected(), "初始选中第一个");
    LatticeTest::RecordingPainter painter;
    painter.nextRadioClick = true;
    second->Render(painter);
    TEST_ASSERT(selected->Get() == 1, "点击写入自身索引");
    TEST_ASSERT(!first->As<UIRadioButton>()->IsSelected(), "第一个取消选中");
    TEST_ASSERT(second->As<UIRadioButton>()->IsSelected(), "第二个选中");
    return true;
}

// ============================================================================
// UISlider
// ============================================================================

bool Test_Slider_Size() {
    auto plain = UISlider::Create({});
    TEST_ASSERT(plain->GetSize() == Size(120.0f, 22.0f), "无标签 120x22");

    auto labeled = UISlider::Create({.label = "Volume"});
    TEST_ASSERT(labeled->GetSize() == Size(120.0f, 42.0f), "标签行 20 + 22");

    auto wide = UISlider::Create({.label = "A very long slider caption"});
    TEST_ASSERT(wide->GetWidth() == 208.0f, "标签宽度超过滑块宽度");
    return true;
}

bool Test_Slider_NormalizeAndValidate() {
    auto slider = UISlider::Create({.min = 0.0f, .max = 10.0f, .roundTo = 0.5f});
    auto* kind = slider->As<UISlider>();
    TEST_ASSERT_NEAR(kind->Normalize(3.26f), 3.5f, 1e-5f, "取整到 0.5 的倍数");
    TEST_ASSERT(kind->Normalize(15.0f) == 10.0f, "夹紧到最大值");
    TEST_ASSERT(kind->Normalize(-3.0f) == 0.0f, "夹紧到最小值");
    TEST_ASSERT(kind->GetValue() == 0.0f, "未给出单元格时从最小值开始");

    bool threw = false;
    try {
        auto invalid = UISlider::Create({.min = 5.0f, .max = 1.0f});
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::InvalidArgument;
    }
    TEST_ASSERT(threw, "min > max 应抛出 InvalidArgument");
    return true;
}

bool Test_Slider_PaintUpdatesValue() {
    auto value = MakeSharedValue<float>(2.0f);
    auto slider = UISlider::Create({.label = "Gain", .value = value, .min = 0.0f, .max = 10.0f, .roundTo = 1.0f});

    LatticeTest::RecordingPainter painter;
    painter.nextSliderValue = 7.3f;
    slider->Render(painter);
    TEST_ASSERT(value->Get() == 7.0f, "交互结果被取整后写回");
    TEST_ASSERT(slider->As<UISlider>()->HasChanged(), "本帧发生变化");
    TEST_ASSERT(painter.labelAnchors.size() == 1 && painter.labelAnchors[0] == UIAlignment::UpperCenter,
                "标签居中绘制");
    TEST_ASSERT(painter.Find("Slider")->rect.y == 20.0f, "滑块位于标签下方");

    slider->Render(painter);
    TEST_ASSERT(!slider->As<UISlider>()->HasChanged(), "下一帧无变化");
    return true;
}

// ============================================================================
// UITextEntry
// ============================================================================

bool Test_TextEntry_Size() {
    auto text = MakeSharedValue<std::string>("");
    auto single = UITextEntry::Create({.text = text});
    TEST_ASSERT(single->GetSize() == Size(150.0f, 20.0f), "单行 150x20");

    auto area = UITextEntry::Create({.label = "Notes", .text = text, .lineCount = 3});
    TEST_ASSERT(area->GetSize() == Size(150.0f, 80.0f), "标签 20 + 三行 60");

    auto clamped = UITextEntry::Create({.text = text, .lineCount = 0});
    TEST_ASSERT(clamped->As<UITextEntry>()->GetLineCount() == 1, "行数至少为 1");
    return true;
}

bool Test_TextEntry_RequiresCell() {
    bool threw = false;
    try {
        auto entry = UITextEntry::Create({.label = "Name"});
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::NullPointer;
    }
    TEST_ASSERT(threw, "空文本单元格应抛出 NullPointer");
    return true;
}

bool Test_TextEntry_EditAndMaxLength() {
    auto text = MakeSharedValue<std::string>("abc");
    auto entry = UITextEntry::Create({.text = text, .maxLength = size_t{5}});

    LatticeTest::RecordingPainter painter;
    painter.nextText = std::string("HelloWorld");
    entry->Render(painter);
    TEST_ASSERT(text->Get() == "Hello", "超出最大长度的文本被截断");
    TEST_ASSERT(entry->As<UITextEntry>()->HasChanged(), "本帧发生变化");
    TEST_ASSERT(painter.Count("TextField") == 1, "单行使用文本框");

    entry->As<UITextEntry>()->SetLineCount(4);
    painter.Reset();
    entry->Render(painter);
    TEST_ASSERT(painter.Count("TextArea") == 1, "多行使用文本区");
    TEST_ASSERT(!entry->As<UITextEntry>()->HasChanged(), "未编辑时无变化");
    TEST_ASSERT(entry->GetHeight() == 80.0f, "行数变化后高度更新");
    return true;
}

// ============================================================================
// UIDropdown
// ============================================================================

bool Test_Dropdown_SizeAndSelection() {
    auto selected = MakeSharedValue<int>(-1);
    auto dropdown = UIDropdown::Create({"Small", "Medium", "Large"}, selected, "Pick a size");
    auto* kind = dropdown->As<UIDropdown>();
    TEST_ASSERT(dropdown->GetSize() == Size(150.0f, 30.0f), "短条目使用最小宽度");
    TEST_ASSERT(kind->GetDisplayText() == "Pick a size", "未选择时显示占位文本");

    LatticeTest::RecordingPainter painter;
    painter.nextDropdownChoice = 2;
    dropdown->Render(painter);
    TEST_ASSERT(selected->Get() == 2, "选择写回单元格");
    TEST_ASSERT(kind->HasChanged(), "本帧发生变化");
    TEST_ASSERT(kind->GetDisplayText() == "Large", "显示选中条目");

    painter.nextDropdownChoice = 7;
    dropdown->Render(painter);
    TEST_ASSERT(selected->Get() == 2, "越界选择被忽略");
    TEST_ASSERT(!kind->HasChanged(), "无变化");
    return true;
}

bool Test_Dropdown_WidthFromLongestItem() {
    auto dropdown = UIDropdown::Create({"x", "An unusually long item"}, MakeSharedValue<int>(0));
    TEST_ASSERT(dropdown->GetWidth() == 206.0f, "22 * 8 + 30");

    dropdown->As<UIDropdown>()->SetItems({"a", "b"});
    TEST_ASSERT(dropdown->GetWidth() == 150.0f, "条目变化后宽度更新");
    return true;
}

bool Test_TextEntry_MaxLengthCountsCodePoints() {
    auto text = MakeSharedValue<std::string>("");
    auto entry = UITextEntry::Create({.text = text, .maxLength = size_t{3}});

    LatticeTest::RecordingPainter painter;
    painter.nextText = std::string("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9");  // "éééé"
    entry->Render(painter);
    TEST_ASSERT(text->Get() == "\xC3\xA9\xC3\xA9\xC3\xA9", "保留三个完整字符");
    TEST_ASSERT(text->Get().size() == 6, "不会切断多字节序列");

    painter.Reset();
    painter.nextText = std::string("a\xE4\xB8\xAD\xE6\x96\x87z");  // "a中文z"
    entry->Render(painter);
    TEST_ASSERT(text->Get() == "a\xE4\xB8\xAD\xE6\x96\x87", "三字节字符按一个字符计数");
    TEST_ASSERT(CountCodePoints(text->Get()) == 3, "码点数等于最大长度");
    return true;
}

// ============================================================================
// UINumericField
// ============================================================================

bool Test_NumericField_Size() {
    auto plain = UIIntField::Create({});
    TEST_ASSERT(plain->GetType() == UIElementType::NumericField, "类型为 NumericField");
    TEST_ASSERT(plain->GetSize() == Size(120.0f, 20.0f), "无标签 120x20");

    auto above = UIIntField::Create({.label = "Count"});
    TEST_ASSERT(above->GetSize() == Size(120.0f, 40.0f), "标签在上：两行");

    auto inlineField = UIIntField::Create({.label = "Count", .placement = UINumericLabelPlacement::Inline});
    TEST_ASSERT(inlineField->GetSize() == Size(166.0f, 20.0f), "标签在左：40 + 6 + 120");

    inlineField->As<UIIntField>()->SetPlacement(UINumericLabelPlacement::Above);
    TEST_ASSERT(inlineField->GetSize() == Size(120.0f, 40.0f), "切换布局后尺寸更新");
    return true;
}

bool Test_NumericField_Parse() {
    TEST_ASSERT(UIIntField::Parse(" 42 ") == 42, "允许首尾空格");
    TEST_ASSERT(UIIntField::Parse("+7") == 7, "允许正号");
    TEST_ASSERT(UIIntField::Parse("-3") == -3, "负数");
    TEST_ASSERT(!UIIntField::Parse("4x").has_value(), "尾部垃圾字符不能解析");
    TEST_ASSERT(!UIIntField::Parse("3.5").has_value(), "整数不接受小数");
    TEST_ASSERT(!UIIntField::Parse("-").has_value(), "输入到一半的负号");
    TEST_ASSERT(!UIIntField::Parse("").has_value(), "空文本");
    TEST_ASSERT(UIFloatField::Parse("2.5") == 2.5f, "浮点解析");
    TEST_ASSERT(UIIntField::Format(-12) == "-12", "格式化");
    return true;
}

bool Test_NumericField_EditClampsAndKeepsBuffer() {
    auto value = MakeSharedValue<int>(5);
    auto field = UIIntField::Create({.value = value, .min = 0, .max = 10});
    auto* kind = field->As<UIIntField>();
    TEST_ASSERT(kind->GetBuffer() == "5", "缓冲区初始为当前值");

    LatticeTest::RecordingPainter painter;
    painter.nextText = std::string("8");
    field->Render(painter);
    TEST_ASSERT(value->Get() == 8, "解析成功写回单元");
    TEST_ASSERT(kind->HasChanged(), "本帧发生变化");

    painter.nextText = std::string("-");
    field->Render(painter);
    TEST_ASSERT(value->Get() == 8, "解析失败时数值不变");
    TEST_ASSERT(kind->GetBuffer() == "-", "解析失败时保留缓冲区");
    TEST_ASSERT(!kind->HasChanged(), "数值未变化");

    painter.nextText = std::string("25");
    field->Render(painter);
    TEST_ASSERT(value->Get() == 10, "超出范围被夹紧");
    TEST_ASSERT(kind->GetBuffer() == "10", "夹紧后缓冲区重新格式化");

    value->Set(3);
    painter.Reset();
    field->Render(painter);
    TEST_ASSERT(painter.Find("TextField")->text == "3", "外部修改后缓冲区跟随新值");
    return true;
}

bool Test_NumericField_InlineLayoutAndRange() {
    auto field = UIFloatField::Create({.label = "Gain", .min = 0.0f, .max = 2.0f,
                                       .placement = UINumericLabelPlacement::Inline});
    LatticeTest::RecordingPainter painter;
    field->Render(painter);
    TEST_ASSERT(painter.Find("Label")->rect.width == 32.0f, "标签占文本宽度");
    TEST_ASSERT(painter.Find("TextField")->rect.x == 38.0f, "输入框在标签右侧");

    auto* kind = field->As<UIFloatField>();
    kind->SetValue(5.0f);
    TEST_ASSERT(kind->GetValue() == 2.0f, "SetValue 夹紧");

    bool threw = false;
    try {
        kind->SetRange(3.0f, 1.0f);
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::InvalidArgument;
    }
    TEST_ASSERT(threw, "反向范围应抛出 InvalidArgument");

    threw = false;
    try {
        auto invalid = UIIntField::Create({.min = 5, .max = 1});
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::InvalidArgument;
    }
    TEST_ASSERT(threw, "min > max 应抛出 InvalidArgument");
    return true;
}

// ============================================================================
// UIIntSlider
// ============================================================================

bool Test_IntSlider_SizeAndRounding() {
    auto plain = UIIntSlider::Create({});
    TEST_ASSERT(plain->GetType() == UIElementType::IntSlider, "类型为 IntSlider");
    TEST_ASSERT(plain->GetSize() == Size(120.0f, 22.0f), "无标签 120x22");

    auto value = MakeSharedValue<int>(10);
    auto slider = UIIntSlider::Create({.label = "Steps", .value = value, .min = 0, .max = 20});
    TEST_ASSERT(slider->GetSize() == Size(120.0f, 42.0f), "标签行 20 + 22");

    LatticeTest::RecordingPainter painter;
    painter.nextSliderValue = 12.6f;
    slider->Render(painter);
    TEST_ASSERT(value->Get() == 13, "拖动结果四舍五入为整数");
    TEST_ASSERT(slider->As<UIIntSlider>()->HasChanged(), "本帧发生变化");
    TEST_ASSERT(painter.Find("Slider")->rect.y == 20.0f, "滑块位于标签下方");

    painter.nextSliderValue = 50.0f;
    slider->Render(painter);
    TEST_ASSERT(value->Get() == 20, "夹紧到最大值");
    return true;
}

bool Test_IntSlider_Percentage() {
    auto slider = UIIntSlider::Create({.min = 0, .max = 20});
    auto* kind = slider->As<UIIntSlider>();
    TEST_ASSERT(kind->GetValue() == 0, "未给出单元格时从最小值开始");

    kind->SetToPercentage(0.25f);
    TEST_ASSERT(kind->GetValue() == 5, "25% 对应 5");
    TEST_ASSERT_NEAR(kind->GetPercentage(), 0.25f, 1e-5f, "百分比");

    kind->SetToPercentage(2.0f);
    TEST_ASSERT(kind->GetValue() == 20, "百分比夹紧到 1");

    kind->SetRange(5, 5);
    TEST_ASSERT(kind->GetValue() == 5, "范围收缩后值被夹紧");
    TEST_ASSERT(kind->GetPercentage() == 0.0f, "零跨度时百分比为 0");

    bool threw = false;
    try {
        kind->SetRange(3, 1);
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::InvalidArgument;
    }
    TEST_ASSERT(threw, "反向范围应抛出 InvalidArgument");
    return true;
}

// ============================================================================
// UIRangeSlider
// ============================================================================

bool Test_RangeSlider_GapAndClamp() {
    auto range = MakeSharedValue<UIValueRange<int>>({2, 8});
    auto slider = UIIntRangeSlider::Create({.range = range, .min = 0, .max = 10, .gap = 2});
    auto* kind = slider->As<UIIntRangeSlider>();
    TEST_ASSERT(slider->GetType() == UIElementType::RangeSlider, "类型为 RangeSlider");
    TEST_ASSERT(slider->GetSize() == Size(200.0f, 31.0f), "尺寸 200x31");

    kind->SetValues(5, 5);
    TEST_ASSERT(kind->GetLower() == 4 && kind->GetUpper() == 6, "间距不足时围绕中点展开");

    kind->SetValues(9, 12);
    TEST_ASSERT(kind->GetLower() == 8 && kind->GetUpper() == 10, "展开后推回上边界之内");

    kind->SetValues(4, 6);
    kind->SetLower(7);
    TEST_ASSERT(kind->GetLower() == 4, "下端不能越过 upper - gap");
    kind->SetUpper(1);
    TEST_ASSERT(kind->GetUpper() == 6, "上端不能低于 lower + gap");

    kind->SetToFullRange();
    TEST_ASSERT(range->Get() == (UIValueRange<int>{0, 10}), "全范围");
    kind->SetToSingleValue(3);
    TEST_ASSERT(range->Get() == (UIValueRange<int>{3, 3}), "单值忽略间距");
    TEST_ASSERT(kind->GetTotalSpan() == 10, "总跨度");
    return true;
}

bool Test_RangeSlider_PaintRoundsResult() {
    auto range = MakeSharedValue<UIValueRange<int>>({0, 10});
    auto slider = UIIntRangeSlider::Create({.range = range, .min = 0, .max = 10});

    LatticeTest::RecordingPainter painter;
    painter.nextRange = UIValueRange<float>{2.4f, 7.6f};
    slider->Render(painter);
    TEST_ASSERT(range->Get() == (UIValueRange<int>{2, 8}), "整数范围四舍五入");
    TEST_ASSERT(slider->As<UIIntRangeSlider>()->HasChanged(), "本帧发生变化");
    TEST_ASSERT(painter.Count("RangeSlider") == 1, "绘制范围滑块");

    slider->Render(painter);
    TEST_ASSERT(!slider->As<UIIntRangeSlider>()->HasChanged(), "下一帧无变化");

    auto floatRange = MakeSharedValue<UIValueRange<float>>({0.0f, 1.0f});
    auto floatSlider = UIFloatRangeSlider::Create({.range = floatRange, .min = 0.0f, .max = 10.0f, .roundTo = 0.5f});
    painter.nextRange = UIValueRange<float>{1.2f, 3.9f};
    floatSlider->Render(painter);
    TEST_ASSERT(floatRange->Get() == (UIValueRange<float>{1.0f, 4.0f}), "浮点范围取整到 0.5");

    floatSlider->As<UIFloatRangeSlider>()->SetValues(6.0f, 4.0f);
    TEST_ASSERT(floatRange->Get() == (UIValueRange<float>{4.0f, 4.0f}), "无间距时反向区间收拢到上端");
    return true;
}

bool Test_RangeSlider_Validation() {
    bool threw = false;
    try {
        auto slider = UIIntRangeSlider::Create({.min = 0, .max = 10});
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::NullPointer;
    }
    TEST_ASSERT(threw, "空范围单元应抛出 NullPointer");

    threw = false;
    try {
        auto slider = UIIntRangeSlider::Create({.range = MakeSharedValue<UIValueRange<int>>(), .min = 0, .max = 3,
                                                .gap = 5});
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::InvalidArgument;
    }
    TEST_ASSERT(threw, "间距超过范围应抛出 InvalidArgument");
    return true;
}

// ============================================================================
// UIImageButton
// ============================================================================

bool Test_ImageButton_SizeAndClick() {
    auto clicked = MakeSharedValue<bool>(false);
    auto button = UIImageButton::Create(UITexture{.handle = 3, .width = 64.0f, .height = 48.0f}, clicked);
    TEST_ASSERT(button->GetType() == UIElementType::ImageButton, "类型为 ImageButton");
    TEST_ASSERT(button->GetSize() == Size(64.0f, 48.0f), "取纹理尺寸");

    auto fallback = UIImageButton::Create(UITexture{}, MakeSharedValue<bool>(false));
    TEST_ASSERT(fallback->GetSize() == Size(32.0f, 32.0f), "无纹理 32x32");

    LatticeTest::RecordingPainter painter;
    painter.nextImageClick = true;
    button->Render(painter);
    TEST_ASSERT(clicked->Get(), "点击后单元格为 true");
    button->Render(painter);
    TEST_ASSERT(!clicked->Get(), "下一帧未点击时复位");

    button->As<UIImageButton>()->SetDisabled(true);
    painter.Reset();
    painter.nextImageClick = true;
    button->Render(painter);
    TEST_ASSERT(!clicked->Get(), "禁用时忽略点击");
    TEST_ASSERT(painter.Count("ImageButtonDisabled") == 1, "以禁用状态绘制");

    button->As<UIImageButton>()->SetTexture(UITexture{.handle = 4, .width = 16.0f, .height = 16.0f});
    TEST_ASSERT(button->GetSize() == Size(16.0f, 16.0f), "更换纹理后尺寸更新");

    bool threw = false;
    try {
        auto invalid = UIImageButton::Create(UITexture{}, nullptr);
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::NullPointer;
    }
    TEST_ASSERT(threw, "空状态单元格应抛出 NullPointer");
    return true;
}

// ============================================================================
// UIColorPicker
// ============================================================================

bool Test_ColorPicker_Size() {
    auto color = MakeSharedValue<Color>(Color::White());
    auto picker = UIColorPicker::Create({.text = "Tint", .color = color});
    auto* kind = picker->As<UIColorPicker>();
    TEST_ASSERT(picker->GetType() == UIElementType::ColorPicker, "类型为 ColorPicker");
    TEST_ASSERT(picker->GetSize() == Size(80.0f, 30.0f), "文本 32 + 20 + 色块 20 + 间距 8");

    kind->SetShowSwatch(false);
    TEST_ASSERT(picker->GetSize() == Size(52.0f, 30.0f), "无色块时与按钮相同");

    kind->SetShowSwatch(true);
    kind->SetSwatchSize(40.0f);
    TEST_ASSERT(picker->GetSize() == Size(100.0f, 50.0f), "大色块撑高按钮");

    kind->SetSwatchSize(2.0f);
    TEST_ASSERT(kind->GetSwatchSize() == 10.0f, "色块不小于最小尺寸");
    TEST_ASSERT(kind->GetPalette().size() == 16, "未设置调色板时使用默认调色板");
    return true;
}

bool Test_ColorPicker_OpensHostPicker() {
    auto color = MakeSharedValue<Color>(Color::White());
    auto picker = UIColorPicker::Create({.text = "Tint", .color = color, .mode = UIColorPickerMode::Palette});

    LatticeTest::RecordingPainter painter;
    picker->Render(painter);
    TEST_ASSERT(painter.colorPickerOpens == 0, "未点击不打开取色窗口");
    TEST_ASSERT(painter.filledRects.size() == 1, "绘制色块");
    TEST_ASSERT(painter.filledRects[0] == Rect(8.0f, 5.0f, 20.0f, 20.0f), "色块在左侧垂直居中");
    TEST_ASSERT(painter.Find("Label")->rect.x == 36.0f, "文本位于色块右侧");

    painter.nextButtonClick = true;
    painter.nextPickedColor = Color(1.0f, 0.0f, 0.0f);
    picker->Render(painter);
    TEST_ASSERT(painter.colorPickerOpens == 1, "点击后打开取色窗口");
    TEST_ASSERT(painter.lastPickerMode == UIColorPickerMode::Palette, "传递取色模式");
    TEST_ASSERT(color->Get() == Color(1.0f, 0.0f, 0.0f), "取色结果写入颜色单元");

    bool threw = false;
    try {
        auto invalid = UIColorPicker::Create({.text = "Tint"});
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::NullPointer;
    }
    TEST_ASSERT(threw, "空颜色单元应抛出 NullPointer");
    return true;
}

// ============================================================================
// UILabel
// ============================================================================

bool Test_Label_Size() {
    auto label = UILabel::Create("Hello");
    TEST_ASSERT(label->GetSize() == Size(40.0f, 20.0f), "5 * 8 x 20");

    auto empty = UILabel::Create("");
    TEST_ASSERT(empty->GetSize() == Size(1.0f, 20.0f), "空标签 1 x 行高");
    return true;
}

bool Test_Label_WordWrap() {
    auto wrapped = UILabel::Create("aaaa bbbb cccc", true, 80.0f);
    TEST_ASSERT(wrapped->GetSize() == Size(80.0f, 40.0f), "在 80 宽度内换成两行");

    auto capped = UILabel::Create(std::string(50, 'x'), true);
    TEST_ASSERT(capped->GetWidth() == 300.0f, "未给出最大宽度时上限 300");
    TEST_ASSERT(capped->GetHeight() == 40.0f, "超长单词截断成两行");

    auto narrow = UILabel::Create("short", true);
    TEST_ASSERT(narrow->GetWidth() == 40.0f, "短文本取实际宽度");
    return true;
}

bool Test_Label_WrapsAtResolvedWidth() {
    const std::string text = "alpha beta gamma delta epsilon zeta eta theta";
    auto fixed = UILabel::Create(text, true, std::nullopt, {.width = 100.0f});
    TEST_ASSERT(fixed->GetWidth() == 100.0f, "固定宽度");
    TEST_ASSERT(fixed->GetHeight() == 80.0f, "在 100 宽度内换成四行");

    auto stack = UIStack::Create({.width = 100.0f});
    UIElement* filled = stack->AddChild(UILabel::Create(text, true, std::nullopt, {.widthMode = SizeMode::Fill}));
    TEST_ASSERT(filled->GetHeight() == 80.0f, "Fill 宽度取父元素宽度后换行");
    TEST_ASSERT(stack->GetHeight() == 80.0f, "父元素高度包含换行后的标签");

    stack->SetWidth(200.0f);
    TEST_ASSERT(filled->GetHeight() == 40.0f, "父元素变宽后重新换成两行");
    TEST_ASSERT(stack->GetHeight() == 40.0f, "父元素高度随之更新");
    return true;
}

bool Test_Label_PaintUsesAlignment() {
    auto label = UILabel::Create("Title", false, std::nullopt, {.alignment = UIAlignment::MiddleRight});
    LatticeTest::RecordingPainter painter;
    label->Render(painter);
    TEST_ASSERT(painter.labelAnchors.size() == 1, "绘制一次");
    TEST_ASSERT(painter.labelAnchors[0] == UIAlignment::MiddleRight, "使用元素对齐方式");
    TEST_ASSERT(painter.Find("Label")->text == "Title", "文本");
    return true;
}

// ============================================================================
// UILine / UIEmpty
// ============================================================================

bool Test_Line_Size() {
    auto horizontal = UILine::Create(UILineOrientation::Horizontal, 2.0f);
    TEST_ASSERT(horizontal->GetSize() == Size(100.0f, 2.0f), "水平线 100 x 粗细");

    auto vertical = UILine::Create(UILineOrientation::Vertical, 3.0f);
    TEST_ASSERT(vertical->GetSize() == Size(3.0f, 100.0f), "垂直线 粗细 x 100");

    auto hairline = UILine::Create(UILineOrientation::Horizontal, 0.0f);
    TEST_ASSERT_NEAR(hairline->As<UILine>()->GetThickness(), 0.1f, 1e-6f, "粗细至少为 0.1");
    return true;
}

bool Test_Line_PaintRespectsAlignment() {
    auto line = UILine::Create(UILineOrientation::Horizontal, 2.0f, Color::White(),
                               {.height = 20.0f, .alignment = UIAlignment::MiddleCenter});
    LatticeTest::RecordingPainter painter;
    line->Render(painter);
    TEST_ASSERT(painter.lines.size() == 1, "绘制一条线");
    TEST_ASSERT(painter.lines[0].first == Vector2(0.0f, 10.0f), "起点位于矩形垂直中点");
    TEST_ASSERT(painter.lines[0].second == Vector2(100.0f, 10.0f), "终点位于矩形右侧");

    line->SetAlignment(UIAlignment::LowerLeft);
    painter.Reset();
    line->Render(painter);
    TEST_ASSERT(painter.lines[0].first.y() == 19.0f, "底部对齐时线宽不越出矩形");
    return true;
}

bool Test_Empty_Size() {
    auto spacer = UIEmpty::Create();
    TEST_ASSERT(spacer->GetType() == UIElementType::Empty, "类型为 Empty");
    TEST_ASSERT(spacer->GetSize() == Size(10.0f, 10.0f), "10x10");

    LatticeTest::RecordingPainter painter;
    spacer->Render(painter);
    TEST_ASSERT(painter.calls.empty(), "不绘制任何内容");
    return true;
}

// ============================================================================
// 组合
// ============================================================================

bool Test_Widgets_InStack() {
    auto stack = UIStack::Create({}, 4.0f);
    stack->AddChild(UILabel::Create("Settings"));
    stack->AddChild(UICheckbox::Create("Enable", MakeSharedValue<bool>(true)));
    stack->AddChild(UIButton::Create("Save", MakeSharedValue<bool>(false)));

    TEST_ASSERT(stack->GetWidth() == 76.0f, "最宽的是复选框 24 + 4 + 48");
    TEST_ASSERT(stack->GetHeight() == 82.0f, "20 + 24 + 30 + 4*2");

    LatticeTest::RecordingPainter painter;
    stack->Render(painter);
    TEST_ASSERT(painter.Find("Button")->rect == Rect(0.0f, 52.0f, 52.0f, 30.0f), "按钮位于第三行");
    return true;
}

// ============================================================================
// 主函数
// ============================================================================

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    std::cout << "========================================" << std::endl;
    std::cout << "叶子控件测试开始" << std::endl;
    std::cout << "========================================" << std::endl;

    Logger::GetInstance().SetLogToFile(false);
    Logger::GetInstance().SetLogLevel(LogLevel::Warning);

    std::cout << "\n[UIButton 测试]" << std::endl;
    RUN_TEST(Test_Button_Size);
    RUN_TEST(Test_Button_RequiresCell);
    RUN_TEST(Test_Button_ClickLifecycle);
    RUN_TEST(Test_Button_DisabledIgnoresClicks);
    RUN_TEST(Test_Button_SetTextResizes);
    RUN_TEST(Test_Button_Tooltip);

    std::cout << "\n[UICheckbox / UIRadioButton 测试]" << std::endl;
    RUN_TEST(Test_Checkbox_SizeAndToggle);
    RUN_TEST(Test_RadioButton_SharedSelection);

    std::cout << "\n[UISlider 测试]" << std::endl;
    RUN_TEST(Test_Slider_Size);
    RUN_TEST(Test_Slider_NormalizeAndValidate);
    RUN_TEST(Test_Slider_PaintUpdatesValue);

    std::cout << "\n[UITextEntry 测试]" << std::endl;
    RUN_TEST(Test_TextEntry_Size);
    RUN_TEST(Test_TextEntry_RequiresCell);
    RUN_TEST(Test_TextEntry_EditAndMaxLength);
    RUN_TEST(Test_TextEntry_MaxLengthCountsCodePoints);

    std::cout << "\n[UIDropdown 测试]" << std::endl;
    RUN_TEST(Test_Dropdown_SizeAndSelection);
    RUN_TEST(Test_Dropdown_WidthFromLongestItem);

    std::cout << "\n[UINumericField 测试]" << std::endl;
    RUN_TEST(Test_NumericField_Size);
    RUN_TEST(Test_NumericField_Parse);
    RUN_TEST(Test_NumericField_EditClampsAndKeepsBuffer);
    RUN_TEST(Test_NumericField_InlineLayoutAndRange);

    std::cout << "\n[UIIntSlider / UIRangeSlider 测试]" << std::endl;
    RUN_TEST(Test_IntSlider_SizeAndRounding);
    RUN_TEST(Test_IntSlider_Percentage);
    RUN_TEST(Test_RangeSlider_GapAndClamp);
    RUN_TEST(Test_RangeSlider_PaintRoundsResult);
    RUN_TEST(Test_RangeSlider_Validation);

    std::cout << "\n[UIImageButton / UIColorPicker 测试]" << std::endl;
    RUN_TEST(Test_ImageButton_SizeAndClick);
    RUN_TEST(Test_ColorPicker_Size);
    RUN_TEST(Test_ColorPicker_OpensHostPicker);

    std::cout << "\n[UILabel 测试]" << std::endl;
    RUN_TEST(Test_Label_Size);
    RUN_TEST(Test_Label_WordWrap);
    RUN_TEST(Test_Label_WrapsAtResolvedWidth);
    RUN_TEST(Test_Label_PaintUsesAlignment);

    std::cout << "\n[UILine / UIEmpty 测试]" << std::endl;
    RUN_TEST(Test_Line_Size);
    RUN_TEST(Test_Line_PaintRespectsAlignment);
    RUN_TEST(Test_Empty_Size);

    std::cout << "\n[组合测试]" << std::endl;
    RUN_TEST(Test_Widgets_InStack);

    // 打印统计
    std::cout << "\n========================================" << std::endl;
    std::cout << "测试完成" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "总测试数: " << g_testCount << std::endl;
    std::cout << "通过: " << g_passedCount << " ✓" << std::endl;
    std::cout << "失败: " << g_failedCount << " ✗" << std::endl;

    if (g_failedCount > 0) {
        std::cout << "\n❌ 部分测试失败" << std::endl;
        return 1;  // CTest 会识别非零返回码为失败
    }

    std::cout << "\n✅ 所有测试通过" << std::endl;
    return 0;  // CTest 识别返回 0 为成功
}
