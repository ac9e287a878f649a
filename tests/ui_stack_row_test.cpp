/**
 * @file ui_stack_row_test.cpp
 * @brief UIStack / UIRow 一维布局测试（CTest 兼容版本）
 */

#include "lattice/logger.h"
#include "lattice/ui/layout/ui_row.h"
#include "lattice/ui/layout/ui_stack.h"
#include "lattice/ui/ui_layout_config.h"
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

UIElementPtr MakeBox(float width, float height) {
    UIElementOptions options;
    options.width = width;
    options.height = height;
    return UIElement::Create(std::move(options));
}

// ============================================================================
// UIStack
// ============================================================================

bool Test_Stack_DefaultsToContent() {
    auto stack = UIStack::Create();
    TEST_ASSERT(stack->GetType() == UIElementType::Stack, "类型为 Stack");
    TEST_ASSERT(stack->GetWidthMode() == SizeMode::Content, "默认宽度模式 Content");
    TEST_ASSERT(stack->GetHeightMode() == SizeMode::Content, "默认高度模式 Content");
    TEST_ASSERT(stack->As<UIStack>()->GetSpacing() == GetLayoutConfig().stackSpacing, "默认间距来自配置");
    return true;
}

bool Test_Stack_EmptyUsesDefaultSize() {
    auto stack = UIStack::Create();
    TEST_ASSERT(stack->GetWidth() == 50.0f, "空 Stack 宽 50");
    TEST_ASSERT(stack->GetHeight() == 30.0f, "空 Stack 高 30");
    return true;
}

bool Test_Stack_ContentSize() {
    auto stack = UIStack::Create({}, 10.0f);
    stack->AddChild(MakeBox(80.0f, 20.0f));
    stack->AddChild(MakeBox(120.0f, 30.0f));
    stack->AddChild(MakeBox(60.0f, 40.0f));

    TEST_ASSERT(stack->GetWidth() == 120.0f, "宽度为子元素最大宽度");
    TEST_ASSERT(stack->GetHeight() == 110.0f, "高度为 20+30+40 加两段间距");
    return true;
}

bool Test_Stack_ArrangesTopToBottom() {
    auto stack = UIStack::Create({.x = 5.0f, .y = 7.0f}, 4.0f);
    auto* a = stack->AddChild(MakeBox(10.0f, 20.0f));
    auto* b = stack->AddChild(MakeBox(30.0f, 15.0f));
    auto* c = stack->AddChild(MakeBox(20.0f, 5.0f));

    stack->UpdateLayout();
    TEST_ASSERT(a->GetPosition() == Vector2(5.0f, 7.0f), "第一个子元素在原点");
    TEST_ASSERT(b->GetPosition() == Vector2(5.0f, 31.0f), "第二个子元素 7 + 20 + 4");
    TEST_ASSERT(c->GetPosition() == Vector2(5.0f, 50.0f), "第三个子元素 31 + 15 + 4");
    return true;
}

bool Test_Stack_SetSpacingInvalidatesHeightOnly() {
    auto stack = UIStack::Create({}, 2.0f);
    stack->AddChild(MakeBox(40.0f, 10.0f));
    stack->AddChild(MakeBox(40.0f, 10.0f));
    TEST_ASSERT(stack->GetHeight() == 22.0f, "初始高度");
    TEST_ASSERT(stack->GetWidth() == 40.0f, "初始宽度");

    stack->As<UIStack>()->SetSpacing(8.0f);
    TEST_ASSERT(stack->IsWidthCached(), "间距只影响纵向");
    TEST_ASSERT(!stack->IsHeightCached(), "纵向缓存失效");
    TEST_ASSERT(stack->GetHeight() == 28.0f, "新高度");
    return true;
}

bool Test_Stack_FillChildTakesStackWidth() {
    auto stack = UIStack::Create({}, 0.0f);
    stack->AddChild(MakeBox(150.0f, 20.0f));
    UIElementOptions fillOptions;
    fillOptions.height = 10.0f;
    fillOptions.widthMode = SizeMode::Fill;
    auto* fill = stack->AddChild(UIElement::Create(std::move(fillOptions)));

    TEST_ASSERT(fill->GetWidthMode() == SizeMode::Fill, "给出高度不影响宽度模式");
    TEST_ASSERT(stack->GetWidth() == 150.0f, "Stack 宽度来自固定子元素");
    TEST_ASSERT(fill->GetWidth() == 150.0f, "Fill 子元素占满 Stack 宽度");
    TEST_ASSERT(stack->GetHeight() == 30.0f, "高度为 20 + 10");
    return true;
}

bool Test_Stack_NestedContentPropagates() {
    auto outer = UIStack::Create({}, 0.0f);
    auto* inner = outer->AddChild(UIStack::Create({}, 0.0f));
    auto* box = inner->AddChild(MakeBox(30.0f, 30.0f));
    TEST_ASSERT(outer->GetWidth() == 30.0f, "初始外层宽度");

    box->SetWidth(90.0f);
    TEST_ASSERT(!inner->IsWidthCached(), "内层失效");
    TEST_ASSERT(!outer->IsWidthCached(), "外层失效");
    TEST_ASSERT(outer->GetWidth() == 90.0f, "外层读取到新宽度");
    return true;
}

// ============================================================================
// UIRow
// ============================================================================

bool Test_Row_ContentSize() {
    auto row = UIRow::Create({}, 5.0f);
    row->AddChild(MakeBox(40.0f, 20.0f));
    row->AddChild(MakeBox(60.0f, 35.0f));

    TEST_ASSERT(row->GetType() == UIElementType::Row, "类型为 Row");
    TEST_ASSERT(row->GetWidth() == 105.0f, "宽度为 40 + 60 + 5");
    TEST_ASSERT(row->GetHeight() == 35.0f, "高度为最大高度");
    return true;
}

bool Test_Row_ArrangesLeftToRight() {
    auto row = UIRow::Create({.x = 100.0f, .y = 50.0f}, 10.0f);
    auto* a = row->AddChild(MakeBox(40.0f, 20.0f));
    auto* b = row->AddChild(MakeBox(25.0f, 20.0f));
    auto* c = row->AddChild(MakeBox(10.0f, 20.0f));

    row->UpdateLayout();
    TEST_ASSERT(a->GetPosition() == Vector2(100.0f, 50.0f), "第一个子元素在原点");
    TEST_ASSERT(b->GetPosition() == Vector2(150.0f, 50.0f), "第二个子元素 100 + 40 + 10");
    TEST_ASSERT(c->GetPosition() == Vector2(185.0f, 50.0f), "第三个子元素 150 + 25 + 10");
    return true;
}

bool Test_Row_FixedWidthKeepsExplicitValue() {
    auto row = UIRow::Create({.width = 300.0f});
    row->AddChild(MakeBox(40.0f, 20.0f));
    TEST_ASSERT(row->GetWidthMode() == SizeMode::Fixed, "给出宽度时为 Fixed");
    TEST_ASSERT(row->GetWidth() == 300.0f, "Fixed 宽度不随内容变化");
    TEST_ASSERT(row->GetHeightMode() == SizeMode::Content, "高度仍为 Content");
    TEST_ASSERT(row->GetHeight() == 20.0f, "高度来自子元素");
    return true;
}

bool Test_Row_RenderVisitsChildrenInOrder() {
    auto row = UIRow::Create({}, 0.0f);
    row->AddChild(UIElement::Create({.width = 10.0f, .height = 10.0f, .showBorders = true}));
    row->AddChild(UIElement::Create({.width = 20.0f, .height = 10.0f, .showBorders = true}));

    LatticeTest::RecordingPainter painter;
    row->Render(painter);
    TEST_ASSERT(painter.filledRects.size() == 8, "两个元素各四条边框");
    TEST_ASSERT(painter.filledRects[0].x == 0.0f, "先绘制第一个子元素");
    TEST_ASSERT(painter.filledRects[4].x == 10.0f, "第二个子元素位于 x = 10");
    return true;
}

// ============================================================================
// 主函数
// ============================================================================

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    std::cout << "========================================" << std::endl;
    std::cout << "UIStack / UIRow 测试开始" << std::endl;
    std::cout << "========================================" << std::endl;

    Logger::GetInstance().SetLogToFile(false);
    Logger::GetInstance().SetLogLevel(LogLevel::Warning);

    std::cout << "\n[UIStack 测试]" << std::endl;
    RUN_TEST(Test_Stack_DefaultsToContent);
    RUN_TEST(Test_Stack_EmptyUsesDefaultSize);
    RUN_TEST(Test_Stack_ContentSize);
    RUN_TEST(Test_Stack_ArrangesTopToBottom);
    RUN_TEST(Test_Stack_SetSpacingInvalidatesHeightOnly);
    RUN_TEST(Test_Stack_FillChildTakesStackWidth);
    RUN_TEST(Test_Stack_NestedContentPropagates);

    std::cout << "\n[UIRow 测试]" << std::endl;
    RUN_TEST(Test_Row_ContentSize);
    RUN_TEST(Test_Row_ArrangesLeftToRight);
    RUN_TEST(Test_Row_FixedWidthKeepsExplicitValue);
    RUN_TEST(Test_Row_RenderVisitsChildrenInOrder);

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
