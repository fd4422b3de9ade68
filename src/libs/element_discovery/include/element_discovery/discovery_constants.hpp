#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace element_discovery {

namespace defaults {

// Traversal and result caps
constexpr int max_traversal_depth = 3;
constexpr int promotion_depth = 3;
constexpr std::size_t descendant_cap = 20;
constexpr std::size_t sibling_cap = 15;
constexpr std::size_t recommended_cap = 5;

// Base confidence, relative to the relationship kind
constexpr double base_confidence = 0.5;
constexpr double text_bonus = 0.3;
constexpr double hidden_text_bonus = 0.2;
constexpr double clickable_bonus = 0.2;
constexpr double resource_id_bonus = 0.1;
constexpr double parent_bonus = 0.1;
constexpr double child_text_bonus = 0.2;
constexpr double child_hidden_text_bonus = 0.25;

// Quality weights (sum to 1)
constexpr double text_weight = 0.30;
constexpr double uniqueness_weight = 0.25;
constexpr double stability_weight = 0.25;
constexpr double matchability_weight = 0.20;

// Dimensions a matcher can reasonably rely on, per side
constexpr int min_reasonable_side_px = 10;
constexpr int max_reasonable_side_px = 2000;

// Action vocabulary of the contacts/social apps the thresholds were tuned on,
// plus the English equivalents.
constexpr std::array<std::string_view, 40> action_words = {
    "关注", "取关", "点赞", "收藏", "分享", "评论", "发送", "确定",
    "保存", "提交", "登录", "注册", "查看", "展开", "收起", "更多",
    "详情", "进入", "打开", "关闭", "返回", "刷新", "取消", "跳过",
    "confirm", "cancel", "submit", "ok", "save", "send", "login", "sign in",
    "register", "search", "delete", "share", "follow", "next", "back", "done",
};

// Resource-name fragments that identify an element by its role.
constexpr std::array<std::string_view, 14> meaningful_id_patterns = {
    "button", "btn", "input", "edit", "search", "submit", "confirm",
    "cancel", "login", "tab", "nav", "menu", "title", "item",
};

// Texts that on their own pin down one element of a screen.
constexpr std::array<std::string_view, 12> unique_phrases = {
    "电话", "联系人", "收藏", "通讯录", "我的", "首页",
    "消息", "设置", "搜索", "Phone", "Contacts", "Favorites",
};

// Actionable-children analysis
constexpr int actionable_max_depth = 5;
constexpr int actionable_base_priority = 50;
constexpr int actionable_depth_penalty = 5;
constexpr int actionable_keyword_priority = 15;
constexpr double actionable_high_keyword_bonus = 0.2;
constexpr double actionable_medium_keyword_bonus = 0.1;
constexpr double actionable_low_keyword_penalty = 0.1;
constexpr double actionable_short_text_bonus = 0.1;
constexpr double actionable_long_text_penalty = 0.15;
constexpr std::size_t actionable_short_text_max = 20;
constexpr std::size_t actionable_long_text_min = 51;
constexpr std::size_t actionable_key_text_max = 20;

// Keyword tiers for actionable children. High raises confidence and priority,
// medium raises confidence, low (dismissals) lowers it.
constexpr std::array<std::string_view, 19> high_action_keywords = {
    "关注", "取关", "点赞", "收藏", "分享", "评论", "发送", "确定", "保存", "提交",
    "登录", "注册", "follow", "like", "share", "send", "confirm", "submit", "sign in",
};
constexpr std::array<std::string_view, 16> medium_action_keywords = {
    "查看", "展开", "收起", "更多", "详情", "进入", "打开", "关闭", "返回", "刷新",
    "view", "more", "details", "open", "close", "refresh",
};
constexpr std::array<std::string_view, 11> low_action_keywords = {
    "了解", "知道了", "好的", "取消", "跳过", "暂不", "稍后",
    "cancel", "skip", "later", "not now",
};

// Widget classes that take input even when the dump does not mark them clickable.
constexpr std::array<std::string_view, 9> interactive_class_markers = {
    "Button", "EditText", "CheckBox", "Switch", "ImageButton",
    "Spinner", "SeekBar", "ToggleButton", "RadioButton",
};

} // namespace defaults
} // namespace element_discovery
