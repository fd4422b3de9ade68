#include <screen_loaders/sample_screen.hpp>

namespace screen_loaders {

std::vector<screen_model::UIElement> generate_sample_screen() {
    std::vector<screen_model::UIElement> out;

    auto add = [&](const char* id, const char* class_name, const char* resource_id,
        screen_model::Bounds bounds, bool clickable = false, const char* text = "")
    {
        screen_model::UIElement e;
        e.id = id;
        e.class_name = class_name;
        e.resource_id = resource_id;
        e.bounds = bounds;
        e.clickable = clickable;
        e.text = text;
        out.push_back(std::move(e));
    };
    const screen_model::Bounds hidden{0, 0, 0, 0};

    add("screen", "android.widget.FrameLayout", "android:id/content", {0, 0, 1080, 2340});
    add("bottom_nav", "android.widget.LinearLayout", "com.hihonor.contacts:id/bottom_navgation", {0, 2200, 1080, 2340});

    struct Tab {
        const char* id;
        const char* icon;
        const char* container;
        const char* label;
        const char* text;
    };
    const Tab tabs[] = {
        {"tab_phone", "tab_phone_icon", "tab_phone_container", "tab_phone_label", "电话"},
        {"tab_contacts", "tab_contacts_icon", "tab_contacts_container", "tab_contacts_label", "联系人"},
        {"tab_favorites", "tab_favorites_icon", "tab_favorites_container", "tab_favorites_label", "收藏"},
    };
    int left = 0;
    for (const Tab& t : tabs) {
        add(t.id, "android.widget.LinearLayout", "com.hihonor.contacts:id/tab_item", {left, 2200, left + 360, 2340}, true);
        add(t.icon, "android.widget.ImageView", "com.hihonor.contacts:id/top_icon", {left + 130, 2215, left + 230, 2295});
        add(t.container, "android.widget.LinearLayout", "com.hihonor.contacts:id/container", hidden);
        add(t.label, "android.widget.TextView", "com.hihonor.contacts:id/content", hidden, false, t.text);
        left += 360;
    }
    return out;
}

} // namespace screen_loaders
