#include "handlers/EditorState.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace handlers {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

EditorState::EditorState() {
    tags_.insert(kUntaggedTag);
}

bool EditorState::enter_play_mode() {
    if (playing_) return false;
    playing_ = true;
    paused_ = false;
    return true;
}

bool EditorState::exit_play_mode() {
    if (!playing_) return false;
    playing_ = false;
    paused_ = false;
    return true;
}

void EditorState::toggle_pause() {
    if (playing_) paused_ = !paused_;
}

const std::vector<std::string>& EditorState::standard_tools() {
    static const std::vector<std::string> tools = {
        "View", "Move", "Rotate", "Scale", "Rect", "Transform"
    };
    return tools;
}

std::string EditorState::canonical_tool_name(const std::string& name) {
    const std::string wanted = to_lower(name);
    for (const auto& tool : standard_tools()) {
        if (to_lower(tool) == wanted) return tool;
    }
    return "";
}

bool EditorState::add_tag(const std::string& tag) {
    return tags_.insert(tag).second;
}

bool EditorState::remove_tag(const std::string& tag) {
    if (tag == kUntaggedTag) return false;
    return tags_.erase(tag) > 0;
}

void EditorState::add_menu_item(const std::string& path, MenuAction action) {
    if (path.empty() || !action) {
        throw std::invalid_argument("menu item needs a path and an action");
    }
    menu_items_[path] = std::move(action);
}

bool EditorState::has_menu_item(const std::string& path) const {
    return menu_items_.count(path) > 0;
}

bool EditorState::execute_menu_item(const std::string& path) {
    auto it = menu_items_.find(path);
    if (it == menu_items_.end()) return false;
    it->second();
    return true;
}

std::vector<std::string> EditorState::menu_paths() const {
    std::vector<std::string> paths;
    paths.reserve(menu_items_.size());
    for (const auto& entry : menu_items_) {
        paths.push_back(entry.first);
    }
    return paths;
}

} // namespace handlers
