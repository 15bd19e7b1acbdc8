#pragma once
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace handlers {

// ============================================================================
// EditorState - Host-side state the editor tools mutate
// ============================================================================
// Thread-confined: after startup wiring, only the host thread touches it
// (tools run inside the dispatcher's tick). No internal locking.
// ============================================================================

class EditorState {
public:
    using MenuAction = std::function<void()>;

    static constexpr const char* kDefaultTool = "Move";
    static constexpr const char* kUntaggedTag = "Untagged";

    EditorState();

    // ========== Play Mode ==========

    bool is_playing() const { return playing_; }
    bool is_paused() const { return paused_; }

    // Returns false when already playing
    bool enter_play_mode();

    // Returns false when not playing
    bool exit_play_mode();

    // Flips the pause flag; only meaningful while playing
    void toggle_pause();

    // ========== Tools ==========

    const std::string& active_tool() const { return active_tool_; }

    // Case-insensitive lookup among the standard tools. Returns the
    // canonical name, or an empty string when `name` is not one of them.
    static std::string canonical_tool_name(const std::string& name);

    static const std::vector<std::string>& standard_tools();

    void set_active_tool(const std::string& canonical_name) { active_tool_ = canonical_name; }

    // ========== Tags ==========

    const std::set<std::string>& tags() const { return tags_; }
    bool add_tag(const std::string& tag);
    bool remove_tag(const std::string& tag);

    // ========== Menu ==========

    void add_menu_item(const std::string& path, MenuAction action);
    bool has_menu_item(const std::string& path) const;

    // Returns false for an unknown path; exceptions from the action propagate
    bool execute_menu_item(const std::string& path);

    std::vector<std::string> menu_paths() const;

private:
    bool playing_ = false;
    bool paused_ = false;
    std::string active_tool_ = kDefaultTool;
    std::set<std::string> tags_;
    std::map<std::string, MenuAction> menu_items_;
};

} // namespace handlers
