#pragma once
#include "surface.hpp"
#include "tab.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shellhost {

class EventBus;

struct TabRegistryOptions {
    int chrome_height = 108;
    int panel_width = 420;
    std::string internal_scheme = "shell://";
    std::string home_url = "shell://home";
};

// Ordered set of tabs layered into one window. Exactly one tab is active
// unless the registry is empty; only the active tab's surface is attached.
// Surfaces are created lazily, the first time a tab shows external content,
// and are detached (never destroyed) when their tab loses focus.
class TabRegistry {
public:
    TabRegistry(Window& window, EventBus& bus, TabRegistryOptions options = {});

    TabRegistry(const TabRegistry&) = delete;
    TabRegistry& operator=(const TabRegistry&) = delete;

    // A requested id that is already present returns that tab untouched.
    // An empty url means the home page.
    const Tab& create(const std::optional<std::string>& requested_id = std::nullopt,
                      const std::string& url = {});

    bool switch_to(const std::string& id);
    bool close(const std::string& id);

    NavigateResult navigate_active(const std::string& url);
    NavigateResult search(const std::string& query);

    bool go_back();
    bool go_forward();
    bool reload();
    bool can_go_back() const;
    bool can_go_forward() const;

    // URL of the active tab, or the home URL when there is none.
    std::string active_url() const;
    std::optional<std::string> active_id() const { return active_id_; }

    // nullopt only when the id is unknown; capture failures omit fields.
    std::optional<TabContext> get_context(const std::string& id);

    std::vector<TabSummary> list() const;
    const Tab* find(const std::string& id) const;
    size_t size() const { return tabs_.size(); }

    void set_panel_open(bool open);
    bool panel_open() const { return panel_open_; }
    void on_window_resized();
    Rect content_bounds() const;

private:
    Tab* find_mut(const std::string& id);
    Tab* active_tab();
    const Tab* active_external_surface_tab() const;

    bool is_internal(const std::string& url) const;

    // Creates the surface if the tab has none yet. Returns true if created.
    bool ensure_surface(Tab& tab);
    void wire_events(const std::string& tab_id, Surface& surface);
    void attach_active(Tab& tab);
    void update_active_bounds();
    void show_context_menu(const std::string& tab_id, const ContextMenuParams& params);

    void publish_tabs_updated();
    void publish_url_changed(const std::string& url);
    void publish_external_mode(bool enabled);

    Window& window_;
    EventBus& bus_;
    TabRegistryOptions options_;

    std::vector<std::unique_ptr<Tab>> tabs_;
    std::optional<std::string> active_id_;
    bool panel_open_ = false;
};

} // namespace shellhost
