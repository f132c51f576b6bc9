#include "tab_registry.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "url.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace shellhost {

TabRegistry::TabRegistry(Window& window, EventBus& bus, TabRegistryOptions options)
    : window_(window), bus_(bus), options_(std::move(options))
{}

bool TabRegistry::is_internal(const std::string& url) const {
    return is_internal_url(url, options_.internal_scheme);
}

Tab* TabRegistry::find_mut(const std::string& id) {
    for (auto& tab : tabs_) {
        if (tab->id == id) return tab.get();
    }
    return nullptr;
}

const Tab* TabRegistry::find(const std::string& id) const {
    for (const auto& tab : tabs_) {
        if (tab->id == id) return tab.get();
    }
    return nullptr;
}

Tab* TabRegistry::active_tab() {
    return active_id_ ? find_mut(*active_id_) : nullptr;
}

const Tab* TabRegistry::active_external_surface_tab() const {
    const Tab* tab = active_id_ ? find(*active_id_) : nullptr;
    if (!tab || !tab->is_external || !tab->surface) return nullptr;
    return tab;
}

// ── Lifecycle ───────────────────────────────────────────────────

const Tab& TabRegistry::create(const std::optional<std::string>& requested_id,
                               const std::string& url) {
    std::string id = requested_id && !requested_id->empty()
        ? *requested_id : "tab-" + generate_id();

    if (Tab* existing = find_mut(id)) return *existing;

    std::string target = trim(url).empty() ? options_.home_url
                                           : normalize_url(url, options_.internal_scheme);

    auto tab = std::make_unique<Tab>();
    tab->id = id;
    tab->is_external = !is_internal(target);
    tab->url = target;
    tab->title = tab->is_external ? "New Tab" : "Home";
    tabs_.push_back(std::move(tab));
    Tab& record = *tabs_.back();

    if (record.is_external && ensure_surface(record)) {
        record.surface->load_url(record.url);
    }

    if (!active_id_) switch_to(id);

    publish_tabs_updated();
    return record;
}

bool TabRegistry::switch_to(const std::string& id) {
    Tab* tab = find_mut(id);
    if (!tab) return false;

    Tab* current = active_tab();
    if (current && current->surface && window_.is_attached(*current->surface)) {
        window_.detach(*current->surface);
    }

    active_id_ = id;

    if (tab->is_external) {
        bool created = ensure_surface(*tab);
        if (tab->surface) {
            attach_active(*tab);
            if (created) tab->surface->load_url(tab->url);
        }
        publish_external_mode(true);
    } else {
        publish_external_mode(false);
    }

    publish_url_changed(tab->url);
    return true;
}

bool TabRegistry::close(const std::string& id) {
    auto it = std::find_if(tabs_.begin(), tabs_.end(),
                           [&](const std::unique_ptr<Tab>& t) { return t->id == id; });
    if (it == tabs_.end()) return false;

    size_t index = static_cast<size_t>(it - tabs_.begin());
    std::unique_ptr<Tab> removed = std::move(*it);
    tabs_.erase(it);

    if (removed->surface) {
        if (window_.is_attached(*removed->surface)) {
            window_.detach(*removed->surface);
        }
        try {
            removed->surface->close();
        } catch (const std::exception& e) {
            std::cerr << "[tabs] Ignoring surface close failure for " << id
                      << ": " << e.what() << "\n";
        }
    }

    if (active_id_ == id) {
        active_id_.reset();
        if (index < tabs_.size()) {
            switch_to(tabs_[index]->id);
        } else if (index > 0) {
            switch_to(tabs_[index - 1]->id);
        } else {
            publish_external_mode(false);
        }
    }

    publish_tabs_updated();
    return true;
}

// ── Navigation ──────────────────────────────────────────────────

NavigateResult TabRegistry::navigate_active(const std::string& url) {
    Tab* tab = active_tab();
    if (!tab) {
        const Tab& created = create(std::nullopt, url);
        return NavigateResult{true, created.is_external, created.url};
    }

    std::string normalized = normalize_url(url, options_.internal_scheme);
    tab->url = normalized;
    tab->is_external = !is_internal(normalized);

    if (tab->is_external) {
        ensure_surface(*tab);
        if (!tab->surface) {
            return NavigateResult{false, true, normalized};
        }
        attach_active(*tab);
        publish_external_mode(true);
        tab->surface->load_url(normalized);
        publish_tabs_updated();
        return NavigateResult{true, true, normalized};
    }

    // Internal page: the UI renders it, so the surface just leaves the window.
    if (tab->surface && window_.is_attached(*tab->surface)) {
        window_.detach(*tab->surface);
    }
    publish_external_mode(false);
    publish_url_changed(tab->url);
    publish_tabs_updated();
    return NavigateResult{true, false, normalized};
}

NavigateResult TabRegistry::search(const std::string& query) {
    std::string q = trim(query);
    if (q.empty()) return NavigateResult{false, false, active_url()};
    return navigate_active(internal_search_url(q, options_.internal_scheme));
}

bool TabRegistry::go_back() {
    const Tab* tab = active_external_surface_tab();
    if (!tab || !tab->surface->can_go_back()) return false;
    tab->surface->go_back();
    return true;
}

bool TabRegistry::go_forward() {
    const Tab* tab = active_external_surface_tab();
    if (!tab || !tab->surface->can_go_forward()) return false;
    tab->surface->go_forward();
    return true;
}

bool TabRegistry::reload() {
    const Tab* tab = active_external_surface_tab();
    if (!tab) return false;
    tab->surface->reload();
    return true;
}

bool TabRegistry::can_go_back() const {
    const Tab* tab = active_external_surface_tab();
    return tab && tab->surface->can_go_back();
}

bool TabRegistry::can_go_forward() const {
    const Tab* tab = active_external_surface_tab();
    return tab && tab->surface->can_go_forward();
}

std::string TabRegistry::active_url() const {
    const Tab* tab = active_id_ ? find(*active_id_) : nullptr;
    return tab ? tab->url : options_.home_url;
}

// ── Queries ─────────────────────────────────────────────────────

std::vector<TabSummary> TabRegistry::list() const {
    std::vector<TabSummary> out;
    out.reserve(tabs_.size());
    for (const auto& tab : tabs_) {
        out.push_back(TabSummary{tab->id, tab->url, tab->title, tab->favicon,
                                 active_id_ == tab->id});
    }
    return out;
}

std::optional<TabContext> TabRegistry::get_context(const std::string& id) {
    Tab* tab = find_mut(id);
    if (!tab) return std::nullopt;

    TabContext ctx;
    ctx.id = tab->id;
    ctx.url = tab->url;
    ctx.title = tab->title;
    ctx.favicon = tab->favicon;
    if (!tab->is_external || !tab->surface) return ctx;

    ctx.is_external = true;
    Surface& surface = *tab->surface;

    try {
        std::string live_url = surface.url();
        if (!live_url.empty()) ctx.url = live_url;
        std::string live_title = surface.title();
        if (!live_title.empty()) ctx.title = live_title;
    } catch (const std::exception& e) {
        std::cerr << "[tabs] " << id << ": live url/title unavailable: " << e.what() << "\n";
    }

    try {
        ctx.dom = surface.capture_document();
    } catch (const std::exception& e) {
        std::cerr << "[tabs] " << id << ": document capture failed: " << e.what() << "\n";
    }

    try {
        ctx.cookies = surface.cookies(ctx.url);
    } catch (const std::exception& e) {
        std::cerr << "[tabs] " << id << ": cookie snapshot failed: " << e.what() << "\n";
    }

    try {
        auto png = surface.capture_png();
        if (png && !png->empty()) ctx.screenshot = base64_encode(*png);
    } catch (const std::exception& e) {
        std::cerr << "[tabs] " << id << ": screenshot failed: " << e.what() << "\n";
    }

    return ctx;
}

// ── Bounds ──────────────────────────────────────────────────────

Rect TabRegistry::content_bounds() const {
    Size size = window_.content_size();
    int panel = panel_open_ ? options_.panel_width : 0;
    return Rect{0, options_.chrome_height,
                std::max(0, size.width - panel),
                std::max(0, size.height - options_.chrome_height)};
}

void TabRegistry::set_panel_open(bool open) {
    panel_open_ = open;
    update_active_bounds();
}

void TabRegistry::on_window_resized() {
    update_active_bounds();
}

void TabRegistry::update_active_bounds() {
    Tab* tab = active_tab();
    if (tab && tab->surface) tab->surface->set_bounds(content_bounds());
}

// ── Surfaces ────────────────────────────────────────────────────

bool TabRegistry::ensure_surface(Tab& tab) {
    if (tab.surface_state == SurfaceState::Surfaced) return false;

    std::unique_ptr<Surface> surface = window_.create_surface();
    if (!surface) {
        std::cerr << "[tabs] Engine refused to create a surface for " << tab.id << "\n";
        return false;
    }
    surface->set_bounds(content_bounds());
    wire_events(tab.id, *surface);
    tab.surface = std::move(surface);
    tab.surface_state = SurfaceState::Surfaced;
    return true;
}

void TabRegistry::attach_active(Tab& tab) {
    if (active_id_ != tab.id || !tab.surface) return;
    tab.surface->set_bounds(content_bounds());
    if (!window_.is_attached(*tab.surface)) window_.attach(*tab.surface);
}

void TabRegistry::wire_events(const std::string& tab_id, Surface& surface) {
    SurfaceEvents events;

    events.navigated = [this, tab_id](const std::string& url) {
        Tab* tab = find_mut(tab_id);
        if (!tab) return;
        tab->url = url;
        if (active_id_ == tab_id) publish_url_changed(url);
    };

    events.load_finished = [this, tab_id]() {
        const Tab* tab = find(tab_id);
        if (!tab) return;
        NavigationCompleteEvent ev;
        ev.url = tab->url;
        bus_.publish(ev);
    };

    events.load_failed = [this, tab_id](int code, const std::string& description,
                                        const std::string& url) {
        std::cerr << "[tabs] " << tab_id << " failed to load " << url << ": "
                  << code << " " << description << "\n";
        NavigationErrorEvent ev;
        ev.error_code = code;
        ev.error_description = description;
        ev.url = url;
        bus_.publish(ev);
    };

    events.title_changed = [this, tab_id](const std::string& title) {
        Tab* tab = find_mut(tab_id);
        if (!tab) return;
        tab->title = title;
        publish_tabs_updated();
    };

    events.favicon_changed = [this, tab_id](const std::vector<std::string>& favicons) {
        Tab* tab = find_mut(tab_id);
        if (!tab) return;
        if (favicons.empty()) tab->favicon.reset();
        else tab->favicon = favicons.front();
        publish_tabs_updated();
    };

    events.context_menu = [this, tab_id](const ContextMenuParams& params) {
        show_context_menu(tab_id, params);
    };

    surface.set_events(std::move(events));
}

void TabRegistry::show_context_menu(const std::string& tab_id, const ContextMenuParams& params) {
    const Tab* tab = find(tab_id);
    if (!tab || !tab->surface) return;

    // Menu actions run later; they look the tab up again at click time.
    auto with_surface = [this, tab_id](void (Surface::*action)()) {
        return [this, tab_id, action]() {
            Tab* t = find_mut(tab_id);
            if (t && t->surface) ((*t->surface).*action)();
        };
    };

    std::vector<MenuItem> items;

    if (!params.selection_text.empty()) {
        MenuItem ask;
        ask.label = "Ask assistant";
        std::string selection = params.selection_text;
        ask.on_click = [this, tab_id, selection]() {
            const Tab* t = find(tab_id);
            AskAssistantEvent ev;
            ev.selection_text = selection;
            ev.source_url = t ? t->url : std::string();
            bus_.publish(ev);
        };
        items.push_back(std::move(ask));
        items.push_back(MenuItem::separator());
    }

    MenuItem copy;
    copy.label = "Copy";
    copy.enabled = params.edit_flags.can_copy;
    copy.on_click = with_surface(&Surface::copy);
    items.push_back(std::move(copy));

    MenuItem paste;
    paste.label = "Paste";
    paste.enabled = params.edit_flags.can_paste;
    paste.on_click = with_surface(&Surface::paste);
    items.push_back(std::move(paste));

    MenuItem cut;
    cut.label = "Cut";
    cut.enabled = params.edit_flags.can_cut;
    cut.on_click = with_surface(&Surface::cut);
    items.push_back(std::move(cut));

    items.push_back(MenuItem::separator());

    MenuItem back;
    back.label = "Back";
    back.enabled = tab->surface->can_go_back();
    back.on_click = [this, tab_id]() {
        Tab* t = find_mut(tab_id);
        if (t && t->surface && t->surface->can_go_back()) t->surface->go_back();
    };
    items.push_back(std::move(back));

    MenuItem forward;
    forward.label = "Forward";
    forward.enabled = tab->surface->can_go_forward();
    forward.on_click = [this, tab_id]() {
        Tab* t = find_mut(tab_id);
        if (t && t->surface && t->surface->can_go_forward()) t->surface->go_forward();
    };
    items.push_back(std::move(forward));

    MenuItem reload_item;
    reload_item.label = "Reload";
    reload_item.on_click = with_surface(&Surface::reload);
    items.push_back(std::move(reload_item));

    items.push_back(MenuItem::separator());

    MenuItem inspect;
    inspect.label = "Inspect Element";
    int x = params.x;
    int y = params.y;
    inspect.on_click = [this, tab_id, x, y]() {
        Tab* t = find_mut(tab_id);
        if (t && t->surface) t->surface->inspect_element(x, y);
    };
    items.push_back(std::move(inspect));

    window_.show_context_menu(std::move(items));
}

// ── Notifications ───────────────────────────────────────────────

void TabRegistry::publish_tabs_updated() {
    TabsUpdatedEvent ev;
    ev.tabs = list();
    bus_.publish(ev);
}

void TabRegistry::publish_url_changed(const std::string& url) {
    UrlChangedEvent ev;
    ev.url = url;
    bus_.publish(ev);
}

void TabRegistry::publish_external_mode(bool enabled) {
    ExternalModeEvent ev;
    ev.enabled = enabled;
    bus_.publish(ev);
}

} // namespace shellhost
