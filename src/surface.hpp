#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shellhost {

// Engine-facing primitives. The rendering engine supplies concrete Window and
// Surface implementations; the tab registry only drives them through these
// interfaces.

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

struct Size {
    int width = 0;
    int height = 0;
};

struct MetaTag {
    std::string name;
    std::string content;
};

struct DocumentSnapshot {
    std::string html;
    std::string text;
    std::vector<MetaTag> metas;
    std::map<std::string, std::string> local_storage;
    std::map<std::string, std::string> session_storage;
};

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path;
    bool secure = false;
    bool http_only = false;
};

struct EditFlags {
    bool can_copy = false;
    bool can_paste = false;
    bool can_cut = false;
};

struct ContextMenuParams {
    int x = 0;
    int y = 0;
    std::string selection_text;
    EditFlags edit_flags;
};

struct MenuItem {
    enum class Kind { Action, Separator };

    Kind kind = Kind::Action;
    std::string label;
    bool enabled = true;
    std::function<void()> on_click;

    static MenuItem separator() {
        MenuItem item;
        item.kind = Kind::Separator;
        return item;
    }
};

// Callbacks a surface fires as the page changes. Unset members are ignored.
struct SurfaceEvents {
    std::function<void(const std::string& url)> navigated;
    std::function<void()> load_finished;
    std::function<void(int error_code, const std::string& description,
                       const std::string& url)> load_failed;
    std::function<void(const std::string& title)> title_changed;
    std::function<void(const std::vector<std::string>& favicons)> favicon_changed;
    std::function<void(const ContextMenuParams& params)> context_menu;
};

class Surface {
public:
    virtual ~Surface() = default;

    virtual void set_events(SurfaceEvents events) = 0;

    virtual void load_url(const std::string& url) = 0;
    virtual std::string url() const = 0;
    virtual std::string title() const = 0;

    virtual bool can_go_back() const = 0;
    virtual bool can_go_forward() const = 0;
    virtual void go_back() = 0;
    virtual void go_forward() = 0;
    virtual void reload() = 0;
    virtual void inspect_element(int /*x*/, int /*y*/) {}

    // Clipboard actions on the page's current selection or focused field.
    virtual void copy() = 0;
    virtual void paste() = 0;
    virtual void cut() = 0;

    virtual void set_bounds(const Rect& bounds) = 0;

    // Capture steps are best-effort: nullopt (or an exception) means the
    // engine could not provide the data.
    virtual std::optional<DocumentSnapshot> capture_document() = 0;
    virtual std::optional<std::vector<Cookie>> cookies(const std::string& url) = 0;
    virtual std::optional<std::vector<uint8_t>> capture_png() = 0;

    // Tear down the page. May throw if the engine already destroyed it.
    virtual void close() = 0;
};

class Window {
public:
    virtual ~Window() = default;

    virtual Size content_size() const = 0;
    virtual std::unique_ptr<Surface> create_surface() = 0;

    virtual void attach(Surface& surface) = 0;
    virtual void detach(Surface& surface) = 0;
    virtual bool is_attached(const Surface& surface) const = 0;

    virtual void show_context_menu(std::vector<MenuItem> items) = 0;
};

} // namespace shellhost
