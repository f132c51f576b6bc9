#pragma once
#include "surface.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace shellhost {

class EventLoop;

// Engine stand-in used when the host runs without a renderer: surfaces keep
// a navigation history and report loads asynchronously through the loop,
// but never fetch or render anything.
class HeadlessSurface : public Surface {
public:
    explicit HeadlessSurface(EventLoop& loop);
    ~HeadlessSurface() override;

    void set_events(SurfaceEvents events) override;

    void load_url(const std::string& url) override;
    std::string url() const override;
    std::string title() const override { return title_; }

    bool can_go_back() const override { return index_ > 0; }
    bool can_go_forward() const override { return index_ + 1 < history_.size(); }
    void go_back() override;
    void go_forward() override;
    void reload() override;

    // Nothing is rendered, so there is never a selection or focused field.
    void copy() override {}
    void paste() override {}
    void cut() override {}

    void set_bounds(const Rect& bounds) override { bounds_ = bounds; }
    const Rect& bounds() const { return bounds_; }

    std::optional<DocumentSnapshot> capture_document() override { return std::nullopt; }
    std::optional<std::vector<Cookie>> cookies(const std::string& url) override;
    std::optional<std::vector<uint8_t>> capture_png() override { return std::nullopt; }

    void close() override;
    bool closed() const { return closed_; }

private:
    void commit(const std::string& url);

    EventLoop& loop_;
    SurfaceEvents events_;
    std::vector<std::string> history_;
    size_t index_ = 0;
    std::string title_;
    Rect bounds_;
    bool closed_ = false;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

class HeadlessWindow : public Window {
public:
    HeadlessWindow(EventLoop& loop, Size size);

    Size content_size() const override { return size_; }
    void resize(Size size) { size_ = size; }

    std::unique_ptr<Surface> create_surface() override;

    void attach(Surface& surface) override;
    void detach(Surface& surface) override;
    bool is_attached(const Surface& surface) const override;

    // No menu can be shown; the items are logged.
    void show_context_menu(std::vector<MenuItem> items) override;

private:
    EventLoop& loop_;
    Size size_;
    std::set<const Surface*> attached_;
};

} // namespace shellhost
