#include "headless_window.hpp"
#include "event_loop.hpp"
#include <iostream>

namespace shellhost {

HeadlessSurface::HeadlessSurface(EventLoop& loop) : loop_(loop) {}

HeadlessSurface::~HeadlessSurface() {
    *alive_ = false;
}

void HeadlessSurface::set_events(SurfaceEvents events) {
    events_ = std::move(events);
}

std::string HeadlessSurface::url() const {
    return history_.empty() ? std::string() : history_[index_];
}

void HeadlessSurface::load_url(const std::string& url) {
    if (closed_) return;
    if (!history_.empty()) history_.resize(index_ + 1);
    history_.push_back(url);
    index_ = history_.size() - 1;
    commit(url);
}

void HeadlessSurface::go_back() {
    if (closed_ || !can_go_back()) return;
    --index_;
    commit(history_[index_]);
}

void HeadlessSurface::go_forward() {
    if (closed_ || !can_go_forward()) return;
    ++index_;
    commit(history_[index_]);
}

void HeadlessSurface::reload() {
    if (closed_ || history_.empty()) return;
    commit(history_[index_]);
}

std::optional<std::vector<Cookie>> HeadlessSurface::cookies(const std::string& /*url*/) {
    return std::vector<Cookie>{};
}

void HeadlessSurface::close() {
    closed_ = true;
    events_ = SurfaceEvents{};
}

// Events arrive on a later loop iteration, as they would from a real engine.
void HeadlessSurface::commit(const std::string& url) {
    title_ = url;
    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive, url]() {
        auto guard = alive.lock();
        if (!guard || !*guard || closed_) return;
        if (events_.navigated) events_.navigated(url);
        if (events_.title_changed) events_.title_changed(title_);
        if (events_.load_finished) events_.load_finished();
    });
}

HeadlessWindow::HeadlessWindow(EventLoop& loop, Size size) : loop_(loop), size_(size) {}

std::unique_ptr<Surface> HeadlessWindow::create_surface() {
    return std::make_unique<HeadlessSurface>(loop_);
}

void HeadlessWindow::attach(Surface& surface) {
    attached_.insert(&surface);
}

void HeadlessWindow::detach(Surface& surface) {
    attached_.erase(&surface);
}

bool HeadlessWindow::is_attached(const Surface& surface) const {
    return attached_.count(&surface) > 0;
}

void HeadlessWindow::show_context_menu(std::vector<MenuItem> items) {
    std::cerr << "[window] Context menu:";
    for (const auto& item : items) {
        if (item.kind == MenuItem::Kind::Separator) std::cerr << " |";
        else std::cerr << " " << item.label;
    }
    std::cerr << "\n";
}

} // namespace shellhost
