#pragma once
#include "surface.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shellhost {

// Uncommitted: no surface has been created yet. Surfaced: `surface` is live.
enum class SurfaceState { Uncommitted, Surfaced };

struct Tab {
    std::string id;
    std::string url;
    std::string title;
    std::optional<std::string> favicon;
    bool is_external = false;
    SurfaceState surface_state = SurfaceState::Uncommitted;
    std::unique_ptr<Surface> surface;
};

struct TabSummary {
    std::string id;
    std::string url;
    std::string title;
    std::optional<std::string> favicon;
    bool is_active = false;
};

struct TabContext {
    std::string id;
    std::string url;
    std::string title;
    std::optional<std::string> favicon;
    bool is_external = false;
    std::optional<DocumentSnapshot> dom;
    std::optional<std::vector<Cookie>> cookies;
    std::optional<std::string> screenshot; // base64 PNG
};

struct NavigateResult {
    bool success = false;
    bool is_external = false;
    std::string url;
};

} // namespace shellhost
