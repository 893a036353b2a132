#pragma once

#include <string>

struct Config {
    struct DeepLink {
        std::string scheme = "app"; // matched as "<scheme>://"
    } deep_link;

    struct Window {
        std::string app_id = "linkrelay-ui"; // main window, as the compositor sees it
    } window;

    static Config load(const std::string& path);
    static Config load_default();
};
