#pragma once

#include <nlohmann/json.hpp>

// Trimmed GET_TREE reply: one output with a tiled kitty (focused), a split
// container holding an editor, a fullscreen XWayland firefox, and a foot
// terminal parked in the scratchpad.
inline nlohmann::json sample_tree(int kitty_pid = 4242) {
    auto tree = nlohmann::json::parse(R"({
        "id": 1, "type": "root", "name": "root",
        "rect": {"x": 0, "y": 0, "width": 3840, "height": 1080},
        "nodes": [
            {
                "id": 2147483646, "type": "output", "name": "__i3",
                "nodes": [
                    {
                        "id": 2147483647, "type": "workspace", "name": "__i3_scratch",
                        "nodes": [],
                        "floating_nodes": [
                            {
                                "id": 12, "type": "floating_con", "name": "foot",
                                "app_id": "foot", "pid": 3003, "focused": false,
                                "visible": false, "fullscreen_mode": 0,
                                "rect": {"x": 100, "y": 100, "width": 800, "height": 600},
                                "nodes": [], "floating_nodes": []
                            }
                        ]
                    }
                ]
            },
            {
                "id": 3, "type": "output", "name": "DP-1",
                "rect": {"x": 0, "y": 0, "width": 1920, "height": 1080},
                "nodes": [
                    {
                        "id": 4, "type": "workspace", "name": "1",
                        "nodes": [
                            {
                                "id": 10, "type": "con", "name": "~/src",
                                "app_id": "kitty", "pid": 0, "focused": true,
                                "visible": true, "fullscreen_mode": 0,
                                "rect": {"x": 0, "y": 0, "width": 960, "height": 1080},
                                "nodes": [], "floating_nodes": []
                            },
                            {
                                "id": 20, "type": "con", "name": null,
                                "rect": {"x": 960, "y": 0, "width": 960, "height": 1080},
                                "nodes": [
                                    {
                                        "id": 13, "type": "con", "name": "main.cpp - editor",
                                        "app_id": "editor", "pid": 2002, "focused": false,
                                        "visible": true, "fullscreen_mode": 0,
                                        "rect": {"x": 960, "y": 0, "width": 960, "height": 1080},
                                        "nodes": [], "floating_nodes": []
                                    }
                                ],
                                "floating_nodes": []
                            }
                        ],
                        "floating_nodes": [
                            {
                                "id": 11, "type": "floating_con", "name": "Mozilla Firefox",
                                "app_id": null, "pid": 1001, "focused": false,
                                "visible": true, "fullscreen_mode": 1,
                                "window_properties": {"class": "Firefox", "instance": "Navigator"},
                                "rect": {"x": 200, "y": 150, "width": 1280, "height": 720},
                                "nodes": [], "floating_nodes": []
                            }
                        ]
                    }
                ]
            }
        ]
    })");
    tree["nodes"][1]["nodes"][0]["nodes"][0]["pid"] = kitty_pid;
    return tree;
}
