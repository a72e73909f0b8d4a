#pragma once
#include "marks.hpp"
#include <string>
#include <vector>

// Run-directory files shared by the capture side and the overlay.
struct RunFiles {
    std::string marks;
    std::string cursor;
    std::string canvas;
    std::string memory;
    std::string state;

    static RunFiles in(const std::string& run_dir);
};

std::string marks_to_json(const std::vector<Mark>& marks);
bool parse_marks_json(const std::string& body, std::vector<Mark>& out);
std::string cursor_to_json(const CursorState& st);
bool parse_cursor_json(const std::string& body, CursorState& out);

// Missing or unreadable files yield empty / default state.
std::vector<Mark> load_marks(const std::string& path);
CursorState load_cursor_state(const std::string& path);

bool save_marks(const std::string& path, const std::vector<Mark>& marks);
bool save_cursor_state(const std::string& path, const CursorState& st);
