#pragma once
#include <string>
#include <vector>

// Append-only list of strings kept as a JSON array in the run directory.
class NoteStore {
public:
    explicit NoteStore(std::string path);

    std::vector<std::string> load() const;
    bool append(const std::string& note);
    // "- a\n- b", or "(no memories yet)" when empty or unreadable.
    std::string recall() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
