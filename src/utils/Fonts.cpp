#include "utils/Fonts.h"

#include "utils/Logger.h"

#include <string>
#include <unordered_map>

namespace FontRegistry {

namespace {
const std::unordered_map<std::string, Fl_Font> &faces() {
    static const std::unordered_map<std::string, Fl_Font> map = {
        {"regular", FL_HELVETICA},   {"bold", FL_HELVETICA_BOLD}, {"italic", FL_HELVETICA_ITALIC},
        {"bold-italic", FL_HELVETICA_BOLD_ITALIC}, {"mono", FL_COURIER}, {"serif", FL_TIMES},
    };
    return map;
}
} // namespace

Fl_Font resolve(const std::string &name) {
    auto it = faces().find(name);
    if (it != faces().end()) {
        return it->second;
    }

    if (name.rfind("face:", 0) == 0) {
        try {
            return static_cast<Fl_Font>(std::stoi(name.substr(5)));
        } catch (const std::exception &e) {
            Logger::warn("Malformed face reference '" + name + "': " + e.what());
            return FL_HELVETICA;
        }
    }

    Logger::warn("Unknown font face '" + name + "', using regular");
    return FL_HELVETICA;
}

std::string nameOf(Fl_Font face) {
    for (const auto &[name, id] : faces()) {
        if (id == face) {
            return name;
        }
    }
    return "face:" + std::to_string(face);
}

} // namespace FontRegistry
