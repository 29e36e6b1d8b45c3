#pragma once

#include <FL/Enumerations.H>
#include <string>

/**
 * @brief Names for FLTK faces, so styled text and configuration files can refer to fonts by name
 */
namespace FontRegistry {

/**
 * @brief Resolve a face name ("regular", "bold", "italic", "bold-italic", "mono" or "serif")
 * @return The FLTK face; unknown names resolve to FL_HELVETICA with a warning
 */
Fl_Font resolve(const std::string &name);

/**
 * @brief Reverse lookup used when serialising; unnamed faces come back as "face:<id>"
 */
std::string nameOf(Fl_Font face);

} // namespace FontRegistry
